#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

#include "devkit/core/environment.hpp"

namespace devkit::config {

// Configuration file locations
class ConfigPaths {
public:
    static constexpr const char* CONFIG_ENV_VAR = "DEVKIT_CONFIG";
    static constexpr const char* USER_CONFIG_FILE = ".devkit/config.yaml";

    // $DEVKIT_CONFIG if set, otherwise ~/.devkit/config.yaml when it exists
    static std::optional<std::string> resolve_config_file(
        const core::Environment& env);
};

enum class ConfigFormat { YAML, JSON, INI };

ConfigFormat format_from_extension(const std::string& config_file);

// Typed view over one top-level section of the configuration tree
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;
    virtual void from_ptree(const boost::property_tree::ptree& pt) = 0;
    virtual void validate() const {}
    virtual std::string properties_name() const = 0;
    virtual std::unique_ptr<ConfigurationProperties> clone() const = 0;
    // Copies the values of an object of the same concrete type
    virtual void assign(const ConfigurationProperties& other) = 0;

protected:
    template <typename T>
    T get_value(const boost::property_tree::ptree& pt, const std::string& path,
                const T& default_value) {
        return pt.get<T>(path, default_value);
    }

    template <typename T>
    std::optional<T> get_optional_value(const boost::property_tree::ptree& pt,
                                        const std::string& path) {
        auto result = pt.get_optional<T>(path);
        if (result) {
            return *result;
        }
        return std::nullopt;
    }
};

// CRTP template for providing automatic clone() implementation
template <typename Derived>
class ClonableConfigurationProperties : public ConfigurationProperties {
public:
    std::unique_ptr<ConfigurationProperties> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }

    void assign(const ConfigurationProperties& other) override {
        static_cast<Derived&>(*this) = dynamic_cast<const Derived&>(other);
    }
};

class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager instance;
        return instance;
    }

    void load_config(const std::string& config_file,
                     ConfigFormat format = ConfigFormat::YAML);

    template <typename T>
    void register_configuration_properties(std::shared_ptr<T> config) {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "T must inherit from ConfigurationProperties");
        configs_[std::type_index(typeid(T))] = config;
        config_by_name_[config->properties_name()] = config;
    }

    template <typename T>
    std::shared_ptr<T> get_configuration_properties() const {
        auto it = configs_.find(std::type_index(typeid(T)));
        if (it != configs_.end()) {
            return std::static_pointer_cast<T>(it->second);
        }
        return nullptr;
    }

    std::shared_ptr<ConfigurationProperties> get_config_by_name(
        const std::string& name) const {
        auto it = config_by_name_.find(name);
        return (it != config_by_name_.end()) ? it->second : nullptr;
    }

    void reset() {
        configs_.clear();
        config_by_name_.clear();
        config_tree_ = boost::property_tree::ptree();
    }

    const boost::property_tree::ptree& get_config_tree() const {
        return config_tree_;
    }

private:
    ConfigManager() = default;

    // Parses every registered section into a copy first; the registered
    // objects change only when all sections are valid
    void load_component_configs(const boost::property_tree::ptree& tree);

    boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);

    std::unordered_map<std::type_index,
                       std::shared_ptr<ConfigurationProperties>>
        configs_;
    std::unordered_map<std::string, std::shared_ptr<ConfigurationProperties>>
        config_by_name_;
    boost::property_tree::ptree config_tree_;
};

template <typename T>
class ConfigurationPropertiesFactory {
public:
    static std::shared_ptr<T> create_and_register() {
        auto config = std::make_shared<T>();
        ConfigManager::instance().register_configuration_properties(config);
        return config;
    }
};

}  // namespace devkit::config

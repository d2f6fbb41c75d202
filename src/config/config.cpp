#include "devkit/config/config.hpp"

#include <algorithm>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "devkit/log/logger.hpp"

namespace devkit::config {

std::optional<std::string> ConfigPaths::resolve_config_file(
    const core::Environment& env) {
    if (auto explicit_file = env.get(CONFIG_ENV_VAR)) {
        if (!explicit_file->empty()) {
            return explicit_file;
        }
    }

    auto home = env.get(env.windows() ? "USERPROFILE" : "HOME");
    if (!home || home->empty()) {
        return std::nullopt;
    }
    std::filesystem::path candidate =
        std::filesystem::path(*home) / USER_CONFIG_FILE;
    if (!env.exists(candidate)) {
        return std::nullopt;
    }
    return candidate.string();
}

ConfigFormat format_from_extension(const std::string& config_file) {
    std::string ext = std::filesystem::path(config_file).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (ext == ".json") {
        return ConfigFormat::JSON;
    }
    if (ext == ".ini") {
        return ConfigFormat::INI;
    }
    return ConfigFormat::YAML;
}

// Helper to convert YAML::Node to boost::property_tree::ptree
boost::property_tree::ptree ConfigManager::yaml_to_ptree(
    const YAML::Node& node) {
    boost::property_tree::ptree pt;
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child(it->first.as<std::string>(),
                         yaml_to_ptree(it->second));
        }
    } else if (node.IsSequence()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child("", yaml_to_ptree(*it));
        }
    } else if (node.IsScalar()) {
        pt.put("", node.as<std::string>());
    }
    return pt;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    DEVKIT_LOG_DEBUG << "Loading config file: " << config_file;

    boost::property_tree::ptree new_tree;
    try {
        switch (format) {
            case ConfigFormat::YAML: {
                YAML::Node yaml_node = YAML::LoadFile(config_file);
                new_tree = yaml_to_ptree(yaml_node);
                break;
            }
            case ConfigFormat::JSON: {
                std::ifstream ifs(config_file);
                if (!ifs) {
                    throw std::runtime_error("cannot open file");
                }
                boost::property_tree::read_json(ifs, new_tree);
                break;
            }
            case ConfigFormat::INI: {
                std::ifstream ifs(config_file);
                if (!ifs) {
                    throw std::runtime_error("cannot open file");
                }
                boost::property_tree::read_ini(ifs, new_tree);
                break;
            }
        }
    } catch (const std::exception& e) {
        DEVKIT_LOG_ERROR << "Failed to load config file: " << config_file
                         << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }

    load_component_configs(new_tree);
    config_tree_ = std::move(new_tree);
    DEVKIT_LOG_DEBUG << "Successfully loaded config file: " << config_file;
}

void ConfigManager::load_component_configs(
    const boost::property_tree::ptree& tree) {
    std::vector<std::pair<std::shared_ptr<ConfigurationProperties>,
                          std::unique_ptr<ConfigurationProperties>>>
        staged;
    for (auto& [type_id, config] : configs_) {
        const std::string& properties_name = config->properties_name();
        auto section = tree.get_child_optional(properties_name);
        if (!section) {
            DEVKIT_LOG_DEBUG << "No configuration found for properties: "
                             << properties_name << ", using defaults";
            continue;
        }

        auto candidate = config->clone();
        try {
            candidate->from_ptree(*section);
            candidate->validate();
        } catch (const std::exception& e) {
            DEVKIT_LOG_ERROR << "Failed to load configuration for properties "
                             << properties_name << ": " << e.what();
            throw std::runtime_error("Invalid '" + properties_name +
                                     "' configuration: " + e.what());
        }
        staged.emplace_back(config, std::move(candidate));
    }

    for (auto& [config, candidate] : staged) {
        config->assign(*candidate);
    }
}

}  // namespace devkit::config

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace devkit::core {

// Read-only view of the process environment. Everything the dispatcher and
// the sanity check learn about the host goes through this interface.
class Environment {
public:
    virtual ~Environment() = default;

    virtual std::optional<std::string> get(const std::string& name) const = 0;

    // Resolved path of the running executable
    virtual std::filesystem::path runtime_location() const = 0;

    virtual bool exists(const std::filesystem::path& path) const = 0;

    virtual bool windows() const = 0;

    char path_separator() const { return windows() ? ';' : ':'; }
    std::string path_key() const { return "PATH"; }

    // PATH split on the platform separator, empty segments dropped
    std::vector<std::string> search_path() const;

    // Whether a PATH entry names dir. Exact on Unix; on Windows slashes are
    // unified and case is ignored.
    bool same_directory(const std::string& entry, const std::string& dir) const;
};

// Environment backed by the live process
class SystemEnvironment : public Environment {
public:
    std::optional<std::string> get(const std::string& name) const override;
    std::filesystem::path runtime_location() const override;
    bool exists(const std::filesystem::path& path) const override;
    bool windows() const override;
};

std::vector<std::string> split_search_path(const std::string& value,
                                           char separator);

}  // namespace devkit::core

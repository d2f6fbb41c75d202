#pragma once
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "devkit/cli/command.hpp"
#include "devkit/cli/console.hpp"
#include "devkit/core/environment.hpp"

namespace devkit::cli {

using CommandFactory = std::function<std::unique_ptr<Command>(
    Console& console, const core::Environment& env)>;

struct CommandSpec {
    std::string name;
    std::string description;
    CommandFactory factory;
};

// Name -> command mapping, in registration order. Lookup is an exact,
// case-sensitive match on the name.
class CommandsMap {
public:
    // Throws std::invalid_argument for an empty or already registered name
    void builtin(const std::string& name, const std::string& description,
                 CommandFactory factory);

    template <typename T>
    void builtin(const std::string& name, const std::string& description) {
        builtin(name, description,
                [](Console& console, const core::Environment& env) {
                    return std::unique_ptr<Command>(
                        std::make_unique<T>(console, env));
                });
    }

    const CommandSpec* find(const std::string& name) const;
    bool have_command(const std::string& name) const {
        return find(name) != nullptr;
    }

    const std::vector<CommandSpec>& specs() const { return specs_; }
    std::vector<std::string> command_names() const;

private:
    std::vector<CommandSpec> specs_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace devkit::cli

#include "devkit/cli/commands_map.hpp"

#include <stdexcept>

namespace devkit::cli {

void CommandsMap::builtin(const std::string& name,
                          const std::string& description,
                          CommandFactory factory) {
    if (name.empty()) {
        throw std::invalid_argument("Command name cannot be empty");
    }
    if (!factory) {
        throw std::invalid_argument("Command '" + name + "' has no factory");
    }
    if (index_.count(name)) {
        throw std::invalid_argument("Command '" + name +
                                    "' is already registered");
    }
    index_.emplace(name, specs_.size());
    specs_.push_back({name, description, std::move(factory)});
}

const CommandSpec* CommandsMap::find(const std::string& name) const {
    auto it = index_.find(name);
    return it != index_.end() ? &specs_[it->second] : nullptr;
}

std::vector<std::string> CommandsMap::command_names() const {
    std::vector<std::string> names;
    names.reserve(specs_.size());
    for (const auto& spec : specs_) {
        names.push_back(spec.name);
    }
    return names;
}

}  // namespace devkit::cli

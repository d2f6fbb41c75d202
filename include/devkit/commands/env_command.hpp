#pragma once
#include "devkit/cli/command.hpp"
#include "devkit/core/environment.hpp"

namespace devkit::commands {

// Prints a YAML description of the installation and its PATH setup
class EnvCommand : public cli::Command {
public:
    EnvCommand(cli::Console& console, const core::Environment& env);
    int run(const std::vector<std::string>& params) override;

private:
    const core::Environment& env_;
};

}  // namespace devkit::commands

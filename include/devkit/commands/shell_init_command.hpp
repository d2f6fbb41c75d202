#pragma once
#include <string>

#include "devkit/cli/command.hpp"
#include "devkit/core/environment.hpp"

namespace devkit::commands {

// Prints the shell code that puts the omnibus bin dir ahead of the embedded
// bin dir on PATH, e.g. `eval "$(devkit shell-init bash)"`.
class ShellInitCommand : public cli::Command {
public:
    ShellInitCommand(cli::Console& console, const core::Environment& env);
    int run(const std::vector<std::string>& params) override;

private:
    void emit_posix(const std::string& path) const;
    void emit_fish(const std::vector<std::string>& dirs) const;
    void emit_powershell(const std::string& path) const;

    const core::Environment& env_;
};

}  // namespace devkit::commands

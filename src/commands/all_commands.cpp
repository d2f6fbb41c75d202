#include "devkit/commands/all_commands.hpp"

namespace devkit::commands {

void register_builtin_commands(cli::CommandsMap& commands) {
    commands.builtin<VerifyCommand>("verify",
                                    "Test the embedded kit applications");
    commands.builtin<EnvCommand>("env",
                                 "Prints environment variables used by the kit");
    commands.builtin<ShellInitCommand>(
        "shell-init",
        "Initialize your shell to use the kit as your primary toolchain");
}

}  // namespace devkit::commands

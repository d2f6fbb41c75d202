#pragma once
#include "devkit/cli/commands_map.hpp"
#include "devkit/commands/env_command.hpp"
#include "devkit/commands/shell_init_command.hpp"
#include "devkit/commands/verify_command.hpp"

namespace devkit::commands {

// Registers the commands shipped with the kit, in help-listing order
void register_builtin_commands(cli::CommandsMap& commands);

}  // namespace devkit::commands

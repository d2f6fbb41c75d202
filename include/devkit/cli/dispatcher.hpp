#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "devkit/cli/commands_map.hpp"
#include "devkit/cli/console.hpp"
#include "devkit/cli/help_renderer.hpp"
#include "devkit/core/environment.hpp"
#include "devkit/core/sanity_checker.hpp"

namespace devkit::cli {

enum class InvocationMode {
    Help,
    Version,
    RunCommand,
    InvalidOption,
    UnknownCommand
};

struct ParsedInvocation {
    InvocationMode mode = InvocationMode::Help;
    // Command name for RunCommand/UnknownCommand, the offending flag for
    // InvalidOption
    std::optional<std::string> command_name;
    std::vector<std::string> remaining_args;
};

// Top-level entry point of the `devkit` executable. Every run is
// independent: the only state is the read-only command map.
class Dispatcher {
public:
    using ExitHandler = std::function<void(int)>;

    Dispatcher(const CommandsMap& commands, Console& console,
               const core::Environment& env);

    // Called exactly once per run() with the final exit code
    void set_exit_handler(ExitHandler handler) {
        exit_handler_ = std::move(handler);
    }

    void set_sanity_check_enabled(bool enabled) {
        sanity_check_enabled_ = enabled;
    }

    // `argv` excludes the program name
    ParsedInvocation parse(const std::vector<std::string>& argv) const;

    int run(const std::vector<std::string>& argv);

private:
    int dispatch(const ParsedInvocation& invocation);
    int run_command(const CommandSpec& spec,
                    const std::vector<std::string>& params);
    int exit(int code);

    const CommandsMap& commands_;
    Console& console_;
    const core::Environment& env_;
    HelpRenderer help_;
    ExitHandler exit_handler_;
    bool sanity_check_enabled_ = true;
};

}  // namespace devkit::cli

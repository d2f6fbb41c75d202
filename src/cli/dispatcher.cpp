#include "devkit/cli/dispatcher.hpp"

#include <stdexcept>

#include "devkit/log/logger.hpp"
#include "devkit/version.hpp"

namespace devkit::cli {

namespace {

bool is_help_flag(const std::string& arg) {
    return arg == "-h" || arg == "--help";
}

bool is_version_flag(const std::string& arg) {
    return arg == "-v" || arg == "--version";
}

}  // namespace

Dispatcher::Dispatcher(const CommandsMap& commands, Console& console,
                       const core::Environment& env)
    : commands_(commands), console_(console), env_(env), help_(PROGRAM_NAME) {}

ParsedInvocation Dispatcher::parse(const std::vector<std::string>& argv) const {
    ParsedInvocation invocation;
    if (argv.empty() || is_help_flag(argv.front())) {
        invocation.mode = InvocationMode::Help;
        return invocation;
    }

    const std::string& first = argv.front();
    if (is_version_flag(first)) {
        invocation.mode = InvocationMode::Version;
        return invocation;
    }

    if (!first.empty() && first.front() == '-') {
        invocation.mode = InvocationMode::InvalidOption;
        invocation.command_name = first;
        return invocation;
    }

    invocation.command_name = first;
    invocation.remaining_args.assign(argv.begin() + 1, argv.end());
    invocation.mode = commands_.have_command(first)
                          ? InvocationMode::RunCommand
                          : InvocationMode::UnknownCommand;
    return invocation;
}

int Dispatcher::run(const std::vector<std::string>& argv) {
    return exit(dispatch(parse(argv)));
}

int Dispatcher::dispatch(const ParsedInvocation& invocation) {
    switch (invocation.mode) {
        case InvocationMode::Help:
            help_.print(console_.out, commands_);
            return 0;

        case InvocationMode::Version:
            print_version(console_.out);
            return 0;

        case InvocationMode::InvalidOption:
            console_.err << "invalid option: " << *invocation.command_name
                         << "\n";
            help_.print(console_.out, commands_);
            return 1;

        case InvocationMode::UnknownCommand:
            DEVKIT_LOG_DEBUG << "No command registered as "
                             << *invocation.command_name;
            console_.err << "Unknown command `" << *invocation.command_name
                         << "'.\n";
            help_.print(console_.out, commands_);
            return 1;

        case InvocationMode::RunCommand:
            break;
    }

    if (sanity_check_enabled_) {
        auto result = core::EnvironmentSanityChecker(env_).check();
        DEVKIT_LOG_DEBUG << "PATH sanity check: "
                         << core::to_string(result.verdict);
        if (result.message) {
            console_.out << *result.message;
        }
        if (result.blocking()) {
            return result.exit_code();
        }
    }

    return run_command(*commands_.find(*invocation.command_name),
                       invocation.remaining_args);
}

int Dispatcher::run_command(const CommandSpec& spec,
                            const std::vector<std::string>& params) {
    DEVKIT_LOG_DEBUG << "Running command " << spec.name << " with "
                     << params.size() << " argument(s)";
    try {
        auto command = spec.factory(console_, env_);
        if (!command) {
            throw std::runtime_error("command `" + spec.name +
                                     "' could not be created");
        }
        return command->run(params);
    } catch (const std::exception& e) {
        DEVKIT_LOG_ERROR << "Command " << spec.name << " failed: " << e.what();
        console_.err << "Error: " << e.what() << "\n";
        return 1;
    }
}

int Dispatcher::exit(int code) {
    if (exit_handler_) {
        exit_handler_(code);
    }
    return code;
}

}  // namespace devkit::cli

#include <iostream>
#include <string>
#include <vector>

#include "devkit/cli/dispatcher.hpp"
#include "devkit/commands/all_commands.hpp"
#include "devkit/config/cli_config.hpp"
#include "devkit/config/config.hpp"
#include "devkit/core/environment.hpp"
#include "devkit/log/logger.hpp"

namespace {

constexpr const char* LOG_LEVEL_ENV_VAR = "DEVKIT_LOG_LEVEL";

void load_configuration(const devkit::core::Environment& env) {
    auto config_file = devkit::config::ConfigPaths::resolve_config_file(env);
    if (!config_file) {
        return;
    }
    try {
        devkit::config::ConfigManager::instance().load_config(
            *config_file, devkit::config::format_from_extension(*config_file));
    } catch (const std::exception& e) {
        std::cerr << "WARN: ignoring configuration: " << e.what() << std::endl;
    }
}

void apply_log_level_override(const devkit::core::Environment& env,
                              devkit::log::LogConfig& log_config) {
    auto level = env.get(LOG_LEVEL_ENV_VAR);
    if (!level || level->empty()) {
        return;
    }
    try {
        log_config.global_level =
            devkit::log::LogConfig::level_from_string(*level);
        log_config.console.enabled = true;
    } catch (const std::invalid_argument& e) {
        std::cerr << "WARN: " << LOG_LEVEL_ENV_VAR << ": " << e.what()
                  << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        devkit::core::SystemEnvironment env;

        auto log_config = devkit::config::ConfigurationPropertiesFactory<
            devkit::log::LogConfig>::create_and_register();
        auto cli_config = devkit::config::ConfigurationPropertiesFactory<
            devkit::config::CliConfig>::create_and_register();

        // Quiet until the configured sinks are known
        devkit::log::Logger::init(*log_config);
        load_configuration(env);
        apply_log_level_override(env, *log_config);
        devkit::log::Logger::init(*log_config);

        devkit::cli::CommandsMap commands;
        devkit::commands::register_builtin_commands(commands);

        auto console = devkit::cli::Console::standard();
        devkit::cli::Dispatcher dispatcher(commands, console, env);
        dispatcher.set_sanity_check_enabled(cli_config->sanity_check);

        std::vector<std::string> args(argv + 1, argv + argc);
        int code = dispatcher.run(args);
        std::cout.flush();
        return code;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

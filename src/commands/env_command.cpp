#include "devkit/commands/env_command.hpp"

#include <yaml-cpp/yaml.h>

#include "devkit/core/omnibus.hpp"
#include "devkit/core/sanity_checker.hpp"
#include "devkit/version.hpp"

namespace devkit::commands {

EnvCommand::EnvCommand(cli::Console& console, const core::Environment& env)
    : cli::Command("env", "Prints environment variables used by the kit",
                   console),
      env_(env) {
    set_usage("devkit env");
}

int EnvCommand::run(const std::vector<std::string>& params) {
    int status = 0;
    auto ctx = parse_options(params, status);
    if (!ctx) {
        return status;
    }

    core::OmnibusLayout layout(env_);
    const bool omnibus = layout.installed();

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << PRODUCT_NAME << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "Version" << YAML::Value << VERSION;
    out << YAML::Key << "Platform" << YAML::Value
        << (env_.windows() ? "windows" : "unix");
    out << YAML::Key << "Omnibus Install" << YAML::Value << omnibus;
    if (omnibus) {
        out << YAML::Key << "Install Directory" << YAML::Value
            << core::display_path(layout.root());
        out << YAML::Key << "Bin Directory" << YAML::Value
            << core::display_path(layout.bin_dir());
        out << YAML::Key << "Embedded Bin Directory" << YAML::Value
            << core::display_path(layout.embedded_bin_dir());
    }
    out << YAML::Key << "PATH Check" << YAML::Value
        << core::to_string(core::EnvironmentSanityChecker(env_).check().verdict);
    out << YAML::EndMap;

    out << YAML::Key << "PATH" << YAML::Value << YAML::BeginSeq;
    for (const auto& entry : env_.search_path()) {
        out << entry;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    console_.out << out.c_str() << "\n";
    return 0;
}

}  // namespace devkit::commands

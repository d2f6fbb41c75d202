#include "devkit/commands/verify_command.hpp"

#include <algorithm>
#include <filesystem>

#include "devkit/core/omnibus.hpp"
#include "devkit/log/logger.hpp"

namespace devkit::commands {

VerifyCommand::VerifyCommand(cli::Console& console,
                             const core::Environment& env)
    : cli::Command("verify", "Test the embedded kit applications", console),
      env_(env) {
    add_bool_flag_with_short("verbose", "V", "Print the checked paths");
    set_usage("devkit verify [COMPONENT...] [OPTIONS]")
        .set_long_description(
            "Checks the install layout. Components: bin, embedded-bin. "
            "All components are checked when none is given. An install "
            "without its apps marker is rejected before any component.");
}

const std::vector<std::string>& VerifyCommand::components() {
    static const std::vector<std::string> names = {"bin", "embedded-bin"};
    return names;
}

int VerifyCommand::run(const std::vector<std::string>& params) {
    int status = 0;
    auto ctx = parse_options(params, status);
    if (!ctx) {
        return status;
    }

    std::vector<std::string> selected = ctx->args();
    for (const auto& name : selected) {
        if (std::find(components().begin(), components().end(), name) ==
            components().end()) {
            console_.err << "Component " << name << " does not exist.\n";
            return 1;
        }
    }
    if (selected.empty()) {
        selected = components();
    }

    core::OmnibusLayout layout(env_);
    try {
        layout.root();
    } catch (const core::OmnibusInstallNotFound& e) {
        console_.err << "Error: " << e.what() << "\n";
        return 1;
    }

    const bool verbose = ctx->get_bool_flag("verbose");
    int failures = 0;
    for (const auto& name : selected) {
        const std::filesystem::path dir =
            name == "bin" ? layout.bin_dir() : layout.embedded_bin_dir();

        const bool ok = env_.exists(dir);
        DEVKIT_LOG_DEBUG << "verify " << name << ": " << core::display_path(dir)
                         << (ok ? " present" : " missing");
        console_.out << "[" << (ok ? "PASS" : "FAIL") << "] " << name;
        if (verbose || !ok) {
            console_.out << " (" << core::display_path(dir) << ")";
        }
        console_.out << "\n";
        if (!ok) {
            ++failures;
        }
    }

    console_.out << "Verification of " << selected.size()
                 << " component(s) " << (failures == 0 ? "succeeded" : "failed")
                 << ".\n";
    return failures == 0 ? 0 : 1;
}

}  // namespace devkit::commands

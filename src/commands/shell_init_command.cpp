#include "devkit/commands/shell_init_command.hpp"

#include <algorithm>
#include <array>

#include "devkit/core/omnibus.hpp"
#include "devkit/log/logger.hpp"

namespace devkit::commands {

namespace {

constexpr std::array<const char*, 5> SUPPORTED_SHELLS = {
    "bash", "zsh", "sh", "fish", "powershell"};

std::string join(const std::vector<std::string>& parts, char separator) {
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += part;
    }
    return joined;
}

}  // namespace

ShellInitCommand::ShellInitCommand(cli::Console& console,
                                   const core::Environment& env)
    : cli::Command("shell-init",
                   "Initialize your shell to use the kit as your primary "
                   "toolchain",
                   console),
      env_(env) {
    add_flag("omnibus-dir", "Alternate path to the omnibus install root");
    set_usage("devkit shell-init SHELL_NAME [OPTIONS]")
        .set_long_description(
            "Prints the environment setup for SHELL_NAME (bash, zsh, sh, "
            "fish or powershell) so that the kit's bin dir is searched "
            "before its embedded runtime.")
        .set_example(
            "  eval \"$(devkit shell-init bash)\"\n"
            "  devkit shell-init fish | source");
}

int ShellInitCommand::run(const std::vector<std::string>& params) {
    int status = 0;
    auto ctx = parse_options(params, status);
    if (!ctx) {
        return status;
    }

    if (ctx->args().empty()) {
        console_.err << "Please specify what shell you are using\n\n";
        print_help();
        return 1;
    }

    const std::string shell = ctx->arg(0);
    if (std::find(SUPPORTED_SHELLS.begin(), SUPPORTED_SHELLS.end(), shell) ==
        SUPPORTED_SHELLS.end()) {
        console_.err << "Shell `" << shell << "' is not currently supported\n"
                     << "Supported shells are: bash zsh sh fish powershell\n";
        return 1;
    }

    std::vector<std::string> dirs;
    try {
        auto layout = ctx->is_user_provided("omnibus-dir")
                          ? core::OmnibusLayout(env_, ctx->get_flag("omnibus-dir"))
                          : core::OmnibusLayout(env_);
        dirs.push_back(core::display_path(layout.bin_dir()));
        dirs.push_back(core::display_path(layout.embedded_bin_dir()));
    } catch (const core::OmnibusInstallNotFound& e) {
        DEVKIT_LOG_DEBUG << "shell-init: " << e.what();
        console_.err << "Error: " << e.what() << "\n"
                     << "Use --omnibus-dir to point at the install root.\n";
        return 1;
    }

    if (shell == "fish") {
        emit_fish(dirs);
        return 0;
    }

    const char separator = shell == "powershell" ? ';' : env_.path_separator();
    std::vector<std::string> path_entries = dirs;
    if (auto current = env_.get(env_.path_key())) {
        // Drop stale copies so repeated evals don't grow PATH
        for (const auto& entry :
             core::split_search_path(*current, env_.path_separator())) {
            if (std::none_of(dirs.begin(), dirs.end(),
                             [&](const std::string& dir) {
                                 return env_.same_directory(entry, dir);
                             })) {
                path_entries.push_back(entry);
            }
        }
    }

    if (shell == "powershell") {
        emit_powershell(join(path_entries, separator));
    } else {
        emit_posix(join(path_entries, separator));
    }
    return 0;
}

void ShellInitCommand::emit_posix(const std::string& path) const {
    console_.out << "export PATH=\"" << path << "\"\n";
}

void ShellInitCommand::emit_fish(const std::vector<std::string>& dirs) const {
    // fish keeps PATH as a list; prepend in reverse so the bin dir ends first
    for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
        console_.out << "fish_add_path --move --prepend --path \"" << *it
                     << "\"\n";
    }
}

void ShellInitCommand::emit_powershell(const std::string& path) const {
    console_.out << "$env:PATH=\"" << path << "\"\n";
}

}  // namespace devkit::commands

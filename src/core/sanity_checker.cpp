#include "devkit/core/sanity_checker.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

#include "devkit/core/omnibus.hpp"
#include "devkit/log/logger.hpp"
#include "devkit/version.hpp"

namespace devkit::core {

namespace {

// Printed to stdout ahead of shell-init output that is meant for eval, so
// every line is a shell comment and nothing can be expanded
std::string shell_init_hint() {
    std::ostringstream ss;
    ss << "# Run '" << PROGRAM_NAME
       << " shell-init SHELL_NAME' to print the commands that set up your "
          "PATH correctly.\n";
    return ss.str();
}

std::string missing_bin_dir_message(const std::string& bin_dir,
                                    const std::string& embedded_bin_dir) {
    std::ostringstream ss;
    ss << "# WARN: " << embedded_bin_dir << " is on your PATH but " << bin_dir
       << " is not.\n"
       << "# To use the tools shipped with " << PRODUCT_NAME
       << " you must add " << bin_dir << " to your PATH, ahead of "
       << embedded_bin_dir << ".\n"
       << shell_init_hint() << "#\n";
    return ss.str();
}

std::string wrong_order_message(const std::string& bin_dir,
                                const std::string& embedded_bin_dir) {
    std::ostringstream ss;
    ss << "# WARN: " << embedded_bin_dir << " comes before " << bin_dir
       << " on your PATH.\n"
       << "# Programs from the embedded runtime will shadow the tools shipped "
          "with "
       << PRODUCT_NAME << ", please reverse that order.\n"
       << shell_init_hint() << "#\n";
    return ss.str();
}

}  // namespace

std::string to_string(SanityVerdict verdict) {
    switch (verdict) {
        case SanityVerdict::Ok:
            return "ok";
        case SanityVerdict::WarnWrongOrder:
            return "wrong-order";
        case SanityVerdict::WarnMissingEmbedded:
            return "missing-bin-dir";
        case SanityVerdict::SkippedNoInstall:
            return "skipped";
    }
    return "unknown";
}

SanityResult EnvironmentSanityChecker::check() const {
    OmnibusLayout layout(env_);

    std::string bin_dir;
    std::string embedded_bin_dir;
    try {
        bin_dir = display_path(layout.bin_dir());
        embedded_bin_dir = display_path(layout.embedded_bin_dir());
    } catch (const std::exception& e) {
        DEVKIT_LOG_DEBUG << "Skipping PATH sanity check: " << e.what();
        return {SanityVerdict::SkippedNoInstall, std::nullopt};
    }

    const std::vector<std::string> entries = env_.search_path();
    auto index_of = [&](const std::string& dir) {
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&](const std::string& entry) {
                                   return env_.same_directory(entry, dir);
                               });
        return it == entries.end() ? std::optional<std::size_t>{}
                                   : std::optional<std::size_t>{
                                         static_cast<std::size_t>(
                                             it - entries.begin())};
    };

    const auto bin_index = index_of(bin_dir);
    const auto embedded_index = index_of(embedded_bin_dir);

    if (!embedded_index) {
        return {SanityVerdict::Ok, std::nullopt};
    }
    if (!bin_index) {
        DEVKIT_LOG_DEBUG << "PATH has " << embedded_bin_dir << " without "
                         << bin_dir;
        return {SanityVerdict::WarnMissingEmbedded,
                missing_bin_dir_message(bin_dir, embedded_bin_dir)};
    }
    if (*embedded_index < *bin_index) {
        DEVKIT_LOG_DEBUG << "PATH has " << embedded_bin_dir << " before "
                         << bin_dir;
        return {SanityVerdict::WarnWrongOrder,
                wrong_order_message(bin_dir, embedded_bin_dir)};
    }
    return {SanityVerdict::Ok, std::nullopt};
}

}  // namespace devkit::core

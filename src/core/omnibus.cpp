#include "devkit/core/omnibus.hpp"

#include "devkit/version.hpp"

namespace devkit::core {

OmnibusLayout::OmnibusLayout(const Environment& env) : env_(env) {}

OmnibusLayout::OmnibusLayout(const Environment& env,
                             std::filesystem::path root)
    : env_(env), root_override_(std::move(root)) {}

bool OmnibusLayout::installed() const noexcept {
    try {
        root();
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::filesystem::path OmnibusLayout::derive_root() const {
    std::filesystem::path location;
    try {
        location = env_.runtime_location();
    } catch (const std::exception& e) {
        throw OmnibusInstallNotFound(e.what());
    }

    // <root>/embedded/bin/<executable>
    auto root = location.parent_path().parent_path().parent_path();
    if (root.empty() || !root.has_relative_path()) {
        throw OmnibusInstallNotFound("unexpected executable location " +
                                     display_path(location));
    }
    return root;
}

std::filesystem::path OmnibusLayout::root() const {
    if (root_override_) {
        return *root_override_;
    }

    auto root = derive_root();
    auto marker_path = root / "embedded" / "apps" / PROGRAM_NAME;
    if (!env_.exists(marker_path)) {
        throw OmnibusInstallNotFound("missing " + display_path(marker_path));
    }
    return root;
}

std::filesystem::path OmnibusLayout::bin_dir() const { return root() / "bin"; }

std::filesystem::path OmnibusLayout::embedded_bin_dir() const {
    return root() / "embedded" / "bin";
}

std::filesystem::path OmnibusLayout::apps_dir() const {
    return root() / "embedded" / "apps";
}

std::filesystem::path OmnibusLayout::marker() const {
    return apps_dir() / PROGRAM_NAME;
}

std::string display_path(const std::filesystem::path& path) {
    return path.generic_string();
}

}  // namespace devkit::core

#pragma once
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "devkit/core/environment.hpp"

namespace devkit::core {

class OmnibusInstallNotFound : public std::runtime_error {
public:
    OmnibusInstallNotFound()
        : std::runtime_error("devkit is not running from an omnibus install") {}
    explicit OmnibusInstallNotFound(const std::string& detail)
        : std::runtime_error(
              "devkit is not running from an omnibus install: " + detail) {}
};

// Directory layout of a self-contained ("omnibus") installation:
//
//   <root>/bin                  user-facing binstubs, first on PATH
//   <root>/embedded/bin         bundled runtime, including this executable
//   <root>/embedded/apps/devkit marker proving the layout is ours
//
// The root is three levels above the running executable. All accessors
// throw OmnibusInstallNotFound when the marker is missing or the location
// of the executable cannot be determined.
class OmnibusLayout {
public:
    explicit OmnibusLayout(const Environment& env);

    // Uses `root` as-is; no marker check is performed
    OmnibusLayout(const Environment& env, std::filesystem::path root);

    bool installed() const noexcept;

    std::filesystem::path root() const;
    std::filesystem::path bin_dir() const;
    std::filesystem::path embedded_bin_dir() const;
    std::filesystem::path apps_dir() const;
    std::filesystem::path marker() const;

private:
    std::filesystem::path derive_root() const;

    const Environment& env_;
    std::optional<std::filesystem::path> root_override_;
};

// Generic (forward slash) string form used for PATH comparisons and output
std::string display_path(const std::filesystem::path& path);

}  // namespace devkit::core

#pragma once
#include <optional>
#include <string>

#include "devkit/core/environment.hpp"

namespace devkit::core {

enum class SanityVerdict {
    Ok,
    WarnWrongOrder,       // embedded bin dir precedes the bin dir
    WarnMissingEmbedded,  // embedded bin dir on PATH, bin dir absent
    SkippedNoInstall      // not an omnibus install
};

std::string to_string(SanityVerdict verdict);

struct SanityResult {
    SanityVerdict verdict = SanityVerdict::Ok;
    std::optional<std::string> message;

    // Environment problems are advisory; none of the verdicts stop a run
    bool blocking() const { return false; }
    int exit_code() const { return 0; }
};

// Checks that an omnibus install's bin dir takes precedence over its
// embedded bin dir on PATH. Never throws; layout detection failures yield
// SkippedNoInstall.
class EnvironmentSanityChecker {
public:
    explicit EnvironmentSanityChecker(const Environment& env) : env_(env) {}

    SanityResult check() const;

private:
    const Environment& env_;
};

}  // namespace devkit::core

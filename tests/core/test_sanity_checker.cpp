// tests/core/test_sanity_checker.cpp
#define BOOST_TEST_MODULE SanityCheckerTests
#include <boost/test/unit_test.hpp>
#include <sstream>

#include "devkit/core/sanity_checker.hpp"
#include "support/fake_environment.hpp"

using devkit::core::EnvironmentSanityChecker;
using devkit::core::SanityVerdict;

namespace {

bool contains(const std::optional<std::string>& text, const std::string& s) {
    return text && text->find(s) != std::string::npos;
}

// Warnings precede shell-init output that users eval, so each line must be
// a shell comment with nothing to expand
void check_shell_comment(const std::optional<std::string>& text) {
    BOOST_REQUIRE(text);
    BOOST_CHECK(text->find('`') == std::string::npos);
    BOOST_CHECK(text->find('$') == std::string::npos);
    std::istringstream lines(*text);
    std::string line;
    while (std::getline(lines, line)) {
        BOOST_CHECK_MESSAGE(!line.empty() && line[0] == '#',
                            "not a comment: " << line);
    }
}

}  // namespace

struct UnixOmnibusFixture {
    devkit::test::FakeEnvironment env;
    UnixOmnibusFixture() { env.install_omnibus("/opt/devkit"); }
};

struct WindowsOmnibusFixture {
    devkit::test::FakeEnvironment env;
    WindowsOmnibusFixture() {
        env.is_windows = true;
        env.install_omnibus("c:/opscode/devkit", "devkit.exe");
    }
};

BOOST_FIXTURE_TEST_SUITE(UnixSanityTestSuite, UnixOmnibusFixture)

BOOST_AUTO_TEST_CASE(test_embedded_first_is_wrong_order) {
    env.set_path("/usr/bin:/opt/devkit/embedded/bin:/opt/devkit/bin");
    auto result = EnvironmentSanityChecker(env).check();
    BOOST_CHECK(result.verdict == SanityVerdict::WarnWrongOrder);
    BOOST_CHECK(contains(result.message, "please reverse that order"));
    BOOST_CHECK(contains(result.message, "devkit shell-init"));
    BOOST_CHECK(contains(result.message, "/opt/devkit/embedded/bin"));
    BOOST_CHECK(!result.blocking());
    BOOST_CHECK_EQUAL(result.exit_code(), 0);
}

BOOST_AUTO_TEST_CASE(test_only_embedded_present) {
    env.set_path("/opt/devkit/embedded/bin:/usr/bin");
    auto result = EnvironmentSanityChecker(env).check();
    BOOST_CHECK(result.verdict == SanityVerdict::WarnMissingEmbedded);
    BOOST_CHECK(contains(result.message, "you must add"));
    BOOST_CHECK(contains(result.message, "devkit shell-init"));
    BOOST_CHECK(!result.blocking());
}

BOOST_AUTO_TEST_CASE(test_warnings_are_shell_comments) {
    env.set_path("/opt/devkit/embedded/bin:/opt/devkit/bin");
    check_shell_comment(EnvironmentSanityChecker(env).check().message);

    env.set_path("/opt/devkit/embedded/bin");
    check_shell_comment(EnvironmentSanityChecker(env).check().message);
}

BOOST_AUTO_TEST_CASE(test_correct_order) {
    env.set_path("/opt/devkit/bin:/usr/bin:/opt/devkit/embedded/bin");
    auto result = EnvironmentSanityChecker(env).check();
    BOOST_CHECK(result.verdict == SanityVerdict::Ok);
    BOOST_CHECK(!result.message);
}

BOOST_AUTO_TEST_CASE(test_only_bin_present) {
    env.set_path("/opt/devkit/bin");
    BOOST_CHECK(EnvironmentSanityChecker(env).check().verdict ==
                SanityVerdict::Ok);
}

BOOST_AUTO_TEST_CASE(test_neither_present) {
    env.set_path("/usr/local/bin:/usr/bin");
    BOOST_CHECK(EnvironmentSanityChecker(env).check().verdict ==
                SanityVerdict::Ok);

    env.vars.erase("PATH");
    BOOST_CHECK(EnvironmentSanityChecker(env).check().verdict ==
                SanityVerdict::Ok);
}

BOOST_AUTO_TEST_CASE(test_exact_match_only) {
    // Trailing slashes and case differences are not the same directory
    env.set_path("/opt/devkit/embedded/bin/:/OPT/devkit/bin");
    BOOST_CHECK(EnvironmentSanityChecker(env).check().verdict ==
                SanityVerdict::Ok);

    env.set_path("/opt/devkit/embedded/bin:/opt/devkit/bin/");
    BOOST_CHECK(EnvironmentSanityChecker(env).check().verdict ==
                SanityVerdict::WarnMissingEmbedded);
}

BOOST_AUTO_TEST_CASE(test_first_occurrence_decides) {
    env.set_path("/opt/devkit/bin:/opt/devkit/embedded/bin:/opt/devkit/bin");
    BOOST_CHECK(EnvironmentSanityChecker(env).check().verdict ==
                SanityVerdict::Ok);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(WindowsSanityTestSuite, WindowsOmnibusFixture)

BOOST_AUTO_TEST_CASE(test_embedded_first_is_wrong_order) {
    env.set_path("C:\\opscode\\devkit\\embedded\\bin;C:\\opscode\\devkit\\bin");
    auto result = EnvironmentSanityChecker(env).check();
    BOOST_CHECK(result.verdict == SanityVerdict::WarnWrongOrder);
    BOOST_CHECK(contains(result.message, "please reverse that order"));
}

BOOST_AUTO_TEST_CASE(test_only_embedded_present) {
    env.set_path("C:\\opscode\\devkit\\embedded\\bin");
    auto result = EnvironmentSanityChecker(env).check();
    BOOST_CHECK(result.verdict == SanityVerdict::WarnMissingEmbedded);
    BOOST_CHECK(contains(result.message, "you must add"));
}

BOOST_AUTO_TEST_CASE(test_correct_order) {
    env.set_path("C:\\opscode\\devkit\\bin;C:\\opscode\\devkit\\embedded\\bin");
    BOOST_CHECK(EnvironmentSanityChecker(env).check().verdict ==
                SanityVerdict::Ok);
}

BOOST_AUTO_TEST_CASE(test_only_bin_present) {
    env.set_path("C:\\opscode\\devkit\\bin");
    BOOST_CHECK(EnvironmentSanityChecker(env).check().verdict ==
                SanityVerdict::Ok);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(NoInstallSanityTestSuite)

BOOST_AUTO_TEST_CASE(test_skipped_when_marker_missing) {
    devkit::test::FakeEnvironment env;
    env.location = "/Users/bog/.lots_o_tools/2.1.2/bin/devkit";
    env.set_path("/Users/bog/.lots_o_tools/embedded/bin");

    auto result = EnvironmentSanityChecker(env).check();
    BOOST_CHECK(result.verdict == SanityVerdict::SkippedNoInstall);
    BOOST_CHECK(!result.message);
}

BOOST_AUTO_TEST_CASE(test_skipped_when_location_unknown) {
    devkit::test::FakeEnvironment env;
    env.set_path("/opt/devkit/embedded/bin");
    BOOST_CHECK_NO_THROW(EnvironmentSanityChecker(env).check());
    BOOST_CHECK(EnvironmentSanityChecker(env).check().verdict ==
                SanityVerdict::SkippedNoInstall);
}

BOOST_AUTO_TEST_CASE(test_verdict_names) {
    BOOST_CHECK_EQUAL(devkit::core::to_string(SanityVerdict::Ok), "ok");
    BOOST_CHECK_EQUAL(devkit::core::to_string(SanityVerdict::WarnWrongOrder),
                      "wrong-order");
    BOOST_CHECK_EQUAL(
        devkit::core::to_string(SanityVerdict::WarnMissingEmbedded),
        "missing-bin-dir");
    BOOST_CHECK_EQUAL(devkit::core::to_string(SanityVerdict::SkippedNoInstall),
                      "skipped");
}

BOOST_AUTO_TEST_SUITE_END()

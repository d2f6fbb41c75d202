// tests/core/test_omnibus.cpp
#define BOOST_TEST_MODULE OmnibusTests
#include <boost/test/unit_test.hpp>

#include "devkit/core/omnibus.hpp"
#include "support/fake_environment.hpp"

using devkit::core::display_path;
using devkit::core::OmnibusInstallNotFound;
using devkit::core::OmnibusLayout;

BOOST_AUTO_TEST_SUITE(OmnibusTestSuite)

BOOST_AUTO_TEST_CASE(test_layout_derived_from_executable) {
    devkit::test::FakeEnvironment env;
    env.install_omnibus("/opt/devkit");

    OmnibusLayout layout(env);
    BOOST_CHECK(layout.installed());
    BOOST_CHECK_EQUAL(display_path(layout.root()), "/opt/devkit");
    BOOST_CHECK_EQUAL(display_path(layout.bin_dir()), "/opt/devkit/bin");
    BOOST_CHECK_EQUAL(display_path(layout.embedded_bin_dir()),
                      "/opt/devkit/embedded/bin");
    BOOST_CHECK_EQUAL(display_path(layout.apps_dir()),
                      "/opt/devkit/embedded/apps");
    BOOST_CHECK_EQUAL(display_path(layout.marker()),
                      "/opt/devkit/embedded/apps/devkit");
}

BOOST_AUTO_TEST_CASE(test_windows_style_root) {
    devkit::test::FakeEnvironment env;
    env.is_windows = true;
    env.install_omnibus("c:/opscode/devkit", "devkit.exe");

    OmnibusLayout layout(env);
    BOOST_CHECK_EQUAL(display_path(layout.bin_dir()), "c:/opscode/devkit/bin");
}

BOOST_AUTO_TEST_CASE(test_missing_marker_throws) {
    devkit::test::FakeEnvironment env;
    env.location = "/Users/bog/.lots_o_tools/2.1.2/bin/devkit";

    OmnibusLayout layout(env);
    BOOST_CHECK(!layout.installed());
    BOOST_CHECK_THROW(layout.root(), OmnibusInstallNotFound);
    BOOST_CHECK_THROW(layout.bin_dir(), OmnibusInstallNotFound);
    BOOST_CHECK_THROW(layout.embedded_bin_dir(), OmnibusInstallNotFound);
    BOOST_CHECK_THROW(layout.apps_dir(), OmnibusInstallNotFound);
}

BOOST_AUTO_TEST_CASE(test_unknown_location_throws) {
    devkit::test::FakeEnvironment env;
    OmnibusLayout layout(env);
    BOOST_CHECK(!layout.installed());
    BOOST_CHECK_THROW(layout.root(), OmnibusInstallNotFound);
}

BOOST_AUTO_TEST_CASE(test_shallow_location_throws) {
    devkit::test::FakeEnvironment env;
    env.location = "/devkit";
    env.existing_paths.insert("/embedded/apps/devkit");
    BOOST_CHECK_THROW(OmnibusLayout(env).root(), OmnibusInstallNotFound);
}

BOOST_AUTO_TEST_CASE(test_explicit_root_skips_detection) {
    devkit::test::FakeEnvironment env;
    OmnibusLayout layout(env, "/srv/kit");
    BOOST_CHECK(layout.installed());
    BOOST_CHECK_EQUAL(display_path(layout.embedded_bin_dir()),
                      "/srv/kit/embedded/bin");
}

BOOST_AUTO_TEST_SUITE_END()

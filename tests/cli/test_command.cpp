// tests/cli/test_command.cpp
#define BOOST_TEST_MODULE CommandTests
#include <boost/test/unit_test.hpp>
#include <sstream>

#include "devkit/cli/command.hpp"

namespace {

// Exposes the option parsing of the base class
class FlagCommand : public devkit::cli::Command {
public:
    explicit FlagCommand(devkit::cli::Console& console)
        : devkit::cli::Command("flags", "Flag parsing fixture", console) {
        add_flag_with_short("output", "o", "Output file", "out.txt");
        add_bool_flag("force", "Overwrite files");
        set_usage("devkit flags [OPTIONS] FILE...");
    }

    int run(const std::vector<std::string>& params) override {
        int status = 0;
        auto ctx = parse_options(params, status);
        if (!ctx) {
            return status;
        }
        last = *ctx;
        return 0;
    }

    devkit::cli::CommandContext last;
};

struct CommandFixture {
    std::ostringstream out;
    std::ostringstream err;
    devkit::cli::Console console{out, err};
    FlagCommand command{console};
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(CommandTestSuite, CommandFixture)

BOOST_AUTO_TEST_CASE(test_defaults_and_positionals) {
    BOOST_CHECK_EQUAL(command.run({"a.txt", "b.txt"}), 0);
    BOOST_CHECK_EQUAL(command.last.get_flag("output"), "out.txt");
    BOOST_CHECK(!command.last.is_user_provided("output"));
    BOOST_CHECK(!command.last.get_bool_flag("force"));
    BOOST_REQUIRE_EQUAL(command.last.args().size(), 2u);
    BOOST_CHECK_EQUAL(command.last.arg(0), "a.txt");
    BOOST_CHECK_EQUAL(command.last.arg(1), "b.txt");
    BOOST_CHECK_EQUAL(command.last.arg(2), "");
}

BOOST_AUTO_TEST_CASE(test_user_flags) {
    BOOST_CHECK_EQUAL(command.run({"-o", "x.log", "--force", "in"}), 0);
    BOOST_CHECK_EQUAL(command.last.get_flag("output"), "x.log");
    BOOST_CHECK(command.last.is_user_provided("output"));
    BOOST_CHECK(command.last.get_bool_flag("force"));
    BOOST_CHECK_EQUAL(command.last.arg(0), "in");
}

BOOST_AUTO_TEST_CASE(test_help_flag_prints_help) {
    BOOST_CHECK_EQUAL(command.run({"--help"}), 0);
    BOOST_CHECK(out.str().find("flags - Flag parsing fixture") !=
                std::string::npos);
    BOOST_CHECK(out.str().find("Usage: devkit flags [OPTIONS] FILE...") !=
                std::string::npos);
    BOOST_CHECK(out.str().find("(default: out.txt)") != std::string::npos);
    BOOST_CHECK(err.str().empty());
}

BOOST_AUTO_TEST_CASE(test_unknown_flag_is_an_error) {
    BOOST_CHECK_EQUAL(command.run({"--bogus"}), 1);
    BOOST_CHECK(err.str().find("Error: ") == 0);
    BOOST_CHECK(err.str().find("bogus") != std::string::npos);
    BOOST_CHECK(out.str().find("Flags:") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

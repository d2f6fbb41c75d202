#include "devkit/cli/command.hpp"

#include <boost/program_options.hpp>
#include <iomanip>

#include "devkit/log/logger.hpp"

namespace po = boost::program_options;

namespace devkit::cli {

namespace {

constexpr const char* POSITIONAL_ARGS = "__args";

}  // namespace

Command::Command(const std::string& name, const std::string& description,
                 Console& console)
    : console_(console), name_(name), description_(description) {}

void Command::add_flag(const std::string& name, const std::string& description,
                       const std::string& default_value) {
    flags_.push_back({name, "", description, default_value, "string"});
}

void Command::add_flag_with_short(const std::string& name,
                                  const std::string& short_name,
                                  const std::string& description,
                                  const std::string& default_value) {
    flags_.push_back({name, short_name, description, default_value, "string"});
}

void Command::add_bool_flag(const std::string& name,
                            const std::string& description) {
    flags_.push_back({name, "", description, "false", "bool"});
}

void Command::add_bool_flag_with_short(const std::string& name,
                                       const std::string& short_name,
                                       const std::string& description) {
    flags_.push_back({name, short_name, description, "false", "bool"});
}

std::optional<CommandContext> Command::parse_options(
    const std::vector<std::string>& params, int& exit_code) const {
    po::options_description desc("Options");
    desc.add_options()("help,h", "Show help message");

    for (const auto& flag : flags_) {
        std::string option_spec = flag.name;
        if (!flag.short_name.empty()) {
            option_spec += "," + flag.short_name;
        }

        if (flag.type == "bool") {
            desc.add_options()(option_spec.c_str(), flag.description.c_str());
        } else {
            desc.add_options()(option_spec.c_str(), po::value<std::string>(),
                               flag.description.c_str());
        }
    }

    po::options_description hidden;
    hidden.add_options()(POSITIONAL_ARGS,
                         po::value<std::vector<std::string>>());

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add(POSITIONAL_ARGS, -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(params)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        DEVKIT_LOG_DEBUG << name_ << ": option parsing failed: " << e.what();
        console_.err << "Error: " << e.what() << "\n";
        print_help();
        exit_code = 1;
        return std::nullopt;
    }

    if (vm.count("help")) {
        print_help();
        exit_code = 0;
        return std::nullopt;
    }

    CommandContext ctx;
    for (const auto& flag : flags_) {
        if (vm.count(flag.name)) {
            if (flag.type == "bool") {
                ctx.set_user_flag(flag.name, "true");
            } else {
                ctx.set_user_flag(flag.name, vm[flag.name].as<std::string>());
            }
        } else {
            ctx.set_flag(flag.name, flag.default_value);
        }
    }

    if (vm.count(POSITIONAL_ARGS)) {
        for (const auto& arg :
             vm[POSITIONAL_ARGS].as<std::vector<std::string>>()) {
            ctx.add_arg(arg);
        }
    }

    exit_code = 0;
    return ctx;
}

void Command::print_help() const {
    auto& out = console_.out;
    out << name_ << " - " << description_ << "\n\n";

    if (!long_description_.empty()) {
        out << long_description_ << "\n\n";
    }

    if (!usage_.empty()) {
        out << "Usage: " << usage_ << "\n\n";
    } else {
        out << "Usage: " << name_ << " [OPTIONS]\n\n";
    }

    out << "Flags:\n";
    out << "  --" << std::left << std::setw(14) << "help"
        << "-h, Show help message\n";
    for (const auto& flag : flags_) {
        out << "  --" << std::left << std::setw(14) << flag.name;
        if (!flag.short_name.empty()) {
            out << "-" << flag.short_name << ", ";
        } else {
            out << "    ";
        }
        out << flag.description;
        if (flag.type != "bool" && !flag.default_value.empty()) {
            out << " (default: " << flag.default_value << ")";
        }
        out << "\n";
    }

    if (!example_.empty()) {
        out << "\nExamples:\n" << example_ << "\n";
    }
}

std::string CommandContext::get_flag(const std::string& name) const {
    auto it = flags_.find(name);
    return it != flags_.end() ? it->second : "";
}

bool CommandContext::get_bool_flag(const std::string& name) const {
    std::string value = get_flag(name);
    return value == "true" || value == "1";
}

}  // namespace devkit::cli

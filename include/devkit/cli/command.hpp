#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "devkit/cli/console.hpp"

namespace devkit::cli {

// Flag values and positional arguments of one command invocation
class CommandContext {
public:
    void set_flag(const std::string& name, const std::string& value) {
        flags_[name] = value;
    }
    void set_user_flag(const std::string& name, const std::string& value) {
        flags_[name] = value;
        user_provided_flags_.insert(name);
    }
    std::string get_flag(const std::string& name) const;
    bool get_bool_flag(const std::string& name) const;
    bool is_user_provided(const std::string& name) const {
        return user_provided_flags_.count(name) > 0;
    }

    void add_arg(const std::string& arg) { args_.emplace_back(arg); }
    const std::vector<std::string>& args() const { return args_; }
    std::string arg(size_t index) const {
        return index < args_.size() ? args_[index] : "";
    }

private:
    std::unordered_map<std::string, std::string> flags_;
    std::unordered_set<std::string> user_provided_flags_;
    std::vector<std::string> args_;
};

// A subcommand: receives the arguments that follow its name on the command
// line and returns the process exit code.
class Command {
public:
    Command(const std::string& name, const std::string& description,
            Console& console);
    virtual ~Command() = default;

    std::string name() const { return name_; }
    std::string description() const { return description_; }
    std::string long_description() const { return long_description_; }
    std::string usage() const { return usage_; }

    virtual int run(const std::vector<std::string>& params) = 0;

    void print_help() const;

    Command& set_long_description(const std::string& desc) {
        long_description_ = desc;
        return *this;
    }
    Command& set_usage(const std::string& usage) {
        usage_ = usage;
        return *this;
    }
    Command& set_example(const std::string& example) {
        example_ = example;
        return *this;
    }

protected:
    struct Flag {
        std::string name;
        std::string short_name;
        std::string description;
        std::string default_value;
        std::string type;  // "string", "bool"
    };

    void add_flag(const std::string& name, const std::string& description,
                  const std::string& default_value = "");
    void add_flag_with_short(const std::string& name,
                             const std::string& short_name,
                             const std::string& description,
                             const std::string& default_value = "");
    void add_bool_flag(const std::string& name, const std::string& description);
    void add_bool_flag_with_short(const std::string& name,
                                  const std::string& short_name,
                                  const std::string& description);

    // Parses `params` against the registered flags. Returns nullopt when the
    // command must stop right away; `exit_code` then holds 0 after --help and
    // 1 after a parse error (reported on the error stream with the help).
    std::optional<CommandContext> parse_options(
        const std::vector<std::string>& params, int& exit_code) const;

    Console& console_;

    std::string name_;
    std::string description_;
    std::string long_description_;
    std::string usage_;
    std::string example_;

    std::vector<Flag> flags_;
};

}  // namespace devkit::cli

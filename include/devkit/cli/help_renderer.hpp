#pragma once
#include <ostream>
#include <string>

#include "devkit/cli/commands_map.hpp"

namespace devkit::cli {

// Top-level usage text:
//
//   Usage:
//       <prog> -h/--help
//       <prog> -v/--version
//       <prog> command [arguments...] [options...]
//
//
//   Available Commands:
//       <name>  <description>
//
// Names are left-aligned and padded to the widest name plus two spaces.
class HelpRenderer {
public:
    explicit HelpRenderer(std::string program_name)
        : program_name_(std::move(program_name)) {}

    std::string render(const CommandsMap& commands) const;
    void print(std::ostream& os, const CommandsMap& commands) const {
        os << render(commands);
    }

private:
    std::string program_name_;
};

}  // namespace devkit::cli

#include "devkit/cli/help_renderer.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace devkit::cli {

std::string HelpRenderer::render(const CommandsMap& commands) const {
    std::ostringstream ss;
    ss << "Usage:\n";
    ss << "    " << program_name_ << " -h/--help\n";
    ss << "    " << program_name_ << " -v/--version\n";
    ss << "    " << program_name_
       << " command [arguments...] [options...]\n";
    ss << "\n\n";
    ss << "Available Commands:\n";

    std::size_t width = 0;
    for (const auto& spec : commands.specs()) {
        width = std::max(width, spec.name.size());
    }

    for (const auto& spec : commands.specs()) {
        ss << "    " << std::left << std::setw(static_cast<int>(width + 2))
           << spec.name << spec.description << "\n";
    }
    return ss.str();
}

}  // namespace devkit::cli

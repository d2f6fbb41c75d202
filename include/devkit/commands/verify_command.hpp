#pragma once
#include <string>
#include <vector>

#include "devkit/cli/command.hpp"
#include "devkit/core/environment.hpp"

namespace devkit::commands {

// Checks that the directories of the omnibus layout are present
class VerifyCommand : public cli::Command {
public:
    VerifyCommand(cli::Console& console, const core::Environment& env);
    int run(const std::vector<std::string>& params) override;

    static const std::vector<std::string>& components();

private:
    const core::Environment& env_;
};

}  // namespace devkit::commands

#pragma once
#include <string>

#include "devkit/config/config.hpp"

namespace devkit::config {

// `cli:` section of the user configuration
class CliConfig : public ClonableConfigurationProperties<CliConfig> {
public:
    // Run the PATH ordering check before delegating to a subcommand
    bool sanity_check = true;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    std::string properties_name() const override { return "cli"; }
};

}  // namespace devkit::config

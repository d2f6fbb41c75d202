#include "devkit/config/cli_config.hpp"

namespace devkit::config {

void CliConfig::from_ptree(const boost::property_tree::ptree& pt) {
    sanity_check = get_value(pt, "sanity_check", sanity_check);
}

}  // namespace devkit::config

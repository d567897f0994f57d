#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace scriptbox::config {

// Explicit path first, then $SCRIPTBOX_CONFIG, then ~/.scriptbox/config.json.
std::filesystem::path ResolveConfigPath(const std::string& explicit_path);

// Defaults, overlaid by the JSON file (if present), overlaid by
// SCRIPTBOX_* environment variables. Unset paths are filled in last.
ServiceConfig LoadConfig(const std::string& explicit_path = std::string());

// Returns one message per problem; empty when the config is usable.
std::vector<std::string> ValidateConfig(const ServiceConfig& config);

}  // namespace scriptbox::config

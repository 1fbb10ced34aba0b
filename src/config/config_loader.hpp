#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace helix::config {

// ~/.helix/config.json, or the file named by HELIX_CONFIG.
std::filesystem::path GetConfigPath();

// Defaults, then the config file, then HELIX_* environment overrides.
// A missing or malformed file keeps the defaults.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& path);

}  // namespace helix::config

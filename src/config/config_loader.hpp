#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace sandforge::config {

// SANDFORGE_CONFIG when set, otherwise ~/.sandforge/config.json.
std::filesystem::path GetConfigPath();

// Overlays the recognised keys of `data` onto `config`. Keys of the wrong
// type are ignored; the rest of the document is left untouched.
void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

// Applies SANDFORGE_* environment overrides.
void ApplyEnvOverrides(Config& config);

// Defaults, then the config file if present, then the environment. Throws
// ConfigError when the file exists but is not valid JSON or a value is out
// of range.
Config LoadConfig();

// Throws ConfigError for values no component can run with.
void ValidateConfig(const Config& config);

// Expands a leading "~/" against HOME.
std::filesystem::path ExpandHome(const std::string& path);

}  // namespace sandforge::config

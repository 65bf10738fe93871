#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace gamesmith::config {

// Defaults, then ~/.gamesmith/config.json, then GAMESMITH_* environment overrides.
Config LoadConfig();

// Same layering with an explicit file in place of the default location.
Config LoadConfigFromFile(const std::filesystem::path& path);

std::filesystem::path DefaultConfigPath();

// Expands a leading "~/" against $HOME.
std::string ExpandUserPath(const std::string& path);

}  // namespace gamesmith::config

#pragma once

#include <filesystem>

#include "nlohmann/json.hpp"

#include "config/config_schema.hpp"

namespace codecred::config {

// $CODECRED_CONFIG, else ~/.codecred/config.json.
std::filesystem::path DefaultConfigPath();

// Reads the JSON file (missing or malformed files keep defaults), then applies
// CODECRED_* environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

}  // namespace codecred::config

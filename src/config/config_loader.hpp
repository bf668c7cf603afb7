#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace pysandbox::config {

// Defaults, then the JSON file, then PYSANDBOX_* environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

std::filesystem::path GetConfigPath();

}  // namespace pysandbox::config

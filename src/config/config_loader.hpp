#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace agentrun::config {

// Defaults, then the JSON config file, then AGENTRUN_* environment overrides.
Config LoadConfig();

std::filesystem::path GetConfigPath();
void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

}  // namespace agentrun::config

#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace socrates::config {

std::filesystem::path GetConfigPath();

// Defaults, then ~/.socrates/config.json, then SOCRATES_* environment overrides.
Config LoadConfig();
Config LoadConfigFrom(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

}  // namespace socrates::config

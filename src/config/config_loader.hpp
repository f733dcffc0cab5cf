#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace katabox::config {

std::filesystem::path GetConfigPath();

// Overlays recognised keys of `data` onto `config`; unknown keys and values
// of the wrong type are ignored.
void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

void ApplyConfigFromEnv(Config& config);

Config LoadConfig();

}  // namespace katabox::config

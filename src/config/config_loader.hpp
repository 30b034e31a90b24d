#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace codebox::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// CODEBOX_CONFIG when set, otherwise ~/.codebox/config.json.
std::filesystem::path GetConfigPath();

// Defaults, then the config file when it exists, then CODEBOX_* environment
// overrides. Throws ConfigError on unreadable or invalid sandbox settings.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvironment(Config& config);

}  // namespace codebox::config

#pragma once
#include <vaultstream/core/config/app_config.hpp>
#include <string>

/**
 * YAML configuration loading.
 *
 * Every failure (missing file, missing required field, wrong type, value out
 * of range) is reported as VaultStream::ConfigError, which derives from
 * std::runtime_error.
 */
class ConfigLoader {
public:
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
    static AppConfig::AppConfiguration loadFromString(const std::string& yaml);

    // Checks a connector configuration before any session is created
    static void validate(const AppConfig::ConnectorConfig& config);
};

#pragma once
#include <gelfbridge/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    /**
     * @brief Load and validate a YAML configuration file
     * @throws GelfBridge::ConfigError (a std::runtime_error) on missing file,
     *         missing required key, wrong type or out-of-range value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    // Same validation, from an in-memory YAML document
    static AppConfig::AppConfiguration loadFromString(const std::string& yaml);
};

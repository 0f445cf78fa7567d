#pragma once
#include <workflowengine/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    /**
     * @brief Load and validate a YAML configuration file
     * @throws std::runtime_error on a missing file, missing required field,
     *         wrong field type or invalid value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};

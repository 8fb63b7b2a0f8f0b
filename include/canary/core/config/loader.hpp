#pragma once
#include <canary/core/config/app_config.hpp>
#include <cstdlib>
#include <functional>
#include <string>

class ConfigLoader {
public:
    using EnvLookup = std::function<const char*(const char*)>;

    /**
     * @brief Load settings from a YAML file on top of the defaults
     * @throws std::runtime_error on a missing file, bad YAML or invalid values
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    /**
     * @brief Apply OPERATOR_TOKEN, IP, PORT and LOG_LEVEL from the environment
     *
     * Unparseable IP/PORT values are ignored with a warning.
     * @throws std::runtime_error if OPERATOR_TOKEN is missing or empty
     */
    static void applyEnvironment(AppConfig::AppConfiguration& config,
                                 const EnvLookup& lookup = [](const char* name) { return std::getenv(name); });

    static bool isValidAddress(const std::string& host);
    static bool isValidLogLevel(const std::string& level);
};

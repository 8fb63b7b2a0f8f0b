// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and environment overrides
// ============================================================================

#include <gtest/gtest.h>
#include <canary/core/config/loader.hpp>
#include <canary/core/config/app_config.hpp>
#include <map>
#include <stdexcept>
#include <string>

namespace {

// Environment stand-in so tests never touch the process environment
ConfigLoader::EnvLookup envFrom(const std::map<std::string, std::string>& vars) {
    return [vars](const char* name) -> const char* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, DefaultsMatchDocumentedValues) {
    AppConfig::AppConfiguration config;
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.store.capacity, 8u);
    EXPECT_EQ(config.logging.level, "info");
}

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("unittest/config/valid.yaml");

    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.threads, 2u);
    EXPECT_EQ(config.server.requestTimeoutSeconds, 5u);
    EXPECT_EQ(config.server.maxConnections, 10u);
    EXPECT_EQ(config.store.capacity, 16u);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(ConfigLoader, PartialFileKeepsDefaults) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("unittest/config/partial.yaml");

    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.server.threads, 4u);
    EXPECT_EQ(config.server.requestTimeoutSeconds, 30u);
    EXPECT_EQ(config.server.maxConnections, 256u);
    EXPECT_EQ(config.store.capacity, 3u);
}

TEST(ConfigLoader, ShippedConfigurationLoads) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/canary.yaml");
    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.store.capacity, 8u);
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(ConfigLoader::loadConfig("unittest/config/non_existent.yaml"), std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnMalformedYaml) {
    EXPECT_THROW(ConfigLoader::loadConfig("unittest/config/malformed.yaml"), std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(ConfigLoader::loadConfig("unittest/config/invalid_type.yaml"), std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(ConfigLoader::loadConfig("unittest/config/invalid_value.yaml"), std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadConfig("unittest/config/invalid_host.yaml"), std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadConfig("unittest/config/invalid_timeout.yaml"), std::runtime_error);
}

// ============================================================================
// ENVIRONMENT TESTS
// ============================================================================

TEST(ConfigLoader, RequiresOperatorToken) {
    AppConfig::AppConfiguration config;
    EXPECT_THROW(ConfigLoader::applyEnvironment(config, envFrom({})), std::runtime_error);
    EXPECT_THROW(ConfigLoader::applyEnvironment(config, envFrom({{"OPERATOR_TOKEN", ""}})),
                 std::runtime_error);
}

TEST(ConfigLoader, EnvironmentOverridesFile) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("unittest/config/valid.yaml");
    ConfigLoader::applyEnvironment(config, envFrom({
        {"OPERATOR_TOKEN", "secret"},
        {"IP", "::1"},
        {"PORT", "4000"},
        {"LOG_LEVEL", "warn"},
    }));

    EXPECT_EQ(config.operatorToken, "secret");
    EXPECT_EQ(config.server.host, "::1");
    EXPECT_EQ(config.server.port, 4000);
    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_EQ(config.store.capacity, 16u);
}

TEST(ConfigLoader, InvalidEnvironmentValuesAreIgnored) {
    AppConfig::AppConfiguration config;
    ConfigLoader::applyEnvironment(config, envFrom({
        {"OPERATOR_TOKEN", "secret"},
        {"IP", "localhost"},
        {"PORT", "70000"},
        {"LOG_LEVEL", "chatty"},
    }));

    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.logging.level, "info");

    ConfigLoader::applyEnvironment(config, envFrom({{"OPERATOR_TOKEN", "secret"}, {"PORT", "80a"}}));
    EXPECT_EQ(config.server.port, 3000);
}

TEST(ConfigLoader, AddressValidation) {
    EXPECT_TRUE(ConfigLoader::isValidAddress("127.0.0.1"));
    EXPECT_TRUE(ConfigLoader::isValidAddress("0.0.0.0"));
    EXPECT_TRUE(ConfigLoader::isValidAddress("::"));
    EXPECT_FALSE(ConfigLoader::isValidAddress("256.0.0.1"));
    EXPECT_FALSE(ConfigLoader::isValidAddress(""));
}

#include <canary/core/config/loader.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

bool parsePort(const std::string& text, uint16_t& port) {
    if (text.empty() || text.size() > 5) return false;
    unsigned long value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) return false;
    port = static_cast<uint16_t>(value);
    return true;
}

void loadServer(const YAML::Node& node, AppConfig::ServerConfig& server) {
    if (!node) return;
    if (!node.IsMap())
        throw std::runtime_error("'server' must be a mapping");

    if (node["host"]) {
        server.host = node["host"].as<std::string>();
        if (!ConfigLoader::isValidAddress(server.host))
            throw std::runtime_error("server.host is not a valid IP address: " + server.host);
    }
    if (node["port"]) {
        int port = node["port"].as<int>();
        if (port < 1 || port > 65535)
            throw std::runtime_error("server.port must be within 1..65535");
        server.port = static_cast<uint16_t>(port);
    }
    if (node["threads"]) {
        int threads = node["threads"].as<int>();
        if (threads < 1 || threads > 256)
            throw std::runtime_error("server.threads must be within 1..256");
        server.threads = static_cast<unsigned>(threads);
    }
    if (node["request_timeout_seconds"]) {
        int timeout = node["request_timeout_seconds"].as<int>();
        if (timeout < 1 || timeout > 3600)
            throw std::runtime_error("server.request_timeout_seconds must be within 1..3600");
        server.requestTimeoutSeconds = static_cast<unsigned>(timeout);
    }
    if (node["max_connections"]) {
        long long limit = node["max_connections"].as<long long>();
        if (limit < 1)
            throw std::runtime_error("server.max_connections must be at least 1");
        server.maxConnections = static_cast<size_t>(limit);
    }
}

void loadStore(const YAML::Node& node, AppConfig::StoreConfig& store) {
    if (!node) return;
    if (!node.IsMap())
        throw std::runtime_error("'store' must be a mapping");

    if (node["capacity"]) {
        long long capacity = node["capacity"].as<long long>();
        if (capacity < 1)
            throw std::runtime_error("store.capacity must be at least 1");
        store.capacity = static_cast<size_t>(capacity);
    }
}

void loadLogging(const YAML::Node& node, AppConfig::LoggingConfig& logging) {
    if (!node) return;
    if (!node.IsMap())
        throw std::runtime_error("'logging' must be a mapping");

    if (node["level"]) {
        logging.level = node["level"].as<std::string>();
        if (!ConfigLoader::isValidLogLevel(logging.level))
            throw std::runtime_error("logging.level is not a known level: " + logging.level);
    }
}

} // anonymous namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    AppConfig::AppConfiguration config;

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Config file not found: " + filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse " + filepath + ": " + e.what());
    }

    if (root.IsNull()) {
        return config;  // empty file keeps the defaults
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Config root must be a mapping: " + filepath);
    }

    try {
        loadServer(root["server"], config.server);
        loadStore(root["store"], config.store);
        loadLogging(root["logging"], config.logging);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value in " + filepath + ": " + e.what());
    }

    return config;
}

void ConfigLoader::applyEnvironment(AppConfig::AppConfiguration& config, const EnvLookup& lookup) {
    const char* token = lookup("OPERATOR_TOKEN");
    if (token == nullptr || *token == '\0') {
        throw std::runtime_error("OPERATOR_TOKEN should be defined");
    }
    config.operatorToken = token;

    if (const char* ip = lookup("IP")) {
        if (isValidAddress(ip)) {
            config.server.host = ip;
        } else {
            spdlog::warn("Ignoring invalid IP '{}', keeping {}", ip, config.server.host);
        }
    }

    if (const char* port = lookup("PORT")) {
        uint16_t parsed = 0;
        if (parsePort(port, parsed)) {
            config.server.port = parsed;
        } else {
            spdlog::warn("Ignoring invalid PORT '{}', keeping {}", port, config.server.port);
        }
    }

    if (const char* level = lookup("LOG_LEVEL")) {
        if (isValidLogLevel(level)) {
            config.logging.level = level;
        } else {
            spdlog::warn("Ignoring unknown LOG_LEVEL '{}'", level);
        }
    }
}

bool ConfigLoader::isValidAddress(const std::string& host) {
    in6_addr buf{};
    return inet_pton(AF_INET, host.c_str(), &buf) == 1 ||
           inet_pton(AF_INET6, host.c_str(), &buf) == 1;
}

bool ConfigLoader::isValidLogLevel(const std::string& level) {
    return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
}

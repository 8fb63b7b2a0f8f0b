#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace AppConfig {

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 3000;
    unsigned threads = 4;
    unsigned requestTimeoutSeconds = 30;
    size_t maxConnections = 256;
};

struct StoreConfig {
    size_t capacity = 8;
};

struct LoggingConfig {
    std::string level = "info";
};

struct AppConfiguration {
    ServerConfig server;
    StoreConfig store;
    LoggingConfig logging;
    std::string operatorToken;  // never logged
};

} // namespace AppConfig

#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include <canary/core/config/loader.hpp>
#include <canary/core/store/ping_store.hpp>
#include <canary/core/service/canary_service.hpp>
#include <canary/core/http/http_server.hpp>

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    (void)signum;
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("presence-canary v1.0.0 starting...");
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    AppConfig::AppConfiguration config;
    if (argc > 1) {
        spdlog::info("Loading configuration from: {}", argv[1]);
        config = ConfigLoader::loadConfig(argv[1]);
    }
    ConfigLoader::applyEnvironment(config);
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    return config;
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Order matters for destruction: the server goes first
    std::shared_ptr<Canary::PingStore> store;
    std::unique_ptr<Canary::CanaryService> service;
    std::unique_ptr<Canary::HttpServer> server;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;

    c.store = std::make_shared<Canary::PingStore>(config.store.capacity);
    c.service = std::make_unique<Canary::CanaryService>(c.store, config.operatorToken);

    Canary::CanaryService* service = c.service.get();
    Canary::HttpServerOptions options;
    options.host = config.server.host;
    options.port = config.server.port;
    options.threads = config.server.threads;
    options.requestTimeout = std::chrono::seconds(config.server.requestTimeoutSeconds);
    options.maxConnections = config.server.maxConnections;

    c.server = std::make_unique<Canary::HttpServer>(
        options,
        [service](const Canary::HttpRequest& request) { return service->handle(request); }
    );

    return c;
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        auto config = loadConfiguration(argc, argv);
        spdlog::info("Configuration loaded (history capacity: {})", config.store.capacity);

        auto components = initializeComponents(config);

        if (!components.server->start()) {
            spdlog::error("Fatal error: could not listen on {}:{}",
                          config.server.host, config.server.port);
            return EXIT_FAILURE;
        }

        spdlog::info("Listening at http://{}:{} ...",
                     components.server->host(), components.server->port());

        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        spdlog::info("Signal received, shutting down...");
        components.server->stop();
        spdlog::info("Pings recorded this run: {} (requests served: {})",
                     components.store->totalRecorded(), components.server->totalRequests());

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("presence-canary terminated gracefully");
    return EXIT_SUCCESS;
}

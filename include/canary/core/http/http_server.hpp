#pragma once
#include <canary/core/http/http_types.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace Canary {

constexpr size_t kMaxHeaderBytes = 16 * 1024;
constexpr size_t kMaxBodyBytes = 1024 * 1024;

struct HttpServerOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 3000;                       // 0 picks an ephemeral port
    unsigned threads = 4;                       // fixed worker pool running the io_context
    std::chrono::seconds requestTimeout{30};    // whole request, first byte to last
    size_t maxConnections = 256;
};

/**
 * @class HttpServer
 * @brief HTTP/1.1 front end on Boost.Beast.
 *
 * Connections are served asynchronously by a fixed pool of threads, so a
 * slow client holds a socket but never a thread. Each request, header and
 * body together, must arrive within requestTimeout or the connection is
 * closed; connections beyond maxConnections are closed on accept.
 * Exceptions escaping the handler become a 500 for that request.
 */
class HttpServer {
public:
    HttpServer(HttpServerOptions options, RequestHandler handler);
    ~HttpServer() noexcept;

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind, listen and start the worker pool
     * @return false if the address is invalid or the socket cannot be bound
     */
    bool start();
    void stop();

    /**
     * @brief Port actually bound (differs from the requested one for port 0)
     */
    uint16_t port() const { return boundPort_; }
    const std::string& host() const { return options_.host; }

    size_t activeConnections() const {
        return activeConnections_.load(std::memory_order_relaxed);
    }
    uint64_t totalRequests() const {
        return totalRequestsServed_.load(std::memory_order_relaxed);
    }

private:
    friend class HttpSession;

    void doAccept();
    void onAccept(beast::error_code ec, boost::asio::ip::tcp::socket socket);
    HttpResponse dispatch(const HttpRequest& request, const std::string& clientAddress);

    HttpServerOptions options_;
    RequestHandler handler_;
    uint16_t boundPort_;

    // Declared before the io_context: sessions still queued in it update these
    // counters while it is being destroyed
    std::atomic<size_t> activeConnections_{0};
    std::atomic<uint64_t> totalConnectionsAccepted_{0};
    std::atomic<uint64_t> totalConnectionsRejected_{0};
    std::atomic<uint64_t> totalRequestsServed_{0};

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> workers_;
    std::atomic<bool> isRunning{false};
};

} // namespace Canary

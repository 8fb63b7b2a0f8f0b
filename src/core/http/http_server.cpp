#include <canary/core/http/http_server.hpp>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>

namespace Canary {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

HttpResponse makeTextResponse(http::status status, std::string body) {
    HttpResponse response{status, 11};
    response.set(http::field::content_type, "text/plain; charset=utf-8");
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

// ============================================================================
// HttpSession: one keep-alive connection
// ============================================================================

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, HttpServer& server, std::string clientAddress)
        : stream_(std::move(socket)), server_(server), clientAddress_(std::move(clientAddress)) {
        server_.activeConnections_.fetch_add(1, std::memory_order_relaxed);
    }

    ~HttpSession() {
        server_.activeConnections_.fetch_sub(1, std::memory_order_relaxed);
    }

    void run() {
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
    }

private:
    void doRead() {
        parser_.emplace();
        parser_->header_limit(static_cast<std::uint32_t>(kMaxHeaderBytes));
        parser_->body_limit(static_cast<std::uint64_t>(kMaxBodyBytes));

        // One deadline for the whole request; received bytes do not extend it
        stream_.expires_after(server_.options_.requestTimeout);

        http::async_read_header(stream_, buffer_, *parser_,
            beast::bind_front_handler(&HttpSession::onReadHeader, shared_from_this()));
    }

    void onReadHeader(beast::error_code ec, std::size_t) {
        if (ec) {
            return onReadFailed(ec);
        }

        const auto& header = parser_->get();
        if (beast::iequals(header[http::field::expect], "100-continue")) {
            continue_ = http::response<http::empty_body>{http::status::continue_, header.version()};
            http::async_write(stream_, continue_,
                beast::bind_front_handler(&HttpSession::onContinueSent, shared_from_this()));
            return;
        }
        readBody();
    }

    void onContinueSent(beast::error_code ec, std::size_t) {
        if (ec) {
            spdlog::debug("Failed to send 100 Continue to {}: {}", clientAddress_, ec.message());
            return;
        }
        readBody();
    }

    void readBody() {
        http::async_read(stream_, buffer_, *parser_,
            beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            return onReadFailed(ec);
        }

        HttpRequest request = parser_->release();
        const bool keepAlive = request.keep_alive();

        response_ = server_.dispatch(request, clientAddress_);
        response_.version(request.version());
        response_.keep_alive(keepAlive);
        response_.prepare_payload();
        if (request.method() == http::verb::head) {
            response_.body().clear();  // Content-Length still describes the GET body
        }

        server_.totalRequestsServed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("{} {} {} -> {}", clientAddress_, std::string(request.method_string()),
                      std::string(request.target()), response_.result_int());

        doWrite(keepAlive);
    }

    void onReadFailed(beast::error_code ec) {
        if (ec == http::error::end_of_stream) {
            return doClose();
        }
        if (ec == beast::error::timeout) {
            // tcp_stream has already closed the socket
            spdlog::debug("Request from {} not completed within {}s, closing",
                          clientAddress_, server_.options_.requestTimeout.count());
            return;
        }
        if (ec == http::error::body_limit) {
            return sendError(http::status::payload_too_large);
        }
        if (ec == http::error::header_limit) {
            return sendError(http::status::request_header_fields_too_large);
        }
        if (ec.category() == beast::error_code(http::error::bad_method).category()) {
            spdlog::warn("Rejecting malformed request from {}: {}", clientAddress_, ec.message());
            return sendError(http::status::bad_request);
        }
        spdlog::debug("Read from {} failed: {}", clientAddress_, ec.message());
    }

    void sendError(http::status status) {
        response_ = makeTextResponse(status, std::string(http::obsolete_reason(status)));
        response_.keep_alive(false);
        doWrite(false);
    }

    void doWrite(bool keepAlive) {
        stream_.expires_after(server_.options_.requestTimeout);
        http::async_write(stream_, response_,
            beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(), keepAlive));
    }

    void onWrite(bool keepAlive, beast::error_code ec, std::size_t) {
        if (ec) {
            spdlog::debug("Client {} went away before the response was sent: {}",
                          clientAddress_, ec.message());
            return;
        }
        if (!keepAlive) {
            return doClose();
        }
        doRead();
    }

    void doClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    HttpServer& server_;
    std::string clientAddress_;
    std::optional<http::request_parser<http::string_body>> parser_;
    http::response<http::empty_body> continue_;
    HttpResponse response_;
};

// ============================================================================
// HttpServer
// ============================================================================

HttpServer::HttpServer(HttpServerOptions options, RequestHandler handler)
    : options_(std::move(options)), handler_(std::move(handler)), boundPort_(options_.port),
      ioc_(static_cast<int>(options_.threads)), acceptor_(ioc_) {
    if (options_.threads == 0) {
        options_.threads = 1;
    }
}

HttpServer::~HttpServer() noexcept {
    stop();
}

bool HttpServer::start() {
    beast::error_code ec;

    const auto address = asio::ip::make_address(options_.host, ec);
    if (ec) {
        spdlog::error("Invalid listen address '{}'", options_.host);
        return false;
    }
    const tcp::endpoint endpoint{address, options_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        spdlog::error("Failed to create socket for HTTP server: {}", ec.message());
        return false;
    }

    // Enable SO_REUSEADDR to avoid "address already in use" errors
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);

    acceptor_.bind(endpoint, ec);
    if (ec) {
        spdlog::error("Failed to bind {}:{}: {}", options_.host, options_.port, ec.message());
        acceptor_.close(ec);
        return false;
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("Failed to listen on socket: {}", ec.message());
        acceptor_.close(ec);
        return false;
    }

    boundPort_ = acceptor_.local_endpoint(ec).port();
    isRunning.store(true, std::memory_order_release);
    doAccept();

    workers_.reserve(options_.threads);
    for (unsigned i = 0; i < options_.threads; ++i) {
        workers_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                spdlog::error("HTTP worker terminated: {}", e.what());
            }
        });
    }

    spdlog::debug("HTTP server accepting on {}:{} ({} workers)", options_.host, boundPort_,
                  options_.threads);
    return true;
}

void HttpServer::stop() {
    if (!isRunning.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    ioc_.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    beast::error_code ec;
    acceptor_.close(ec);

    spdlog::info("HTTP server stopped. Connections: {} accepted, {} rejected; requests: {}",
                 totalConnectionsAccepted_.load(), totalConnectionsRejected_.load(),
                 totalRequestsServed_.load());
}

void HttpServer::doAccept() {
    acceptor_.async_accept(asio::make_strand(ioc_),
                           beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == asio::error::operation_aborted || !isRunning.load(std::memory_order_acquire)) {
            return;
        }
        spdlog::error("Failed to accept client connection: {}", ec.message());
        return doAccept();
    }

    beast::error_code peerEc;
    const auto peer = socket.remote_endpoint(peerEc);
    std::string clientAddress = peerEc ? std::string("unknown") : peer.address().to_string();

    if (activeConnections_.load(std::memory_order_relaxed) >= options_.maxConnections) {
        totalConnectionsRejected_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("Connection limit ({}) reached, dropping {}", options_.maxConnections, clientAddress);
        socket.close(peerEc);
        return doAccept();
    }

    totalConnectionsAccepted_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("Accepted HTTP connection from {}", clientAddress);
    std::make_shared<HttpSession>(std::move(socket), *this, std::move(clientAddress))->run();

    doAccept();
}

HttpResponse HttpServer::dispatch(const HttpRequest& request, const std::string& clientAddress) {
    try {
        return handler_(request);
    } catch (const std::exception& e) {
        spdlog::error("Handler failed for {} {} from {}: {}",
                      std::string(request.method_string()), std::string(request.target()),
                      clientAddress, e.what());
        return makeTextResponse(http::status::internal_server_error, "Internal Server Error");
    }
}

} // namespace Canary

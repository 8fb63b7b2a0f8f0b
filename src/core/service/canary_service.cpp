#include <canary/core/service/canary_service.hpp>
#include <canary/core/service/status_page.hpp>
#include <canary/core/utils/text.hpp>
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace Canary {

namespace {

HttpResponse htmlResponse(std::string body) {
    HttpResponse response{http::status::ok, 11};
    response.set(http::field::content_type, "text/html; charset=utf-8");
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

} // namespace

CanaryService::CanaryService(std::shared_ptr<PingStore> store, std::string operatorToken)
    : store_(std::move(store)), expectedAuthorization_("Bearer " + operatorToken) {
    if (!store_) {
        throw std::invalid_argument("CanaryService requires a ping store");
    }
}

HttpResponse CanaryService::handle(const HttpRequest& request) const {
    switch (request.method()) {
    case http::verb::get:
    case http::verb::head:
        return statusPage();
    case http::verb::post:
        return ingest(request);
    default:
        break;
    }

    HttpResponse response = makeTextResponse(http::status::method_not_allowed, "Method Not Allowed");
    response.set(http::field::allow, "GET, HEAD, POST");
    return response;
}

HttpResponse CanaryService::statusPage() const {
    return htmlResponse(
        renderStatusPage(store_->snapshot(), store_->capacity(), std::chrono::system_clock::now()));
}

HttpResponse CanaryService::ingest(const HttpRequest& request) const {
    std::optional<std::string> authorization;
    auto it = request.find(http::field::authorization);
    if (it != request.end()) {
        authorization = std::string(it->value());
    }

    if (!isAuthorized(authorization)) {
        spdlog::warn("[Ingest] Rejected ping: unauthorized");
        return makeTextResponse(http::status::unauthorized, "Unauthorized");
    }

    const std::string& reason = request.body();
    if (!isValidUtf8(reason)) {
        spdlog::warn("[Ingest] Rejected ping: body is not UTF-8 ({} bytes)", reason.size());
        return makeTextResponse(http::status::bad_request, "Bad Request");
    }

    store_->record(reason);
    spdlog::info("[Ingest] Ping recorded ({} bytes, total: {})", reason.size(), store_->totalRecorded());

    return makeTextResponse(http::status::ok, "Ok");
}

bool CanaryService::isAuthorized(const std::optional<std::string>& authorization) const {
    if (!authorization) {
        return false;
    }
    return constantTimeEquals(*authorization, expectedAuthorization_);
}

} // namespace Canary

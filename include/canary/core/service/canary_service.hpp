#pragma once
#include <canary/core/http/http_types.hpp>
#include <canary/core/store/ping_store.hpp>
#include <memory>
#include <optional>
#include <string>

namespace Canary {

/**
 * @class CanaryService
 * @brief Request handlers of the canary, routed by method.
 *
 * GET/HEAD render the status page, POST records an authenticated ping.
 * The store is shared with whoever else holds the pointer; the service keeps
 * no state of its own besides the credential, so handle() may run
 * concurrently from any number of server worker threads.
 */
class CanaryService {
public:
    CanaryService(std::shared_ptr<PingStore> store, std::string operatorToken);
    ~CanaryService() = default;

    HttpResponse handle(const HttpRequest& request) const;

    /**
     * @brief Status page for the current history (never fails)
     */
    HttpResponse statusPage() const;

    /**
     * @brief Record the request body as a ping if the bearer credential matches
     *
     * 401 on credential mismatch, 400 if the body is not UTF-8 text,
     * 200 "Ok" otherwise. Only the 200 path touches the store.
     */
    HttpResponse ingest(const HttpRequest& request) const;

    /**
     * @brief Exact match against "Bearer <token>"
     */
    bool isAuthorized(const std::optional<std::string>& authorization) const;

    const PingStore& store() const { return *store_; }

private:
    std::shared_ptr<PingStore> store_;
    std::string expectedAuthorization_;
};

} // namespace Canary

#pragma once

#include <boost/beast/http.hpp>
#include <functional>
#include <string>

namespace Canary {

namespace beast = boost::beast;
namespace http = beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Invoked concurrently from the server's worker threads
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Plain-text response with Content-Length already prepared
 */
HttpResponse makeTextResponse(http::status status, std::string body);

} // namespace Canary

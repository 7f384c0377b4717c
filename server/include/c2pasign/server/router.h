/**
 * @file router.h
 * @brief Request routing and error-to-HTTP mapping
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_SERVER_ROUTER_H
#define C2PASIGN_SERVER_ROUTER_H

#include "c2pasign/common/error.h"
#include "c2pasign/server/api.h"
#include <boost/beast/http.hpp>
#include <functional>
#include <map>
#include <string>

namespace c2pasign {
namespace server {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;
using Handler = std::function<HttpResponse(const HttpRequest&)>;

constexpr const char* CONTENT_TYPE_JSON = "application/json";

/**
 * @brief HTTP status for an error kind (400, 401 or 500)
 */
http::status StatusForErrorKind(ErrorKind kind);

/**
 * @brief JSON response mirroring the request's HTTP version and keep-alive
 */
HttpResponse JsonResponse(const HttpRequest& request, http::status status, const json& body);

/**
 * @brief Error response with the standard error body
 *
 * @param production Replace reason by a generic text per category
 */
HttpResponse ErrorResponse(
    unsigned int version,
    bool keep_alive,
    http::status status,
    const std::string& kind,
    const std::string& reason,
    bool production
);

/**
 * @brief Exact-path router
 *
 * Handlers report failures by throwing c2pasign::Error; Route() turns them
 * into error responses. Read-only after setup, so Route() may be called from
 * several threads.
 */
class Router {
public:
    explicit Router(bool production = false);

    /**
     * @brief Register a handler; replaces an existing one for the same method and path
     */
    void Add(http::verb method, const std::string& path, Handler handler);

    /**
     * @brief Dispatch a request
     *
     * Unknown path -> 404, known path with another method -> 405. The query
     * string is ignored for matching.
     */
    HttpResponse Route(const HttpRequest& request) const;

    bool production() const { return production_; }

private:
    bool production_;
    std::map<std::string, std::map<http::verb, Handler>> routes_;
};

} // namespace server
} // namespace c2pasign

#endif // C2PASIGN_SERVER_ROUTER_H

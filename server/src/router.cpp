/**
 * @file router.cpp
 * @brief Request routing and error-to-HTTP mapping
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/server/router.h"
#include <glog/logging.h>

namespace c2pasign {
namespace server {

namespace {

constexpr const char* CLIENT_CATEGORY = "client";
constexpr const char* SERVER_CATEGORY = "server";
constexpr const char* CLIENT_REDACTED = "Bad request";
constexpr const char* SERVER_REDACTED = "Internal server error";

std::string PathOf(const HttpRequest& request) {
    std::string target(request.target());
    size_t query = target.find('?');
    if (query != std::string::npos) {
        target.resize(query);
    }
    return target;
}

}  // namespace

http::status StatusForErrorKind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedInput:
            return http::status::bad_request;
        case ErrorKind::Unauthorized:
            return http::status::unauthorized;
        default:
            return http::status::internal_server_error;
    }
}

HttpResponse JsonResponse(const HttpRequest& request, http::status status, const json& body) {
    HttpResponse response{status, request.version()};
    response.set(http::field::content_type, CONTENT_TYPE_JSON);
    response.keep_alive(request.keep_alive());
    response.body() = body.dump();
    response.prepare_payload();
    return response;
}

HttpResponse ErrorResponse(
    unsigned int version,
    bool keep_alive,
    http::status status,
    const std::string& kind,
    const std::string& reason,
    bool production
) {
    bool client = http::to_status_class(status) == http::status_class::client_error;

    std::string text = reason;
    if (production) {
        text = client ? CLIENT_REDACTED : SERVER_REDACTED;
    }

    HttpResponse response{status, version};
    response.set(http::field::content_type, CONTENT_TYPE_JSON);
    if (status == http::status::unauthorized) {
        response.set(http::field::www_authenticate, "Bearer");
    }
    response.keep_alive(keep_alive);
    response.body() = ErrorToJSON(client ? CLIENT_CATEGORY : SERVER_CATEGORY, kind, text).dump();
    response.prepare_payload();
    return response;
}

Router::Router(bool production) : production_(production) {}

void Router::Add(http::verb method, const std::string& path, Handler handler) {
    routes_[path][method] = std::move(handler);
}

HttpResponse Router::Route(const HttpRequest& request) const {
    std::string path = PathOf(request);
    VLOG(1) << "Routing " << request.method_string() << " " << path
            << " (" << request.body().size() << " body bytes)";

    auto route = routes_.find(path);
    if (route == routes_.end()) {
        return ErrorResponse(request.version(), request.keep_alive(), http::status::not_found,
                             "not_found", "No route for " + path, production_);
    }

    auto handler = route->second.find(request.method());
    if (handler == route->second.end()) {
        HttpResponse response = ErrorResponse(
            request.version(), request.keep_alive(), http::status::method_not_allowed,
            "method_not_allowed",
            std::string(request.method_string()) + " not allowed on " + path, production_);

        std::string allow;
        for (const auto& entry : route->second) {
            if (!allow.empty()) {
                allow += ", ";
            }
            allow += std::string(http::to_string(entry.first));
        }
        response.set(http::field::allow, allow);
        return response;
    }

    try {
        return handler->second(request);
    } catch (const Error& e) {
        if (IsClientError(e.kind())) {
            LOG(WARNING) << request.method_string() << " " << path << " rejected ("
                         << ErrorKindName(e.kind()) << "): " << e.what();
        } else {
            LOG(ERROR) << request.method_string() << " " << path << " failed ("
                       << ErrorKindName(e.kind()) << "): " << e.what();
        }
        return ErrorResponse(request.version(), request.keep_alive(), StatusForErrorKind(e.kind()),
                             ErrorKindName(e.kind()), e.what(), production_);
    } catch (const std::exception& e) {
        LOG(ERROR) << request.method_string() << " " << path << " failed: " << e.what();
        return ErrorResponse(request.version(), request.keep_alive(),
                             http::status::internal_server_error, "internal", e.what(), production_);
    }
}

} // namespace server
} // namespace c2pasign

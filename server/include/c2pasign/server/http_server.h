/**
 * @file http_server.h
 * @brief Multi-threaded HTTP/1.1 server on Boost.Beast
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_SERVER_HTTP_SERVER_H
#define C2PASIGN_SERVER_HTTP_SERVER_H

#include "c2pasign/server/router.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace c2pasign {
namespace server {

struct HttpServerOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 0;          ///< 0 picks an ephemeral port
    unsigned int threads = 0;   ///< 0 means one per hardware thread
    size_t max_body_size = 0;   ///< Requests above this get 413
};

/**
 * @brief Accepts connections and hands each request to a Router
 *
 * One asynchronous session per connection, keep-alive supported. Handlers
 * run synchronously on the session's I/O thread.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<const Router> router, HttpServerOptions options);

    /**
     * @brief Stops and joins the I/O threads
     */
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind, listen and start the I/O threads
     * @throws StartupError if the address is invalid or cannot be bound
     */
    void Start();

    /**
     * @brief Stop accepting and abandon open connections; safe from any thread
     */
    void Stop();

    /**
     * @brief Block until all I/O threads have exited
     */
    void Wait();

    /**
     * @brief Bound port (valid after Start)
     */
    uint16_t Port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace server
} // namespace c2pasign

#endif // C2PASIGN_SERVER_HTTP_SERVER_H

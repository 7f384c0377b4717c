/**
 * @file http_server.cpp
 * @brief Multi-threaded HTTP/1.1 server on Boost.Beast
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/server/http_server.h"
#include "c2pasign/common/error.h"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <glog/logging.h>
#include <algorithm>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

namespace c2pasign {
namespace server {

namespace beast = boost::beast;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr std::chrono::seconds SESSION_TIMEOUT{30};

// ============================================================================
// Session
// ============================================================================

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, std::shared_ptr<const Router> router, size_t max_body_size)
        : stream_(std::move(socket)), router_(std::move(router)), max_body_size_(max_body_size) {}

    void Run() {
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&Session::DoRead, shared_from_this()));
    }

private:
    void DoRead() {
        parser_.emplace();
        parser_->body_limit(max_body_size_);

        stream_.expires_after(SESSION_TIMEOUT);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnRead, shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }

        if (ec == http::error::body_limit) {
            LOG(WARNING) << "Request body exceeds " << max_body_size_ << " bytes, rejecting";
            HttpResponse response = ErrorResponse(
                parser_->get().version(), false, http::status::payload_too_large, "payload_too_large",
                "Request body exceeds " + std::to_string(max_body_size_) + " bytes",
                router_->production());
            return Send(std::move(response));
        }

        if (ec) {
            if (ec != beast::error::timeout) {
                VLOG(1) << "Read failed: " << ec.message();
            }
            return;
        }

        HttpRequest request = parser_->release();
        HttpResponse response = router_->Route(request);

        LOG(INFO) << request.method_string() << " " << request.target() << " -> "
                  << response.result_int();
        Send(std::move(response));
    }

    void Send(HttpResponse&& response) {
        response_ = std::make_shared<HttpResponse>(std::move(response));

        stream_.expires_after(SESSION_TIMEOUT);
        http::async_write(stream_, *response_,
                          beast::bind_front_handler(&Session::OnWrite, shared_from_this(),
                                                    response_->need_eof()));
    }

    void OnWrite(bool close, beast::error_code ec, std::size_t /*bytes*/) {
        if (ec) {
            VLOG(1) << "Write failed: " << ec.message();
            return;
        }

        if (close) {
            return DoClose();
        }

        response_.reset();
        DoRead();
    }

    void DoClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        if (ec && ec != beast::errc::not_connected) {
            VLOG(1) << "Shutdown failed: " << ec.message();
        }
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<HttpResponse> response_;
    std::shared_ptr<const Router> router_;
    size_t max_body_size_;
};

}  // namespace

// ============================================================================
// HttpServer
// ============================================================================

class HttpServer::Impl {
public:
    Impl(std::shared_ptr<const Router> router, HttpServerOptions options)
        : router(std::move(router)), options(std::move(options)), acceptor(ioc) {}

    void DoAccept() {
        acceptor.async_accept(asio::make_strand(ioc),
                              beast::bind_front_handler(&Impl::OnAccept, this));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            LOG(WARNING) << "Accept failed: " << ec.message();
        } else {
            std::make_shared<Session>(std::move(socket), router, options.max_body_size)->Run();
        }
        DoAccept();
    }

    void RunLoop() {
        for (;;) {
            try {
                ioc.run();
                return;
            } catch (const std::exception& e) {
                LOG(ERROR) << "Unhandled exception on I/O thread: " << e.what();
            }
        }
    }

    std::shared_ptr<const Router> router;
    HttpServerOptions options;
    asio::io_context ioc;
    tcp::acceptor acceptor;
    std::vector<std::thread> threads;
    uint16_t port = 0;
};

HttpServer::HttpServer(std::shared_ptr<const Router> router, HttpServerOptions options)
    : impl_(std::make_unique<Impl>(std::move(router), std::move(options))) {}

HttpServer::~HttpServer() {
    Stop();
    Wait();
}

void HttpServer::Start() {
    beast::error_code ec;

    auto address = asio::ip::make_address(impl_->options.host, ec);
    if (ec) {
        throw StartupError("Invalid listen address \"" + impl_->options.host + "\": " + ec.message());
    }
    tcp::endpoint endpoint{address, impl_->options.port};

    impl_->acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        throw StartupError("Failed to open socket: " + ec.message());
    }
    impl_->acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
        throw StartupError("Failed to set SO_REUSEADDR: " + ec.message());
    }
    impl_->acceptor.bind(endpoint, ec);
    if (ec) {
        throw StartupError("Failed to bind " + impl_->options.host + ":" +
                           std::to_string(impl_->options.port) + ": " + ec.message());
    }
    impl_->acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        throw StartupError("Failed to listen: " + ec.message());
    }

    impl_->port = impl_->acceptor.local_endpoint().port();

    unsigned int threads = impl_->options.threads;
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }

    impl_->DoAccept();
    for (unsigned int i = 0; i < threads; i++) {
        impl_->threads.emplace_back([this] { impl_->RunLoop(); });
    }

    LOG(INFO) << "Listening on " << impl_->options.host << ":" << impl_->port
              << " with " << threads << " I/O threads";
}

void HttpServer::Stop() {
    impl_->ioc.stop();
}

void HttpServer::Wait() {
    for (auto& thread : impl_->threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    impl_->threads.clear();
}

uint16_t HttpServer::Port() const {
    return impl_->port;
}

} // namespace server
} // namespace c2pasign

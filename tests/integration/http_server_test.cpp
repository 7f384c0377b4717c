/**
 * @file http_server_test.cpp
 * @brief End-to-end tests against an in-process server on an ephemeral port
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "test_support.h"
#include "c2pasign/common/crypto.h"
#include "c2pasign/common/error.h"
#include "c2pasign/server/http_server.h"
#include "c2pasign/server/routes.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <ctime>

using namespace c2pasign;
using namespace c2pasign::crypto;
using namespace c2pasign::server;
using namespace c2pasign::server::testing_support;
using ::testing::NiceMock;
using ::testing::Return;

namespace beast = boost::beast;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr int64_t kLeafLifetime = 365 * 24 * 60 * 60;

/**
 * @brief Blocking HTTP/1.1 client on one connection
 */
class TestClient {
public:
    explicit TestClient(uint16_t port) : stream_(ioc_) {
        stream_.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    }

    ~TestClient() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    HttpResponse Send(HttpRequest request) {
        http::write(stream_, request);

        HttpResponse response;
        http::read(stream_, buffer_, response);
        return response;
    }

private:
    asio::io_context ioc_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
};

HttpRequest CsrRequest(const std::string& common_name) {
    json body;
    body["csr"] = MakeCsrPem(common_name);
    body["metadata"] = {{"device_id", "integration"}, {"purpose", "testing"}};
    return MakeRequest(http::verb::post, "/api/v1/certificates/sign", body.dump(), "application/json");
}

}  // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        authority = std::make_shared<const ca::CertificateAuthority>();

        engine = std::make_shared<NiceMock<MockManifestEngine>>();
        ON_CALL(*engine, Version()).WillByDefault(Return("0.99.0"));
    }

    void StartServer(const ServerConfig& config) {
        SigningServiceOptions service_options;
        service_options.resources_dir = resources.Path();
        service_options.temp_dir = scratch.Path();
        auto service = std::make_shared<const C2paSigningService>(engine, service_options);

        auto router = std::make_shared<const Router>(BuildRouter(config, authority, service));

        HttpServerOptions options;
        options.host = "127.0.0.1";
        options.port = 0;
        options.threads = 2;
        options.max_body_size = config.max_body_size;

        server = std::make_unique<HttpServer>(router, options);
        server->Start();
        ASSERT_NE(server->Port(), 0);
    }

    void TearDown() override {
        if (server) {
            server->Stop();
            server->Wait();
        }
    }

    static ServerConfig DefaultConfig() {
        const char* argv[] = {"c2pasign-server"};
        return ParseServerConfig(1, argv, [](const std::string&) { return std::optional<std::string>(); });
    }

    std::shared_ptr<const ca::CertificateAuthority> authority;
    std::shared_ptr<NiceMock<MockManifestEngine>> engine;
    TempDirectory resources;
    TempDirectory scratch;
    std::unique_ptr<HttpServer> server;
};

// ============================================================================
// Certificate Signing
// ============================================================================

TEST_F(HttpServerTest, CsrSigningRoundTrip) {
    StartServer(DefaultConfig());
    TestClient client(server->Port());

    int64_t before = static_cast<int64_t>(std::time(nullptr));
    auto response = client.Send(CsrRequest("Integration Test"));
    int64_t after = static_cast<int64_t>(std::time(nullptr));

    ASSERT_EQ(response.result(), http::status::ok) << response.body();
    auto body = json::parse(response.body());

    // Leaf, intermediate, root
    auto chain = Certificate::LoadChainFromPEM(body["certificate_chain"].get<std::string>());
    ASSERT_EQ(chain.size(), 3u);
    EXPECT_EQ(chain[0].GetSubjectName().GetAttribute("CN"), std::optional<std::string>("Integration Test"));
    EXPECT_TRUE(chain[1].GetSubjectName() == authority->IntermediateCertificate().GetSubjectName());
    EXPECT_TRUE(chain[2].GetSubjectName() == authority->RootCertificate().GetSubjectName());

    int64_t now = static_cast<int64_t>(std::time(nullptr));
    EXPECT_TRUE(chain[0].VerifyChain(chain[1], now));
    EXPECT_TRUE(chain[1].VerifyChain(chain[2], now));
    EXPECT_TRUE(chain[2].VerifyChain(chain[2], now));

    int64_t expires = chain[0].GetValidityPeriod().second;
    EXPECT_GE(expires, before + kLeafLifetime);
    EXPECT_LE(expires, after + kLeafLifetime);
    EXPECT_EQ(body["expires_at"], FormatIso8601(expires));
    EXPECT_EQ(body["serial_number"], chain[0].GetSerialNumberString());
}

TEST_F(HttpServerTest, KeepAliveIssuesFreshSerials) {
    StartServer(DefaultConfig());
    TestClient client(server->Port());

    auto first = json::parse(client.Send(CsrRequest("Integration Test")).body());
    auto second = json::parse(client.Send(CsrRequest("Integration Test")).body());

    EXPECT_NE(first["serial_number"], second["serial_number"]);
    EXPECT_NE(first["certificate_id"], second["certificate_id"]);
}

TEST_F(HttpServerTest, MalformedCsr) {
    StartServer(DefaultConfig());
    TestClient client(server->Port());

    auto response = client.Send(MakeRequest(http::verb::post, "/api/v1/certificates/sign",
                                            "{\"csr\":\"no marker\"}", "application/json"));

    EXPECT_EQ(response.result(), http::status::bad_request);
    EXPECT_EQ(json::parse(response.body())["kind"], "malformed_input");
}

// ============================================================================
// Routing and Limits
// ============================================================================

TEST_F(HttpServerTest, StatusAndHealth) {
    StartServer(DefaultConfig());
    TestClient client(server->Port());

    auto status = client.Send(MakeRequest(http::verb::get, "/"));
    EXPECT_EQ(status.result(), http::status::ok);
    EXPECT_EQ(json::parse(status.body())["status"], "C2PA Signing Server is running");

    EXPECT_EQ(client.Send(MakeRequest(http::verb::get, "/health")).result(), http::status::ok);
    EXPECT_EQ(client.Send(MakeRequest(http::verb::get, "/missing")).result(), http::status::not_found);
}

TEST_F(HttpServerTest, OversizedBodyRejected) {
    ServerConfig config = DefaultConfig();
    config.max_body_size = 1024;
    StartServer(config);
    TestClient client(server->Port());

    auto response = client.Send(MakeRequest(http::verb::post, "/api/v1/certificates/sign",
                                            std::string(4096, 'x'), "application/json"));

    EXPECT_EQ(response.result(), http::status::payload_too_large);
    EXPECT_EQ(json::parse(response.body())["kind"], "payload_too_large");
    EXPECT_FALSE(response.keep_alive());
}

TEST_F(HttpServerTest, OversizedBodyRejectedForHttp10) {
    ServerConfig config = DefaultConfig();
    config.max_body_size = 1024;
    StartServer(config);
    TestClient client(server->Port());

    auto request = MakeRequest(http::verb::post, "/api/v1/certificates/sign",
                               std::string(4096, 'x'), "application/json");
    request.version(10);
    auto response = client.Send(request);

    EXPECT_EQ(response.result(), http::status::payload_too_large);
    EXPECT_EQ(response.version(), 10u);
    EXPECT_FALSE(response.keep_alive());
}

TEST_F(HttpServerTest, BearerGateOverSocket) {
    WriteTestCredentials(*authority, resources);
    ServerConfig config = DefaultConfig();
    config.token = "integration-token";
    config.public_url = "http://127.0.0.1";
    StartServer(config);
    TestClient client(server->Port());

    auto denied = client.Send(MakeRequest(http::verb::get, "/api/v1/c2pa/configuration"));
    EXPECT_EQ(denied.result(), http::status::unauthorized);

    auto request = MakeRequest(http::verb::get, "/api/v1/c2pa/configuration");
    request.set(http::field::authorization, "Bearer integration-token");
    auto allowed = client.Send(request);
    EXPECT_EQ(allowed.result(), http::status::ok);
    EXPECT_EQ(json::parse(allowed.body())["signing_url"], "http://127.0.0.1/api/v1/c2pa/sign");
}

TEST_F(HttpServerTest, PortInUse) {
    StartServer(DefaultConfig());

    HttpServerOptions options;
    options.host = "127.0.0.1";
    options.port = server->Port();
    options.threads = 1;
    options.max_body_size = 1024;

    HttpServer second(std::make_shared<const Router>(), options);
    EXPECT_THROW(second.Start(), StartupError);
}

TEST_F(HttpServerTest, InvalidHost) {
    HttpServerOptions options;
    options.host = "not-an-address";

    HttpServer bad(std::make_shared<const Router>(), options);
    EXPECT_THROW(bad.Start(), StartupError);
}

/**
 * @file c2pasign_server.cpp
 * @brief C2PA signing server executable
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/ca/certificate_authority.h"
#include "c2pasign/common/error.h"
#include "c2pasign/server/c2pa_manifest_engine.h"
#include "c2pasign/server/c2pa_signing_service.h"
#include "c2pasign/server/config.h"
#include "c2pasign/server/http_server.h"
#include "c2pasign/server/routes.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <glog/logging.h>
#include <csignal>
#include <iostream>

using namespace c2pasign;
using namespace c2pasign::server;

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;

    ServerConfig config;
    try {
        config = ParseServerConfig(argc, argv, ProcessEnvironment());
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        PrintUsage(std::cerr, argv[0]);
        return 1;
    }

    if (config.show_help) {
        PrintUsage(std::cout, argv[0]);
        return 0;
    }
    if (config.verbose) {
        FLAGS_v = 1;
    }

    std::shared_ptr<const ca::CertificateAuthority> authority;
    try {
        authority = std::make_shared<const ca::CertificateAuthority>();
    } catch (const Error& e) {
        LOG(ERROR) << "Certificate authority bootstrap failed: " << e.what();
        return 1;
    }
    LOG(INFO) << "Root CA: " << authority->RootCertificate().GetSubject();
    LOG(INFO) << "Intermediate CA: " << authority->IntermediateCertificate().GetSubject();

    try {
        SigningServiceOptions service_options;
        service_options.resources_dir = config.resources_dir;
        service_options.tsa_url = config.tsa_url;
        auto signing_service = std::make_shared<const C2paSigningService>(
            std::make_shared<const C2paManifestEngine>(), service_options);

        try {
            signing_service->LoadTestCredentials();
        } catch (const MissingMaterialError& e) {
            LOG(WARNING) << "C2PA signing will fail until test credentials are provided: " << e.what();
        }

        if (!config.token) {
            LOG(WARNING) << "No bearer token configured, C2PA routes are open";
        }
        if (!config.public_url) {
            LOG(WARNING) << "No public URL configured, " << CONFIGURATION_PATH << " will fail";
        }

        auto router = std::make_shared<const Router>(BuildRouter(config, authority, signing_service));

        HttpServerOptions server_options;
        server_options.host = config.host;
        server_options.port = config.port;
        server_options.threads = config.threads;
        server_options.max_body_size = config.max_body_size;

        HttpServer server(router, server_options);
        server.Start();

        LOG(INFO) << "c2pa " << signing_service->EngineVersion() << ", "
                  << (config.production ? "production" : "development") << " mode";

        boost::asio::io_context signal_context;
        boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
            if (!ec) {
                LOG(INFO) << "Received signal " << signal_number << ", shutting down";
            }
        });
        signal_context.run();

        server.Stop();
        server.Wait();
        LOG(INFO) << "Server stopped";
        return 0;

    } catch (const std::exception& e) {
        LOG(ERROR) << e.what();
        return 1;
    }
}

/**
 * @file routes.cpp
 * @brief Route table of the signing server
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/server/routes.h"
#include "c2pasign/server/c2pa_controller.h"
#include "c2pasign/server/certificate_controller.h"

namespace c2pasign {
namespace server {

Router BuildRouter(
    const ServerConfig& config,
    std::shared_ptr<const ca::CertificateAuthority> authority,
    std::shared_ptr<const C2paSigningService> signing_service
) {
    auto certificates = std::make_shared<const CertificateController>(std::move(authority));

    C2paControllerOptions c2pa_options;
    c2pa_options.token = config.token;
    c2pa_options.public_url = config.public_url;
    c2pa_options.timestamp_url = config.timestamp_url;
    auto c2pa = std::make_shared<const C2paController>(std::move(signing_service), c2pa_options);

    Router router(config.production);

    router.Add(http::verb::get, ROOT_PATH, [c2pa](const HttpRequest& request) {
        return c2pa->Status(request);
    });

    router.Add(http::verb::get, HEALTH_PATH, [](const HttpRequest& request) {
        HttpResponse response{http::status::ok, request.version()};
        response.keep_alive(request.keep_alive());
        response.prepare_payload();
        return response;
    });

    router.Add(http::verb::post, CERTIFICATE_SIGN_PATH, [certificates](const HttpRequest& request) {
        return certificates->SignCertificate(request);
    });

    router.Add(http::verb::get, CONFIGURATION_PATH, [c2pa](const HttpRequest& request) {
        return c2pa->Configuration(request);
    });

    router.Add(http::verb::post, SIGN_PATH, [c2pa](const HttpRequest& request) {
        return c2pa->Sign(request);
    });

    return router;
}

} // namespace server
} // namespace c2pasign

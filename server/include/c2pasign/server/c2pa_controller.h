/**
 * @file c2pa_controller.h
 * @brief C2PA configuration and signing endpoints behind the bearer gate
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_SERVER_C2PA_CONTROLLER_H
#define C2PASIGN_SERVER_C2PA_CONTROLLER_H

#include "c2pasign/server/c2pa_signing_service.h"
#include "c2pasign/server/router.h"
#include <memory>
#include <optional>
#include <string>

namespace c2pasign {
namespace server {

constexpr const char* SIGN_PATH = "/api/v1/c2pa/sign";
constexpr const char* CONFIGURATION_PATH = "/api/v1/c2pa/configuration";

constexpr const char* HEADER_ALGORITHM = "X-C2PA-Algorithm";
constexpr const char* HEADER_TIMESTAMP = "X-C2PA-Timestamp";
constexpr const char* HEADER_CERTIFICATE_CHAIN = "X-C2PA-Certificate-Chain";

struct C2paControllerOptions {
    /// Required bearer token; nullopt leaves the routes open
    std::optional<std::string> token;

    /// Base URL the configuration route advertises
    std::optional<std::string> public_url;

    std::string timestamp_url;
};

class C2paController {
public:
    C2paController(std::shared_ptr<const C2paSigningService> service, C2paControllerOptions options);

    /**
     * @brief Check the Authorization header against the configured token
     * @throws UnauthorizedError if a token is configured and the header does not carry it
     */
    void Authorize(const HttpRequest& request) const;

    /**
     * @brief GET /api/v1/c2pa/configuration
     * @throws MissingMaterialError if the public URL or the certificate chain is unavailable
     */
    HttpResponse Configuration(const HttpRequest& request) const;

    /**
     * @brief POST /api/v1/c2pa/sign
     *
     * multipart/form-data signs a manifest into the "image" part,
     * application/json signs a base64 claim.
     *
     * @throws MalformedInputError for any other content type or a malformed body
     */
    HttpResponse Sign(const HttpRequest& request) const;

    /**
     * @brief GET / status document
     */
    HttpResponse Status(const HttpRequest& request) const;

private:
    HttpResponse SignManifest(const HttpRequest& request) const;
    HttpResponse SignClaim(const HttpRequest& request) const;

    std::shared_ptr<const C2paSigningService> service_;
    C2paControllerOptions options_;
};

} // namespace server
} // namespace c2pasign

#endif // C2PASIGN_SERVER_C2PA_CONTROLLER_H

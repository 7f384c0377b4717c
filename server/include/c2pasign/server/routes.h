/**
 * @file routes.h
 * @brief Route table of the signing server
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_SERVER_ROUTES_H
#define C2PASIGN_SERVER_ROUTES_H

#include "c2pasign/ca/certificate_authority.h"
#include "c2pasign/server/c2pa_signing_service.h"
#include "c2pasign/server/config.h"
#include "c2pasign/server/router.h"
#include <memory>

namespace c2pasign {
namespace server {

constexpr const char* ROOT_PATH = "/";
constexpr const char* HEALTH_PATH = "/health";
constexpr const char* CERTIFICATE_SIGN_PATH = "/api/v1/certificates/sign";

/**
 * @brief Register all routes
 *
 *   GET  /                            status
 *   GET  /health                      liveness
 *   POST /api/v1/certificates/sign    CSR signing
 *   GET  /api/v1/c2pa/configuration   signer configuration (bearer gate)
 *   POST /api/v1/c2pa/sign            manifest or claim signing (bearer gate)
 */
Router BuildRouter(
    const ServerConfig& config,
    std::shared_ptr<const ca::CertificateAuthority> authority,
    std::shared_ptr<const C2paSigningService> signing_service
);

} // namespace server
} // namespace c2pasign

#endif // C2PASIGN_SERVER_ROUTES_H

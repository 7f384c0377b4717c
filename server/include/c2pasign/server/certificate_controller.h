/**
 * @file certificate_controller.h
 * @brief CSR signing endpoint
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_SERVER_CERTIFICATE_CONTROLLER_H
#define C2PASIGN_SERVER_CERTIFICATE_CONTROLLER_H

#include "c2pasign/ca/certificate_authority.h"
#include "c2pasign/server/router.h"
#include <memory>

namespace c2pasign {
namespace server {

class CertificateController {
public:
    explicit CertificateController(std::shared_ptr<const ca::CertificateAuthority> authority);

    /**
     * @brief POST /api/v1/certificates/sign
     * @throws MalformedInputError for bad JSON or CSR
     */
    HttpResponse SignCertificate(const HttpRequest& request) const;

private:
    std::shared_ptr<const ca::CertificateAuthority> authority_;
};

} // namespace server
} // namespace c2pasign

#endif // C2PASIGN_SERVER_CERTIFICATE_CONTROLLER_H

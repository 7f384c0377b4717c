/**
 * @file certificate_controller.cpp
 * @brief CSR signing endpoint
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/server/certificate_controller.h"

namespace c2pasign {
namespace server {

CertificateController::CertificateController(std::shared_ptr<const ca::CertificateAuthority> authority)
    : authority_(std::move(authority)) {}

HttpResponse CertificateController::SignCertificate(const HttpRequest& request) const {
    CertificateSigningRequest csr_request = ParseCertificateSigningRequest(request.body());

    ca::IssuedCertificate issued = authority_->SignCSR(csr_request.csr, csr_request.metadata);

    return JsonResponse(request, http::status::ok, IssuedCertificateToJSON(issued));
}

} // namespace server
} // namespace c2pasign

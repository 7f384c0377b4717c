/**
 * @file api.h
 * @brief JSON request and response models of the HTTP API
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_SERVER_API_H
#define C2PASIGN_SERVER_API_H

#include "c2pasign/ca/certificate_authority.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace c2pasign {
namespace server {

using json = nlohmann::json;

constexpr const char* SERVER_STATUS = "C2PA Signing Server is running";
constexpr const char* SERVER_VERSION = "1.0.0";
constexpr const char* SERVER_MODE = "testing";

/**
 * @brief Body of POST /api/v1/certificates/sign
 */
struct CertificateSigningRequest {
    std::string csr;
    std::optional<ca::CsrMetadata> metadata;
};

/**
 * @brief Body of a JSON-encoded manifest signing request
 */
struct ManifestSigningRequest {
    std::string manifest_json;
    std::string format;
};

/**
 * @brief Parse a CSR signing request
 *
 * Metadata keys are accepted in snake_case and camelCase.
 *
 * @throws MalformedInputError if the body is not JSON, csr is missing or not a string
 */
CertificateSigningRequest ParseCertificateSigningRequest(const std::string& body);

/**
 * @brief Parse the "request" part of a manifest signing request
 *
 * manifest_json (or manifestJSON) may be a string or an embedded object.
 * format must be a bare "type/subtype" media type of token characters.
 *
 * @throws MalformedInputError if the body is not JSON, a field is missing or
 *         the format is not a media type
 */
ManifestSigningRequest ParseManifestSigningRequest(const std::string& body);

/**
 * @brief Decode {"claim": base64} into claim bytes
 * @throws MalformedInputError if the body is not JSON or claim is not valid base64
 */
std::vector<uint8_t> ParseClaimSigningRequest(const std::string& body);

json IssuedCertificateToJSON(const ca::IssuedCertificate& issued);

json ClaimSignatureToJSON(const std::vector<uint8_t>& signature);

json StatusToJSON(const std::string& engine_version);

/**
 * @brief Error body {"error": true, "category", "kind", "reason"}
 */
json ErrorToJSON(const std::string& category, const std::string& kind, const std::string& reason);

/**
 * @brief Unix seconds as "YYYY-MM-DDTHH:MM:SSZ"
 */
std::string FormatIso8601(int64_t epoch_seconds);

} // namespace server
} // namespace c2pasign

#endif // C2PASIGN_SERVER_API_H

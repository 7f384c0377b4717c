/**
 * @file c2pa_controller.cpp
 * @brief C2PA configuration and signing endpoints behind the bearer gate
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/server/c2pa_controller.h"
#include "c2pasign/server/multipart.h"
#include "c2pasign/common/pem.h"
#include <openssl/crypto.h>

namespace c2pasign {
namespace server {

namespace {

constexpr const char* BEARER_PREFIX = "Bearer ";
constexpr const char* REQUEST_PART = "request";
constexpr const char* IMAGE_PART = "image";
constexpr const char* ENGINE_ALGORITHM_NAME = "es256";

bool TokensEqual(const std::string& presented, const std::string& expected) {
    if (presented.size() != expected.size()) {
        return false;
    }
    return CRYPTO_memcmp(presented.data(), expected.data(), expected.size()) == 0;
}

std::vector<uint8_t> Bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

}  // namespace

C2paController::C2paController(std::shared_ptr<const C2paSigningService> service,
                               C2paControllerOptions options)
    : service_(std::move(service)), options_(std::move(options)) {}

void C2paController::Authorize(const HttpRequest& request) const {
    if (!options_.token) {
        return;
    }

    auto header = request.find(http::field::authorization);
    if (header == request.end()) {
        throw UnauthorizedError("Missing Authorization header");
    }

    std::string value(header->value());
    const std::string prefix = BEARER_PREFIX;
    if (value.compare(0, prefix.size(), prefix) != 0) {
        throw UnauthorizedError("Invalid Authorization header format");
    }

    if (!TokensEqual(value.substr(prefix.size()), *options_.token)) {
        throw UnauthorizedError("Invalid bearer token");
    }
}

HttpResponse C2paController::Configuration(const HttpRequest& request) const {
    Authorize(request);

    if (!options_.public_url) {
        throw MissingMaterialError("Public signing URL is not configured");
    }

    std::string chain = service_->LoadCertificateChain();

    json body;
    body["algorithm"] = ENGINE_ALGORITHM_NAME;
    body["timestamp_url"] = options_.timestamp_url;
    body["signing_url"] = *options_.public_url + SIGN_PATH;
    body["certificate_chain"] = pem::Base64Encode(Bytes(chain));

    return JsonResponse(request, http::status::ok, body);
}

HttpResponse C2paController::Sign(const HttpRequest& request) const {
    Authorize(request);

    std::string content_type(request[http::field::content_type]);
    std::string media_type = MediaType(content_type);

    if (media_type == "multipart/form-data") {
        return SignManifest(request);
    }
    if (media_type == CONTENT_TYPE_JSON) {
        return SignClaim(request);
    }
    throw MalformedInputError("Unsupported Content-Type \"" + content_type +
                              "\", expected multipart/form-data or application/json");
}

HttpResponse C2paController::Status(const HttpRequest& request) const {
    return JsonResponse(request, http::status::ok, StatusToJSON(service_->EngineVersion()));
}

HttpResponse C2paController::SignManifest(const HttpRequest& request) const {
    std::string boundary = MultipartBoundary(std::string(request[http::field::content_type]));
    std::vector<MultipartPart> parts = ParseMultipart(request.body(), boundary);

    const MultipartPart* request_part = FindPart(parts, REQUEST_PART);
    if (!request_part) {
        throw MalformedInputError("Missing \"request\" part");
    }
    const MultipartPart* image_part = FindPart(parts, IMAGE_PART);
    if (!image_part) {
        throw MalformedInputError("Missing \"image\" part");
    }
    if (image_part->body.empty()) {
        throw MalformedInputError("Empty \"image\" part");
    }

    ManifestSigningRequest signing_request = ParseManifestSigningRequest(request_part->body);

    SignedManifest signed_manifest = service_->SignManifest(
        signing_request.manifest_json, Bytes(image_part->body), signing_request.format);

    HttpResponse response{http::status::ok, request.version()};
    response.set(http::field::content_type, signing_request.format);
    response.set(HEADER_ALGORITHM, signed_manifest.algorithm);
    response.set(HEADER_TIMESTAMP, FormatIso8601(signed_manifest.timestamp));
    response.set(HEADER_CERTIFICATE_CHAIN, pem::Base64Encode(Bytes(signed_manifest.certificate_chain)));
    response.keep_alive(request.keep_alive());
    response.body().assign(signed_manifest.asset.begin(), signed_manifest.asset.end());
    response.prepare_payload();
    return response;
}

HttpResponse C2paController::SignClaim(const HttpRequest& request) const {
    std::vector<uint8_t> claim = ParseClaimSigningRequest(request.body());
    std::vector<uint8_t> signature = service_->SignClaim(claim);

    return JsonResponse(request, http::status::ok, ClaimSignatureToJSON(signature));
}

} // namespace server
} // namespace c2pasign

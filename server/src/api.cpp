/**
 * @file api.cpp
 * @brief JSON request and response models of the HTTP API
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/server/api.h"
#include "c2pasign/common/error.h"
#include "c2pasign/common/pem.h"
#include <cctype>
#include <cstring>
#include <ctime>
#include <stdexcept>

namespace c2pasign {
namespace server {

namespace {

json ParseObject(const std::string& body, const char* what) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        throw MalformedInputError(std::string(what) + " is not valid JSON");
    }
    if (!j.is_object()) {
        throw MalformedInputError(std::string(what) + " must be a JSON object");
    }
    return j;
}

/**
 * @brief String value under the first present key, nullopt if none is present
 */
std::optional<std::string> StringField(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            continue;
        }
        if (!it->is_string()) {
            throw MalformedInputError(std::string("Field \"") + key + "\" must be a string");
        }
        return it->get<std::string>();
    }
    return std::nullopt;
}

// RFC 7230 tchar
bool IsTokenChar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    return c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

bool IsToken(const std::string& text, size_t begin, size_t end) {
    if (begin >= end) {
        return false;
    }
    for (size_t i = begin; i < end; ++i) {
        if (!IsTokenChar(text[i])) {
            return false;
        }
    }
    return true;
}

/**
 * @brief True if text is a bare "type/subtype" media type
 *
 * The format is echoed as the response Content-Type, so anything outside the
 * token alphabet (whitespace, CR, LF, parameters) is refused.
 */
bool IsBareMediaType(const std::string& text) {
    size_t slash = text.find('/');
    if (slash == std::string::npos || text.find('/', slash + 1) != std::string::npos) {
        return false;
    }
    return IsToken(text, 0, slash) && IsToken(text, slash + 1, text.size());
}

}  // namespace

CertificateSigningRequest ParseCertificateSigningRequest(const std::string& body) {
    json j = ParseObject(body, "Request body");

    CertificateSigningRequest request;
    auto csr = StringField(j, {"csr"});
    if (!csr) {
        throw MalformedInputError("Missing \"csr\" field");
    }
    request.csr = *csr;

    auto metadata = j.find("metadata");
    if (metadata != j.end() && !metadata->is_null()) {
        if (!metadata->is_object()) {
            throw MalformedInputError("Field \"metadata\" must be an object");
        }
        ca::CsrMetadata meta;
        meta.device_id = StringField(*metadata, {"device_id", "deviceId"});
        meta.app_version = StringField(*metadata, {"app_version", "appVersion"});
        meta.purpose = StringField(*metadata, {"purpose"});
        request.metadata = meta;
    }

    return request;
}

ManifestSigningRequest ParseManifestSigningRequest(const std::string& body) {
    json j = ParseObject(body, "Signing request");

    ManifestSigningRequest request;

    const json* manifest = nullptr;
    for (const char* key : {"manifest_json", "manifestJSON"}) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            manifest = &*it;
            break;
        }
    }
    if (!manifest) {
        throw MalformedInputError("Missing \"manifest_json\" field");
    }
    if (manifest->is_string()) {
        request.manifest_json = manifest->get<std::string>();
    } else if (manifest->is_object()) {
        request.manifest_json = manifest->dump();
    } else {
        throw MalformedInputError("Field \"manifest_json\" must be a string or object");
    }

    auto format = StringField(j, {"format"});
    if (!format || format->empty()) {
        throw MalformedInputError("Missing \"format\" field");
    }
    if (!IsBareMediaType(*format)) {
        throw MalformedInputError("Field \"format\" must be a type/subtype media type");
    }
    request.format = *format;

    return request;
}

std::vector<uint8_t> ParseClaimSigningRequest(const std::string& body) {
    json j = ParseObject(body, "Claim request");

    auto claim = StringField(j, {"claim"});
    if (!claim) {
        throw MalformedInputError("Missing \"claim\" field");
    }
    return pem::Base64Decode(*claim);
}

json IssuedCertificateToJSON(const ca::IssuedCertificate& issued) {
    json j;
    j["certificate_id"] = issued.certificate_id;
    j["certificate_chain"] = issued.certificate_chain;
    j["expires_at"] = FormatIso8601(issued.expires_at);
    j["serial_number"] = issued.serial_number;
    return j;
}

json ClaimSignatureToJSON(const std::vector<uint8_t>& signature) {
    json j;
    j["signature"] = pem::Base64Encode(signature);
    return j;
}

json StatusToJSON(const std::string& engine_version) {
    json j;
    j["status"] = SERVER_STATUS;
    j["version"] = SERVER_VERSION;
    j["mode"] = SERVER_MODE;
    j["c2pa_version"] = engine_version;
    return j;
}

json ErrorToJSON(const std::string& category, const std::string& kind, const std::string& reason) {
    json j;
    j["error"] = true;
    j["category"] = category;
    j["kind"] = kind;
    j["reason"] = reason;
    return j;
}

std::string FormatIso8601(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    if (!gmtime_r(&t, &tm)) {
        throw std::out_of_range("Timestamp out of range: " + std::to_string(epoch_seconds));
    }

    char buffer[32];
    size_t n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer, n);
}

} // namespace server
} // namespace c2pasign

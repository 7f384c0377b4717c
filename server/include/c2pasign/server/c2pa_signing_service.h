/**
 * @file c2pa_signing_service.h
 * @brief Manifest and claim signing with the static test credentials
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_SERVER_C2PA_SIGNING_SERVICE_H
#define C2PASIGN_SERVER_C2PA_SIGNING_SERVICE_H

#include "c2pasign/server/manifest_engine.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace c2pasign {
namespace server {

constexpr const char* CERTIFICATE_CHAIN_FILE = "es256_certs.pem";
constexpr const char* PRIVATE_KEY_FILE = "es256_private.key";
constexpr const char* SIGNING_ALGORITHM = "ES256";

struct SigningServiceOptions {
    /// Directory holding CERTIFICATE_CHAIN_FILE and PRIVATE_KEY_FILE
    std::string resources_dir;

    /// Timestamp authority passed to the engine
    std::optional<std::string> tsa_url;

    /// Where request-scoped temporary files are created
    std::string temp_dir = "/tmp";
};

/**
 * @brief PEM text of the test certificate chain and key
 */
struct TestCredentials {
    std::string certificate_chain;
    std::string private_key_pem;
};

struct SignedManifest {
    std::vector<uint8_t> asset;
    std::string algorithm;          ///< Always SIGNING_ALGORITHM
    std::string certificate_chain;  ///< PEM chain used for signing
    int64_t timestamp = 0;          ///< Unix seconds at signing
};

/**
 * @brief Signs C2PA manifests and claims with the files in the resources directory
 *
 * The credential files are read on every call so they can be replaced while
 * the server runs.
 */
class C2paSigningService {
public:
    C2paSigningService(std::shared_ptr<const ManifestEngine> engine, SigningServiceOptions options);

    /**
     * @brief Read and sanity-check the chain and key files
     * @throws MissingMaterialError if a file is missing, unreadable or has no PEM marker
     */
    TestCredentials LoadTestCredentials() const;

    /**
     * @brief Read the chain file only
     * @throws MissingMaterialError if it is missing or has no certificate marker
     */
    std::string LoadCertificateChain() const;

    /**
     * @brief Embed a signed manifest into an asset
     *
     * @param manifest_json Manifest definition
     * @param asset Unsigned asset bytes
     * @param format Asset MIME type
     * @throws MalformedInputError if manifest_json or format is empty
     * @throws MissingMaterialError if the test credentials are unavailable
     * @throws EngineError on engine or temporary file failure
     */
    SignedManifest SignManifest(
        const std::string& manifest_json,
        const std::vector<uint8_t>& asset,
        const std::string& format
    ) const;

    /**
     * @brief ES256 signature over claim bytes, r || s encoding
     * @throws MalformedInputError if the claim is empty
     * @throws MissingMaterialError if the test credentials are unavailable
     * @throws CryptoError if the key does not load or signing fails
     */
    std::vector<uint8_t> SignClaim(const std::vector<uint8_t>& claim) const;

    std::string EngineVersion() const;

private:
    std::shared_ptr<const ManifestEngine> engine_;
    SigningServiceOptions options_;
};

} // namespace server
} // namespace c2pasign

#endif // C2PASIGN_SERVER_C2PA_SIGNING_SERVICE_H

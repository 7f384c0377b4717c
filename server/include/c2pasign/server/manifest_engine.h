/**
 * @file manifest_engine.h
 * @brief Interface to the native C2PA manifest engine
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_SERVER_MANIFEST_ENGINE_H
#define C2PASIGN_SERVER_MANIFEST_ENGINE_H

#include <iosfwd>
#include <optional>
#include <string>

namespace c2pasign {
namespace server {

/**
 * @brief Signing material handed to the engine
 */
struct SignerDescriptor {
    std::string algorithm;          ///< Engine algorithm name, e.g. "es256"
    std::string certificate_chain;  ///< PEM chain, leaf first
    std::string private_key_pem;
    std::optional<std::string> tsa_url;
};

/**
 * @brief Embeds a signed C2PA manifest into an asset
 *
 * Implementations must be safe to call from several threads at once.
 */
class ManifestEngine {
public:
    virtual ~ManifestEngine() = default;

    /**
     * @brief Engine version string, reported by the status route
     */
    virtual std::string Version() const = 0;

    /**
     * @brief Sign and embed a manifest
     *
     * @param manifest_json Manifest definition
     * @param format Asset MIME type (e.g. "image/jpeg")
     * @param signer Signing material
     * @param source Unsigned asset
     * @param dest Receives the signed asset
     * @throws EngineError if the engine rejects the manifest, asset or signer
     */
    virtual void Sign(
        const std::string& manifest_json,
        const std::string& format,
        const SignerDescriptor& signer,
        std::istream& source,
        std::iostream& dest
    ) const = 0;
};

} // namespace server
} // namespace c2pasign

#endif // C2PASIGN_SERVER_MANIFEST_ENGINE_H

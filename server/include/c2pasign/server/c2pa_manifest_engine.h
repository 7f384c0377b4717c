/**
 * @file c2pa_manifest_engine.h
 * @brief ManifestEngine backed by the c2pa C++ API
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_SERVER_C2PA_MANIFEST_ENGINE_H
#define C2PASIGN_SERVER_C2PA_MANIFEST_ENGINE_H

#include "c2pasign/server/manifest_engine.h"

namespace c2pasign {
namespace server {

/**
 * @brief Signs through c2pa::Builder with a c2pa::Signer built per call
 *
 * Each call creates its own context, builder and signer, so instances carry
 * no state and can be shared between sessions.
 */
class C2paManifestEngine : public ManifestEngine {
public:
    std::string Version() const override;

    void Sign(
        const std::string& manifest_json,
        const std::string& format,
        const SignerDescriptor& signer,
        std::istream& source,
        std::iostream& dest
    ) const override;
};

} // namespace server
} // namespace c2pasign

#endif // C2PASIGN_SERVER_C2PA_MANIFEST_ENGINE_H

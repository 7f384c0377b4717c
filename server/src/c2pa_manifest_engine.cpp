/**
 * @file c2pa_manifest_engine.cpp
 * @brief ManifestEngine backed by the c2pa C++ API
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/server/c2pa_manifest_engine.h"
#include "c2pasign/common/error.h"
#include <c2pa.hpp>
#include <glog/logging.h>
#include <istream>

namespace c2pasign {
namespace server {

std::string C2paManifestEngine::Version() const {
    return c2pa::version();
}

void C2paManifestEngine::Sign(
    const std::string& manifest_json,
    const std::string& format,
    const SignerDescriptor& signer,
    std::istream& source,
    std::iostream& dest
) const {
    try {
        c2pa::Context context;
        c2pa::Builder builder(context, manifest_json);
        c2pa::Signer c2pa_signer(signer.algorithm, signer.certificate_chain,
                                 signer.private_key_pem, signer.tsa_url);

        std::vector<unsigned char> manifest_bytes = builder.sign(format, source, dest, c2pa_signer);
        VLOG(1) << "c2pa manifest embedded, " << manifest_bytes.size() << " manifest bytes";
    } catch (const c2pa::C2paException& e) {
        throw EngineError(std::string("c2pa signing failed: ") + e.what());
    }
}

} // namespace server
} // namespace c2pasign

/**
 * @file crypto_ecdsa.cpp
 * @brief ECDSA (SHA-256) signing and verification implementation
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/common/crypto.h"
#include "openssl_wrappers.h"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>

namespace c2pasign {
namespace crypto {

using namespace internal;

namespace {

EVP_PKEY* RequireEcKey(void* handle, const char* role) {
    auto* pkey = static_cast<EVP_PKEY*>(handle);
    if (!pkey) {
        throw CryptoError(std::string("Empty ") + role);
    }
    if (!EVP_PKEY_is_a(pkey, "EC")) {
        throw CryptoError(std::string(role) + " is not an EC key");
    }
    return pkey;
}

size_t CoordinateSize(EVP_PKEY* pkey) {
    int bits = EVP_PKEY_get_bits(pkey);
    if (bits <= 0) {
        throw CryptoError("Failed to determine EC key size");
    }
    return static_cast<size_t>((bits + 7) / 8);
}

}  // namespace

// ============================================================================
// ECDSA Implementation
// ============================================================================

std::vector<uint8_t> ECDSA::Sign(
    const PrivateKey& private_key,
    const std::vector<uint8_t>& data
) {
    EVP_PKEY* pkey = RequireEcKey(private_key.GetNativeHandle(), "Signing key");

    EVP_MD_CTX_ptr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw CryptoError("Failed to create signature context");
    }

    if (EVP_DigestSignInit(md_ctx.get(), nullptr, EVP_sha256(), nullptr, pkey) != 1) {
        throw CryptoError("Failed to initialize ECDSA signing");
    }

    // Get maximum signature length
    size_t sig_len = 0;
    if (EVP_DigestSign(md_ctx.get(), nullptr, &sig_len, data.data(), data.size()) != 1) {
        throw CryptoError("Failed to get ECDSA signature length");
    }

    std::vector<uint8_t> signature(sig_len);
    if (EVP_DigestSign(md_ctx.get(), signature.data(), &sig_len, data.data(), data.size()) != 1) {
        throw CryptoError("Failed to create ECDSA signature");
    }

    // DER length varies with leading zeros of r and s
    signature.resize(sig_len);
    return signature;
}

std::vector<uint8_t> ECDSA::SignRaw(
    const PrivateKey& private_key,
    const std::vector<uint8_t>& data
) {
    EVP_PKEY* pkey = RequireEcKey(private_key.GetNativeHandle(), "Signing key");
    const size_t coordinate_size = CoordinateSize(pkey);

    std::vector<uint8_t> der = Sign(private_key, data);

    const unsigned char* p = der.data();
    ECDSA_SIG_ptr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size())));
    if (!sig) {
        throw CryptoError("Failed to decode ECDSA signature");
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    std::vector<uint8_t> raw(2 * coordinate_size);
    const int width = static_cast<int>(coordinate_size);
    if (BN_bn2binpad(r, raw.data(), width) != width ||
        BN_bn2binpad(s, raw.data() + coordinate_size, width) != width) {
        throw CryptoError("Failed to encode raw ECDSA signature");
    }

    return raw;
}

bool ECDSA::Verify(
    const PublicKey& public_key,
    const std::vector<uint8_t>& data,
    const std::vector<uint8_t>& signature
) {
    EVP_PKEY* pkey = RequireEcKey(public_key.GetNativeHandle(), "Verification key");

    if (signature.empty()) {
        throw SignatureVerificationError();
    }

    EVP_MD_CTX_ptr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw CryptoError("Failed to create verification context");
    }

    if (EVP_DigestVerifyInit(md_ctx.get(), nullptr, EVP_sha256(), nullptr, pkey) != 1) {
        throw CryptoError("Failed to initialize verification");
    }

    int result = EVP_DigestVerify(md_ctx.get(), signature.data(), signature.size(), data.data(), data.size());
    ERR_clear_error();

    if (result == 1) {
        return true;
    }
    // 0 = mismatch, negative = malformed DER; both mean the signature does not verify
    throw SignatureVerificationError();
}

bool ECDSA::VerifyRaw(
    const PublicKey& public_key,
    const std::vector<uint8_t>& data,
    const std::vector<uint8_t>& raw_signature
) {
    EVP_PKEY* pkey = RequireEcKey(public_key.GetNativeHandle(), "Verification key");
    const size_t coordinate_size = CoordinateSize(pkey);

    if (raw_signature.size() != 2 * coordinate_size) {
        throw CryptoError("Invalid raw ECDSA signature size (expected " +
                          std::to_string(2 * coordinate_size) + " bytes)");
    }

    BIGNUM_ptr r(BN_bin2bn(raw_signature.data(), static_cast<int>(coordinate_size), nullptr));
    BIGNUM_ptr s(BN_bin2bn(raw_signature.data() + coordinate_size, static_cast<int>(coordinate_size), nullptr));
    ECDSA_SIG_ptr sig(ECDSA_SIG_new());
    if (!r || !s || !sig) {
        throw CryptoError("Failed to allocate ECDSA signature");
    }

    // ECDSA_SIG_set0 takes ownership of r and s
    if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
        throw CryptoError("Failed to assemble ECDSA signature");
    }
    r.release();
    s.release();

    unsigned char* der = nullptr;
    int der_len = i2d_ECDSA_SIG(sig.get(), &der);
    if (der_len <= 0) {
        throw CryptoError("Failed to encode ECDSA signature");
    }
    std::vector<uint8_t> der_signature(der, der + der_len);
    OPENSSL_free(der);

    return Verify(public_key, data, der_signature);
}

} // namespace crypto
} // namespace c2pasign

/**
 * @file crypto_hash.cpp
 * @brief Digests, randomness and identifier formatting
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/common/crypto.h"
#include "openssl_wrappers.h"
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace c2pasign {
namespace crypto {

using namespace internal;

namespace {

std::vector<uint8_t> Digest(const EVP_MD* md, size_t expected_size, const std::vector<uint8_t>& data) {
    EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw CryptoError("Failed to create hash context");
    }

    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        throw CryptoError("Failed to initialize hash");
    }

    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw CryptoError("Failed to update hash");
    }

    std::vector<uint8_t> hash(expected_size);
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &hash_len) != 1) {
        throw CryptoError("Failed to finalize hash");
    }

    if (hash_len != expected_size) {
        throw CryptoError("Unexpected hash size");
    }

    return hash;
}

constexpr char kLowerHex[] = "0123456789abcdef";
constexpr char kUpperHex[] = "0123456789ABCDEF";

}  // namespace

// ============================================================================
// SHA256 / SHA1 Implementation
// ============================================================================

std::vector<uint8_t> SHA256::Hash(const std::vector<uint8_t>& data) {
    return Digest(EVP_sha256(), SHA256_HASH_SIZE, data);
}

std::vector<uint8_t> SHA1::Hash(const std::vector<uint8_t>& data) {
    return Digest(EVP_sha1(), SHA1_HASH_SIZE, data);
}

// ============================================================================
// Randomness and identifiers
// ============================================================================

std::vector<uint8_t> RandomBytes(size_t size) {
    if (RAND_status() != 1) {
        throw CryptoError("OpenSSL PRNG not properly seeded - insufficient entropy");
    }

    std::vector<uint8_t> bytes(size);
    if (size > 0 && RAND_bytes(bytes.data(), static_cast<int>(size)) != 1) {
        throw CryptoError("Failed to generate random bytes");
    }
    return bytes;
}

std::string GenerateUUID() {
    std::vector<uint8_t> b = RandomBytes(16);

    // RFC 4122 version 4, variant 10xx
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);

    std::string uuid;
    uuid.reserve(36);
    for (size_t i = 0; i < b.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            uuid += '-';
        }
        uuid += kUpperHex[b[i] >> 4];
        uuid += kUpperHex[b[i] & 0x0F];
    }
    return uuid;
}

std::string ToColonHex(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve(bytes.size() * 3);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) {
            out += ':';
        }
        out += kLowerHex[bytes[i] >> 4];
        out += kLowerHex[bytes[i] & 0x0F];
    }
    return out;
}

} // namespace crypto
} // namespace c2pasign

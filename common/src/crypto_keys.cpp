/**
 * @file crypto_keys.cpp
 * @brief EC key wrapper implementations (OpenSSL 3.x)
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/common/crypto.h"
#include "openssl_wrappers.h"
#include "x509_constants.h"
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/x509.h>
#include <fstream>
#include <iterator>

namespace c2pasign {
namespace crypto {

using namespace internal;

namespace {

std::string ReadBio(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data) {
        return std::string();
    }
    return std::string(data, static_cast<size_t>(len));
}

}  // namespace

// ============================================================================
// PrivateKey Implementation
// ============================================================================

class PrivateKey::Impl {
public:
    EVP_PKEY_ptr pkey;
};

PrivateKey::PrivateKey() : impl_(std::make_unique<Impl>()) {}

PrivateKey::~PrivateKey() = default;

PrivateKey::PrivateKey(PrivateKey&&) noexcept = default;
PrivateKey& PrivateKey::operator=(PrivateKey&&) noexcept = default;

PrivateKey PrivateKey::LoadFromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CryptoError("Failed to open private key file: " + path);
    }

    std::string pem((std::istreambuf_iterator<char>(file)),
                    std::istreambuf_iterator<char>());

    try {
        return LoadFromPEM(pem);
    } catch (const CryptoError&) {
        throw CryptoError("Failed to parse private key from: " + path);
    }
}

PrivateKey PrivateKey::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM");
    }

    // Accepts both PKCS#8 "PRIVATE KEY" and SEC1 "EC PRIVATE KEY"
    PrivateKey key;
    key.impl_->pkey.reset(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));

    if (!key.impl_->pkey) {
        throw CryptoError("Failed to parse private key from PEM");
    }

    return key;
}

PrivateKey PrivateKey::Generate() {
    // Refuse to generate keys from an unseeded PRNG
    if (RAND_status() != 1) {
        throw CryptoError("OpenSSL PRNG not properly seeded - insufficient entropy");
    }

    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
    if (!ctx) {
        throw CryptoError("Failed to create EC key context");
    }

    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw CryptoError("Failed to initialize EC keygen");
    }

    if (EVP_PKEY_CTX_set_group_name(ctx.get(), EC_CURVE_NAME) <= 0) {
        throw CryptoError(std::string("Failed to select curve ") + EC_CURVE_NAME);
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw CryptoError("Failed to generate P-256 key pair");
    }

    PrivateKey key;
    key.impl_->pkey.reset(raw);
    return key;
}

std::string PrivateKey::ToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_PrivateKey(bio.get(), impl_->pkey.get(), nullptr, nullptr, 0, nullptr, nullptr)) {
        throw CryptoError("Failed to write private key to PEM");
    }

    return ReadBio(bio.get());
}

bool PrivateKey::Matches(const PublicKey& public_key) const {
    auto* pub = static_cast<EVP_PKEY*>(public_key.GetNativeHandle());
    if (!impl_->pkey || !pub) {
        return false;
    }
    return EVP_PKEY_eq(impl_->pkey.get(), pub) == 1;
}

void* PrivateKey::GetNativeHandle() const {
    return impl_->pkey.get();
}

// ============================================================================
// PublicKey Implementation
// ============================================================================

class PublicKey::Impl {
public:
    EVP_PKEY_ptr pkey;
};

PublicKey::PublicKey() : impl_(std::make_unique<Impl>()) {}

PublicKey::~PublicKey() = default;

PublicKey::PublicKey(PublicKey&&) noexcept = default;
PublicKey& PublicKey::operator=(PublicKey&&) noexcept = default;

PublicKey PublicKey::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM");
    }

    PublicKey key;
    key.impl_->pkey.reset(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));

    if (!key.impl_->pkey) {
        throw CryptoError("Failed to parse public key from PEM");
    }

    return key;
}

PublicKey PublicKey::FromPrivateKey(const PrivateKey& privkey) {
    auto* priv_pkey = static_cast<EVP_PKEY*>(privkey.GetNativeHandle());
    if (!priv_pkey) {
        throw CryptoError("Cannot derive public key from empty private key");
    }

    // Export the public half and re-import it so no private material is shared
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO for public key");
    }

    if (!PEM_write_bio_PUBKEY(bio.get(), priv_pkey)) {
        throw CryptoError("Failed to write public key");
    }

    PublicKey pubkey;
    pubkey.impl_->pkey.reset(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!pubkey.impl_->pkey) {
        throw CryptoError("Failed to read public key");
    }

    return pubkey;
}

std::string PublicKey::ToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_PUBKEY(bio.get(), impl_->pkey.get())) {
        throw CryptoError("Failed to write public key to PEM");
    }

    return ReadBio(bio.get());
}

std::vector<uint8_t> PublicKey::EncodedPoint() const {
    EVP_PKEY* pkey = impl_->pkey.get();
    if (!pkey) {
        throw CryptoError("Cannot encode empty public key");
    }

    if (EVP_PKEY_is_a(pkey, "EC")) {
        // Rebuild 0x04 || X || Y from the affine coordinates so the result does
        // not depend on the point format the key was imported with
        BIGNUM* x_raw = nullptr;
        BIGNUM* y_raw = nullptr;
        if (EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_EC_PUB_X, &x_raw) != 1) {
            throw CryptoError("Failed to read EC public key X coordinate");
        }
        BIGNUM_ptr x(x_raw);
        if (EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_EC_PUB_Y, &y_raw) != 1) {
            throw CryptoError("Failed to read EC public key Y coordinate");
        }
        BIGNUM_ptr y(y_raw);

        int bits = EVP_PKEY_get_bits(pkey);
        if (bits <= 0) {
            throw CryptoError("Failed to determine EC key size");
        }
        const int coordinate_size = (bits + 7) / 8;

        std::vector<uint8_t> point(1 + 2 * static_cast<size_t>(coordinate_size));
        point[0] = 0x04;
        if (BN_bn2binpad(x.get(), point.data() + 1, coordinate_size) != coordinate_size ||
            BN_bn2binpad(y.get(), point.data() + 1 + coordinate_size, coordinate_size) != coordinate_size) {
            throw CryptoError("Failed to encode EC public key point");
        }
        return point;
    }

    // Other key types: subjectPublicKey BIT STRING contents
    X509_PUBKEY* raw_pub = nullptr;
    if (X509_PUBKEY_set(&raw_pub, pkey) != 1) {
        throw CryptoError("Failed to encode public key");
    }
    X509_PUBKEY_ptr pub(raw_pub);

    const unsigned char* bytes = nullptr;
    int len = 0;
    if (X509_PUBKEY_get0_param(nullptr, &bytes, &len, nullptr, pub.get()) != 1 || !bytes || len <= 0) {
        throw CryptoError("Failed to read encoded public key");
    }
    return std::vector<uint8_t>(bytes, bytes + len);
}

bool PublicKey::Equals(const PublicKey& other) const {
    if (!impl_->pkey || !other.impl_->pkey) {
        return false;
    }
    return EVP_PKEY_eq(impl_->pkey.get(), other.impl_->pkey.get()) == 1;
}

void* PublicKey::GetNativeHandle() const {
    return impl_->pkey.get();
}

} // namespace crypto
} // namespace c2pasign

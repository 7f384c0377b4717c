/**
 * @file openssl_wrappers.h
 * @brief RAII wrappers for OpenSSL resources
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_OPENSSL_WRAPPERS_H
#define C2PASIGN_OPENSSL_WRAPPERS_H

#include <memory>
#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace c2pasign {
namespace crypto {
namespace internal {

// Custom deleters for OpenSSL types
struct EVP_PKEY_Deleter {
    void operator()(EVP_PKEY* p) const { if (p) EVP_PKEY_free(p); }
};

struct EVP_PKEY_CTX_Deleter {
    void operator()(EVP_PKEY_CTX* p) const { if (p) EVP_PKEY_CTX_free(p); }
};

struct EVP_MD_CTX_Deleter {
    void operator()(EVP_MD_CTX* p) const { if (p) EVP_MD_CTX_free(p); }
};

struct BIO_Deleter {
    void operator()(BIO* p) const { if (p) BIO_free(p); }
};

struct X509_Deleter {
    void operator()(X509* p) const { if (p) X509_free(p); }
};

struct X509_REQ_Deleter {
    void operator()(X509_REQ* p) const { if (p) X509_REQ_free(p); }
};

struct X509_NAME_Deleter {
    void operator()(X509_NAME* p) const { if (p) X509_NAME_free(p); }
};

struct X509_EXTENSION_Deleter {
    void operator()(X509_EXTENSION* p) const { if (p) X509_EXTENSION_free(p); }
};

struct X509_PUBKEY_Deleter {
    void operator()(X509_PUBKEY* p) const { if (p) X509_PUBKEY_free(p); }
};

struct ASN1_INTEGER_Deleter {
    void operator()(ASN1_INTEGER* p) const { if (p) ASN1_INTEGER_free(p); }
};

struct ASN1_OCTET_STRING_Deleter {
    void operator()(ASN1_OCTET_STRING* p) const { if (p) ASN1_OCTET_STRING_free(p); }
};

struct AUTHORITY_KEYID_Deleter {
    void operator()(AUTHORITY_KEYID* p) const { if (p) AUTHORITY_KEYID_free(p); }
};

struct BASIC_CONSTRAINTS_Deleter {
    void operator()(BASIC_CONSTRAINTS* p) const { if (p) BASIC_CONSTRAINTS_free(p); }
};

struct EXTENDED_KEY_USAGE_Deleter {
    void operator()(EXTENDED_KEY_USAGE* p) const { if (p) EXTENDED_KEY_USAGE_free(p); }
};

struct BIGNUM_Deleter {
    void operator()(BIGNUM* p) const { if (p) BN_free(p); }
};

struct ECDSA_SIG_Deleter {
    void operator()(ECDSA_SIG* p) const { if (p) ECDSA_SIG_free(p); }
};

// RAII wrappers using unique_ptr
using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;
using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;
using BIO_ptr = std::unique_ptr<BIO, BIO_Deleter>;
using X509_ptr = std::unique_ptr<X509, X509_Deleter>;
using X509_REQ_ptr = std::unique_ptr<X509_REQ, X509_REQ_Deleter>;
using X509_NAME_ptr = std::unique_ptr<X509_NAME, X509_NAME_Deleter>;
using X509_EXTENSION_ptr = std::unique_ptr<X509_EXTENSION, X509_EXTENSION_Deleter>;
using X509_PUBKEY_ptr = std::unique_ptr<X509_PUBKEY, X509_PUBKEY_Deleter>;
using ASN1_INTEGER_ptr = std::unique_ptr<ASN1_INTEGER, ASN1_INTEGER_Deleter>;
using ASN1_OCTET_STRING_ptr = std::unique_ptr<ASN1_OCTET_STRING, ASN1_OCTET_STRING_Deleter>;
using AUTHORITY_KEYID_ptr = std::unique_ptr<AUTHORITY_KEYID, AUTHORITY_KEYID_Deleter>;
using BASIC_CONSTRAINTS_ptr = std::unique_ptr<BASIC_CONSTRAINTS, BASIC_CONSTRAINTS_Deleter>;
using EXTENDED_KEY_USAGE_ptr = std::unique_ptr<EXTENDED_KEY_USAGE, EXTENDED_KEY_USAGE_Deleter>;
using BIGNUM_ptr = std::unique_ptr<BIGNUM, BIGNUM_Deleter>;
using ECDSA_SIG_ptr = std::unique_ptr<ECDSA_SIG, ECDSA_SIG_Deleter>;

} // namespace internal
} // namespace crypto
} // namespace c2pasign

#endif // C2PASIGN_OPENSSL_WRAPPERS_H

/**
 * @file x509.cpp
 * @brief X.509 v3 certificate construction
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/common/x509.h"
#include "openssl_wrappers.h"
#include "x509_constants.h"
#include <openssl/asn1.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <ctime>

namespace c2pasign {

using namespace crypto::internal;

namespace {

std::string JoinUsages(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& n : names) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += n;
    }
    return joined;
}

void AddConfExtension(X509* cert, int nid, const std::string& value, const char* what) {
    X509_EXTENSION_ptr ext(X509V3_EXT_conf_nid(nullptr, nullptr, nid, value.c_str()));
    if (!ext) {
        throw crypto::CryptoError(std::string("Failed to create ") + what + " extension");
    }
    if (X509_add_ext(cert, ext.get(), -1) != 1) {
        throw crypto::CryptoError(std::string("Failed to add ") + what + " extension");
    }
}

ASN1_OCTET_STRING_ptr MakeOctetString(const std::vector<uint8_t>& bytes) {
    ASN1_OCTET_STRING_ptr octets(ASN1_OCTET_STRING_new());
    if (!octets || ASN1_OCTET_STRING_set(octets.get(), bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw crypto::CryptoError("Failed to build key identifier");
    }
    return octets;
}

// Random positive serial below 2^SERIAL_NUMBER_BITS
void SetRandomSerial(X509* cert) {
    BIGNUM_ptr bn(BN_new());
    if (!bn) {
        throw crypto::CryptoError("Failed to allocate serial number");
    }

    do {
        if (BN_rand(bn.get(), crypto::SERIAL_NUMBER_BITS, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1) {
            throw crypto::CryptoError("Failed to generate serial number");
        }
    } while (BN_is_zero(bn.get()));

    ASN1_INTEGER_ptr serial(BN_to_ASN1_INTEGER(bn.get(), nullptr));
    if (!serial || X509_set_serialNumber(cert, serial.get()) != 1) {
        throw crypto::CryptoError("Failed to set serial number");
    }
}

}  // namespace

crypto::Name DistinguishedName::ToName() const {
    std::vector<std::pair<std::string, std::string>> attributes;

    auto add = [&attributes](const char* key, const std::string& value) {
        if (!value.empty()) {
            attributes.emplace_back(key, value);
        }
    };

    add("C", country);
    add("ST", state);
    add("L", locality);
    add("O", organization);
    add("OU", organizational_unit);
    add("CN", common_name);
    if (email) {
        add("emailAddress", *email);
    }

    return crypto::Name::FromAttributes(attributes);
}

std::vector<uint8_t> ComputeKeyIdentifier(const crypto::PublicKey& public_key) {
    return crypto::SHA1::Hash(public_key.EncodedPoint());
}

crypto::Certificate IssueCertificate(
    const CertificateProfile& profile,
    const crypto::Name& subject,
    const crypto::PublicKey& subject_key,
    const crypto::PrivateKey& signing_key,
    const crypto::Certificate* issuer_cert,
    int64_t now
) {
    auto* subject_name = static_cast<X509_NAME*>(subject.GetNativeHandle());
    auto* subject_pkey = static_cast<EVP_PKEY*>(subject_key.GetNativeHandle());
    auto* signing_pkey = static_cast<EVP_PKEY*>(signing_key.GetNativeHandle());
    if (!subject_name || !subject_pkey || !signing_pkey) {
        throw crypto::CryptoError("Certificate issuance requires a subject, a subject key and a signing key");
    }

    // The signing key must belong to whoever appears as issuer
    crypto::PublicKey issuer_key = issuer_cert ? issuer_cert->GetPublicKey()
                                               : crypto::PublicKey::FromPrivateKey(signing_key);
    if (issuer_cert ? !signing_key.Matches(issuer_key) : !signing_key.Matches(subject_key)) {
        throw crypto::CryptoError(issuer_cert
            ? "Signing key does not match the issuer certificate"
            : "Signing key does not match the subject key of a self-issued certificate");
    }

    X509_ptr cert(X509_new());
    if (!cert) {
        throw crypto::CryptoError("Failed to create X509 structure");
    }

    if (X509_set_version(cert.get(), X509_VERSION_3) != 1) {
        throw crypto::CryptoError("Failed to set certificate version");
    }

    SetRandomSerial(cert.get());

    // Validity: [now - backdate, now + validity]
    if (!ASN1_TIME_set(X509_getm_notBefore(cert.get()), static_cast<time_t>(now - profile.backdate_seconds)) ||
        !ASN1_TIME_set(X509_getm_notAfter(cert.get()), static_cast<time_t>(now + profile.validity_seconds))) {
        throw crypto::CryptoError("Failed to set validity period");
    }

    if (X509_set_subject_name(cert.get(), subject_name) != 1) {
        throw crypto::CryptoError("Failed to set subject name");
    }

    X509_NAME* issuer_name = issuer_cert
        ? X509_get_subject_name(static_cast<X509*>(issuer_cert->GetNativeHandle()))
        : subject_name;
    if (X509_set_issuer_name(cert.get(), issuer_name) != 1) {
        throw crypto::CryptoError("Failed to set issuer name");
    }

    if (X509_set_pubkey(cert.get(), subject_pkey) != 1) {
        throw crypto::CryptoError("Failed to set subject public key");
    }

    // basicConstraints (critical)
    std::string bc = std::string(CRITICAL_PREFIX) +
                     (profile.basic_constraints.is_ca ? CA_TRUE : CA_FALSE);
    if (profile.basic_constraints.is_ca && profile.basic_constraints.max_path_length) {
        bc += PATHLEN_PREFIX + std::to_string(*profile.basic_constraints.max_path_length);
    }
    AddConfExtension(cert.get(), NID_basic_constraints, bc, "basicConstraints");

    // keyUsage (critical)
    if (!profile.key_usage.empty()) {
        AddConfExtension(cert.get(), NID_key_usage,
                         CRITICAL_PREFIX + JoinUsages(profile.key_usage), "keyUsage");
    }

    // extendedKeyUsage (non-critical)
    if (!profile.extended_key_usage.empty()) {
        AddConfExtension(cert.get(), NID_ext_key_usage,
                         JoinUsages(profile.extended_key_usage), "extendedKeyUsage");
    }

    // subjectKeyIdentifier
    ASN1_OCTET_STRING_ptr ski = MakeOctetString(ComputeKeyIdentifier(subject_key));
    if (X509_add1_ext_i2d(cert.get(), NID_subject_key_identifier, ski.get(), 0, X509V3_ADD_DEFAULT) != 1) {
        throw crypto::CryptoError("Failed to add subjectKeyIdentifier extension");
    }

    // authorityKeyIdentifier (omitted for self-issued certificates)
    if (issuer_cert) {
        AUTHORITY_KEYID_ptr akid(AUTHORITY_KEYID_new());
        if (!akid) {
            throw crypto::CryptoError("Failed to allocate authorityKeyIdentifier");
        }
        akid->keyid = MakeOctetString(ComputeKeyIdentifier(issuer_key)).release();
        if (X509_add1_ext_i2d(cert.get(), NID_authority_key_identifier, akid.get(), 0, X509V3_ADD_DEFAULT) != 1) {
            throw crypto::CryptoError("Failed to add authorityKeyIdentifier extension");
        }
    }

    if (X509_sign(cert.get(), signing_pkey, EVP_sha256()) <= 0) {
        throw crypto::CryptoError("Failed to sign certificate");
    }

    // Convert to DER and create Certificate object
    unsigned char* der = nullptr;
    int len = i2d_X509(cert.get(), &der);
    if (len < 0) {
        throw crypto::CryptoError("Failed to encode certificate");
    }

    std::vector<uint8_t> der_vec(der, der + len);
    OPENSSL_free(der);

    return crypto::Certificate::LoadFromDER(der_vec);
}

} // namespace c2pasign

/**
 * @file x509.h
 * @brief X.509 certificate construction
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_X509_H
#define C2PASIGN_X509_H

#include "c2pasign/common/crypto.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace c2pasign {

/**
 * @brief Structured distinguished name
 *
 * Converted to an X.509 name with attributes in the order
 * C, ST, L, O, OU, CN, emailAddress. Empty attributes are skipped.
 */
struct DistinguishedName {
    std::string common_name;
    std::string organization;
    std::string organizational_unit;
    std::string country;
    std::string state;
    std::string locality;
    std::optional<std::string> email;

    crypto::Name ToName() const;
};

/**
 * @brief Extension and validity profile of a certificate to issue
 */
struct CertificateProfile {
    crypto::BasicConstraints basic_constraints;

    /// OpenSSL key usage names ("digitalSignature", "keyCertSign", "cRLSign", ...)
    std::vector<std::string> key_usage;

    /// OpenSSL extended key usage names ("emailProtection", "codeSigning", ...); empty = no EKU
    std::vector<std::string> extended_key_usage;

    /// notBefore = now - backdate_seconds (clock skew tolerance)
    int64_t backdate_seconds = 0;

    /// notAfter = now + validity_seconds
    int64_t validity_seconds = 0;
};

/**
 * @brief Key identifier used for SKI/AKI
 *
 * SHA-1 over the canonical public key bytes (uncompressed point for EC keys),
 * RFC 5280 section 4.2.1.2 method (1). Deterministic for a given key.
 *
 * @return 20-byte identifier
 */
std::vector<uint8_t> ComputeKeyIdentifier(const crypto::PublicKey& public_key);

/**
 * @brief Issue an X.509 v3 certificate
 *
 * - If issuer_cert is nullptr: self-issued, issuer = subject, no authority key identifier
 * - If issuer_cert is provided: issuer = issuer_cert's subject, AKI from issuer_cert's key
 *
 * The serial number is a fresh random positive integer. The certificate is
 * signed with ECDSA-with-SHA256.
 *
 * @param profile Extensions and validity
 * @param subject Subject name (copied)
 * @param subject_key Public key to certify
 * @param signing_key Issuer private key (subject's own key when self-issued)
 * @param issuer_cert Issuer certificate, or nullptr for self-issued
 * @param now Issuance time, Unix epoch seconds
 * @return Signed certificate
 * @throws CryptoError if signing_key does not belong to the issuer, or on any OpenSSL failure
 */
crypto::Certificate IssueCertificate(
    const CertificateProfile& profile,
    const crypto::Name& subject,
    const crypto::PublicKey& subject_key,
    const crypto::PrivateKey& signing_key,
    const crypto::Certificate* issuer_cert,
    int64_t now
);

} // namespace c2pasign

#endif // C2PASIGN_X509_H

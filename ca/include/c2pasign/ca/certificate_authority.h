/**
 * @file certificate_authority.h
 * @brief In-memory two-level test certificate authority
 *
 * A root and an intermediate CA (ECDSA P-256) are generated when the
 * CertificateAuthority is constructed and live only as long as the object.
 * Leaf certificates are issued by the intermediate. Nothing is persisted, so
 * a restarted process invalidates every chain issued before.
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_CERTIFICATE_AUTHORITY_H
#define C2PASIGN_CERTIFICATE_AUTHORITY_H

#include "c2pasign/common/crypto.h"
#include "c2pasign/common/x509.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace c2pasign {
namespace ca {

/**
 * @brief Subject of the generated root CA
 */
DistinguishedName DefaultRootSubject();

/**
 * @brief Subject of the generated intermediate CA
 */
DistinguishedName DefaultIntermediateSubject();

/**
 * @brief Subject of temporary signing certificates (IssueSigner)
 */
DistinguishedName DefaultSignerSubject();

/**
 * @brief Bootstrap parameters
 */
struct CaConfig {
    DistinguishedName root_subject = DefaultRootSubject();
    DistinguishedName intermediate_subject = DefaultIntermediateSubject();

    int root_validity_days = 3650;
    int intermediate_validity_days = 1825;
    int leaf_validity_days = 365;

    long root_path_length = 1;
    long intermediate_path_length = 0;

    /// notBefore backdating for CA certificates
    int64_t ca_backdate_seconds = 300;

    /// notBefore backdating for leaf certificates
    int64_t leaf_backdate_seconds = 60;
};

/**
 * @brief Advisory information sent along with a CSR
 *
 * Logged with the issuance; never written into the certificate.
 */
struct CsrMetadata {
    std::optional<std::string> device_id;
    std::optional<std::string> app_version;
    std::optional<std::string> purpose;
};

/**
 * @brief Result of SignCSR
 */
struct IssuedCertificate {
    std::string certificate_id;     ///< Random UUID, uppercase
    std::string certificate_chain;  ///< Leaf, intermediate, root PEM blocks joined by "\n"
    int64_t expires_at = 0;         ///< Leaf notAfter, Unix epoch seconds
    std::string serial_number;      ///< Colon-separated lowercase hex
    crypto::Certificate certificate;
};

/**
 * @brief Result of IssueSigner: a ready-to-use signing identity
 */
struct IssuedSigner {
    std::string certificate_chain;  ///< Leaf, intermediate, root PEM blocks joined by "\n"
    std::string private_key_pem;    ///< PKCS#8
    int64_t expires_at = 0;
    crypto::Certificate certificate;
};

/**
 * @brief Two-level test CA
 *
 * Immutable after construction; all issuing operations are const and may be
 * called concurrently. Share it as std::shared_ptr<const CertificateAuthority>.
 */
class CertificateAuthority {
public:
    /**
     * @brief Generate root and intermediate keys and certificates
     * @param config Subjects, validity and skew settings
     * @throws StartupError if any step of the bootstrap fails
     */
    explicit CertificateAuthority(const CaConfig& config = CaConfig());
    ~CertificateAuthority();

    CertificateAuthority(const CertificateAuthority&) = delete;
    CertificateAuthority& operator=(const CertificateAuthority&) = delete;

    /**
     * @brief Issue a leaf certificate for a PEM-encoded CSR
     *
     * The CSR subject and public key are copied unmodified. The leaf is valid
     * for leaf_validity_days, carries digitalSignature and emailProtection,
     * and is signed by the intermediate.
     *
     * @param csr_pem "-----BEGIN CERTIFICATE REQUEST-----" PEM text
     * @param metadata Advisory metadata (logged only)
     * @return Issued certificate with its chain
     * @throws MalformedInputError if the PEM marker is missing or the CSR does not parse
     * @throws CryptoError if certificate construction fails
     */
    IssuedCertificate SignCSR(
        const std::string& csr_pem,
        const std::optional<CsrMetadata>& metadata = std::nullopt
    ) const;

    /**
     * @brief Generate a key pair and a leaf certificate for it
     *
     * @param subject Subject of the new certificate
     * @param validity_days Validity in days (> 0)
     * @throws MalformedInputError if validity_days is not positive
     * @throws CryptoError on key generation or signing failure
     */
    IssuedSigner IssueSigner(
        const DistinguishedName& subject = DefaultSignerSubject(),
        int validity_days = 1
    ) const;

    const crypto::Certificate& RootCertificate() const;
    const crypto::Certificate& IntermediateCertificate() const;

    /**
     * @brief Intermediate and root PEM blocks joined by "\n"
     */
    std::string CaChainPEM() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ca
} // namespace c2pasign

#endif // C2PASIGN_CERTIFICATE_AUTHORITY_H

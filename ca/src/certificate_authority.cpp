/**
 * @file certificate_authority.cpp
 * @brief In-memory two-level test certificate authority
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/ca/certificate_authority.h"
#include "c2pasign/common/limits.h"
#include "c2pasign/common/pem.h"
#include <glog/logging.h>
#include <ctime>

namespace c2pasign {
namespace ca {

namespace {

constexpr int64_t SECONDS_PER_DAY = 24 * 60 * 60;

DistinguishedName AuthoritySubject(const std::string& common_name) {
    DistinguishedName dn;
    dn.common_name = common_name;
    dn.organization = "C2PA Signing Server";
    dn.organizational_unit = "Certificate Authority";
    dn.country = "US";
    dn.state = "California";
    dn.locality = "San Francisco";
    return dn;
}

CertificateProfile CaProfile(long path_length, int validity_days, int64_t backdate_seconds) {
    CertificateProfile profile;
    profile.basic_constraints.is_ca = true;
    profile.basic_constraints.max_path_length = path_length;
    profile.key_usage = {"keyCertSign", "cRLSign"};
    profile.backdate_seconds = backdate_seconds;
    profile.validity_seconds = static_cast<int64_t>(validity_days) * SECONDS_PER_DAY;
    return profile;
}

CertificateProfile LeafProfile(int validity_days, int64_t backdate_seconds) {
    CertificateProfile profile;
    profile.basic_constraints.is_ca = false;
    profile.key_usage = {"digitalSignature"};
    profile.extended_key_usage = {"emailProtection"};
    profile.backdate_seconds = backdate_seconds;
    profile.validity_seconds = static_cast<int64_t>(validity_days) * SECONDS_PER_DAY;
    return profile;
}

std::string DescribeMetadata(const std::optional<CsrMetadata>& metadata) {
    if (!metadata) {
        return "none";
    }
    std::string out;
    auto append = [&out](const char* key, const std::optional<std::string>& value) {
        if (!value) {
            return;
        }
        if (!out.empty()) {
            out += ' ';
        }
        out += key;
        out += '=';
        out += *value;
    };
    append("device_id", metadata->device_id);
    append("app_version", metadata->app_version);
    append("purpose", metadata->purpose);
    return out.empty() ? "none" : out;
}

}  // namespace

DistinguishedName DefaultRootSubject() {
    return AuthoritySubject("C2PA Test Root CA");
}

DistinguishedName DefaultIntermediateSubject() {
    return AuthoritySubject("C2PA Test Intermediate CA");
}

DistinguishedName DefaultSignerSubject() {
    DistinguishedName dn;
    dn.common_name = "Temporary C2PA Signer";
    dn.organization = "Temporary Certificate";
    dn.organizational_unit = "FOR TESTING ONLY";
    dn.country = "US";
    return dn;
}

class CertificateAuthority::Impl {
public:
    CaConfig config;
    crypto::PrivateKey root_key;
    crypto::Certificate root_cert;
    crypto::PrivateKey intermediate_key;
    crypto::Certificate intermediate_cert;

    explicit Impl(const CaConfig& cfg) : config(cfg) {}

    // Leaf signed by the intermediate
    crypto::Certificate IssueLeaf(
        const crypto::Name& subject,
        const crypto::PublicKey& subject_key,
        int validity_days,
        int64_t now
    ) const {
        return IssueCertificate(
            LeafProfile(validity_days, config.leaf_backdate_seconds),
            subject, subject_key, intermediate_key, &intermediate_cert, now);
    }

    std::string ChainFor(const crypto::Certificate& leaf) const {
        return crypto::Certificate::CreateChainPEM({&leaf, &intermediate_cert, &root_cert});
    }
};

CertificateAuthority::CertificateAuthority(const CaConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    const int64_t now = static_cast<int64_t>(std::time(nullptr));

    try {
        // Root: self-issued, signed by its own key
        impl_->root_key = crypto::PrivateKey::Generate();
        crypto::PublicKey root_pub = crypto::PublicKey::FromPrivateKey(impl_->root_key);
        crypto::Name root_name = config.root_subject.ToName();
        impl_->root_cert = IssueCertificate(
            CaProfile(config.root_path_length, config.root_validity_days, config.ca_backdate_seconds),
            root_name, root_pub, impl_->root_key, nullptr, now);

        // Intermediate: signed by the root
        impl_->intermediate_key = crypto::PrivateKey::Generate();
        crypto::PublicKey intermediate_pub = crypto::PublicKey::FromPrivateKey(impl_->intermediate_key);
        crypto::Name intermediate_name = config.intermediate_subject.ToName();
        impl_->intermediate_cert = IssueCertificate(
            CaProfile(config.intermediate_path_length, config.intermediate_validity_days,
                      config.ca_backdate_seconds),
            intermediate_name, intermediate_pub, impl_->root_key, &impl_->root_cert, now);
    } catch (const Error& e) {
        throw StartupError(std::string("Certificate authority bootstrap failed: ") + e.what());
    }

    LOG(INFO) << "Certificate authority ready: root=\"" << impl_->root_cert.GetSubject()
              << "\" intermediate=\"" << impl_->intermediate_cert.GetSubject() << "\"";
    VLOG(1) << "Root serial " << impl_->root_cert.GetSerialNumberString()
            << ", intermediate serial " << impl_->intermediate_cert.GetSerialNumberString();
}

CertificateAuthority::~CertificateAuthority() = default;

IssuedCertificate CertificateAuthority::SignCSR(
    const std::string& csr_pem,
    const std::optional<CsrMetadata>& metadata
) const {
    // Structural checks come before any parsing or use of key material
    if (!pem::HasBeginMarker(csr_pem, pem::CERTIFICATE_REQUEST_LABEL)) {
        throw MalformedInputError("Invalid CSR format: expected " +
                                  pem::BeginMarker(pem::CERTIFICATE_REQUEST_LABEL));
    }
    if (csr_pem.size() > limits::MAX_CSR_PEM_SIZE) {
        throw MalformedInputError("CSR exceeds maximum size (" +
                                  std::to_string(limits::MAX_CSR_PEM_SIZE) + " bytes)");
    }

    crypto::CertificateRequest request = crypto::CertificateRequest::LoadFromPEM(csr_pem);
    crypto::Name subject = request.GetSubjectName();
    crypto::PublicKey subject_key = request.GetPublicKey();

    const int64_t now = static_cast<int64_t>(std::time(nullptr));

    IssuedCertificate issued;
    issued.certificate = impl_->IssueLeaf(subject, subject_key, impl_->config.leaf_validity_days, now);
    issued.certificate_id = crypto::GenerateUUID();
    issued.certificate_chain = impl_->ChainFor(issued.certificate);
    issued.expires_at = issued.certificate.GetValidityPeriod().second;
    issued.serial_number = issued.certificate.GetSerialNumberString();

    LOG(INFO) << "Issued certificate " << issued.certificate_id
              << " subject=\"" << issued.certificate.GetSubject() << "\""
              << " serial=" << issued.serial_number
              << " metadata: " << DescribeMetadata(metadata);

    return issued;
}

IssuedSigner CertificateAuthority::IssueSigner(
    const DistinguishedName& subject,
    int validity_days
) const {
    if (validity_days <= 0) {
        throw MalformedInputError("Signer validity must be a positive number of days");
    }

    crypto::PrivateKey key = crypto::PrivateKey::Generate();
    crypto::PublicKey public_key = crypto::PublicKey::FromPrivateKey(key);
    crypto::Name name = subject.ToName();

    const int64_t now = static_cast<int64_t>(std::time(nullptr));

    IssuedSigner signer;
    signer.certificate = impl_->IssueLeaf(name, public_key, validity_days, now);
    signer.certificate_chain = impl_->ChainFor(signer.certificate);
    signer.private_key_pem = key.ToPEM();
    signer.expires_at = signer.certificate.GetValidityPeriod().second;

    LOG(INFO) << "Issued signer \"" << signer.certificate.GetSubject() << "\" serial="
              << signer.certificate.GetSerialNumberString()
              << " valid for " << validity_days << " day(s)";

    return signer;
}

const crypto::Certificate& CertificateAuthority::RootCertificate() const {
    return impl_->root_cert;
}

const crypto::Certificate& CertificateAuthority::IntermediateCertificate() const {
    return impl_->intermediate_cert;
}

std::string CertificateAuthority::CaChainPEM() const {
    return crypto::Certificate::CreateChainPEM({&impl_->intermediate_cert, &impl_->root_cert});
}

} // namespace ca
} // namespace c2pasign

/**
 * @file crypto_certificate.cpp
 * @brief X.509 name, certificate and CSR wrapper implementations (OpenSSL 3.x)
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/common/crypto.h"
#include "c2pasign/common/pem.h"
#include "openssl_wrappers.h"
#include "x509_constants.h"
#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <ctime>
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

// Hand a borrowed EVP_PKEY to a PublicKey via PEM round trip
PublicKey PublicKeyFromHandle(EVP_PKEY* pkey) {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_PUBKEY(bio.get(), pkey)) {
        throw CryptoError("Failed to write public key to PEM");
    }

    return PublicKey::LoadFromPEM(ReadBio(bio.get()));
}

int64_t AsnTimeToEpoch(const ASN1_TIME* t, const char* which) {
    struct tm tm_time = {};
    if (!t || !ASN1_TIME_to_tm(t, &tm_time)) {
        throw CryptoError(std::string("Failed to convert ") + which);
    }
    return static_cast<int64_t>(timegm(&tm_time));
}

std::string NameToString(const X509_NAME* name) {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    // RFC 2253 rendering with UTF-8 output
    unsigned long flags = XN_FLAG_RFC2253 & ~ASN1_STRFLGS_ESC_MSB;
    if (X509_NAME_print_ex(bio.get(), name, 0, flags) < 0) {
        throw CryptoError("Failed to render distinguished name");
    }

    return ReadBio(bio.get());
}

std::vector<uint8_t> OctetsToVector(const ASN1_OCTET_STRING* octets) {
    const unsigned char* data = ASN1_STRING_get0_data(octets);
    int len = ASN1_STRING_length(octets);
    if (!data || len <= 0) {
        return std::vector<uint8_t>();
    }
    return std::vector<uint8_t>(data, data + len);
}

}  // namespace

// ============================================================================
// Name Implementation
// ============================================================================

class Name::Impl {
public:
    X509_NAME_ptr name;
};

Name::Name() : impl_(std::make_unique<Impl>()) {}

Name::~Name() = default;

Name::Name(Name&&) noexcept = default;
Name& Name::operator=(Name&&) noexcept = default;

Name Name::FromAttributes(const std::vector<std::pair<std::string, std::string>>& attributes) {
    Name result;
    result.impl_->name.reset(X509_NAME_new());
    if (!result.impl_->name) {
        throw CryptoError("Failed to create X509_NAME");
    }

    for (const auto& attr : attributes) {
        const auto* value = reinterpret_cast<const unsigned char*>(attr.second.c_str());
        if (X509_NAME_add_entry_by_txt(result.impl_->name.get(), attr.first.c_str(),
                                       MBSTRING_UTF8, value, -1, -1, 0) != 1) {
            throw CryptoError("Failed to add name attribute: " + attr.first);
        }
    }

    return result;
}

Name Name::Clone() const {
    Name copy;
    if (impl_->name) {
        copy.impl_->name.reset(X509_NAME_dup(impl_->name.get()));
        if (!copy.impl_->name) {
            throw CryptoError("Failed to duplicate X509_NAME");
        }
    }
    return copy;
}

std::string Name::ToString() const {
    if (!impl_->name) {
        return std::string();
    }
    return NameToString(impl_->name.get());
}

std::optional<std::string> Name::GetAttribute(const std::string& short_name) const {
    if (!impl_->name) {
        return std::nullopt;
    }

    int nid = OBJ_txt2nid(short_name.c_str());
    if (nid == NID_undef) {
        return std::nullopt;
    }

    int idx = X509_NAME_get_index_by_NID(impl_->name.get(), nid, -1);
    if (idx < 0) {
        return std::nullopt;
    }

    X509_NAME_ENTRY* entry = X509_NAME_get_entry(impl_->name.get(), idx);
    ASN1_STRING* data = X509_NAME_ENTRY_get_data(entry);
    unsigned char* utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0) {
        throw CryptoError("Failed to decode name attribute: " + short_name);
    }

    std::string value(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return value;
}

bool Name::operator==(const Name& other) const {
    if (!impl_->name || !other.impl_->name) {
        return !impl_->name && !other.impl_->name;
    }
    return X509_NAME_cmp(impl_->name.get(), other.impl_->name.get()) == 0;
}

void* Name::GetNativeHandle() const {
    return impl_->name.get();
}

// ============================================================================
// Certificate Implementation
// ============================================================================

class Certificate::Impl {
public:
    X509_ptr cert;
};

Certificate::Certificate() : impl_(std::make_unique<Impl>()) {}

Certificate::~Certificate() = default;

Certificate::Certificate(Certificate&&) noexcept = default;
Certificate& Certificate::operator=(Certificate&&) noexcept = default;

Certificate Certificate::LoadFromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CryptoError("Failed to open certificate file: " + path);
    }

    std::string pem_data((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());

    return LoadFromPEM(pem_data);
}

Certificate Certificate::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM data");
    }

    Certificate cert;
    cert.impl_->cert.reset(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert.impl_->cert) {
        throw CryptoError("Failed to parse certificate from PEM");
    }

    return cert;
}

std::vector<Certificate> Certificate::LoadChainFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM data");
    }

    std::vector<Certificate> chain;
    while (true) {
        X509* x509 = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
        if (!x509) {
            break;  // No more certificates
        }
        Certificate cert;
        cert.impl_->cert.reset(x509);
        chain.push_back(std::move(cert));
    }

    // Reading past the last block leaves a "no start line" error queued
    ERR_clear_error();

    if (chain.empty()) {
        throw CryptoError("No certificates found in PEM data");
    }

    return chain;
}

Certificate Certificate::LoadFromDER(const std::vector<uint8_t>& der) {
    if (der.empty()) {
        throw CryptoError("Cannot parse certificate from empty DER");
    }

    const unsigned char* p = der.data();
    Certificate cert;
    cert.impl_->cert.reset(d2i_X509(nullptr, &p, static_cast<long>(der.size())));

    if (!cert.impl_->cert) {
        throw CryptoError("Failed to parse certificate from DER");
    }

    return cert;
}

std::vector<uint8_t> Certificate::ToDER() const {
    unsigned char* der = nullptr;
    int len = i2d_X509(impl_->cert.get(), &der);

    if (len < 0) {
        throw CryptoError("Failed to encode certificate to DER");
    }

    std::vector<uint8_t> result(der, der + len);
    OPENSSL_free(der);

    return result;
}

std::string Certificate::ToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_X509(bio.get(), impl_->cert.get())) {
        throw CryptoError("Failed to write certificate to PEM");
    }

    return ReadBio(bio.get());
}

std::string Certificate::CreateChainPEM(const std::vector<const Certificate*>& chain) {
    std::string bundle;
    for (const Certificate* cert : chain) {
        if (!cert) {
            throw CryptoError("Null certificate in chain");
        }
        std::string block = cert->ToPEM();
        while (!block.empty() && (block.back() == '\n' || block.back() == '\r')) {
            block.pop_back();
        }
        if (!bundle.empty()) {
            bundle += '\n';
        }
        bundle += block;
    }
    return bundle;
}

Certificate Certificate::Clone() const {
    return Certificate::LoadFromDER(ToDER());
}

PublicKey Certificate::GetPublicKey() const {
    EVP_PKEY* pkey = X509_get0_pubkey(impl_->cert.get());
    if (!pkey) {
        throw CryptoError("Failed to extract public key from certificate");
    }
    return PublicKeyFromHandle(pkey);
}

Name Certificate::GetSubjectName() const {
    Name name;
    name.impl_->name.reset(X509_NAME_dup(X509_get_subject_name(impl_->cert.get())));
    if (!name.impl_->name) {
        throw CryptoError("Failed to get certificate subject");
    }
    return name;
}

Name Certificate::GetIssuerName() const {
    Name name;
    name.impl_->name.reset(X509_NAME_dup(X509_get_issuer_name(impl_->cert.get())));
    if (!name.impl_->name) {
        throw CryptoError("Failed to get certificate issuer");
    }
    return name;
}

std::string Certificate::GetSubject() const {
    return NameToString(X509_get_subject_name(impl_->cert.get()));
}

std::string Certificate::GetIssuer() const {
    return NameToString(X509_get_issuer_name(impl_->cert.get()));
}

std::vector<uint8_t> Certificate::GetSerialNumber() const {
    const ASN1_INTEGER* serial = X509_get0_serialNumber(impl_->cert.get());
    BIGNUM_ptr bn(ASN1_INTEGER_to_BN(serial, nullptr));
    if (!bn) {
        throw CryptoError("Failed to read certificate serial number");
    }

    std::vector<uint8_t> bytes(static_cast<size_t>(BN_num_bytes(bn.get())));
    BN_bn2bin(bn.get(), bytes.data());
    return bytes;
}

std::string Certificate::GetSerialNumberString() const {
    return ToColonHex(GetSerialNumber());
}

std::pair<int64_t, int64_t> Certificate::GetValidityPeriod() const {
    int64_t not_before = AsnTimeToEpoch(X509_get0_notBefore(impl_->cert.get()), "notBefore");
    int64_t not_after = AsnTimeToEpoch(X509_get0_notAfter(impl_->cert.get()), "notAfter");
    return {not_before, not_after};
}

BasicConstraints Certificate::GetBasicConstraints() const {
    BasicConstraints result;

    int critical = -1;
    BASIC_CONSTRAINTS_ptr bc(static_cast<BASIC_CONSTRAINTS*>(
        X509_get_ext_d2i(impl_->cert.get(), NID_basic_constraints, &critical, nullptr)));
    if (!bc) {
        return result;
    }

    result.is_ca = bc->ca != 0;
    if (bc->pathlen) {
        result.max_path_length = ASN1_INTEGER_get(bc->pathlen);
    }
    return result;
}

uint32_t Certificate::GetKeyUsage() const {
    if (!(X509_get_extension_flags(impl_->cert.get()) & EXFLAG_KUSAGE)) {
        return 0;
    }
    return X509_get_key_usage(impl_->cert.get());
}

std::vector<std::string> Certificate::GetExtendedKeyUsage() const {
    std::vector<std::string> oids;

    EXTENDED_KEY_USAGE_ptr eku(static_cast<EXTENDED_KEY_USAGE*>(
        X509_get_ext_d2i(impl_->cert.get(), NID_ext_key_usage, nullptr, nullptr)));
    if (!eku) {
        return oids;
    }

    for (int i = 0; i < sk_ASN1_OBJECT_num(eku.get()); ++i) {
        char buf[128];
        int len = OBJ_obj2txt(buf, sizeof(buf), sk_ASN1_OBJECT_value(eku.get(), i), 1);
        if (len > 0 && static_cast<size_t>(len) < sizeof(buf)) {
            oids.emplace_back(buf, static_cast<size_t>(len));
        }
    }
    return oids;
}

std::optional<std::vector<uint8_t>> Certificate::GetSubjectKeyIdentifier() const {
    const ASN1_OCTET_STRING* ski = X509_get0_subject_key_id(impl_->cert.get());
    if (!ski) {
        return std::nullopt;
    }
    return OctetsToVector(ski);
}

std::optional<std::vector<uint8_t>> Certificate::GetAuthorityKeyIdentifier() const {
    const ASN1_OCTET_STRING* aki = X509_get0_authority_key_id(impl_->cert.get());
    if (!aki) {
        return std::nullopt;
    }
    return OctetsToVector(aki);
}

bool Certificate::IsIssuedBy(const Certificate& issuer) const {
    X509_NAME* our_issuer = X509_get_issuer_name(impl_->cert.get());
    X509_NAME* their_subject = X509_get_subject_name(issuer.impl_->cert.get());
    return our_issuer && their_subject && X509_NAME_cmp(our_issuer, their_subject) == 0;
}

bool Certificate::VerifySignature(const PublicKey& issuer_pubkey) const {
    auto* pkey = static_cast<EVP_PKEY*>(issuer_pubkey.GetNativeHandle());
    if (!pkey) {
        throw CryptoError("Invalid issuer public key");
    }

    int result = X509_verify(impl_->cert.get(), pkey);
    ERR_clear_error();
    return result == 1;
}

bool Certificate::VerifyChain(const Certificate& issuer, int64_t trusted_time) const {
    // 1. Issuer DN must match
    if (!IsIssuedBy(issuer)) {
        return false;
    }

    // 2. Signature under the issuer's key
    EVP_PKEY* issuer_pubkey = X509_get0_pubkey(issuer.impl_->cert.get());
    if (!issuer_pubkey) {
        return false;
    }

    int result = X509_verify(impl_->cert.get(), issuer_pubkey);
    ERR_clear_error();
    if (result != 1) {
        return false;
    }

    // 3. notBefore <= trusted_time <= notAfter
    time_t check_time = static_cast<time_t>(trusted_time);

    const ASN1_TIME* not_before = X509_get0_notBefore(impl_->cert.get());
    const ASN1_TIME* not_after = X509_get0_notAfter(impl_->cert.get());
    if (!not_before || !not_after) {
        return false;
    }

    if (X509_cmp_time(not_before, &check_time) > 0) {
        return false;  // Not yet valid
    }

    if (X509_cmp_time(not_after, &check_time) < 0) {
        return false;  // Expired
    }

    return true;
}

void* Certificate::GetNativeHandle() const {
    return impl_->cert.get();
}

// ============================================================================
// CertificateRequest Implementation
// ============================================================================

class CertificateRequest::Impl {
public:
    X509_REQ_ptr req;
};

CertificateRequest::CertificateRequest() : impl_(std::make_unique<Impl>()) {}

CertificateRequest::~CertificateRequest() = default;

CertificateRequest::CertificateRequest(CertificateRequest&&) noexcept = default;
CertificateRequest& CertificateRequest::operator=(CertificateRequest&&) noexcept = default;

CertificateRequest CertificateRequest::LoadFromPEM(const std::string& pem) {
    if (!pem::HasBeginMarker(pem, pem::CERTIFICATE_REQUEST_LABEL)) {
        throw MalformedInputError("CSR is not a PEM \"CERTIFICATE REQUEST\" block");
    }

    return LoadFromDER(pem::Decode(pem, pem::CERTIFICATE_REQUEST_LABEL));
}

CertificateRequest CertificateRequest::LoadFromDER(const std::vector<uint8_t>& der) {
    if (der.empty()) {
        throw MalformedInputError("CSR is empty");
    }

    const unsigned char* p = der.data();
    const unsigned char* end = der.data() + der.size();

    CertificateRequest request;
    request.impl_->req.reset(d2i_X509_REQ(nullptr, &p, static_cast<long>(der.size())));
    ERR_clear_error();

    if (!request.impl_->req) {
        throw MalformedInputError("CSR is not a valid PKCS#10 structure");
    }

    if (p != end) {
        throw MalformedInputError("CSR carries trailing data after the DER structure");
    }

    return request;
}

CertificateRequest CertificateRequest::Create(const Name& subject, const PrivateKey& key) {
    auto* pkey = static_cast<EVP_PKEY*>(key.GetNativeHandle());
    auto* name = static_cast<X509_NAME*>(subject.GetNativeHandle());
    if (!pkey || !name) {
        throw CryptoError("CSR requires a subject and a key");
    }

    CertificateRequest request;
    request.impl_->req.reset(X509_REQ_new());
    X509_REQ* req = request.impl_->req.get();
    if (!req) {
        throw CryptoError("Failed to create X509_REQ structure");
    }

    if (X509_REQ_set_version(req, X509_REQ_VERSION_1) != 1 ||
        X509_REQ_set_subject_name(req, name) != 1 ||
        X509_REQ_set_pubkey(req, pkey) != 1) {
        throw CryptoError("Failed to populate certificate request");
    }

    if (X509_REQ_sign(req, pkey, EVP_sha256()) <= 0) {
        throw CryptoError("Failed to sign certificate request");
    }

    return request;
}

std::vector<uint8_t> CertificateRequest::ToDER() const {
    unsigned char* der = nullptr;
    int len = i2d_X509_REQ(impl_->req.get(), &der);

    if (len < 0) {
        throw CryptoError("Failed to encode certificate request to DER");
    }

    std::vector<uint8_t> result(der, der + len);
    OPENSSL_free(der);

    return result;
}

std::string CertificateRequest::ToPEM() const {
    return pem::Encode(ToDER(), pem::CERTIFICATE_REQUEST_LABEL);
}

Name CertificateRequest::GetSubjectName() const {
    Name name;
    name.impl_->name.reset(X509_NAME_dup(X509_REQ_get_subject_name(impl_->req.get())));
    if (!name.impl_->name) {
        throw CryptoError("Failed to get certificate request subject");
    }
    return name;
}

PublicKey CertificateRequest::GetPublicKey() const {
    EVP_PKEY* pkey = X509_REQ_get0_pubkey(impl_->req.get());
    if (!pkey) {
        throw MalformedInputError("CSR public key is missing or unsupported");
    }
    return PublicKeyFromHandle(pkey);
}

bool CertificateRequest::VerifySignature() const {
    EVP_PKEY* pkey = X509_REQ_get0_pubkey(impl_->req.get());
    if (!pkey) {
        return false;
    }

    int result = X509_REQ_verify(impl_->req.get(), pkey);
    ERR_clear_error();
    return result == 1;
}

void* CertificateRequest::GetNativeHandle() const {
    return impl_->req.get();
}

} // namespace crypto
} // namespace c2pasign

/**
 * @file crypto.h
 * @brief Cryptographic primitives for the test certificate authority
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_CRYPTO_H
#define C2PASIGN_CRYPTO_H

#include "c2pasign/common/error.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace c2pasign {
namespace crypto {

/**
 * @brief Cryptographic exceptions
 */
class CryptoError : public Error {
public:
    explicit CryptoError(const std::string& what) : Error(ErrorKind::Crypto, what) {}
};

class SignatureVerificationError : public CryptoError {
public:
    SignatureVerificationError() : CryptoError("Signature verification failed") {}
};

/**
 * @brief Cryptographic size constants
 */
// P-256 constants
constexpr size_t P256_COORDINATE_SIZE = 32;
constexpr size_t P256_UNCOMPRESSED_POINT_SIZE = 65;  // 0x04 || X || Y
constexpr size_t P256_RAW_SIGNATURE_SIZE = 64;       // r || s

// Digest sizes
constexpr size_t SHA256_HASH_SIZE = 32;
constexpr size_t SHA1_HASH_SIZE = 20;

// Serial numbers are random positive integers below 2^159 (fits in 20 DER octets)
constexpr int SERIAL_NUMBER_BITS = 159;

// Certificate chain depth: Leaf → Intermediate → Root
constexpr size_t REQUIRED_CERT_CHAIN_DEPTH = 3;

class PublicKey;

/**
 * @brief EC P-256 private key wrapper
 */
class PrivateKey {
public:
    PrivateKey();
    ~PrivateKey();

    PrivateKey(PrivateKey&&) noexcept;
    PrivateKey& operator=(PrivateKey&&) noexcept;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    /**
     * @brief Load private key from PEM file
     * @param path Path to PEM-encoded private key (PKCS#8 or SEC1)
     * @return Loaded private key
     * @throws CryptoError on read or parse error
     */
    static PrivateKey LoadFromFile(const std::string& path);

    /**
     * @brief Load private key from PEM buffer
     * @param pem PEM-encoded private key
     * @return Loaded private key
     * @throws CryptoError on parse error
     */
    static PrivateKey LoadFromPEM(const std::string& pem);

    /**
     * @brief Generate a new P-256 key pair
     * @return Generated private key
     * @throws CryptoError on generation error
     */
    static PrivateKey Generate();

    /**
     * @brief Export to PKCS#8 PEM format
     */
    std::string ToPEM() const;

    /**
     * @brief Check whether this key is the private half of the given public key
     */
    bool Matches(const PublicKey& public_key) const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Public key wrapper
 */
class PublicKey {
public:
    PublicKey();
    ~PublicKey();

    PublicKey(PublicKey&&) noexcept;
    PublicKey& operator=(PublicKey&&) noexcept;
    PublicKey(const PublicKey&) = delete;
    PublicKey& operator=(const PublicKey&) = delete;

    /**
     * @brief Load public key from PEM buffer
     * @param pem PEM-encoded SubjectPublicKeyInfo
     * @throws CryptoError on parse error
     */
    static PublicKey LoadFromPEM(const std::string& pem);

    /**
     * @brief Derive public key from private key
     */
    static PublicKey FromPrivateKey(const PrivateKey& privkey);

    /**
     * @brief Export to PEM format
     */
    std::string ToPEM() const;

    /**
     * @brief Canonical public key bytes
     *
     * For EC keys this is the uncompressed point (0x04 || X || Y), whatever
     * point format the key was loaded with. For other key types it is the
     * content of the subjectPublicKey BIT STRING.
     *
     * @throws CryptoError if the key cannot be encoded
     */
    std::vector<uint8_t> EncodedPoint() const;

    /**
     * @brief Compare key material
     */
    bool Equals(const PublicKey& other) const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief X.509 distinguished name (subject or issuer)
 *
 * Immutable once constructed. Equality is exact name comparison, the same
 * comparison chain builders use to match issuer against subject.
 */
class Name {
public:
    Name();
    ~Name();

    Name(Name&&) noexcept;
    Name& operator=(Name&&) noexcept;
    Name(const Name&) = delete;
    Name& operator=(const Name&) = delete;

    /**
     * @brief Build a name from (short name, value) attributes, in order
     * @param attributes e.g. {{"C", "US"}, {"CN", "Root CA"}}
     * @throws CryptoError if an attribute name is unknown
     */
    static Name FromAttributes(const std::vector<std::pair<std::string, std::string>>& attributes);

    /**
     * @brief Independent copy
     */
    Name Clone() const;

    /**
     * @brief RFC 2253 rendering, e.g. "CN=Root CA,O=Example,C=US"
     */
    std::string ToString() const;

    /**
     * @brief Value of the first attribute with this short name (e.g. "CN")
     */
    std::optional<std::string> GetAttribute(const std::string& short_name) const;

    bool operator==(const Name& other) const;
    bool operator!=(const Name& other) const { return !(*this == other); }

    void* GetNativeHandle() const;

private:
    friend class Certificate;
    friend class CertificateRequest;

    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Basic constraints extension contents
 */
struct BasicConstraints {
    bool is_ca = false;
    std::optional<long> max_path_length;  ///< Only meaningful for CAs
};

/**
 * @brief Key usage bits (values match OpenSSL's X509v3_KU_* flags)
 */
enum KeyUsageBits : uint32_t {
    kDigitalSignature = 0x0080,
    kNonRepudiation   = 0x0040,
    kKeyEncipherment  = 0x0020,
    kDataEncipherment = 0x0010,
    kKeyAgreement     = 0x0008,
    kKeyCertSign      = 0x0004,
    kCrlSign          = 0x0002
};

/**
 * @brief X.509 certificate wrapper
 */
class Certificate {
public:
    Certificate();
    ~Certificate();

    Certificate(Certificate&&) noexcept;
    Certificate& operator=(Certificate&&) noexcept;
    Certificate(const Certificate&) = delete;
    Certificate& operator=(const Certificate&) = delete;

    /**
     * @brief Load the first certificate of a PEM file
     * @throws CryptoError on read or parse error
     */
    static Certificate LoadFromFile(const std::string& path);

    /**
     * @brief Load the first certificate of a PEM string
     * @throws CryptoError on parse error
     */
    static Certificate LoadFromPEM(const std::string& pem);

    /**
     * @brief Load certificate chain from PEM string
     *
     * Loads every certificate of a PEM bundle, in file order
     * (leaf, intermediate, root for chains produced by this library).
     *
     * @param pem PEM string containing one or more certificates
     * @return Vector of certificates in bundle order
     * @throws CryptoError if no certificate can be parsed
     */
    static std::vector<Certificate> LoadChainFromPEM(const std::string& pem);

    /**
     * @brief Load certificate from DER buffer
     * @throws CryptoError on parse error
     */
    static Certificate LoadFromDER(const std::vector<uint8_t>& der);

    std::vector<uint8_t> ToDER() const;
    std::string ToPEM() const;

    /**
     * @brief Create PEM bundle from certificate chain
     *
     * PEM blocks are joined with a newline, leaf first. The result carries no
     * trailing newline after the last END line.
     */
    static std::string CreateChainPEM(const std::vector<const Certificate*>& chain);

    /**
     * @brief Independent copy (DER round trip)
     */
    Certificate Clone() const;

    PublicKey GetPublicKey() const;

    Name GetSubjectName() const;
    Name GetIssuerName() const;

    /**
     * @brief Subject DN string (e.g. "CN=Device-12345,O=Example")
     */
    std::string GetSubject() const;

    /**
     * @brief Issuer DN string
     */
    std::string GetIssuer() const;

    /**
     * @brief Serial number as big-endian magnitude bytes
     */
    std::vector<uint8_t> GetSerialNumber() const;

    /**
     * @brief Serial number for display, colon-separated lowercase hex ("1f:a0:...")
     */
    std::string GetSerialNumberString() const;

    /**
     * @brief Get certificate validity period
     * @return Pair of (notBefore, notAfter) timestamps in Unix epoch seconds
     */
    std::pair<int64_t, int64_t> GetValidityPeriod() const;

    BasicConstraints GetBasicConstraints() const;

    /**
     * @brief Key usage bits (KeyUsageBits); 0 if the extension is absent
     */
    uint32_t GetKeyUsage() const;

    /**
     * @brief Extended key usage OIDs in dotted form (empty if absent)
     */
    std::vector<std::string> GetExtendedKeyUsage() const;

    std::optional<std::vector<uint8_t>> GetSubjectKeyIdentifier() const;
    std::optional<std::vector<uint8_t>> GetAuthorityKeyIdentifier() const;

    /**
     * @brief Check that the issuer name equals the issuer certificate's subject name
     */
    bool IsIssuedBy(const Certificate& issuer) const;

    /**
     * @brief Verify certificate signature with public key
     *
     * Low-level signature verification. For name and time checks as well,
     * use VerifyChain().
     */
    bool VerifySignature(const PublicKey& issuer_pubkey) const;

    /**
     * @brief Verify one link of a chain
     *
     * Checks issuer name, signature under the issuer's key and that
     * trusted_time lies within this certificate's validity window.
     *
     * @param issuer Issuing certificate (this certificate for a self-signed root)
     * @param trusted_time Unix epoch seconds (use time(nullptr) for now)
     * @return true if the link is valid
     */
    bool VerifyChain(const Certificate& issuer, int64_t trusted_time) const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief PKCS#10 certificate signing request wrapper
 */
class CertificateRequest {
public:
    CertificateRequest();
    ~CertificateRequest();

    CertificateRequest(CertificateRequest&&) noexcept;
    CertificateRequest& operator=(CertificateRequest&&) noexcept;
    CertificateRequest(const CertificateRequest&) = delete;
    CertificateRequest& operator=(const CertificateRequest&) = delete;

    /**
     * @brief Parse a PEM "CERTIFICATE REQUEST"
     *
     * The begin marker is checked before anything is decoded.
     *
     * @throws MalformedInputError if the marker is missing, the base64 body is
     *         empty or invalid, or the DER is not a CSR
     */
    static CertificateRequest LoadFromPEM(const std::string& pem);

    /**
     * @brief Parse a DER-encoded CSR
     * @throws MalformedInputError if the bytes are empty, not a CSR, or carry trailing data
     */
    static CertificateRequest LoadFromDER(const std::vector<uint8_t>& der);

    /**
     * @brief Create and self-sign a CSR (ECDSA with SHA-256)
     * @throws CryptoError on failure
     */
    static CertificateRequest Create(const Name& subject, const PrivateKey& key);

    std::vector<uint8_t> ToDER() const;
    std::string ToPEM() const;

    Name GetSubjectName() const;
    PublicKey GetPublicKey() const;

    /**
     * @brief Verify the CSR self-signature (proof of possession)
     */
    bool VerifySignature() const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief ECDSA with SHA-256
 */
class ECDSA {
public:
    /**
     * @brief Sign data, DER-encoded signature
     * @throws CryptoError on signing failure
     */
    static std::vector<uint8_t> Sign(
        const PrivateKey& private_key,
        const std::vector<uint8_t>& data
    );

    /**
     * @brief Sign data, fixed-size r || s signature (64 bytes for P-256)
     * @throws CryptoError on signing failure
     */
    static std::vector<uint8_t> SignRaw(
        const PrivateKey& private_key,
        const std::vector<uint8_t>& data
    );

    /**
     * @brief Verify DER-encoded signature
     * @return true if signature is valid
     * @throws SignatureVerificationError if signature is invalid
     */
    static bool Verify(
        const PublicKey& public_key,
        const std::vector<uint8_t>& data,
        const std::vector<uint8_t>& signature
    );

    /**
     * @brief Verify r || s signature
     * @throws SignatureVerificationError if signature is invalid
     */
    static bool VerifyRaw(
        const PublicKey& public_key,
        const std::vector<uint8_t>& data,
        const std::vector<uint8_t>& raw_signature
    );
};

/**
 * @brief SHA-256 hashing
 */
class SHA256 {
public:
    static std::vector<uint8_t> Hash(const std::vector<uint8_t>& data);
};

/**
 * @brief SHA-1 hashing (key identifiers only)
 */
class SHA1 {
public:
    static std::vector<uint8_t> Hash(const std::vector<uint8_t>& data);
};

/**
 * @brief Fill a buffer from the OpenSSL CSPRNG
 * @throws CryptoError if the PRNG is not seeded
 */
std::vector<uint8_t> RandomBytes(size_t size);

/**
 * @brief Random (version 4) UUID, uppercase canonical form
 */
std::string GenerateUUID();

/**
 * @brief Colon-separated lowercase hex ("0a:ff:...")
 */
std::string ToColonHex(const std::vector<uint8_t>& bytes);

} // namespace crypto
} // namespace c2pasign

#endif // C2PASIGN_CRYPTO_H

/**
 * @file certificate_test.cpp
 * @brief Unit tests for Name, Certificate, CertificateRequest and IssueCertificate
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "c2pasign/common/crypto.h"
#include "c2pasign/common/pem.h"
#include "c2pasign/common/x509.h"
#include <cstdio>
#include <ctime>
#include <fstream>

using namespace c2pasign::crypto;
using namespace c2pasign;

namespace {

constexpr int64_t kDay = 24 * 60 * 60;

// NIDs rendered as dotted OIDs by GetExtendedKeyUsage()
constexpr const char* kEmailProtectionOid = "1.3.6.1.5.5.7.3.4";
constexpr const char* kCodeSigningOid = "1.3.6.1.5.5.7.3.3";

CertificateProfile RootProfile() {
    CertificateProfile profile;
    profile.basic_constraints.is_ca = true;
    profile.basic_constraints.max_path_length = 1;
    profile.key_usage = {"keyCertSign", "cRLSign"};
    profile.backdate_seconds = 300;
    profile.validity_seconds = 3650 * kDay;
    return profile;
}

CertificateProfile LeafProfile() {
    CertificateProfile profile;
    profile.key_usage = {"digitalSignature"};
    profile.extended_key_usage = {"emailProtection"};
    profile.backdate_seconds = 60;
    profile.validity_seconds = 365 * kDay;
    return profile;
}

}  // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class CertificateTest : public ::testing::Test {
protected:
    void SetUp() override {
        now = static_cast<int64_t>(std::time(nullptr));

        ca_privkey = PrivateKey::Generate();
        ca_pubkey = PublicKey::FromPrivateKey(ca_privkey);
        ee_privkey = PrivateKey::Generate();
        ee_pubkey = PublicKey::FromPrivateKey(ee_privkey);

        ca_name = Name::FromAttributes({{"C", "US"}, {"O", "Example"}, {"CN", "Test CA"}});
        ee_name = Name::FromAttributes({{"O", "Example"}, {"CN", "Test EE"}});

        ca_cert = IssueCertificate(RootProfile(), ca_name, ca_pubkey, ca_privkey, nullptr, now);
        ee_cert = IssueCertificate(LeafProfile(), ee_name, ee_pubkey, ca_privkey, &ca_cert, now);
    }

    int64_t now = 0;
    PrivateKey ca_privkey;
    PublicKey ca_pubkey;
    PrivateKey ee_privkey;
    PublicKey ee_pubkey;
    Name ca_name;
    Name ee_name;
    Certificate ca_cert;
    Certificate ee_cert;
};

// ============================================================================
// Name Tests
// ============================================================================

TEST(NameTest, AttributesAndRendering) {
    auto name = Name::FromAttributes({{"C", "US"}, {"O", "Example Org"}, {"CN", "Device-1"}});

    EXPECT_EQ(name.GetAttribute("CN"), std::optional<std::string>("Device-1"));
    EXPECT_EQ(name.GetAttribute("O"), std::optional<std::string>("Example Org"));
    EXPECT_FALSE(name.GetAttribute("OU").has_value());

    // RFC 2253 lists the most specific attribute first
    EXPECT_EQ(name.ToString(), "CN=Device-1,O=Example Org,C=US");
}

TEST(NameTest, EqualityIsExact) {
    auto a = Name::FromAttributes({{"O", "Example"}, {"CN", "A"}});
    auto b = Name::FromAttributes({{"O", "Example"}, {"CN", "A"}});
    auto c = Name::FromAttributes({{"O", "Example"}, {"CN", "B"}});

    EXPECT_TRUE(a == b);
    EXPECT_TRUE(a != c);
    EXPECT_TRUE(a == a.Clone());
}

TEST(NameTest, UnknownAttributeRejected) {
    EXPECT_THROW(Name::FromAttributes({{"NOT_AN_ATTRIBUTE", "x"}}), CryptoError);
}

TEST(NameTest, Utf8Values) {
    auto name = Name::FromAttributes({{"CN", "Caf\xc3\xa9"}});

    EXPECT_EQ(name.GetAttribute("CN"), std::optional<std::string>("Caf\xc3\xa9"));
}

TEST(DistinguishedNameTest, AttributeOrderAndOptionalEmail) {
    DistinguishedName dn;
    dn.common_name = "Signer";
    dn.organization = "Org";
    dn.organizational_unit = "Unit";
    dn.country = "US";
    dn.state = "California";
    dn.locality = "San Francisco";

    auto name = dn.ToName();
    EXPECT_EQ(name.ToString(), "CN=Signer,OU=Unit,O=Org,L=San Francisco,ST=California,C=US");
    EXPECT_FALSE(name.GetAttribute("emailAddress").has_value());

    dn.email = "signer@example.com";
    EXPECT_EQ(dn.ToName().GetAttribute("emailAddress"), std::optional<std::string>("signer@example.com"));
}

TEST(DistinguishedNameTest, EmptyAttributesSkipped) {
    DistinguishedName dn;
    dn.common_name = "Only CN";

    EXPECT_EQ(dn.ToName().ToString(), "CN=Only CN");
}

// ============================================================================
// Load/Save Tests
// ============================================================================

TEST_F(CertificateTest, LoadFromDER) {
    auto loaded = Certificate::LoadFromDER(ca_cert.ToDER());

    EXPECT_EQ(loaded.ToDER(), ca_cert.ToDER());
}

TEST_F(CertificateTest, LoadFromDERInvalidData) {
    EXPECT_THROW(Certificate::LoadFromDER({0x01, 0x02, 0x03}), CryptoError);
    EXPECT_THROW(Certificate::LoadFromDER({}), CryptoError);
}

TEST_F(CertificateTest, PEMFileRoundTrip) {
    const char* temp_file = "/tmp/c2pasign_cert_test.pem";
    {
        std::ofstream ofs(temp_file);
        ofs << ca_cert.ToPEM();
    }

    auto loaded = Certificate::LoadFromFile(temp_file);
    EXPECT_EQ(loaded.ToDER(), ca_cert.ToDER());

    std::remove(temp_file);
}

TEST_F(CertificateTest, LoadFromFileNotFound) {
    EXPECT_THROW(Certificate::LoadFromFile("/nonexistent/path.pem"), CryptoError);
}

TEST_F(CertificateTest, CloneProducesIdenticalCertificate) {
    auto cloned = ee_cert.Clone();

    EXPECT_EQ(cloned.ToDER(), ee_cert.ToDER());
    EXPECT_NE(cloned.GetNativeHandle(), ee_cert.GetNativeHandle());
}

// ============================================================================
// Chain PEM Tests
// ============================================================================

TEST_F(CertificateTest, CreateChainPEMJoinsWithNewline) {
    std::string chain = Certificate::CreateChainPEM({&ee_cert, &ca_cert});

    std::string ee_pem = ee_cert.ToPEM();
    std::string ca_pem = ca_cert.ToPEM();
    ee_pem.pop_back();
    ca_pem.pop_back();

    EXPECT_EQ(chain, ee_pem + "\n" + ca_pem);
    EXPECT_NE(chain.back(), '\n');
}

TEST_F(CertificateTest, LoadChainFromPEMPreservesOrder) {
    auto chain = Certificate::LoadChainFromPEM(Certificate::CreateChainPEM({&ee_cert, &ca_cert}));

    ASSERT_EQ(chain.size(), 2u);
    EXPECT_EQ(chain[0].ToDER(), ee_cert.ToDER());
    EXPECT_EQ(chain[1].ToDER(), ca_cert.ToDER());
}

TEST_F(CertificateTest, LoadChainFromPEMRejectsEmpty) {
    EXPECT_THROW(Certificate::LoadChainFromPEM("no certificates here"), CryptoError);
}

// ============================================================================
// Issuance Tests
// ============================================================================

TEST_F(CertificateTest, SelfIssuedNames) {
    EXPECT_TRUE(ca_cert.GetSubjectName() == ca_name);
    EXPECT_TRUE(ca_cert.GetIssuerName() == ca_name);
    EXPECT_EQ(ca_cert.GetSubject(), "CN=Test CA,O=Example,C=US");
}

TEST_F(CertificateTest, IssuedNamesFollowIssuer) {
    EXPECT_TRUE(ee_cert.GetSubjectName() == ee_name);
    EXPECT_TRUE(ee_cert.GetIssuerName() == ca_cert.GetSubjectName());
    EXPECT_TRUE(ee_cert.IsIssuedBy(ca_cert));
    EXPECT_FALSE(ca_cert.IsIssuedBy(ee_cert));
}

TEST_F(CertificateTest, PublicKeyPreserved) {
    EXPECT_TRUE(ee_cert.GetPublicKey().Equals(ee_pubkey));
    EXPECT_TRUE(ca_cert.GetPublicKey().Equals(ca_pubkey));
}

TEST_F(CertificateTest, ValidityWindow) {
    auto ca_validity = ca_cert.GetValidityPeriod();
    EXPECT_EQ(ca_validity.first, now - 300);
    EXPECT_EQ(ca_validity.second, now + 3650 * kDay);

    auto ee_validity = ee_cert.GetValidityPeriod();
    EXPECT_EQ(ee_validity.first, now - 60);
    EXPECT_EQ(ee_validity.second, now + 365 * kDay);
}

TEST_F(CertificateTest, BasicConstraints) {
    auto ca_bc = ca_cert.GetBasicConstraints();
    EXPECT_TRUE(ca_bc.is_ca);
    ASSERT_TRUE(ca_bc.max_path_length.has_value());
    EXPECT_EQ(*ca_bc.max_path_length, 1);

    auto ee_bc = ee_cert.GetBasicConstraints();
    EXPECT_FALSE(ee_bc.is_ca);
    EXPECT_FALSE(ee_bc.max_path_length.has_value());
}

TEST_F(CertificateTest, KeyUsage) {
    EXPECT_EQ(ca_cert.GetKeyUsage(), static_cast<uint32_t>(kKeyCertSign | kCrlSign));
    EXPECT_EQ(ee_cert.GetKeyUsage(), static_cast<uint32_t>(kDigitalSignature));
}

TEST_F(CertificateTest, ExtendedKeyUsage) {
    EXPECT_TRUE(ca_cert.GetExtendedKeyUsage().empty());
    EXPECT_THAT(ee_cert.GetExtendedKeyUsage(), ::testing::ElementsAre(kEmailProtectionOid));
}

TEST_F(CertificateTest, MultipleExtendedKeyUsages) {
    auto profile = LeafProfile();
    profile.extended_key_usage = {"emailProtection", "codeSigning"};

    auto cert = IssueCertificate(profile, ee_name, ee_pubkey, ca_privkey, &ca_cert, now);

    EXPECT_THAT(cert.GetExtendedKeyUsage(),
                ::testing::ElementsAre(kEmailProtectionOid, kCodeSigningOid));
}

TEST_F(CertificateTest, KeyIdentifiers) {
    EXPECT_EQ(ca_cert.GetSubjectKeyIdentifier(), ComputeKeyIdentifier(ca_pubkey));
    EXPECT_FALSE(ca_cert.GetAuthorityKeyIdentifier().has_value());

    EXPECT_EQ(ee_cert.GetSubjectKeyIdentifier(), ComputeKeyIdentifier(ee_pubkey));
    EXPECT_EQ(ee_cert.GetAuthorityKeyIdentifier(), ComputeKeyIdentifier(ca_pubkey));
}

TEST_F(CertificateTest, SerialNumbers) {
    auto serial = ee_cert.GetSerialNumber();

    EXPECT_FALSE(serial.empty());
    EXPECT_LE(serial.size(), 20u);
    EXPECT_EQ(ee_cert.GetSerialNumberString(), ToColonHex(serial));
    EXPECT_NE(ee_cert.GetSerialNumber(), ca_cert.GetSerialNumber());
}

TEST_F(CertificateTest, SameInputsProduceDistinctSerials) {
    auto a = IssueCertificate(LeafProfile(), ee_name, ee_pubkey, ca_privkey, &ca_cert, now);
    auto b = IssueCertificate(LeafProfile(), ee_name, ee_pubkey, ca_privkey, &ca_cert, now);

    EXPECT_NE(a.GetSerialNumber(), b.GetSerialNumber());
}

TEST_F(CertificateTest, RejectsSigningKeyNotMatchingIssuer) {
    EXPECT_THROW(IssueCertificate(LeafProfile(), ee_name, ee_pubkey, ee_privkey, &ca_cert, now),
                 CryptoError);
}

TEST_F(CertificateTest, RejectsSelfIssuedWithForeignKey) {
    EXPECT_THROW(IssueCertificate(RootProfile(), ca_name, ca_pubkey, ee_privkey, nullptr, now),
                 CryptoError);
}

// ============================================================================
// Verification Tests
// ============================================================================

TEST_F(CertificateTest, VerifySignature) {
    EXPECT_TRUE(ca_cert.VerifySignature(ca_pubkey));
    EXPECT_TRUE(ee_cert.VerifySignature(ca_pubkey));
    EXPECT_FALSE(ee_cert.VerifySignature(ee_pubkey));
}

TEST_F(CertificateTest, VerifyChain) {
    EXPECT_TRUE(ca_cert.VerifyChain(ca_cert, now));
    EXPECT_TRUE(ee_cert.VerifyChain(ca_cert, now));
}

TEST_F(CertificateTest, VerifyChainRejectsOutsideValidity) {
    EXPECT_FALSE(ee_cert.VerifyChain(ca_cert, now - 120));
    EXPECT_FALSE(ee_cert.VerifyChain(ca_cert, now + 366 * kDay));
}

TEST_F(CertificateTest, VerifyChainRejectsWrongIssuer) {
    // Same subject name, different key
    auto other_key = PrivateKey::Generate();
    auto other_ca = IssueCertificate(RootProfile(), ca_name, PublicKey::FromPrivateKey(other_key),
                                     other_key, nullptr, now);

    EXPECT_FALSE(ee_cert.VerifyChain(other_ca, now));
    EXPECT_FALSE(ee_cert.VerifyChain(ee_cert, now));
}

// ============================================================================
// CertificateRequest Tests
// ============================================================================

TEST(CertificateRequestTest, CreateAndParse) {
    auto key = PrivateKey::Generate();
    auto subject = Name::FromAttributes({{"O", "Example"}, {"CN", "Integration Test"}});

    auto csr = CertificateRequest::Create(subject, key);
    auto pem_text = csr.ToPEM();
    EXPECT_EQ(pem_text.rfind("-----BEGIN CERTIFICATE REQUEST-----", 0), 0u);

    auto parsed = CertificateRequest::LoadFromPEM(pem_text);
    EXPECT_TRUE(parsed.GetSubjectName() == subject);
    EXPECT_TRUE(parsed.GetPublicKey().Equals(PublicKey::FromPrivateKey(key)));
    EXPECT_TRUE(parsed.VerifySignature());
    EXPECT_EQ(parsed.ToDER(), csr.ToDER());
}

TEST(CertificateRequestTest, MissingMarkerIsMalformedInput) {
    try {
        CertificateRequest::LoadFromPEM("-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n");
        FAIL() << "Expected MalformedInputError";
    } catch (const MalformedInputError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedInput);
    }
}

TEST(CertificateRequestTest, EmptyBodyIsMalformedInput) {
    EXPECT_THROW(CertificateRequest::LoadFromPEM(
                     "-----BEGIN CERTIFICATE REQUEST-----\n-----END CERTIFICATE REQUEST-----\n"),
                 MalformedInputError);
}

TEST(CertificateRequestTest, GarbageDERIsMalformedInput) {
    std::string text = pem::Encode({0x30, 0x03, 0x02, 0x01, 0x01}, pem::CERTIFICATE_REQUEST_LABEL);

    EXPECT_THROW(CertificateRequest::LoadFromPEM(text), MalformedInputError);
    EXPECT_THROW(CertificateRequest::LoadFromDER({}), MalformedInputError);
}

TEST(CertificateRequestTest, TrailingDataRejected) {
    auto key = PrivateKey::Generate();
    auto csr = CertificateRequest::Create(Name::FromAttributes({{"CN", "x"}}), key);

    auto der = csr.ToDER();
    der.push_back(0x00);

    EXPECT_THROW(CertificateRequest::LoadFromDER(der), MalformedInputError);
}

TEST(CertificateRequestTest, TamperedSignatureDetected) {
    auto key = PrivateKey::Generate();
    auto csr = CertificateRequest::Create(Name::FromAttributes({{"CN", "x"}}), key);

    auto der = csr.ToDER();
    der[der.size() - 5] ^= 0x01;  // Inside the signature BIT STRING

    auto tampered = CertificateRequest::LoadFromDER(der);
    EXPECT_FALSE(tampered.VerifySignature());
}

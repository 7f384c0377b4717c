/**
 * @file pem_test.cpp
 * @brief Unit tests for PEM armor and base64 helpers
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include "c2pasign/common/error.h"
#include "c2pasign/common/pem.h"

using namespace c2pasign;

namespace {

std::vector<uint8_t> Bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

}  // namespace

// ============================================================================
// Base64 Tests
// ============================================================================

TEST(PemTest, Base64EncodeVectors) {
    EXPECT_EQ(pem::Base64Encode({}), "");
    EXPECT_EQ(pem::Base64Encode(Bytes("f")), "Zg==");
    EXPECT_EQ(pem::Base64Encode(Bytes("fo")), "Zm8=");
    EXPECT_EQ(pem::Base64Encode(Bytes("foo")), "Zm9v");
    EXPECT_EQ(pem::Base64Encode(Bytes("foobar")), "Zm9vYmFy");
}

TEST(PemTest, Base64DecodeVectors) {
    EXPECT_EQ(pem::Base64Decode("Zg=="), Bytes("f"));
    EXPECT_EQ(pem::Base64Decode("Zm8="), Bytes("fo"));
    EXPECT_EQ(pem::Base64Decode("Zm9vYmFy"), Bytes("foobar"));
    EXPECT_TRUE(pem::Base64Decode("").empty());
}

TEST(PemTest, Base64DecodeIgnoresLineBreaks) {
    EXPECT_EQ(pem::Base64Decode("Zm9v\r\nYmFy\n"), Bytes("foobar"));
}

TEST(PemTest, Base64DecodeBinary) {
    std::vector<uint8_t> data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<uint8_t>(i));
    }
    EXPECT_EQ(pem::Base64Decode(pem::Base64Encode(data)), data);
}

TEST(PemTest, Base64DecodeRejectsInvalidInput) {
    EXPECT_THROW(pem::Base64Decode("Zm9"), MalformedInputError);       // Length
    EXPECT_THROW(pem::Base64Decode("Zm9v!mFy"), MalformedInputError);  // Character
    EXPECT_THROW(pem::Base64Decode("Zg==Zm9v"), MalformedInputError);  // Padding in the middle
    EXPECT_THROW(pem::Base64Decode("Z==="), MalformedInputError);      // Too much padding
}

// ============================================================================
// PEM Tests
// ============================================================================

TEST(PemTest, Markers) {
    EXPECT_EQ(pem::BeginMarker("CERTIFICATE REQUEST"), "-----BEGIN CERTIFICATE REQUEST-----");
    EXPECT_EQ(pem::EndMarker("CERTIFICATE"), "-----END CERTIFICATE-----");
}

TEST(PemTest, HasBeginMarker) {
    EXPECT_TRUE(pem::HasBeginMarker("junk\n-----BEGIN CERTIFICATE REQUEST-----\n", "CERTIFICATE REQUEST"));
    EXPECT_FALSE(pem::HasBeginMarker("-----BEGIN CERTIFICATE-----", "CERTIFICATE REQUEST"));
    EXPECT_FALSE(pem::HasBeginMarker("", "CERTIFICATE"));
}

TEST(PemTest, EncodeWrapsAt64Columns) {
    std::vector<uint8_t> der(100, 0xAB);

    std::string pem = pem::Encode(der, "CERTIFICATE");

    EXPECT_EQ(pem.rfind("-----BEGIN CERTIFICATE-----\n", 0), 0u);
    EXPECT_NE(pem.find("\n-----END CERTIFICATE-----\n"), std::string::npos);

    // 100 bytes -> 136 base64 chars -> lines of 64, 64, 8
    size_t first_nl = pem.find('\n');
    size_t second_nl = pem.find('\n', first_nl + 1);
    EXPECT_EQ(second_nl - first_nl - 1, 64u);
}

TEST(PemTest, DecodeEncodedBlock) {
    std::vector<uint8_t> der = Bytes("some der bytes that span more than one line of base64 text, really");

    EXPECT_EQ(pem::Decode(pem::Encode(der, "CERTIFICATE REQUEST"), "CERTIFICATE REQUEST"), der);
}

TEST(PemTest, DecodeToleratesCRLF) {
    std::string text = "-----BEGIN CERTIFICATE-----\r\nZm9vYmFy\r\n-----END CERTIFICATE-----\r\n";

    EXPECT_EQ(pem::Decode(text, "CERTIFICATE"), Bytes("foobar"));
}

TEST(PemTest, DecodeMissingBeginMarker) {
    EXPECT_THROW(pem::Decode("Zm9vYmFy\n-----END CERTIFICATE-----\n", "CERTIFICATE"), MalformedInputError);
}

TEST(PemTest, DecodeMissingEndMarker) {
    EXPECT_THROW(pem::Decode("-----BEGIN CERTIFICATE-----\nZm9vYmFy\n", "CERTIFICATE"), MalformedInputError);
}

TEST(PemTest, DecodeEmptyBody) {
    std::string text = "-----BEGIN CERTIFICATE REQUEST-----\n-----END CERTIFICATE REQUEST-----\n";

    try {
        pem::Decode(text, "CERTIFICATE REQUEST");
        FAIL() << "Expected MalformedInputError";
    } catch (const MalformedInputError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedInput);
    }
}

TEST(PemTest, DecodeInvalidBase64Body) {
    std::string text = "-----BEGIN CERTIFICATE-----\n@@@@\n-----END CERTIFICATE-----\n";

    EXPECT_THROW(pem::Decode(text, "CERTIFICATE"), MalformedInputError);
}

// ============================================================================
// Error Taxonomy Tests
// ============================================================================

TEST(ErrorTest, KindNames) {
    EXPECT_STREQ(ErrorKindName(ErrorKind::MalformedInput), "malformed_input");
    EXPECT_STREQ(ErrorKindName(ErrorKind::Unauthorized), "unauthorized");
    EXPECT_STREQ(ErrorKindName(ErrorKind::MissingMaterial), "missing_material");
    EXPECT_STREQ(ErrorKindName(ErrorKind::Crypto), "crypto");
    EXPECT_STREQ(ErrorKindName(ErrorKind::Engine), "engine");
    EXPECT_STREQ(ErrorKindName(ErrorKind::Startup), "startup");
}

TEST(ErrorTest, ClientErrorSplit) {
    EXPECT_TRUE(IsClientError(ErrorKind::MalformedInput));
    EXPECT_TRUE(IsClientError(ErrorKind::Unauthorized));
    EXPECT_FALSE(IsClientError(ErrorKind::MissingMaterial));
    EXPECT_FALSE(IsClientError(ErrorKind::Crypto));
    EXPECT_FALSE(IsClientError(ErrorKind::Engine));
    EXPECT_FALSE(IsClientError(ErrorKind::Startup));
}

TEST(ErrorTest, SubclassesCarryKind) {
    EXPECT_EQ(MissingMaterialError("x").kind(), ErrorKind::MissingMaterial);
    EXPECT_EQ(EngineError("x").kind(), ErrorKind::Engine);
    EXPECT_EQ(StartupError("x").kind(), ErrorKind::Startup);
    EXPECT_STREQ(UnauthorizedError("nope").what(), "nope");
}

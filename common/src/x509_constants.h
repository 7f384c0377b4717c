/**
 * @file x509_constants.h
 * @brief X.509 extension configuration strings and algorithm names
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_X509_CONSTANTS_H
#define C2PASIGN_X509_CONSTANTS_H

namespace c2pasign {
namespace crypto {
namespace internal {

// Curve used for every key this library generates
constexpr const char* EC_CURVE_NAME = "P-256";

// X509_VERSION_3 (2, the zero-based v3 value for X509_set_version) and
// X509_REQ_VERSION_1 (0, the only PKCS#10 version) come from <openssl/x509.h>

// OpenSSL extension config prefixes (X509V3_EXT_conf_nid value syntax)
constexpr const char* CRITICAL_PREFIX = "critical,";
constexpr const char* CA_TRUE = "CA:TRUE";
constexpr const char* CA_FALSE = "CA:FALSE";
constexpr const char* PATHLEN_PREFIX = ",pathlen:";

} // namespace internal
} // namespace crypto
} // namespace c2pasign

#endif // C2PASIGN_X509_CONSTANTS_H

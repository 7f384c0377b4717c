/**
 * @file pem.h
 * @brief PEM armor and base64 helpers
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_PEM_H
#define C2PASIGN_PEM_H

#include <cstdint>
#include <string>
#include <vector>

namespace c2pasign {
namespace pem {

constexpr const char* CERTIFICATE_LABEL = "CERTIFICATE";
constexpr const char* CERTIFICATE_REQUEST_LABEL = "CERTIFICATE REQUEST";
constexpr const char* PRIVATE_KEY_LABEL = "PRIVATE KEY";
constexpr const char* EC_PRIVATE_KEY_LABEL = "EC PRIVATE KEY";

/**
 * @brief "-----BEGIN <label>-----"
 */
std::string BeginMarker(const std::string& label);

/**
 * @brief "-----END <label>-----"
 */
std::string EndMarker(const std::string& label);

/**
 * @brief Structural check: does the text contain the begin marker for label?
 */
bool HasBeginMarker(const std::string& text, const std::string& label);

/**
 * @brief Extract and decode the first block with the given label
 *
 * Lines are compared after trimming surrounding whitespace, so CRLF input
 * is accepted.
 *
 * @throws MalformedInputError if the begin or end marker is missing, the
 *         body is empty, or the body is not valid base64
 */
std::vector<uint8_t> Decode(const std::string& text, const std::string& label);

/**
 * @brief Armor DER bytes (64-column base64 lines, trailing newline)
 */
std::string Encode(const std::vector<uint8_t>& der, const std::string& label);

/**
 * @brief Base64 without line breaks
 */
std::string Base64Encode(const std::vector<uint8_t>& data);

/**
 * @brief Strict base64 decoding (whitespace between groups is ignored)
 * @throws MalformedInputError on invalid characters or length
 */
std::vector<uint8_t> Base64Decode(const std::string& encoded);

} // namespace pem
} // namespace c2pasign

#endif // C2PASIGN_PEM_H

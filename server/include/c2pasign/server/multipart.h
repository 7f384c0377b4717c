/**
 * @file multipart.h
 * @brief multipart/form-data request body parsing
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_SERVER_MULTIPART_H
#define C2PASIGN_SERVER_MULTIPART_H

#include <optional>
#include <string>
#include <vector>

namespace c2pasign {
namespace server {

struct MultipartPart {
    std::string name;                     ///< Content-Disposition name
    std::optional<std::string> filename;  ///< Content-Disposition filename, if any
    std::string content_type;             ///< Part Content-Type, empty if absent
    std::string body;
};

/**
 * @brief Media type without parameters, lowercased ("Text/Plain; q=1" -> "text/plain")
 */
std::string MediaType(const std::string& content_type);

/**
 * @brief Boundary parameter of a multipart/form-data Content-Type
 * @throws MalformedInputError if the type is not multipart/form-data or has no boundary
 */
std::string MultipartBoundary(const std::string& content_type);

/**
 * @brief Split a multipart body into parts
 *
 * Preamble and epilogue are ignored. At most limits::MAX_MULTIPART_PARTS parts
 * are accepted.
 *
 * @throws MalformedInputError if the body is not well-formed
 */
std::vector<MultipartPart> ParseMultipart(const std::string& body, const std::string& boundary);

/**
 * @brief First part with the given name, or nullptr
 */
const MultipartPart* FindPart(const std::vector<MultipartPart>& parts, const std::string& name);

} // namespace server
} // namespace c2pasign

#endif // C2PASIGN_SERVER_MULTIPART_H

/**
 * @file multipart.cpp
 * @brief multipart/form-data request body parsing
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/server/multipart.h"
#include "c2pasign/common/error.h"
#include "c2pasign/common/limits.h"
#include <algorithm>
#include <cctype>

namespace c2pasign {
namespace server {

namespace {

constexpr const char* CRLF = "\r\n";
constexpr const char* HEADER_END = "\r\n\r\n";

std::string Trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string Unquote(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

/**
 * @brief Value of a "key=value" parameter in a ';'-separated header value
 */
std::optional<std::string> HeaderParameter(const std::string& header_value, const std::string& key) {
    size_t pos = header_value.find(';');
    while (pos != std::string::npos) {
        size_t next = header_value.find(';', pos + 1);
        std::string param = Trim(header_value.substr(pos + 1, next == std::string::npos
                                                                 ? std::string::npos
                                                                 : next - pos - 1));
        size_t eq = param.find('=');
        if (eq != std::string::npos && ToLower(Trim(param.substr(0, eq))) == key) {
            return Unquote(Trim(param.substr(eq + 1)));
        }
        pos = next;
    }
    return std::nullopt;
}

void ParsePartHeaders(const std::string& headers, MultipartPart& part) {
    bool has_disposition = false;

    size_t start = 0;
    while (start < headers.size()) {
        size_t end = headers.find(CRLF, start);
        if (end == std::string::npos) {
            end = headers.size();
        }
        std::string line = headers.substr(start, end - start);
        start = end + 2;

        if (line.empty()) {
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            throw MalformedInputError("Malformed multipart header: " + line);
        }
        std::string name = ToLower(Trim(line.substr(0, colon)));
        std::string value = Trim(line.substr(colon + 1));

        if (name == "content-disposition") {
            if (ToLower(MediaType(value)) != "form-data") {
                throw MalformedInputError("Multipart part is not form-data");
            }
            auto field = HeaderParameter(value, "name");
            if (!field || field->empty()) {
                throw MalformedInputError("Multipart part without a name");
            }
            part.name = *field;
            part.filename = HeaderParameter(value, "filename");
            has_disposition = true;
        } else if (name == "content-type") {
            part.content_type = value;
        }
    }

    if (!has_disposition) {
        throw MalformedInputError("Multipart part without Content-Disposition");
    }
}

}  // namespace

std::string MediaType(const std::string& content_type) {
    return ToLower(Trim(content_type.substr(0, content_type.find(';'))));
}

std::string MultipartBoundary(const std::string& content_type) {
    if (MediaType(content_type) != "multipart/form-data") {
        throw MalformedInputError("Expected multipart/form-data, got \"" + content_type + "\"");
    }

    auto boundary = HeaderParameter(content_type, "boundary");
    if (!boundary || boundary->empty()) {
        throw MalformedInputError("multipart/form-data without boundary");
    }
    // RFC 2046 limit
    if (boundary->size() > 70) {
        throw MalformedInputError("Multipart boundary too long");
    }
    return *boundary;
}

std::vector<MultipartPart> ParseMultipart(const std::string& body, const std::string& boundary) {
    if (boundary.empty()) {
        throw MalformedInputError("Empty multipart boundary");
    }

    const std::string delimiter = "--" + boundary;
    const std::string part_delimiter = std::string(CRLF) + delimiter;

    // First delimiter is either at the start or after a preamble line
    size_t pos;
    if (body.compare(0, delimiter.size(), delimiter) == 0) {
        pos = delimiter.size();
    } else {
        pos = body.find(part_delimiter);
        if (pos == std::string::npos) {
            throw MalformedInputError("Multipart boundary not found in body");
        }
        pos += part_delimiter.size();
    }

    std::vector<MultipartPart> parts;
    for (;;) {
        if (body.compare(pos, 2, "--") == 0) {
            break;  // Closing delimiter
        }

        // Transport padding, then CRLF
        while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t')) {
            pos++;
        }
        if (body.compare(pos, 2, CRLF) != 0) {
            throw MalformedInputError("Malformed multipart delimiter line");
        }
        pos += 2;

        if (parts.size() >= limits::MAX_MULTIPART_PARTS) {
            throw MalformedInputError("Too many multipart parts");
        }

        MultipartPart part;
        size_t body_start;
        if (body.compare(pos, 2, CRLF) == 0) {
            body_start = pos + 2;  // No headers
        } else {
            size_t headers_end = body.find(HEADER_END, pos);
            if (headers_end == std::string::npos) {
                throw MalformedInputError("Unterminated multipart headers");
            }
            ParsePartHeaders(body.substr(pos, headers_end - pos), part);
            body_start = headers_end + 4;
        }

        size_t body_end = body.find(part_delimiter, body_start);
        if (body_end == std::string::npos) {
            throw MalformedInputError("Unterminated multipart part");
        }
        part.body = body.substr(body_start, body_end - body_start);
        if (part.name.empty()) {
            throw MalformedInputError("Multipart part without Content-Disposition");
        }
        parts.push_back(std::move(part));

        pos = body_end + part_delimiter.size();
    }

    return parts;
}

const MultipartPart* FindPart(const std::vector<MultipartPart>& parts, const std::string& name) {
    for (const auto& part : parts) {
        if (part.name == name) {
            return &part;
        }
    }
    return nullptr;
}

} // namespace server
} // namespace c2pasign

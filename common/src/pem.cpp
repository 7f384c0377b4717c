/**
 * @file pem.cpp
 * @brief PEM armor and base64 helpers
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/common/pem.h"
#include "c2pasign/common/error.h"
#include <openssl/evp.h>
#include <sstream>

namespace c2pasign {
namespace pem {

namespace {

constexpr size_t PEM_LINE_WIDTH = 64;

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool IsBase64Char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

}  // namespace

std::string BeginMarker(const std::string& label) {
    return "-----BEGIN " + label + "-----";
}

std::string EndMarker(const std::string& label) {
    return "-----END " + label + "-----";
}

bool HasBeginMarker(const std::string& text, const std::string& label) {
    return text.find(BeginMarker(label)) != std::string::npos;
}

std::vector<uint8_t> Decode(const std::string& text, const std::string& label) {
    const std::string begin = BeginMarker(label);
    const std::string end = EndMarker(label);

    std::istringstream in(text);
    std::string line;
    bool in_block = false;
    bool closed = false;
    std::string body;

    while (std::getline(in, line)) {
        std::string trimmed = Trim(line);
        if (!in_block) {
            if (trimmed == begin) {
                in_block = true;
            }
            continue;
        }
        if (trimmed == end) {
            closed = true;
            break;
        }
        body += trimmed;
    }

    if (!in_block) {
        throw MalformedInputError("Missing PEM marker " + begin);
    }
    if (!closed) {
        throw MalformedInputError("Missing PEM marker " + end);
    }
    if (body.empty()) {
        throw MalformedInputError("Empty PEM body for " + label);
    }

    std::vector<uint8_t> der = Base64Decode(body);
    if (der.empty()) {
        throw MalformedInputError("Empty PEM body for " + label);
    }
    return der;
}

std::string Encode(const std::vector<uint8_t>& der, const std::string& label) {
    const std::string b64 = Base64Encode(der);

    std::string out = BeginMarker(label) + "\n";
    for (size_t i = 0; i < b64.size(); i += PEM_LINE_WIDTH) {
        out += b64.substr(i, PEM_LINE_WIDTH);
        out += '\n';
    }
    out += EndMarker(label) + "\n";
    return out;
}

std::string Base64Encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return std::string();
    }

    // EVP_EncodeBlock writes 4 chars per 3-byte group plus a NUL
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                              data.data(), static_cast<int>(data.size()));
    if (len < 0) {
        throw MalformedInputError("Base64 encoding failed");
    }
    out.resize(static_cast<size_t>(len));
    return out;
}

std::vector<uint8_t> Base64Decode(const std::string& encoded) {
    std::string compact;
    compact.reserve(encoded.size());
    for (char c : encoded) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            continue;
        }
        compact += c;
    }

    if (compact.empty()) {
        return std::vector<uint8_t>();
    }

    if (compact.size() % 4 != 0) {
        throw MalformedInputError("Invalid base64 length");
    }

    // Padding may only appear as the last one or two characters
    size_t padding = 0;
    for (size_t i = 0; i < compact.size(); ++i) {
        char c = compact[i];
        if (c == '=') {
            if (i < compact.size() - 2) {
                throw MalformedInputError("Invalid base64 padding");
            }
            ++padding;
        } else if (padding > 0 || !IsBase64Char(c)) {
            throw MalformedInputError("Invalid base64 character");
        }
    }

    std::vector<uint8_t> out(compact.size() / 4 * 3);
    int len = EVP_DecodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(compact.data()),
                              static_cast<int>(compact.size()));
    if (len < 0) {
        throw MalformedInputError("Invalid base64 data");
    }

    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

} // namespace pem
} // namespace c2pasign

/**
 * @file error.cpp
 * @brief Error kind helpers
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/common/error.h"

namespace c2pasign {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedInput:  return "malformed_input";
        case ErrorKind::Unauthorized:    return "unauthorized";
        case ErrorKind::MissingMaterial: return "missing_material";
        case ErrorKind::Crypto:          return "crypto";
        case ErrorKind::Engine:          return "engine";
        case ErrorKind::Startup:         return "startup";
    }
    return "unknown";
}

bool IsClientError(ErrorKind kind) {
    return kind == ErrorKind::MalformedInput || kind == ErrorKind::Unauthorized;
}

} // namespace c2pasign

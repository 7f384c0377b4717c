/**
 * @file limits.h
 * @brief Size limits and constraints for c2pasign
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace c2pasign {
namespace limits {

// ============================================================================
// HTTP limits
// ============================================================================

/**
 * @brief Default maximum request body size
 *
 * Image uploads for manifest signing dominate; 50 MB covers camera JPEG/HEIC
 * output with room to spare.
 */
constexpr size_t DEFAULT_MAX_BODY_SIZE = 50 * 1024 * 1024;

/**
 * @brief Maximum number of parts in a multipart/form-data body
 */
constexpr size_t MAX_MULTIPART_PARTS = 8;

// ============================================================================
// Certificate request limits
// ============================================================================

/**
 * @brief Maximum size of a PEM CSR
 *
 * A P-256 CSR with a long subject is well under 2 KB; RSA-4096 CSRs stay
 * under 4 KB.
 */
constexpr size_t MAX_CSR_PEM_SIZE = 16 * 1024;

}  // namespace limits
}  // namespace c2pasign

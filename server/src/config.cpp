/**
 * @file config.cpp
 * @brief Signing server configuration (command line over environment)
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/server/config.h"
#include "c2pasign/common/error.h"
#include "c2pasign/common/limits.h"
#include <cstdlib>
#include <limits>

namespace c2pasign {
namespace server {

namespace {

constexpr size_t BYTES_PER_MB = 1024 * 1024;

unsigned long ParseUnsigned(const std::string& flag, const std::string& value,
                            unsigned long min, unsigned long max) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw MalformedInputError(flag + " expects a non-negative integer, got \"" + value + "\"");
    }

    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value);
    } catch (const std::out_of_range&) {
        throw MalformedInputError(flag + " value out of range: " + value);
    }

    if (parsed < min || parsed > max) {
        throw MalformedInputError(flag + " must be between " + std::to_string(min) +
                                  " and " + std::to_string(max));
    }
    return parsed;
}

std::optional<std::string> NonEmpty(const std::optional<std::string>& value) {
    if (value && !value->empty()) {
        return value;
    }
    return std::nullopt;
}

std::string TrimTrailingSlashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

}  // namespace

EnvLookup ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

ServerConfig ParseServerConfig(int argc, const char* const* argv, const EnvLookup& env) {
    ServerConfig config;
    config.max_body_size = limits::DEFAULT_MAX_BODY_SIZE;

    // Environment first
    if (auto port = NonEmpty(env("PORT"))) {
        config.port = static_cast<uint16_t>(ParseUnsigned("PORT", *port, 0, 65535));
    }
    if (auto dir = NonEmpty(env("SIGNING_SERVER_RESOURCES"))) {
        config.resources_dir = *dir;
    }
    config.token = NonEmpty(env("SIGNING_SERVER_TOKEN"));
    if (auto url = NonEmpty(env("SIGNING_SERVER_URL"))) {
        config.public_url = TrimTrailingSlashes(*url);
    }
    if (auto mode = NonEmpty(env("SIGNING_SERVER_ENV"))) {
        config.production = (*mode == "production");
    }

    // Flags override
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw MalformedInputError("Missing value for " + flag);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--host") {
            config.host = next(arg);
        } else if (arg == "--port") {
            config.port = static_cast<uint16_t>(ParseUnsigned(arg, next(arg), 0, 65535));
        } else if (arg == "--threads") {
            config.threads = static_cast<unsigned int>(ParseUnsigned(arg, next(arg), 1, 1024));
        } else if (arg == "--resources-dir") {
            config.resources_dir = next(arg);
        } else if (arg == "--token") {
            config.token = NonEmpty(next(arg));
        } else if (arg == "--public-url") {
            config.public_url = TrimTrailingSlashes(next(arg));
        } else if (arg == "--timestamp-url") {
            config.timestamp_url = next(arg);
        } else if (arg == "--tsa-url") {
            config.tsa_url = NonEmpty(next(arg));
        } else if (arg == "--max-body-mb") {
            const unsigned long max_mb = std::numeric_limits<size_t>::max() / BYTES_PER_MB;
            config.max_body_size = ParseUnsigned(arg, next(arg), 1, max_mb) * BYTES_PER_MB;
        } else if (arg == "--production") {
            config.production = true;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else {
            throw MalformedInputError("Unknown argument: " + arg);
        }
    }

    if (config.public_url && config.public_url->empty()) {
        config.public_url.reset();
    }

    return config;
}

void PrintUsage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " [OPTIONS]\n"
        << "\n"
        << "C2PA signing server with an in-memory test certificate authority\n"
        << "\n"
        << "Options:\n"
        << "  --host ADDR            Listen address (default: " << DEFAULT_HOST << ")\n"
        << "  --port PORT            Listen port, 0 for ephemeral (default: " << DEFAULT_PORT << ", env PORT)\n"
        << "  --threads N            I/O threads (default: hardware concurrency)\n"
        << "  --resources-dir DIR    Directory with es256_certs.pem and es256_private.key\n"
        << "                         (default: " << DEFAULT_RESOURCES_DIR << ", env SIGNING_SERVER_RESOURCES)\n"
        << "  --token TOKEN          Bearer token for /api/v1/c2pa/* (env SIGNING_SERVER_TOKEN)\n"
        << "  --public-url URL       Public base URL advertised as signing_url (env SIGNING_SERVER_URL)\n"
        << "  --timestamp-url URL    Timestamp authority advertised to clients\n"
        << "                         (default: " << DEFAULT_TIMESTAMP_URL << ")\n"
        << "  --tsa-url URL          Timestamp authority for server-side manifest signing (default: none)\n"
        << "  --max-body-mb N        Maximum request body in MB (default: 50)\n"
        << "  --production           Hide error details from clients (env SIGNING_SERVER_ENV=production)\n"
        << "  --verbose, -v          Per-request debug logging\n"
        << "  --help, -h             Show this help\n";
}

} // namespace server
} // namespace c2pasign

/**
 * @file config.h
 * @brief Signing server configuration (command line over environment)
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_SERVER_CONFIG_H
#define C2PASIGN_SERVER_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace c2pasign {
namespace server {

constexpr const char* DEFAULT_HOST = "0.0.0.0";
constexpr uint16_t DEFAULT_PORT = 8080;
constexpr const char* DEFAULT_RESOURCES_DIR = "Resources";
constexpr const char* DEFAULT_TIMESTAMP_URL = "http://timestamp.digicert.com";

/**
 * @brief Runtime settings of the signing server
 */
struct ServerConfig {
    std::string host = DEFAULT_HOST;
    uint16_t port = DEFAULT_PORT;

    /// I/O threads; 0 means one per hardware thread
    unsigned int threads = 0;

    /// Directory holding es256_certs.pem and es256_private.key
    std::string resources_dir = DEFAULT_RESOURCES_DIR;

    /// Bearer token guarding the C2PA routes; unset leaves them open
    std::optional<std::string> token;

    /// Externally reachable base URL, used to advertise the signing URL
    std::optional<std::string> public_url;

    /// Timestamp authority advertised to clients by the configuration route
    std::string timestamp_url = DEFAULT_TIMESTAMP_URL;

    /// Timestamp authority used for server-side manifest signing
    std::optional<std::string> tsa_url;

    size_t max_body_size = 0;  ///< Set to limits::DEFAULT_MAX_BODY_SIZE by ParseServerConfig

    /// Hide error details from HTTP clients
    bool production = false;

    bool verbose = false;
    bool show_help = false;
};

/**
 * @brief Environment lookup; returns nullopt for unset variables
 */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Lookup backed by the process environment (getenv)
 */
EnvLookup ProcessEnvironment();

/**
 * @brief Build the configuration from environment and arguments
 *
 * Environment variables (PORT, SIGNING_SERVER_RESOURCES, SIGNING_SERVER_TOKEN,
 * SIGNING_SERVER_URL, SIGNING_SERVER_ENV) are applied first; flags override
 * them. Empty environment values count as unset.
 *
 * @throws MalformedInputError on unknown flags, missing flag values or values out of range
 */
ServerConfig ParseServerConfig(int argc, const char* const* argv, const EnvLookup& env);

/**
 * @brief Write command line help
 */
void PrintUsage(std::ostream& out, const char* program_name);

} // namespace server
} // namespace c2pasign

#endif // C2PASIGN_SERVER_CONFIG_H

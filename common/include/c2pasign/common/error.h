/**
 * @file error.h
 * @brief Error taxonomy shared by the CA and the signing server
 *
 * Every failure raised by c2pasign is an exception derived from Error and
 * carries an ErrorKind, so callers branch on the kind instead of on message
 * text.
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_ERROR_H
#define C2PASIGN_ERROR_H

#include <stdexcept>
#include <string>

namespace c2pasign {

/**
 * @brief Closed set of failure categories
 */
enum class ErrorKind {
    MalformedInput,   ///< Caller sent something unparseable (bad PEM, bad JSON, bad base64)
    Unauthorized,     ///< Missing or wrong bearer token
    MissingMaterial,  ///< Local certificate/key files absent or not in the expected format
    Crypto,           ///< Key generation, certificate construction or signing failed
    Engine,           ///< The native C2PA engine reported a fault
    Startup           ///< CA bootstrap failed; the service cannot run
};

/**
 * @brief Stable snake_case name of an error kind (used in JSON error bodies)
 */
const char* ErrorKindName(ErrorKind kind);

/**
 * @brief True for caller-correctable failures (4xx), false for server faults
 */
bool IsClientError(ErrorKind kind);

/**
 * @brief Base class of all c2pasign exceptions
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class MalformedInputError : public Error {
public:
    explicit MalformedInputError(const std::string& what)
        : Error(ErrorKind::MalformedInput, what) {}
};

class UnauthorizedError : public Error {
public:
    explicit UnauthorizedError(const std::string& what)
        : Error(ErrorKind::Unauthorized, what) {}
};

class MissingMaterialError : public Error {
public:
    explicit MissingMaterialError(const std::string& what)
        : Error(ErrorKind::MissingMaterial, what) {}
};

class EngineError : public Error {
public:
    explicit EngineError(const std::string& what)
        : Error(ErrorKind::Engine, what) {}
};

class StartupError : public Error {
public:
    explicit StartupError(const std::string& what)
        : Error(ErrorKind::Startup, what) {}
};

} // namespace c2pasign

#endif // C2PASIGN_ERROR_H

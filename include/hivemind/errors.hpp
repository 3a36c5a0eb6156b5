/**
 * @file errors.hpp
 * @brief Typed request failures and the HTTP status each maps to
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace hivemind {

/**
 * @brief Base of all Hivemind request failures
 *
 * Carries the HTTP status the service layer answers with. The message is
 * returned to the caller as {"error": message}.
 */
class HiveError : public std::runtime_error {
public:
    HiveError(int status, const std::string& message)
        : std::runtime_error(message)
        , status_(status)
    {}

    int status() const { return status_; }

private:
    int status_;
};

/// Malformed or missing request fields (400)
class ValidationError : public HiveError {
public:
    explicit ValidationError(const std::string& message)
        : HiveError(400, message) {}
};

/// Challenge, signature, device proof or session rejected (401)
class AuthenticationError : public HiveError {
public:
    explicit AuthenticationError(const std::string& message)
        : HiveError(401, message) {}
};

/// Unknown route (404)
class NotFoundError : public HiveError {
public:
    explicit NotFoundError(const std::string& message = "not found")
        : HiveError(404, message) {}
};

/// Backend failure after validation passed (500)
class StorageError : public HiveError {
public:
    explicit StorageError(const std::string& message)
        : HiveError(500, message) {}
};

} // namespace hivemind

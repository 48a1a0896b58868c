#pragma once

/**
 * Error types and user-facing error replies.
 *
 * Failures travel as exceptions derived from std::runtime_error. At the HTTP
 * boundary they are turned into JSON error replies by ErrorResponder, with
 * status codes chosen by classify_error() for free-form transport failures.
 */

#include "http_types.hpp"
#include <stdexcept>
#include <string>
#include <optional>

namespace relay {

// ========== Exceptions ==========

/**
 * The caller sent something unusable (bad path, unsupported model, bad body).
 */
class InvalidRequestError : public std::runtime_error {
public:
    explicit InvalidRequestError(const std::string& message, const std::string& details = "")
        : std::runtime_error(message), details_(details) {}

    // Extra context for the error reply, may be empty.
    const std::string& details() const { return details_; }

private:
    std::string details_;
};

/**
 * Missing or invalid configuration, such as an absent API key.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * The continuation step could not produce a usable response.
 */
class ContinuationError : public std::runtime_error {
public:
    explicit ContinuationError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class TransportFailure {
    Timeout,
    Dns,
    Connect,
    Tls,
    Network
};

/**
 * Network-level failure before a complete HTTP response was received.
 */
class TransportError : public std::runtime_error {
public:
    TransportError(TransportFailure kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    TransportFailure kind() const { return kind_; }

private:
    TransportFailure kind_;
};

enum class UpstreamErrorKind {
    Transient,  // Transport failures outlasted the retry budget.
    Exhausted,  // Retryable status outlasted the retry budget.
    Fatal       // Non-retryable status or unusable body.
};

/**
 * The upstream call failed for good.
 */
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(UpstreamErrorKind kind, int status, const std::string& message)
        : std::runtime_error(message), kind_(kind), status_(status) {}

    UpstreamErrorKind kind() const { return kind_; }

    // Last upstream HTTP status, 0 when no response was received.
    int status() const { return status_; }

private:
    UpstreamErrorKind kind_;
    int status_;
};

// ========== Classification ==========

enum class ErrorCategory {
    Timeout,
    Network,
    Dns,
    Connection,
    Ssl,
    Unknown
};

struct ErrorClassification {
    ErrorCategory category;
    std::string message;  // User-facing description.
    int status;           // HTTP status to reply with.
};

// Maps a free-form error description onto a category. Never throws.
ErrorClassification classify_error(const std::string& description);

const char* category_name(ErrorCategory category);

// ========== Error Replies ==========

// Headers added to every reply so browsers can call the gateway directly.
const HeaderList& cors_headers();

/**
 * Builds JSON error replies: {"error", "status", "timestamp", "details"?}.
 *
 * In production mode, messages that look like they carry secrets or
 * internal addresses are replaced with a generic text.
 */
class ErrorResponder {
public:
    explicit ErrorResponder(bool production = false) : production_(production) {}

    Reply make(const std::string& message, int status,
               const std::optional<std::string>& details = std::nullopt) const;

    std::string sanitize(const std::string& message) const;

    bool production() const { return production_; }

private:
    bool production_;
};

} // namespace relay

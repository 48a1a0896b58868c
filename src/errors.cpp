#include "errors.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <regex>
#include <vector>

namespace relay {

using json = nlohmann::json;

namespace {

struct ErrorPattern {
    std::regex pattern;
    ErrorCategory category;
    const char* message;
    int status;
};

// Checked in order; the first match wins.
const std::vector<ErrorPattern>& error_patterns() {
    static const std::vector<ErrorPattern> patterns = {
        {std::regex("timeout|aborted", std::regex::icase), ErrorCategory::Timeout,
         "Request timeout - the target service took too long to respond", 504},
        {std::regex("network|fetch", std::regex::icase), ErrorCategory::Network,
         "Network error - unable to reach the target service", 502},
        {std::regex("dns|name resolution", std::regex::icase), ErrorCategory::Dns,
         "DNS resolution failed - unable to resolve target hostname", 502},
        {std::regex("connection refused|connect", std::regex::icase), ErrorCategory::Connection,
         "Connection refused - target service is not accepting connections", 503},
        {std::regex("ssl|tls|certificate", std::regex::icase), ErrorCategory::Ssl,
         "SSL/TLS error - certificate or encryption issue", 502},
    };
    return patterns;
}

const std::vector<std::regex>& sensitive_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex("key|token|password|secret|auth|api[_-]?key", std::regex::icase),
        std::regex("localhost|127\\.0\\.0\\.1|192\\.168\\."),
        std::regex("/[a-zA-Z0-9+/=]{20,}"),
        std::regex("[a-zA-Z0-9]{32,}"),
    };
    return patterns;
}

constexpr const char* HIDDEN_DETAILS = "Internal service error - details hidden for security";

} // namespace

ErrorClassification classify_error(const std::string& description) {
    for (const auto& p : error_patterns()) {
        if (std::regex_search(description, p.pattern)) {
            return {p.category, p.message, p.status};
        }
    }
    return {ErrorCategory::Unknown, "Unexpected error: " + description, 500};
}

const char* category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Timeout: return "TIMEOUT";
        case ErrorCategory::Network: return "NETWORK";
        case ErrorCategory::Dns: return "DNS";
        case ErrorCategory::Connection: return "CONNECTION";
        case ErrorCategory::Ssl: return "SSL";
        case ErrorCategory::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const HeaderList& cors_headers() {
    static const HeaderList headers = {
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS, HEAD, PATCH"},
        {"Access-Control-Allow-Headers",
         "Content-Type, Authorization, X-Requested-With, anthropic-version, x-api-key, X-Goog-Api-Key"},
    };
    return headers;
}

std::string ErrorResponder::sanitize(const std::string& message) const {
    if (!production_) {
        return message;
    }
    for (const auto& pattern : sensitive_patterns()) {
        if (std::regex_search(message, pattern)) {
            return HIDDEN_DETAILS;
        }
    }
    return message;
}

Reply ErrorResponder::make(const std::string& message, int status,
                           const std::optional<std::string>& details) const {
    json body = {
        {"error", sanitize(message)},
        {"status", status},
        {"timestamp", timestamp()}
    };
    if (details && !details->empty()) {
        body["details"] = sanitize(*details);
    }

    Reply reply;
    reply.status = status;
    reply.content_type = "application/json; charset=utf-8";
    reply.body = body.dump();
    reply.headers = cors_headers();
    return reply;
}

} // namespace relay

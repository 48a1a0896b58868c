#pragma once

/**
 * Gateway configuration constants.
 *
 * Defines default settings, retry policy, cache limits and the environment
 * variable names read at startup.
 */

#include <string>
#include <unordered_set>
#include <vector>

namespace relay {

// ========== Server ==========

constexpr const char* DEFAULT_LISTEN_ADDRESS = "0.0.0.0";
constexpr int DEFAULT_PORT = 8000;
constexpr const char* GATEWAY_VERSION = "1.0.0";

// ========== Upstream ==========

constexpr const char* DEFAULT_UPSTREAM_URL_BASE = "https://generativelanguage.googleapis.com";
constexpr const char* GEMINI_API_VERSION_PATH = "/v1beta/models/";
constexpr const char* API_KEY_HEADER = "x-goog-api-key";

// ========== Retry Policy ==========

constexpr int DEFAULT_MAX_RETRIES = 3;
constexpr long DEFAULT_REQUEST_TIMEOUT_MS = 30000;
constexpr long DEFAULT_BACKOFF_BASE_MS = 1000;
constexpr long DEFAULT_BACKOFF_CAP_MS = 30000;

// Upstream statuses worth another attempt (forbidden, rate limited, unavailable).
inline const std::unordered_set<int> RETRYABLE_STATUS_CODES = {403, 429, 503};

// ========== Rate Limiting ==========

constexpr int DEFAULT_MAX_REQUESTS_PER_MINUTE = 100;
constexpr long RATE_LIMIT_WINDOW_MS = 60000;
constexpr long RATE_LIMIT_MIN_CLEANUP_INTERVAL_MS = 15000;
constexpr size_t RATE_LIMIT_MAX_CLEANUP_BATCH = 50;
constexpr size_t RATE_LIMIT_MAX_TRACKED_CLIENTS = 1000;

// ========== Caching ==========

constexpr bool DEFAULT_ENABLE_CACHE = true;
constexpr size_t DEFAULT_CACHE_SIZE = 1000;
constexpr long PATH_CACHE_TTL_MS = 300000;

// ========== Monitoring ==========

constexpr size_t RESPONSE_TIME_SAMPLES = 1000;
constexpr long LOG_FLUSH_INTERVAL_MS = 1000;

// ========== Streaming ==========

constexpr size_t STREAM_CHANNEL_CAPACITY = 64;  // Chunks buffered between upstream and client.

// ========== Environment Variables ==========

namespace env {
    constexpr const char* API_KEY = "GEMINI_API_KEY";
    constexpr const char* LISTEN_ADDRESS = "RELAY_LISTEN_ADDRESS";
    constexpr const char* PORT = "PORT";
    constexpr const char* MAX_RETRIES = "MAX_RETRIES";
    constexpr const char* REQUEST_TIMEOUT = "REQUEST_TIMEOUT";
    constexpr const char* BACKOFF_BASE = "BACKOFF_BASE_MS";
    constexpr const char* BACKOFF_CAP = "BACKOFF_CAP_MS";
    constexpr const char* MAX_REQUESTS_PER_MINUTE = "MAX_REQUESTS_PER_MINUTE";
    constexpr const char* ENABLE_CACHE = "ENABLE_CACHE";
    constexpr const char* CACHE_SIZE = "CACHE_SIZE";
    constexpr const char* DEBUG_MODE = "DEBUG_MODE";
    constexpr const char* UPSTREAM_URL_BASE = "UPSTREAM_URL_BASE";
    constexpr const char* ENVIRONMENT = "RELAY_ENV";
}

} // namespace relay

#pragma once

/**
 * Per-client sliding window rate limiter.
 *
 * Each client id keeps the timestamps of its requests inside the window.
 * Stale clients are swept incrementally during checks and fully by
 * cleanup(), which the server's maintenance loop calls.
 */

#include "cache.hpp"
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace relay {

struct RateLimiterStats {
    size_t total_clients = 0;
    size_t active_clients = 0;
    size_t total_requests = 0;
};

class RateLimiter {
public:
    RateLimiter(int max_requests, int64_t window_ms, ClockFn clock = steady_now_ms);

    // Records the request and returns true if the client is under its limit.
    bool is_allowed(const std::string& client_id);

    // Drops expired timestamps for every client. Returns clients removed.
    size_t cleanup();

    RateLimiterStats stats() const;

    int max_requests() const { return max_requests_; }
    int64_t window_ms() const { return window_ms_; }

private:
    int max_requests_;
    int64_t window_ms_;
    int64_t cleanup_interval_ms_;
    ClockFn clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<int64_t>> requests_;
    int64_t last_cleanup_;

    void prune(std::deque<int64_t>& times, int64_t now) const;
    void incremental_cleanup(int64_t now);
};

} // namespace relay

#include "rate_limiter.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <algorithm>

namespace relay {

RateLimiter::RateLimiter(int max_requests, int64_t window_ms, ClockFn clock)
    : max_requests_(max_requests)
    , window_ms_(window_ms)
    , cleanup_interval_ms_(std::max<int64_t>(window_ms / 4, RATE_LIMIT_MIN_CLEANUP_INTERVAL_MS))
    , clock_(std::move(clock)) {
    last_cleanup_ = clock_();
}

// Timestamps are appended in order, so expired ones sit at the front.
void RateLimiter::prune(std::deque<int64_t>& times, int64_t now) const {
    while (!times.empty() && now - times.front() >= window_ms_) {
        times.pop_front();
    }
}

bool RateLimiter::is_allowed(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_();

    incremental_cleanup(now);

    auto& times = requests_[client_id];
    prune(times, now);

    if (times.size() >= static_cast<size_t>(max_requests_)) {
        return false;
    }

    times.push_back(now);
    return true;
}

// Caller holds mutex_.
void RateLimiter::incremental_cleanup(int64_t now) {
    if (now - last_cleanup_ < cleanup_interval_ms_ && requests_.size() <= RATE_LIMIT_MAX_TRACKED_CLIENTS) {
        return;
    }

    size_t cleaned = 0;
    for (auto it = requests_.begin(); it != requests_.end() && cleaned < RATE_LIMIT_MAX_CLEANUP_BATCH;) {
        size_t before = it->second.size();
        prune(it->second, now);
        if (it->second.empty()) {
            it = requests_.erase(it);
            ++cleaned;
            continue;
        }
        if (it->second.size() != before) {
            ++cleaned;
        }
        ++it;
    }

    last_cleanup_ = now;
}

size_t RateLimiter::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_();
    size_t removed = 0;

    for (auto it = requests_.begin(); it != requests_.end();) {
        prune(it->second, now);
        if (it->second.empty()) {
            it = requests_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    last_cleanup_ = now;
    if (removed > 0) {
        Logger::instance().debug("RateLimiter: cleaned " + std::to_string(removed) +
                                 " expired entries, " + std::to_string(requests_.size()) + " remaining");
    }
    return removed;
}

RateLimiterStats RateLimiter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_();
    RateLimiterStats s;
    s.total_clients = requests_.size();

    for (const auto& [client, times] : requests_) {
        size_t valid = std::count_if(times.begin(), times.end(),
                                     [&](int64_t t) { return now - t < window_ms_; });
        if (valid > 0) {
            ++s.active_clients;
            s.total_requests += valid;
        }
    }
    return s;
}

} // namespace relay

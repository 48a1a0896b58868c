#pragma once

/**
 * Size-bounded cache with per-entry time-to-live.
 *
 * When an insert would exceed capacity, expired entries are dropped first;
 * if the cache is still full, the least recently used entries go. The
 * eviction choice is made by select_evictions(), a pure function over entry
 * metadata, so it can be tested without a clock.
 */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace relay {

// Milliseconds from a monotonic clock.
using ClockFn = std::function<int64_t()>;

inline int64_t steady_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

template <typename Key>
struct CacheEntryMeta {
    Key key;
    int64_t inserted_at;
    int64_t last_access;
};

/**
 * Chooses which entries to drop so that one more entry fits in max_size.
 * Expired entries (age >= ttl_ms) are always chosen when a sweep is needed;
 * after that, least recently used entries until there is room.
 */
template <typename Key>
std::vector<Key> select_evictions(const std::vector<CacheEntryMeta<Key>>& entries,
                                  int64_t now, int64_t ttl_ms, size_t max_size) {
    std::vector<Key> evicted;
    if (entries.size() < max_size) {
        return evicted;
    }

    std::vector<const CacheEntryMeta<Key>*> live;
    for (const auto& entry : entries) {
        if (now - entry.inserted_at >= ttl_ms) {
            evicted.push_back(entry.key);
        } else {
            live.push_back(&entry);
        }
    }

    if (live.size() >= max_size) {
        std::sort(live.begin(), live.end(), [](const auto* a, const auto* b) {
            return a->last_access < b->last_access;
        });
        size_t excess = live.size() - max_size + 1;
        for (size_t i = 0; i < excess && i < live.size(); ++i) {
            evicted.push_back(live[i]->key);
        }
    }

    return evicted;
}

struct CacheStats {
    size_t size = 0;
    size_t max_size = 0;
    size_t valid = 0;
    size_t expired = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hit_rate = 0.0;
};

template <typename Key, typename Value>
class ExpiringCache {
public:
    ExpiringCache(size_t max_size, int64_t ttl_ms, ClockFn clock = steady_now_ms)
        : max_size_(max_size), ttl_ms_(ttl_ms), clock_(std::move(clock)) {}

    // Returns the value if present and not expired. Counts a hit or a miss.
    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = clock_();
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++misses_;
            return std::nullopt;
        }
        if (now - it->second.inserted_at >= ttl_ms_) {
            entries_.erase(it);
            ++misses_;
            return std::nullopt;
        }
        it->second.last_access = now;
        ++hits_;
        return it->second.value;
    }

    void set(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (max_size_ == 0) return;
        int64_t now = clock_();

        auto existing = entries_.find(key);
        if (existing == entries_.end()) {
            for (const auto& victim : select_evictions(metadata(), now, ttl_ms_, max_size_)) {
                entries_.erase(victim);
            }
        }
        entries_[key] = Entry{std::move(value), now, now};
    }

    // Removes one entry. Returns true if it was present.
    bool evict(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(key) > 0;
    }

    // Removes all expired entries and returns how many were dropped.
    size_t evict_expired() {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = clock_();
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now - it->second.inserted_at >= ttl_ms_) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = clock_();
        CacheStats s;
        s.size = entries_.size();
        s.max_size = max_size_;
        for (const auto& [key, entry] : entries_) {
            if (now - entry.inserted_at >= ttl_ms_) {
                ++s.expired;
            } else {
                ++s.valid;
            }
        }
        s.hits = hits_;
        s.misses = misses_;
        uint64_t total = hits_ + misses_;
        s.hit_rate = total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
        return s;
    }

private:
    struct Entry {
        Value value;
        int64_t inserted_at;
        int64_t last_access;
    };

    size_t max_size_;
    int64_t ttl_ms_;
    ClockFn clock_;
    mutable std::mutex mutex_;
    std::unordered_map<Key, Entry> entries_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;

    // Caller holds mutex_.
    std::vector<CacheEntryMeta<Key>> metadata() const {
        std::vector<CacheEntryMeta<Key>> out;
        out.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            out.push_back({key, entry.inserted_at, entry.last_access});
        }
        return out;
    }
};

} // namespace relay

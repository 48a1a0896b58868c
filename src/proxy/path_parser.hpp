#pragma once

#include "../cache.hpp"
#include <optional>
#include <string>

namespace relay::proxy {

struct ParsedPath {
    std::string alias;  // Service alias, the second path segment.
    std::string path;   // Everything after the alias segment.
};

/**
 * Splits "/api/{alias}/{rest}" into alias and rest, caching results.
 */
class PathParser {
public:
    PathParser(size_t cache_size, int64_t ttl_ms, bool cache_enabled, ClockFn clock = steady_now_ms);

    // Returns nullopt when the path does not have at least three segments.
    std::optional<ParsedPath> parse(const std::string& pathname);

    // Drops expired cache entries. Returns how many were removed.
    size_t cleanup();

    CacheStats stats() const;

private:
    bool cache_enabled_;
    ExpiringCache<std::string, ParsedPath> cache_;
};

} // namespace relay::proxy

#include "path_parser.hpp"
#include <regex>

namespace relay::proxy {

PathParser::PathParser(size_t cache_size, int64_t ttl_ms, bool cache_enabled, ClockFn clock)
    : cache_enabled_(cache_enabled)
    , cache_(cache_size, ttl_ms, std::move(clock)) {}

std::optional<ParsedPath> PathParser::parse(const std::string& pathname) {
    if (cache_enabled_) {
        if (auto cached = cache_.get(pathname)) {
            return cached;
        }
    }

    static const std::regex path_pattern("^/[^/]+/([^/]+)/(.*)$");
    std::smatch match;
    if (!std::regex_match(pathname, match, path_pattern)) {
        return std::nullopt;
    }

    ParsedPath parsed{match[1].str(), match[2].str()};
    if (cache_enabled_) {
        cache_.set(pathname, parsed);
    }
    return parsed;
}

size_t PathParser::cleanup() {
    return cache_.evict_expired();
}

CacheStats PathParser::stats() const {
    return cache_.stats();
}

} // namespace relay::proxy

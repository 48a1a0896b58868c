#pragma once

/**
 * Request router for the gateway.
 *
 * Owns the shared collaborators (rate limiter, monitoring, path cache) and
 * the two request handlers, and dispatches each inbound request:
 * CORS preflight, service endpoints, rate limiting, the anti-truncation
 * prefix, the generic proxy, and 404 for everything else.
 */

#include "cache.hpp"
#include "errors.hpp"
#include "http_transport.hpp"
#include "http_types.hpp"
#include "monitoring.hpp"
#include "rate_limiter.hpp"
#include "settings.hpp"
#include "gemini/anti_truncation.hpp"
#include "gemini/upstream_client.hpp"
#include "proxy/path_parser.hpp"
#include "proxy/proxy_handler.hpp"
#include <chrono>

namespace relay {

class Logger;

// Replaceable time and resource sources; defaults are the real ones.
struct GatewayHooks {
    gemini::Sleeper sleeper;
    ClockFn clock = steady_now_ms;
    MonitoringService::MemoryProbe memory_probe = read_memory_usage;
};

class Gateway {
public:
    Gateway(const GatewaySettings& settings, HttpTransport& transport, Logger& logger,
            GatewayHooks hooks = GatewayHooks());

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Never throws; unexpected failures become a 500 reply.
    Reply handle(const InboundRequest& request);

    // Flushes request logs and sweeps caches. Called about once per second.
    void run_maintenance();

    MonitoringService& monitoring() { return monitoring_; }
    RateLimiter& rate_limiter() { return rate_limiter_; }
    proxy::PathParser& path_parser() { return path_parser_; }

private:
    Logger& logger_;
    ClockFn clock_;
    ErrorResponder responder_;
    RateLimiter rate_limiter_;
    MonitoringService monitoring_;
    proxy::PathParser path_parser_;
    gemini::UpstreamClient upstream_;
    gemini::AntiTruncationHandler anti_truncation_;
    proxy::ProxyHandler proxy_;
    int64_t last_cleanup_;

    Reply route(const InboundRequest& request, std::chrono::steady_clock::time_point start);
    Reply json_reply(const nlohmann::json& body) const;
    Reply text_reply(int status, const std::string& text) const;
    void record(const Reply& reply, std::chrono::steady_clock::time_point start, const std::string& service);
};

// Client identity for rate limiting: x-forwarded-for, then x-real-ip, then "unknown".
std::string client_id(const InboundRequest& request);

} // namespace relay

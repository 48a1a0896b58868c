#include "gateway.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "proxy/services.hpp"

namespace relay {

using json = nlohmann::json;

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

gemini::UpstreamOptions upstream_options(const GatewaySettings& settings) {
    gemini::UpstreamOptions options;
    options.url_base = settings.upstream_url_base;
    options.api_key = settings.api_key;
    options.max_retries = settings.max_retries;
    options.request_timeout_ms = settings.request_timeout_ms;
    options.backoff_base_ms = settings.backoff_base_ms;
    options.backoff_cap_ms = settings.backoff_cap_ms;
    return options;
}

// Adds any CORS header the reply does not carry yet.
void ensure_cors(Reply& reply) {
    for (const auto& [name, value] : cors_headers()) {
        if (!reply.header(name)) {
            reply.headers.emplace_back(name, value);
        }
    }
}

} // namespace

std::string client_id(const InboundRequest& request) {
    if (auto forwarded = request.header("x-forwarded-for"); forwarded && !forwarded->empty()) {
        return *forwarded;
    }
    if (auto real_ip = request.header("x-real-ip"); real_ip && !real_ip->empty()) {
        return *real_ip;
    }
    return "unknown";
}

Gateway::Gateway(const GatewaySettings& settings, HttpTransport& transport, Logger& logger,
                 GatewayHooks hooks)
    : logger_(logger)
    , clock_(hooks.clock)
    , responder_(settings.production)
    , rate_limiter_(settings.max_requests_per_minute, RATE_LIMIT_WINDOW_MS, hooks.clock)
    , monitoring_(hooks.memory_probe)
    , path_parser_(settings.cache_size, PATH_CACHE_TTL_MS, settings.enable_cache, hooks.clock)
    , upstream_(transport, upstream_options(settings), logger, hooks.sleeper)
    , anti_truncation_(upstream_, logger, responder_, STREAM_CHANNEL_CAPACITY)
    , proxy_(transport, path_parser_, logger, responder_, settings.request_timeout_ms)
    , last_cleanup_(hooks.clock()) {}

Reply Gateway::handle(const InboundRequest& request) {
    auto start = std::chrono::steady_clock::now();
    try {
        Reply reply = route(request, start);
        ensure_cors(reply);
        return reply;
    } catch (const std::exception& e) {
        double duration = elapsed_ms(start);
        logger_.error("Unhandled error in " + request.method + " " + request.path + ": " + e.what());
        monitoring_.record_request(false, duration);
        return responder_.make("Internal server error", 500,
                               "Request failed (" + std::to_string(static_cast<long>(duration)) + "ms)");
    }
}

Reply Gateway::route(const InboundRequest& request, std::chrono::steady_clock::time_point start) {
    const std::string& path = request.path;

    if (request.method == "OPTIONS") {
        Reply reply;
        reply.status = 204;
        reply.headers = cors_headers();
        return reply;
    }

    if (path == "/health" || path == "/") {
        return json_reply(monitoring_.health_check());
    }

    if (path == "/metrics") {
        CacheStats cache = path_parser_.stats();
        RateLimiterStats limiter = rate_limiter_.stats();
        json extra = {
            {"cache", {
                {"size", cache.size},
                {"maxSize", cache.max_size},
                {"valid", cache.valid},
                {"expired", cache.expired},
                {"hits", cache.hits},
                {"misses", cache.misses},
                {"hitRate", cache.hit_rate}
            }},
            {"rateLimiter", {
                {"totalClients", limiter.total_clients},
                {"activeClients", limiter.active_clients},
                {"totalRequests", limiter.total_requests},
                {"maxRequestsPerMinute", rate_limiter_.max_requests()}
            }}
        };
        return json_reply(monitoring_.detailed_metrics(extra));
    }

    if (path == "/services") {
        return json_reply(monitoring_.service_status());
    }

    if (!rate_limiter_.is_allowed(client_id(request))) {
        logger_.request(request.method, path, "", 429);
        return text_reply(429, "Rate limit exceeded");
    }

    if (const auto* special = proxy::find_special_service(path)) {
        logger_.request(request.method, path, "Special service: " + special->alias);
        Reply reply = anti_truncation_.handle(path, request.query, request.body);
        record(reply, start, special->alias);
        return reply;
    }

    if (path.rfind("/api/", 0) == 0) {
        auto parsed = path_parser_.parse(path);
        std::string alias = parsed ? parsed->alias : "";

        logger_.request(request.method, path);
        Reply reply = proxy_.handle(request);
        record(reply, start, alias);
        return reply;
    }

    logger_.request(request.method, path, "", 404);
    monitoring_.record_request(false, elapsed_ms(start));
    return text_reply(404, "Not found");
}

void Gateway::record(const Reply& reply, std::chrono::steady_clock::time_point start,
                     const std::string& service) {
    bool success = reply.status < 400;
    monitoring_.record_request(success, elapsed_ms(start), service);
    if (!success && !service.empty()) {
        monitoring_.update_service_health(service, HealthStatus::Degraded,
                                          "HTTP " + std::to_string(reply.status));
    }
}

Reply Gateway::json_reply(const json& body) const {
    Reply reply;
    reply.status = 200;
    reply.content_type = "application/json";
    reply.body = body.dump();
    reply.headers = cors_headers();
    return reply;
}

Reply Gateway::text_reply(int status, const std::string& text) const {
    Reply reply;
    reply.status = status;
    reply.content_type = "text/plain";
    reply.body = text;
    reply.headers = cors_headers();
    return reply;
}

void Gateway::run_maintenance() {
    logger_.flush();

    int64_t now = clock_();
    if (now - last_cleanup_ < RATE_LIMIT_MIN_CLEANUP_INTERVAL_MS) {
        return;
    }
    last_cleanup_ = now;

    size_t expired_paths = path_parser_.cleanup();
    if (expired_paths > 0) {
        logger_.debug("Path cache: dropped " + std::to_string(expired_paths) + " expired entries");
    }
    rate_limiter_.cleanup();
}

} // namespace relay

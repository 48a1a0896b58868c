#include "proxy_handler.hpp"
#include "services.hpp"
#include "../logger.hpp"
#include <nlohmann/json.hpp>

namespace relay::proxy {

using json = nlohmann::json;

ProxyHandler::ProxyHandler(HttpTransport& transport, PathParser& parser, Logger& logger,
                           const ErrorResponder& responder, long timeout_ms)
    : transport_(transport)
    , parser_(parser)
    , logger_(logger)
    , responder_(responder)
    , timeout_ms_(timeout_ms) {}

std::string build_target_url(const std::string& host, const std::string& path, const std::string& query) {
    std::string clean_path = (!path.empty() && path.front() == '/') ? path.substr(1) : path;
    return "https://" + host + "/" + clean_path + query;
}

HeaderList forward_request_headers(const HeaderList& headers, const std::string& alias) {
    HeaderList out;
    for (const auto& [name, value] : headers) {
        std::string lower = to_lower(name);
        if (BLACKLISTED_HEADERS.count(lower) || HOP_BY_HOP_HEADERS.count(lower)) {
            continue;
        }
        set_header(out, name, value);
    }

    for (const auto& [name, value] : cors_headers()) {
        set_header(out, name, value);
    }

    if (alias == "claude" && !find_header(out, "anthropic-version")) {
        out.emplace_back("anthropic-version", "2023-06-01");
    }
    return out;
}

HeaderList filter_response_headers(const HeaderList& headers) {
    HeaderList out;
    for (const auto& [name, value] : headers) {
        std::string lower = to_lower(name);
        if (BLACKLISTED_HEADERS.count(lower) || HOP_BY_HOP_HEADERS.count(lower) ||
            lower.rfind("x-", 0) == 0 || lower == "content-encoding" || lower == "content-type") {
            continue;
        }
        out.emplace_back(name, value);
    }

    for (const auto& [name, value] : cors_headers()) {
        set_header(out, name, value);
    }
    return out;
}

std::string disable_thinking(const std::string& body) {
    json data = json::parse(body, nullptr, false);
    if (data.is_discarded()) {
        return body;
    }
    if (data.is_object() && data.contains("generationConfig") && data["generationConfig"].is_object()) {
        data["generationConfig"]["thinkingBudget"] = 0;
    }
    return data.dump();
}

Reply ProxyHandler::handle(const InboundRequest& request) const {
    auto parsed = parser_.parse(request.path);
    if (!parsed) {
        return responder_.make("Invalid path format", 400, std::string("Expected format: /api/{service}/{path}"));
    }

    auto host = find_service_host(parsed->alias);
    if (!host) {
        return responder_.make("Service not found", 404, "Service '" + parsed->alias + "' is not supported");
    }

    HttpRequest upstream;
    upstream.method = request.method;
    upstream.url = build_target_url(*host, parsed->path, request.query);
    upstream.headers = forward_request_headers(request.headers, parsed->alias);
    upstream.body = request.body;
    upstream.timeout_ms = timeout_ms_;

    if (parsed->alias == "gemininothink" && request.method == "POST") {
        upstream.body = disable_thinking(request.body);
    }

    HttpResponse response;
    try {
        response = transport_.send(upstream);
    } catch (const TransportError& e) {
        ErrorClassification classification = classify_error(e.what());
        logger_.error("Proxy error for " + parsed->alias + ": " + e.what());
        return responder_.make(classification.message, classification.status, std::string(e.what()));
    }

    logger_.request("PROXY", parsed->alias, upstream.url, response.status);

    Reply reply;
    reply.status = response.status;
    reply.content_type = find_header(response.headers, "Content-Type").value_or("application/octet-stream");
    reply.body = std::move(response.body);
    reply.headers = filter_response_headers(response.headers);
    return reply;
}

} // namespace relay::proxy

#include <catch2/catch.hpp>
#include "gateway.hpp"
#include "config.hpp"
#include "gemini/protocol.hpp"
#include "logger.hpp"
#include "fake_transport.hpp"
#include "test_helpers.hpp"
#include <sstream>

using namespace relay;
using json = nlohmann::json;

namespace {

struct GatewayFixture {
    std::ostringstream log;
    Logger logger{log};
    FakeTransport transport;
    int64_t now = 0;
    GatewaySettings settings = GatewaySettings::defaults();

    GatewayFixture() {
        settings.api_key = "test-key";
        settings.upstream_url_base = "https://upstream.test";
    }

    GatewayHooks hooks() {
        GatewayHooks h;
        h.sleeper = [](std::chrono::milliseconds) {};
        h.clock = [this] { return now; };
        h.memory_probe = [] {
            MemoryUsage usage;
            usage.total = 100;
            usage.used = 10;
            usage.percentage = 10.0;
            return usage;
        };
        return h;
    }

    static InboundRequest request(const std::string& method, const std::string& path,
                                  const std::string& body = "") {
        InboundRequest r;
        r.method = method;
        r.path = path;
        r.body = body;
        return r;
    }
};

}

TEST_CASE_METHOD(GatewayFixture, "Preflight requests get 204 with CORS headers", "[gateway]") {
    Gateway gateway(settings, transport, logger, hooks());
    Reply reply = gateway.handle(request("OPTIONS", "/api/openai/v1/models"));

    REQUIRE(reply.status == 204);
    REQUIRE(reply.body.empty());
    REQUIRE(reply.header("Access-Control-Allow-Origin") == std::optional<std::string>("*"));
    REQUIRE(transport.calls() == 0);
}

TEST_CASE_METHOD(GatewayFixture, "Service endpoints report JSON", "[gateway]") {
    Gateway gateway(settings, transport, logger, hooks());

    Reply health = gateway.handle(request("GET", "/health"));
    REQUIRE(health.status == 200);
    REQUIRE(health.content_type.find("application/json") == 0);
    REQUIRE(json::parse(health.body)["status"] == "healthy");

    Reply root = gateway.handle(request("GET", "/"));
    REQUIRE(json::parse(root.body).contains("checks"));

    Reply metrics = gateway.handle(request("GET", "/metrics"));
    json m = json::parse(metrics.body);
    REQUIRE(m.contains("cache"));
    REQUIRE(m["rateLimiter"]["maxRequestsPerMinute"] == 100);

    Reply services = gateway.handle(request("GET", "/services"));
    REQUIRE(json::parse(services.body)["special"]["count"] == 1);
}

TEST_CASE_METHOD(GatewayFixture, "Unknown paths get a plain 404", "[gateway]") {
    Gateway gateway(settings, transport, logger, hooks());
    Reply reply = gateway.handle(request("GET", "/favicon.ico"));

    REQUIRE(reply.status == 404);
    REQUIRE(reply.body == "Not found");
    REQUIRE(reply.header("Access-Control-Allow-Origin"));
}

TEST_CASE_METHOD(GatewayFixture, "Clients over the rate limit get 429", "[gateway]") {
    settings.max_requests_per_minute = 2;
    Gateway gateway(settings, transport, logger, hooks());

    InboundRequest r = request("GET", "/nothing-here");
    r.headers = {{"X-Forwarded-For", "10.0.0.1"}};

    REQUIRE(gateway.handle(r).status == 404);
    REQUIRE(gateway.handle(r).status == 404);

    Reply limited = gateway.handle(r);
    REQUIRE(limited.status == 429);
    REQUIRE(limited.body == "Rate limit exceeded");

    InboundRequest other = r;
    other.headers = {{"X-Forwarded-For", "10.0.0.2"}};
    REQUIRE(gateway.handle(other).status == 404);

    // Service endpoints are not rate limited.
    REQUIRE(gateway.handle(request("GET", "/health")).status == 200);

    now += 60000;
    REQUIRE(gateway.handle(r).status == 404);
}

TEST_CASE("Client identity prefers forwarded headers", "[gateway]") {
    InboundRequest r;
    REQUIRE(client_id(r) == "unknown");

    r.headers = {{"X-Real-IP", "2.2.2.2"}};
    REQUIRE(client_id(r) == "2.2.2.2");

    r.headers.emplace_back("X-Forwarded-For", "1.1.1.1");
    REQUIRE(client_id(r) == "1.1.1.1");
}

TEST_CASE_METHOD(GatewayFixture, "Generic proxy paths reach the upstream service", "[gateway]") {
    transport.push_response(200, R"({"data":[]})", {{"Content-Type", "application/json"}});
    Gateway gateway(settings, transport, logger, hooks());

    Reply reply = gateway.handle(request("GET", "/api/groq/v1/models"));

    REQUIRE(reply.status == 200);
    REQUIRE(transport.requests()[0].url == "https://api.groq.com/openai/v1/models");
    REQUIRE(gateway.monitoring().health_check()["metrics"]["successfulRequests"] == 1);
}

TEST_CASE_METHOD(GatewayFixture, "Anti-truncation prefix runs the protocol", "[gateway]") {
    transport.push_response(200, text_response("Hello wor").dump());
    transport.push_response(200, text_response(std::string("ld!") + gemini::FINISHED_MARKER).dump());
    Gateway gateway(settings, transport, logger, hooks());

    Reply reply = gateway.handle(request("POST",
                                         "/api/gemini-anti/v1beta/models/gemini-2.5-pro:generateContent",
                                         user_request("Say hello world").dump()));

    REQUIRE(reply.status == 200);
    REQUIRE(json::parse(reply.body)["candidates"][0]["content"]["parts"][0]["text"] == "ld!");
    REQUIRE(transport.calls() == 2);
    REQUIRE(transport.requests()[0].url.rfind("https://upstream.test/v1beta/models/gemini-2.5-pro", 0) == 0);
}

TEST_CASE_METHOD(GatewayFixture, "Failed special requests degrade the service", "[gateway]") {
    Gateway gateway(settings, transport, logger, hooks());

    Reply reply = gateway.handle(request("POST",
                                         "/api/gemini-anti/v1beta/models/gemini-1.0-pro:generateContent",
                                         user_request("hi").dump()));

    REQUIRE(reply.status == 400);
    auto health = gateway.monitoring().service_health("gemini-anti");
    REQUIRE(health);
    REQUIRE(health->status == HealthStatus::Degraded);
    REQUIRE(health->error == std::optional<std::string>("HTTP 400"));
}

TEST_CASE_METHOD(GatewayFixture, "Maintenance flushes request logs and sweeps caches", "[gateway]") {
    Gateway gateway(settings, transport, logger, hooks());
    gateway.handle(request("GET", "/missing"));

    REQUIRE(logger.pending() == 1);
    gateway.run_maintenance();
    REQUIRE(logger.pending() == 0);
    REQUIRE(log.str().find("GET /missing") != std::string::npos);

    transport.push_response(200, "{}");
    gateway.handle(request("GET", "/api/openai/v1/models"));
    REQUIRE(gateway.path_parser().stats().size == 1);

    now += PATH_CACHE_TTL_MS;
    gateway.run_maintenance();
    REQUIRE(gateway.path_parser().stats().size == 0);
    REQUIRE(gateway.rate_limiter().stats().total_clients == 0);
}

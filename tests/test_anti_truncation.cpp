#include <catch2/catch.hpp>
#include "gemini/anti_truncation.hpp"
#include "gemini/protocol.hpp"
#include "logger.hpp"
#include "fake_transport.hpp"
#include "test_helpers.hpp"
#include <sstream>

using namespace relay;
using namespace relay::gemini;
using json = nlohmann::json;

namespace {

const std::string PRO_GENERATE = "/api/gemini-anti/v1beta/models/gemini-2.5-pro:generateContent";
const std::string PRO_STREAM = "/api/gemini-anti/v1beta/models/gemini-2.5-pro:streamGenerateContent";

struct HandlerFixture {
    std::ostringstream log;
    Logger logger{log};
    FakeTransport transport;
    ErrorResponder responder{false};
    UpstreamOptions options;
    std::vector<long> sleeps;

    HandlerFixture() {
        options.url_base = "https://upstream.test";
        options.api_key = "test-key";
        options.max_retries = 3;
    }

    Reply call(const std::string& path, const std::string& body, const std::string& query = "") {
        UpstreamClient client(transport, options, logger,
                              [this](std::chrono::milliseconds d) { sleeps.push_back(static_cast<long>(d.count())); });
        AntiTruncationHandler handler(client, logger, responder, 8);
        return handler.handle(path, query, body);
    }

    Reply call_stream(const std::string& body, std::string& streamed) {
        UpstreamClient client(transport, options, logger, [](std::chrono::milliseconds) {});
        AntiTruncationHandler handler(client, logger, responder, 8);
        Reply reply = handler.handle(PRO_STREAM, "?alt=sse", body);
        if (reply.stream) {
            std::string chunk;
            while (reply.stream->next(chunk)) {
                streamed += chunk;
            }
            reply.stream.reset();
        }
        return reply;
    }
};

std::string candidate_text(const Reply& reply) {
    return json::parse(reply.body)["candidates"][0]["content"]["parts"][0]["text"];
}

std::string error_of(const Reply& reply) {
    return json::parse(reply.body)["error"];
}

}

// ============================================================================
// Path and model validation
// ============================================================================

TEST_CASE("extract_model reads the segment between models/ and the colon", "[anti]") {
    REQUIRE(extract_model(PRO_GENERATE) == std::optional<std::string>("gemini-2.5-pro"));
    REQUIRE_FALSE(extract_model("/api/gemini-anti/v1beta/models/gemini-2.5-pro"));
    REQUIRE_FALSE(extract_model("/api/gemini-anti/v1beta/generateContent"));
}

TEST_CASE("Only the protocol models are targets", "[anti]") {
    REQUIRE(is_target_model("gemini-2.5-pro"));
    REQUIRE(is_target_model("gemini-2.5-flash"));
    REQUIRE_FALSE(is_target_model("gemini-1.0-pro"));
    REQUIRE_FALSE(is_target_model("gemini-2.5-pro-latest"));
}

TEST_CASE_METHOD(HandlerFixture, "Unsupported model is rejected before any network call", "[anti]") {
    Reply reply = call("/api/gemini-anti/v1beta/models/gemini-1.0-pro:generateContent",
                       user_request("hi").dump());

    REQUIRE(reply.status == 400);
    REQUIRE(error_of(reply) == "Model not supported");
    REQUIRE(json::parse(reply.body)["details"] == "Model 'gemini-1.0-pro' is not supported for anti-truncation");
    REQUIRE(transport.calls() == 0);
}

TEST_CASE_METHOD(HandlerFixture, "Direct generate call also gates the model", "[anti]") {
    UpstreamClient client(transport, options, logger, [](std::chrono::milliseconds) {});
    AntiTruncationHandler handler(client, logger, responder, 8);

    Reply reply = handler.generate(GenerationRequest::from_json(user_request("hi")), "gemini-1.0-pro", "");

    REQUIRE(reply.status == 400);
    REQUIRE(transport.calls() == 0);
}

TEST_CASE_METHOD(HandlerFixture, "Path without a model is rejected", "[anti]") {
    Reply reply = call("/api/gemini-anti/v1beta/generateContent", user_request("hi").dump());

    REQUIRE(reply.status == 400);
    REQUIRE(error_of(reply) == "Invalid model path");
    REQUIRE(transport.calls() == 0);
}

TEST_CASE_METHOD(HandlerFixture, "Malformed bodies are rejected", "[anti]") {
    SECTION("not JSON") {
        Reply reply = call(PRO_GENERATE, "{not json");
        REQUIRE(reply.status == 400);
        REQUIRE(error_of(reply) == "Invalid request body");
    }
    SECTION("no contents") {
        Reply reply = call(PRO_GENERATE, R"({"generationConfig":{}})");
        REQUIRE(reply.status == 400);
        REQUIRE(error_of(reply) == "Invalid request body");
    }
    REQUIRE(transport.calls() == 0);
}

// ============================================================================
// Non-streaming protocol
// ============================================================================

TEST_CASE_METHOD(HandlerFixture, "Complete response is returned with markers stripped", "[anti]") {
    transport.push_response(200, text_response(std::string("All done.\n") + FINISHED_MARKER).dump());

    Reply reply = call(PRO_GENERATE, user_request("hi").dump());

    REQUIRE(reply.status == 200);
    REQUIRE(reply.content_type == "application/json");
    REQUIRE(candidate_text(reply) == "All done.");
    REQUIRE(transport.calls() == 1);
    REQUIRE(reply.header("Access-Control-Allow-Origin") == std::optional<std::string>("*"));

    json sent = json::parse(transport.requests()[0].body);
    std::string instruction = sent["systemInstruction"]["parts"][0]["text"];
    REQUIRE(instruction == COMPLETION_MANDATE);
}

TEST_CASE_METHOD(HandlerFixture, "Truncated response is continued and merged", "[anti]") {
    transport.push_response(200, text_response("Hello wor").dump());
    transport.push_response(200, text_response(std::string("ld!") + FINISHED_MARKER).dump());

    Reply reply = call(PRO_GENERATE, user_request("Say hello world").dump(), "?alt=json");

    REQUIRE(reply.status == 200);
    REQUIRE(candidate_text(reply) == "ld!");

    auto sent = transport.requests();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[1].url == "https://upstream.test/v1beta/models/gemini-2.5-pro:generateContent?alt=json");

    json continuation = json::parse(sent[1].body);
    REQUIRE(continuation["contents"].size() == 2);
    REQUIRE(continuation["contents"][1]["role"] == "user");
    std::string turn = continuation["contents"][1]["parts"][0]["text"];
    REQUIRE(turn == std::string("Hello wor\n\n") + RETRY_PROTOCOL_TEXT);
}

TEST_CASE_METHOD(HandlerFixture, "Failed continuation returns the partial response unmodified", "[anti]") {
    json partial = text_response("Hello wor");
    partial["modelVersion"] = "gemini-2.5-pro-001";
    transport.push_response(200, partial.dump());

    SECTION("continuation rejected by upstream") {
        transport.push_response(400, R"({"error":{"message":"too long"}})");
    }
    SECTION("continuation body is not JSON") {
        transport.push_response(200, "<html>oops</html>");
    }
    SECTION("continuation has no candidates") {
        transport.push_response(200, R"({"promptFeedback":{"blockReason":"SAFETY"}})");
    }
    SECTION("continuation candidate carries only a finish reason") {
        transport.push_response(200, R"({"candidates":[{"finishReason":"SAFETY"}]})");
    }

    Reply reply = call(PRO_GENERATE, user_request("hi").dump());

    REQUIRE(reply.status == 200);
    REQUIRE(json::parse(reply.body) == partial);
    REQUIRE(log.str().find("Continuation failed") != std::string::npos);
}

TEST_CASE_METHOD(HandlerFixture, "Blocked prompt is still continued and then returned as is", "[anti]") {
    json blocked = {{"promptFeedback", {{"blockReason", "SAFETY"}}}};
    transport.push_response(200, blocked.dump());
    transport.push_response(200, blocked.dump());

    Reply reply = call(PRO_GENERATE, user_request("hi").dump());

    REQUIRE(reply.status == 200);
    REQUIRE(json::parse(reply.body) == blocked);
    REQUIRE(transport.calls() == 2);

    json sent = json::parse(transport.requests()[1].body);
    REQUIRE(sent["contents"].back()["parts"][0]["text"] == std::string("\n\n") + RETRY_PROTOCOL_TEXT);
}

TEST_CASE_METHOD(HandlerFixture, "Upstream failures map to gateway statuses", "[anti]") {
    SECTION("non-retryable status") {
        transport.push_response(404, R"({"error":{"message":"model not found"}})");
        Reply reply = call(PRO_GENERATE, user_request("hi").dump());
        REQUIRE(reply.status == 502);
        REQUIRE(json::parse(reply.body)["details"].get<std::string>().find("model not found") != std::string::npos);
    }
    SECTION("retryable status exhausted") {
        for (int i = 0; i < 4; ++i) {
            transport.push_response(429, "quota");
        }
        Reply reply = call(PRO_GENERATE, user_request("hi").dump());
        REQUIRE(reply.status == 503);
        REQUIRE(transport.calls() == 4);
        REQUIRE(sleeps == std::vector<long>{1000, 2000, 4000});
    }
    SECTION("timeouts exhausted") {
        options.max_retries = 0;
        transport.push_error(TransportFailure::Timeout, "Upstream request timeout: slow");
        Reply reply = call(PRO_GENERATE, user_request("hi").dump());
        REQUIRE(reply.status == 504);
    }
    SECTION("connection refused exhausted") {
        options.max_retries = 0;
        transport.push_error(TransportFailure::Connect, "Connection refused by upstream: host");
        Reply reply = call(PRO_GENERATE, user_request("hi").dump());
        REQUIRE(reply.status == 503);
    }
    SECTION("success body is not JSON") {
        transport.push_response(200, "<html></html>");
        Reply reply = call(PRO_GENERATE, user_request("hi").dump());
        REQUIRE(reply.status == 502);
    }
    SECTION("no API key") {
        options.api_key.clear();
        Reply reply = call(PRO_GENERATE, user_request("hi").dump());
        REQUIRE(reply.status == 500);
        REQUIRE(transport.calls() == 0);
    }
}

TEST_CASE_METHOD(HandlerFixture, "Error details include the elapsed time", "[anti]") {
    transport.push_response(400, R"({"error":{"message":"bad"}})");

    Reply reply = call(PRO_GENERATE, user_request("hi").dump());
    std::string details = json::parse(reply.body)["details"];

    REQUIRE(details.size() > 4);
    REQUIRE(details.compare(details.size() - 3, 3, "ms)") == 0);
}

// ============================================================================
// Streaming protocol
// ============================================================================

TEST_CASE_METHOD(HandlerFixture, "Streamed events are cleaned and forwarded", "[anti][stream]") {
    std::string first = "data: " + text_response("Hello ").dump() + "\n\n";
    std::string second = "data: " + text_response(std::string("world") + FINISHED_MARKER).dump() + "\n\n";
    transport.push_stream(200, {first.substr(0, 10), first.substr(10) + second});

    std::string streamed;
    Reply reply = call_stream(user_request("hi").dump(), streamed);

    REQUIRE(reply.status == 200);
    REQUIRE(reply.content_type == "text/event-stream");
    REQUIRE(reply.header("Cache-Control") == std::optional<std::string>("no-cache"));

    std::string expected = "data: " + text_response("Hello ").dump() + "\n\n" + "\n" +
                           "data: " + text_response("world").dump() + "\n\n" + "\n";
    REQUIRE(streamed == expected);

    auto sent = transport.requests();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].url == "https://upstream.test/v1beta/models/gemini-2.5-pro:streamGenerateContent?alt=sse");
    REQUIRE(json::parse(sent[0].body).contains("systemInstruction"));
}

TEST_CASE_METHOD(HandlerFixture, "Stream without trailing newline is flushed at the end", "[anti][stream]") {
    transport.push_stream(200, {"data: " + text_response(std::string("x") + FINISHED_MARKER).dump()});

    std::string streamed;
    Reply reply = call_stream(user_request("hi").dump(), streamed);

    REQUIRE(reply.status == 200);
    REQUIRE(streamed == "data: " + text_response("x").dump() + "\n\n");
}

TEST_CASE_METHOD(HandlerFixture, "Stream failing before any data becomes an error reply", "[anti][stream]") {
    transport.push_stream(400, {R"({"error":{"message":"invalid argument"}})"});

    std::string streamed;
    Reply reply = call_stream(user_request("hi").dump(), streamed);

    REQUIRE(reply.status == 502);
    REQUIRE_FALSE(reply.stream);
    REQUIRE(reply.content_type == "application/json; charset=utf-8");
    REQUIRE(error_of(reply) == "Gemini streaming failed");
}

TEST_CASE_METHOD(HandlerFixture, "Stream interrupted after data ends the body quietly", "[anti][stream]") {
    std::string event = "data: " + text_response("partial").dump() + "\n\n";
    transport.push_broken_stream({event}, TransportFailure::Network, "Network error: reset by peer");

    std::string streamed;
    Reply reply = call_stream(user_request("hi").dump(), streamed);

    REQUIRE(reply.status == 200);
    REQUIRE(streamed == event + "\n");
    REQUIRE(transport.calls() == 1);
    REQUIRE(log.str().find("ended with error") != std::string::npos);
}

TEST_CASE_METHOD(HandlerFixture, "Stream interrupted mid-line still delivers the partial line", "[anti][stream]") {
    std::string event = "data: " + text_response("one").dump() + "\n";
    std::string cut = R"(data: {"candidates":[{"content":{"parts":[{"text":"tw)";
    transport.push_broken_stream({event, cut}, TransportFailure::Network, "Network error: reset by peer");

    std::string streamed;
    Reply reply = call_stream(user_request("hi").dump(), streamed);

    REQUIRE(reply.status == 200);
    REQUIRE(streamed == "data: " + text_response("one").dump() + "\n\n" + cut + "\n");
    REQUIRE(log.str().find("ended with error") != std::string::npos);
}

TEST_CASE_METHOD(HandlerFixture, "Cancelling a stream stops the upstream transfer", "[anti][stream]") {
    std::vector<std::string> chunks;
    for (int i = 0; i < 100; ++i) {
        chunks.push_back("data: " + text_response("chunk " + std::to_string(i)).dump() + "\n");
    }
    transport.push_stream(200, chunks);

    UpstreamClient client(transport, options, logger, [](std::chrono::milliseconds) {});
    AntiTruncationHandler handler(client, logger, responder, 2);
    Reply reply = handler.handle(PRO_STREAM, "", user_request("hi").dump());

    REQUIRE(reply.status == 200);
    REQUIRE(reply.stream);

    std::string chunk;
    REQUIRE(reply.stream->next(chunk));
    reply.stream->cancel();

    // Draining after cancel ends promptly; the worker is joined on release.
    while (reply.stream->next(chunk)) {
    }
    reply.stream.reset();
    REQUIRE(transport.calls() == 1);
}

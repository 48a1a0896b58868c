#include <catch2/catch.hpp>
#include "logger.hpp"
#include "chunk_channel.hpp"
#include <sstream>
#include <thread>

using namespace relay;

TEST_CASE("Debug lines print only in debug mode", "[logger]") {
    std::ostringstream out;
    Logger logger(out);

    logger.debug("hidden");
    REQUIRE(out.str().empty());

    logger.set_debug(true);
    logger.debug("shown");
    REQUIRE(out.str().find("[DEBUG] shown") != std::string::npos);

    logger.error("boom");
    REQUIRE(out.str().find("[ERROR] boom") != std::string::npos);
}

TEST_CASE("Request lines are buffered until flush", "[logger]") {
    std::ostringstream out;
    Logger logger(out);

    logger.request("POST", "/api/openai/v1/chat", "https://api.openai.com/v1/chat", 200);
    logger.request("GET", "/missing", "", 404);
    logger.request("GET", "/plain");

    REQUIRE(out.str().empty());
    REQUIRE(logger.pending() == 3);

    logger.flush();
    std::string text = out.str();
    REQUIRE(text.find("POST /api/openai/v1/chat -> https://api.openai.com/v1/chat [200]\n") != std::string::npos);
    REQUIRE(text.find("GET /missing [404]\n") != std::string::npos);
    REQUIRE(text.find("GET /plain\n") != std::string::npos);
    REQUIRE(logger.pending() == 0);
}

TEST_CASE("Timestamps are ISO-8601 UTC with milliseconds", "[logger]") {
    std::string ts = timestamp();
    REQUIRE(ts.size() == 24);
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts[19] == '.');
    REQUIRE(ts.back() == 'Z');
}

TEST_CASE("Long values are truncated for logs", "[logger]") {
    REQUIRE(truncate("short", 10) == "short");
    REQUIRE(truncate(std::string(20, 'a'), 5) == "aaaaa... (20 bytes total)");
}

TEST_CASE("JSON is collapsed onto one line", "[logger]") {
    std::string pretty = "{\n  \"a\": \"x  y\",\n  \"b\": [1,\n 2]\n}";
    REQUIRE(format_json_compact(pretty) == "{ \"a\": \"x  y\", \"b\": [1, 2] }");
}

// ============================================================================
// ChunkChannel
// ============================================================================

TEST_CASE("Channel delivers chunks in order and drains after close", "[channel]") {
    ChunkChannel channel(4);
    REQUIRE(channel.push("a"));
    REQUIRE(channel.push("b"));
    channel.close();
    REQUIRE_FALSE(channel.push("c"));

    std::string chunk;
    REQUIRE(channel.pop(chunk));
    REQUIRE(chunk == "a");
    REQUIRE(channel.pop(chunk));
    REQUIRE(chunk == "b");
    REQUIRE_FALSE(channel.pop(chunk));
}

TEST_CASE("Full channel blocks the producer until the consumer reads", "[channel]") {
    ChunkChannel channel(1);
    REQUIRE(channel.push("first"));

    std::thread producer([&] { channel.push("second"); channel.close(); });

    std::string received;
    std::string chunk;
    while (channel.pop(chunk)) {
        received += chunk;
    }
    producer.join();

    REQUIRE(received == "firstsecond");
}

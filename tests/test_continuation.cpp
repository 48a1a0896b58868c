#include <catch2/catch.hpp>
#include "gemini/continuation.hpp"
#include "gemini/prompt_augmenter.hpp"
#include "gemini/protocol.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace relay::gemini;
using json = nlohmann::json;

// ============================================================================
// Continuation request
// ============================================================================

TEST_CASE("Continuation appends one user turn with partial text and instructions", "[continuation]") {
    auto augmented = augment_request(GenerationRequest::from_json(user_request("Say hello world")));
    auto partial = GenerationResponse::from_json(text_response("Hello wor"));

    auto continuation = build_continuation_request(partial, augmented);

    REQUIRE(continuation.contents.size() == 2);
    REQUIRE(continuation.contents[0].text() == "Say hello world");

    const auto& turn = continuation.contents[1];
    REQUIRE(turn.role == "user");
    REQUIRE(turn.parts.size() == 1);
    REQUIRE(turn.text() == std::string("Hello wor\n\n") + RETRY_PROTOCOL_TEXT);
}

TEST_CASE("Continuation keeps the augmented system instruction", "[continuation]") {
    auto augmented = augment_request(GenerationRequest::from_json(user_request("q")));
    auto partial = GenerationResponse::from_json(text_response("a"));

    auto continuation = build_continuation_request(partial, augmented);

    REQUIRE(continuation.system_instruction);
    REQUIRE(continuation.system_instruction->text() == augmented.system_instruction->text());
}

TEST_CASE("Retry protocol text ends with the reminder", "[continuation]") {
    std::string text = RETRY_PROTOCOL_TEXT;
    std::string reminder = REMINDER_TEXT;
    REQUIRE(text.size() > reminder.size());
    REQUIRE(text.compare(text.size() - reminder.size(), reminder.size(), reminder) == 0);
}

// ============================================================================
// Response combination
// ============================================================================

TEST_CASE("Continuation repeating the partial text yields only the new text", "[combine]") {
    auto partial = GenerationResponse::from_json(text_response("Hello wor"));
    auto more = GenerationResponse::from_json(text_response("Hello world! "));

    auto combined = combine_responses(partial, more);
    REQUIRE(combined.text() == "ld!");
}

TEST_CASE("Continuation without the partial text is kept whole", "[combine]") {
    auto partial = GenerationResponse::from_json(text_response("Hello wor"));
    auto more = GenerationResponse::from_json(text_response(std::string("ld!") + FINISHED_MARKER));

    auto combined = combine_responses(partial, more);
    REQUIRE(combined.text() == std::string("ld!") + FINISHED_MARKER);
}

TEST_CASE("Combined response takes metadata from the continuation", "[combine]") {
    json first = text_response("Hello wor");
    first["candidates"][0]["finishReason"] = "MAX_TOKENS";
    first["usageMetadata"] = {{"totalTokenCount", 5}};

    json second = text_response("ld!");
    second["candidates"][0]["safetyRatings"] = json::array({{{"category", "HARM_CATEGORY_HATE_SPEECH"}}});
    second["usageMetadata"] = {{"totalTokenCount", 9}};

    json out = combine_responses(GenerationResponse::from_json(first),
                                 GenerationResponse::from_json(second)).to_json();

    REQUIRE(out["candidates"].size() == 1);
    REQUIRE(out["candidates"][0]["content"]["role"] == "model");
    REQUIRE(out["candidates"][0]["content"]["parts"].size() == 1);
    REQUIRE(out["candidates"][0]["finishReason"] == "STOP");
    REQUIRE(out["candidates"][0]["safetyRatings"][0]["category"] == "HARM_CATEGORY_HATE_SPEECH");
    REQUIRE(out["usageMetadata"]["totalTokenCount"] == 9);
}

TEST_CASE("Continuation without usage leaves usage absent", "[combine]") {
    json first = text_response("a");
    first["usageMetadata"] = {{"totalTokenCount", 5}};

    json out = combine_responses(GenerationResponse::from_json(first),
                                 GenerationResponse::from_json(text_response("b"))).to_json();
    REQUIRE_FALSE(out.contains("usageMetadata"));
}

TEST_CASE("Continuation without candidates cannot be combined", "[combine]") {
    auto partial = GenerationResponse::from_json(text_response("Hello wor"));
    auto empty = GenerationResponse::from_json({{"candidates", json::array()}});

    REQUIRE_THROWS_AS(combine_responses(partial, empty), relay::ContinuationError);
}

TEST_CASE("Continuation candidate without content cannot be combined", "[combine]") {
    auto partial = GenerationResponse::from_json(text_response("Hello wor"));

    SECTION("finish reason only") {
        auto blocked = GenerationResponse::from_json(json::parse(R"({"candidates":[{"finishReason":"SAFETY"}]})"));
        REQUIRE_THROWS_AS(combine_responses(partial, blocked), relay::ContinuationError);
    }
    SECTION("content without parts") {
        auto hollow = GenerationResponse::from_json(
            json::parse(R"({"candidates":[{"content":{"role":"model","parts":[]}}]})"));
        REQUIRE_THROWS_AS(combine_responses(partial, hollow), relay::ContinuationError);
    }
}

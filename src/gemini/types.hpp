#pragma once

/**
 * Typed projection of Gemini generateContent payloads.
 *
 * Only the fields the anti-truncation protocol reads or writes are typed;
 * everything else is carried as opaque JSON and written back unchanged.
 */

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace relay::gemini {

/**
 * One part of a turn. Text parts have `text`; function calls, function
 * responses, inline data and any other fields live in `extra`.
 */
struct Part {
    std::optional<std::string> text;
    nlohmann::json extra = nlohmann::json::object();

    static Part from_text(const std::string& text);

    nlohmann::json to_json() const;
    static Part from_json(const nlohmann::json& j);
};

/**
 * A conversation turn, also used for the system instruction.
 */
struct Content {
    std::optional<std::string> role;
    std::vector<Part> parts;
    nlohmann::json extra = nlohmann::json::object();

    // Concatenation of all text parts.
    std::string text() const;

    nlohmann::json to_json() const;
    static Content from_json(const nlohmann::json& j);
};

struct GenerationRequest {
    std::vector<Content> contents;
    std::optional<Content> system_instruction;
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> generation_config;
    nlohmann::json extra = nlohmann::json::object();  // safetySettings, toolConfig, ...

    nlohmann::json to_json() const;

    // Throws InvalidRequestError when the body is not an object with a
    // `contents` array.
    static GenerationRequest from_json(const nlohmann::json& j);
};

struct Candidate {
    std::optional<Content> content;
    std::optional<std::string> finish_reason;
    std::optional<nlohmann::json> safety_ratings;
    nlohmann::json extra = nlohmann::json::object();

    nlohmann::json to_json() const;
    static Candidate from_json(const nlohmann::json& j);
};

struct GenerationResponse {
    std::vector<Candidate> candidates;
    std::optional<nlohmann::json> usage_metadata;
    nlohmann::json extra = nlohmann::json::object();

    // Text of candidate 0, or empty when there is none.
    std::string text() const;

    nlohmann::json to_json() const;

    // Never fails on shape: missing or mistyped fields become absent.
    static GenerationResponse from_json(const nlohmann::json& j);
};

} // namespace relay::gemini

#include "types.hpp"
#include "../errors.hpp"

namespace relay::gemini {

using json = nlohmann::json;

// Copies every key of `j` except the ones listed.
static json without_keys(const json& j, std::initializer_list<const char*> keys) {
    json rest = json::object();
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool skip = false;
        for (const char* key : keys) {
            if (it.key() == key) {
                skip = true;
                break;
            }
        }
        if (!skip) {
            rest[it.key()] = it.value();
        }
    }
    return rest;
}

// ========== Part ==========

Part Part::from_text(const std::string& text) {
    Part part;
    part.text = text;
    return part;
}

json Part::to_json() const {
    if (!extra.is_object()) {
        return extra;
    }
    json j = extra;
    if (text) {
        j["text"] = *text;
    }
    return j;
}

Part Part::from_json(const json& j) {
    Part part;
    if (!j.is_object()) {
        part.extra = j;
        return part;
    }
    if (j.contains("text") && j["text"].is_string()) {
        part.text = j["text"].get<std::string>();
        part.extra = without_keys(j, {"text"});
    } else {
        part.extra = j;
    }
    return part;
}

// ========== Content ==========

std::string Content::text() const {
    std::string out;
    for (const auto& part : parts) {
        if (part.text) {
            out += *part.text;
        }
    }
    return out;
}

json Content::to_json() const {
    json j = extra;
    json parts_json = json::array();
    for (const auto& part : parts) {
        parts_json.push_back(part.to_json());
    }
    j["parts"] = parts_json;
    if (role) {
        j["role"] = *role;
    }
    return j;
}

Content Content::from_json(const json& j) {
    Content content;
    if (!j.is_object()) {
        return content;
    }
    if (j.contains("role") && j["role"].is_string()) {
        content.role = j["role"].get<std::string>();
    }
    if (j.contains("parts") && j["parts"].is_array()) {
        for (const auto& part : j["parts"]) {
            content.parts.push_back(Part::from_json(part));
        }
    }
    content.extra = without_keys(j, {"role", "parts"});
    return content;
}

// ========== GenerationRequest ==========

json GenerationRequest::to_json() const {
    json j = extra;
    json contents_json = json::array();
    for (const auto& content : contents) {
        contents_json.push_back(content.to_json());
    }
    j["contents"] = contents_json;
    if (system_instruction) {
        j["systemInstruction"] = system_instruction->to_json();
    }
    if (tools) {
        j["tools"] = *tools;
    }
    if (generation_config) {
        j["generationConfig"] = *generation_config;
    }
    return j;
}

GenerationRequest GenerationRequest::from_json(const json& j) {
    if (!j.is_object()) {
        throw InvalidRequestError("Request body must be a JSON object");
    }
    if (!j.contains("contents") || !j["contents"].is_array()) {
        throw InvalidRequestError("Request body must contain a 'contents' array");
    }

    GenerationRequest request;
    for (const auto& content : j["contents"]) {
        request.contents.push_back(Content::from_json(content));
    }

    // Both spellings are accepted; the camelCase one wins if both are present.
    if (j.contains("systemInstruction") && j["systemInstruction"].is_object()) {
        request.system_instruction = Content::from_json(j["systemInstruction"]);
    } else if (j.contains("system_instruction") && j["system_instruction"].is_object()) {
        request.system_instruction = Content::from_json(j["system_instruction"]);
    }
    if (j.contains("tools") && !j["tools"].is_null()) {
        request.tools = j["tools"];
    }
    if (j.contains("generationConfig") && !j["generationConfig"].is_null()) {
        request.generation_config = j["generationConfig"];
    }

    request.extra = without_keys(j, {"contents", "systemInstruction", "system_instruction",
                                     "tools", "generationConfig"});
    return request;
}

// ========== Candidate ==========

json Candidate::to_json() const {
    json j = extra;
    if (content) {
        j["content"] = content->to_json();
    }
    if (finish_reason) {
        j["finishReason"] = *finish_reason;
    }
    if (safety_ratings) {
        j["safetyRatings"] = *safety_ratings;
    }
    return j;
}

Candidate Candidate::from_json(const json& j) {
    Candidate candidate;
    if (!j.is_object()) {
        return candidate;
    }
    if (j.contains("content") && j["content"].is_object()) {
        candidate.content = Content::from_json(j["content"]);
    }
    if (j.contains("finishReason") && j["finishReason"].is_string()) {
        candidate.finish_reason = j["finishReason"].get<std::string>();
    }
    if (j.contains("safetyRatings") && !j["safetyRatings"].is_null()) {
        candidate.safety_ratings = j["safetyRatings"];
    }
    candidate.extra = without_keys(j, {"content", "finishReason", "safetyRatings"});
    return candidate;
}

// ========== GenerationResponse ==========

std::string GenerationResponse::text() const {
    if (candidates.empty() || !candidates[0].content) {
        return "";
    }
    return candidates[0].content->text();
}

json GenerationResponse::to_json() const {
    json j = extra;
    json candidates_json = json::array();
    for (const auto& candidate : candidates) {
        candidates_json.push_back(candidate.to_json());
    }
    j["candidates"] = candidates_json;
    if (usage_metadata) {
        j["usageMetadata"] = *usage_metadata;
    }
    return j;
}

GenerationResponse GenerationResponse::from_json(const json& j) {
    GenerationResponse response;
    if (!j.is_object()) {
        return response;
    }
    if (j.contains("candidates") && j["candidates"].is_array()) {
        for (const auto& candidate : j["candidates"]) {
            response.candidates.push_back(Candidate::from_json(candidate));
        }
    }
    if (j.contains("usageMetadata") && !j["usageMetadata"].is_null()) {
        response.usage_metadata = j["usageMetadata"];
    }
    response.extra = without_keys(j, {"candidates", "usageMetadata"});
    return response;
}

} // namespace relay::gemini

#include "continuation.hpp"
#include "completion.hpp"
#include "protocol.hpp"
#include "../errors.hpp"

namespace relay::gemini {

GenerationRequest build_continuation_request(const GenerationResponse& incomplete,
                                             const GenerationRequest& augmented_request) {
    GenerationRequest continuation = augmented_request;

    Content turn;
    turn.role = "user";
    turn.parts.push_back(Part::from_text(incomplete.text() + "\n\n" + RETRY_PROTOCOL_TEXT));
    continuation.contents.push_back(std::move(turn));

    return continuation;
}

GenerationResponse combine_responses(const GenerationResponse& incomplete,
                                     const GenerationResponse& continuation) {
    if (continuation.candidates.empty()) {
        throw ContinuationError("Continuation response has no candidates");
    }
    const Candidate& source = continuation.candidates[0];
    if (!source.content || source.content->parts.empty()) {
        throw ContinuationError("Continuation candidate has no content");
    }

    std::string text = continuation.text();
    erase_first(text, incomplete.text());
    text = trim(text);

    Content content;
    content.role = source.content->role;
    content.parts.push_back(Part::from_text(text));

    Candidate merged;
    merged.content = std::move(content);
    merged.finish_reason = source.finish_reason;
    merged.safety_ratings = source.safety_ratings;

    GenerationResponse combined;
    combined.candidates.push_back(std::move(merged));
    combined.usage_metadata = continuation.usage_metadata;
    return combined;
}

} // namespace relay::gemini

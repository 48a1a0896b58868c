#pragma once

/**
 * Continuation of truncated responses.
 *
 * A response missing the finished marker is continued with one extra user
 * turn holding the partial text and the continuation instructions. The
 * two responses are then merged into one.
 */

#include "types.hpp"

namespace relay::gemini {

// Returns a copy of `augmented_request` with one more user turn:
// "<incomplete text>\n\n<continuation instructions>".
GenerationRequest build_continuation_request(const GenerationResponse& incomplete,
                                             const GenerationRequest& augmented_request);

// Merges the partial and continuation responses into a single candidate.
// The continuation text has the first copy of the partial text removed and
// is trimmed; role, finish reason, safety ratings and usage come from the
// continuation. Throws ContinuationError if the continuation has no candidate.
GenerationResponse combine_responses(const GenerationResponse& incomplete,
                                     const GenerationResponse& continuation);

} // namespace relay::gemini

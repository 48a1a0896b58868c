#pragma once

/**
 * Completion detection and protocol marker clean-up for whole responses.
 */

#include "types.hpp"
#include <string>

namespace relay::gemini {

// True iff candidate 0 has at least one part and its text contains the
// finished marker. Any other shape counts as incomplete.
bool is_response_complete(const GenerationResponse& response);

// Removes the first occurrence of `needle` from `text`. Returns true if found.
bool erase_first(std::string& text, const std::string& needle);

// Removes the first finished marker, incomplete marker and reminder from `text`.
void remove_protocol_tokens(std::string& text);

// Returns a copy with protocol tokens removed from every text part of
// candidate 0, each part trimmed of surrounding whitespace.
GenerationResponse strip_markers(const GenerationResponse& response);

// Trims spaces, tabs and line breaks from both ends.
std::string trim(const std::string& s);

} // namespace relay::gemini

#include "completion.hpp"
#include "protocol.hpp"

namespace relay::gemini {

bool is_response_complete(const GenerationResponse& response) {
    if (response.candidates.empty()) {
        return false;
    }
    const auto& candidate = response.candidates[0];
    if (!candidate.content || candidate.content->parts.empty()) {
        return false;
    }
    return candidate.content->text().find(FINISHED_MARKER) != std::string::npos;
}

bool erase_first(std::string& text, const std::string& needle) {
    if (needle.empty()) {
        return false;
    }
    auto pos = text.find(needle);
    if (pos == std::string::npos) {
        return false;
    }
    text.erase(pos, needle.size());
    return true;
}

void remove_protocol_tokens(std::string& text) {
    erase_first(text, FINISHED_MARKER);
    erase_first(text, INCOMPLETE_MARKER);
    erase_first(text, REMINDER_TEXT);
}

std::string trim(const std::string& s) {
    const char* whitespace = " \t\r\n\f\v";
    auto start = s.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

GenerationResponse strip_markers(const GenerationResponse& response) {
    GenerationResponse cleaned = response;
    if (cleaned.candidates.empty() || !cleaned.candidates[0].content) {
        return cleaned;
    }

    for (auto& part : cleaned.candidates[0].content->parts) {
        if (part.text) {
            remove_protocol_tokens(*part.text);
            *part.text = trim(*part.text);
        }
    }
    return cleaned;
}

} // namespace relay::gemini

#pragma once

/**
 * Removes protocol tokens from a streamed generateContent response.
 *
 * Input is the raw server-sent-events body in arbitrary chunks. Complete
 * lines are transformed in order; a trailing partial line is held back until
 * the next chunk or finish().
 */

#include <nlohmann/json.hpp>
#include <string>

namespace relay {
class Logger;
}

namespace relay::gemini {

class StreamTransformer {
public:
    explicit StreamTransformer(Logger& logger);

    // Returns the transformed output for all lines completed by `chunk`.
    std::string transform(const std::string& chunk);

    // Transforms whatever is left in the line buffer at end of stream.
    std::string finish();

private:
    Logger& logger_;
    std::string pending_;

    std::string process_line(const std::string& line) const;
};

// Removes protocol tokens from the text parts of candidate 0, in place.
void clean_fragment(nlohmann::json& fragment);

} // namespace relay::gemini

#include "stream_transformer.hpp"
#include "completion.hpp"
#include "../logger.hpp"

namespace relay::gemini {

using json = nlohmann::json;

namespace {
    constexpr const char* DATA_PREFIX = "data: ";
    constexpr size_t DATA_PREFIX_LEN = 6;
    constexpr size_t LOG_EXCERPT_LEN = 100;
}

void clean_fragment(json& fragment) {
    if (!fragment.is_object() || !fragment.contains("candidates")) return;
    auto& candidates = fragment["candidates"];
    if (!candidates.is_array() || candidates.empty()) return;

    auto& candidate = candidates[0];
    if (!candidate.is_object() || !candidate.contains("content")) return;
    auto& content = candidate["content"];
    if (!content.is_object() || !content.contains("parts") || !content["parts"].is_array()) return;

    for (auto& part : content["parts"]) {
        if (part.is_object() && part.contains("text") && part["text"].is_string()) {
            std::string text = part["text"].get<std::string>();
            remove_protocol_tokens(text);
            part["text"] = text;
        }
    }
}

StreamTransformer::StreamTransformer(Logger& logger) : logger_(logger) {}

std::string StreamTransformer::transform(const std::string& chunk) {
    pending_.append(chunk);

    std::string out;
    size_t pos;
    while ((pos = pending_.find('\n')) != std::string::npos) {
        std::string line = pending_.substr(0, pos);
        pending_.erase(0, pos + 1);
        out += process_line(line);
    }
    return out;
}

std::string StreamTransformer::finish() {
    if (pending_.empty()) {
        return "";
    }
    std::string line;
    line.swap(pending_);
    return process_line(line);
}

std::string StreamTransformer::process_line(const std::string& line) const {
    if (line.compare(0, DATA_PREFIX_LEN, DATA_PREFIX) != 0) {
        return line + "\n";
    }

    std::string payload = line.substr(DATA_PREFIX_LEN);
    if (trim(payload).empty()) {
        return line + "\n";
    }

    try {
        json fragment = json::parse(payload);
        clean_fragment(fragment);
        return std::string(DATA_PREFIX) + fragment.dump() + "\n\n";
    } catch (const json::exception& e) {
        logger_.debug(std::string("JSON parse error in stream chunk: ") + e.what() +
                      ", data: " + payload.substr(0, LOG_EXCERPT_LEN));
        return line + "\n";
    }
}

} // namespace relay::gemini

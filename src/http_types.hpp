#pragma once

/**
 * Server-independent request and reply values.
 *
 * The gateway routes InboundRequest to Reply without knowing about the HTTP
 * library; HttpServer translates at the edges.
 */

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <utility>
#include <algorithm>
#include <cctype>

namespace relay {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

// Case-insensitive header lookup; first match wins.
inline std::optional<std::string> find_header(const HeaderList& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return value;
    }
    return std::nullopt;
}

// Replaces every header with the given name, or appends it.
inline void set_header(HeaderList& headers, const std::string& name, const std::string& value) {
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [&](const auto& h) { return iequals(h.first, name); }),
                  headers.end());
    headers.emplace_back(name, value);
}

/**
 * An incoming HTTP request.
 */
struct InboundRequest {
    std::string method;
    std::string path;    // Decoded path without query.
    std::string query;   // Raw query string including the leading '?', or empty.
    HeaderList headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const {
        return find_header(headers, name);
    }
};

/**
 * Pull-based body for streamed replies.
 *
 * The server calls next() until it returns false. cancel() is called when
 * the client goes away before the stream finished.
 */
class ReplyStream {
public:
    virtual ~ReplyStream() = default;

    // Blocks until the next chunk is available. Returns false at end of stream.
    virtual bool next(std::string& chunk) = 0;

    virtual void cancel() = 0;
};

/**
 * An outgoing HTTP reply. When stream is set, body is ignored and the reply
 * is sent with chunked transfer encoding.
 */
struct Reply {
    int status = 200;
    std::string content_type;
    std::string body;
    HeaderList headers;
    std::shared_ptr<ReplyStream> stream;

    std::optional<std::string> header(const std::string& name) const {
        return find_header(headers, name);
    }
};

} // namespace relay

#pragma once

/**
 * Resilient client for the Gemini generateContent endpoints.
 *
 * One call to generate() or stream_generate() is one logical upstream call:
 * attempts are repeated with exponential backoff while the upstream answers
 * with a retryable status or the network fails, up to max_retries each.
 */

#include "types.hpp"
#include "../http_transport.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace relay {
class Logger;
}

namespace relay::gemini {

struct UpstreamOptions {
    std::string url_base;
    std::string api_key;
    int max_retries = 3;
    long request_timeout_ms = 30000;
    long backoff_base_ms = 1000;
    long backoff_cap_ms = 30000;
};

// Blocks the calling thread between attempts. Replaced in tests.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

struct UpstreamReply {
    int status = 0;
    std::string body;
    int attempts = 0;
};

class UpstreamClient {
public:
    UpstreamClient(HttpTransport& transport, UpstreamOptions options, Logger& logger,
                   Sleeper sleeper = nullptr);

    // Calls :generateContent and returns the buffered success body.
    // Throws ConfigurationError without an API key and UpstreamError once
    // retries are exhausted or the status is not retryable.
    UpstreamReply generate(const GenerationRequest& request, const std::string& model,
                           const std::string& query) const;

    // Calls :streamGenerateContent, passing body bytes to on_chunk. Once a
    // chunk was delivered no further attempt is made.
    UpstreamReply stream_generate(const GenerationRequest& request, const std::string& model,
                                  const std::string& query, const ChunkCallback& on_chunk) const;

    // Delay before retry number `attempt` (0-based): min(base * 2^attempt, cap).
    std::chrono::milliseconds backoff_delay(int attempt) const;

    // Builds {base}/v1beta/models/{model}:{method}{query}.
    std::string build_url(const std::string& model, const std::string& method,
                          const std::string& query) const;

    const UpstreamOptions& options() const { return options_; }

private:
    HttpTransport& transport_;
    UpstreamOptions options_;
    Logger& logger_;
    Sleeper sleeper_;

    UpstreamReply execute(const HttpRequest& http, const ChunkCallback* on_chunk) const;
    HttpRequest make_request(const GenerationRequest& request, const std::string& url) const;
};

// Pulls error.message out of a Google API error body, falling back to a
// truncated copy of the raw body.
std::string upstream_error_message(const std::string& body);

} // namespace relay::gemini

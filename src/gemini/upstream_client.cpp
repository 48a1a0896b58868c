#include "upstream_client.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../logger.hpp"
#include <algorithm>
#include <thread>

namespace relay::gemini {

using json = nlohmann::json;

UpstreamClient::UpstreamClient(HttpTransport& transport, UpstreamOptions options, Logger& logger,
                               Sleeper sleeper)
    : transport_(transport)
    , options_(std::move(options))
    , logger_(logger)
    , sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::chrono::milliseconds UpstreamClient::backoff_delay(int attempt) const {
    // Shifting past the cap is pointless and would overflow for large attempts.
    long delay = options_.backoff_base_ms;
    for (int i = 0; i < attempt && delay < options_.backoff_cap_ms; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, options_.backoff_cap_ms));
}

std::string UpstreamClient::build_url(const std::string& model, const std::string& method,
                                      const std::string& query) const {
    std::string base = options_.url_base;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + GEMINI_API_VERSION_PATH + model + ":" + method + query;
}

HttpRequest UpstreamClient::make_request(const GenerationRequest& request, const std::string& url) const {
    if (options_.api_key.empty()) {
        throw ConfigurationError("GEMINI_API_KEY environment variable is required");
    }

    HttpRequest http;
    http.method = "POST";
    http.url = url;
    http.headers = {
        {"Content-Type", "application/json"},
        {API_KEY_HEADER, options_.api_key}
    };
    http.body = request.to_json().dump();
    http.timeout_ms = options_.request_timeout_ms;
    return http;
}

UpstreamReply UpstreamClient::generate(const GenerationRequest& request, const std::string& model,
                                       const std::string& query) const {
    HttpRequest http = make_request(request, build_url(model, "generateContent", query));
    return execute(http, nullptr);
}

UpstreamReply UpstreamClient::stream_generate(const GenerationRequest& request, const std::string& model,
                                              const std::string& query, const ChunkCallback& on_chunk) const {
    HttpRequest http = make_request(request, build_url(model, "streamGenerateContent", query));
    return execute(http, &on_chunk);
}

UpstreamReply UpstreamClient::execute(const HttpRequest& http, const ChunkCallback* on_chunk) const {
    int status_retries = 0;
    int network_retries = 0;
    int attempts = 0;
    bool delivered = false;

    ChunkCallback tracking;
    if (on_chunk) {
        tracking = [&](const std::string& chunk) {
            delivered = true;
            return (*on_chunk)(chunk);
        };
    }

    while (true) {
        ++attempts;
        HttpResponse response;
        try {
            response = on_chunk ? transport_.stream(http, tracking) : transport_.send(http);
        } catch (const TransportError& e) {
            if (delivered) {
                throw UpstreamError(UpstreamErrorKind::Transient, 0,
                                    std::string("Stream interrupted: ") + e.what());
            }
            if (network_retries < options_.max_retries) {
                logger_.debug("Retrying Gemini request due to error (" +
                              std::to_string(network_retries + 1) + "/" +
                              std::to_string(options_.max_retries) + "): " + e.what());
                sleeper_(backoff_delay(network_retries));
                ++network_retries;
                continue;
            }
            throw UpstreamError(UpstreamErrorKind::Transient, 0, e.what());
        }

        if (response.status >= 200 && response.status < 400) {
            return UpstreamReply{response.status, std::move(response.body), attempts};
        }

        if (RETRYABLE_STATUS_CODES.count(response.status) > 0) {
            if (status_retries < options_.max_retries) {
                logger_.debug("Retrying Gemini request after status " + std::to_string(response.status) +
                              " (" + std::to_string(status_retries + 1) + "/" +
                              std::to_string(options_.max_retries) + ")");
                sleeper_(backoff_delay(status_retries));
                ++status_retries;
                continue;
            }
            throw UpstreamError(UpstreamErrorKind::Exhausted, response.status,
                                "Gemini API request failed with status " + std::to_string(response.status) +
                                " after " + std::to_string(attempts) + " attempts: " +
                                upstream_error_message(response.body));
        }

        throw UpstreamError(UpstreamErrorKind::Fatal, response.status,
                            "Gemini API request failed with status " + std::to_string(response.status) +
                            ": " + upstream_error_message(response.body));
    }
}

std::string upstream_error_message(const std::string& body) {
    try {
        json j = json::parse(body);
        if (j.is_object() && j.contains("error") && j["error"].is_object() &&
            j["error"].contains("message") && j["error"]["message"].is_string()) {
            return j["error"]["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // Not JSON; fall through to the raw excerpt.
    }
    if (body.empty()) {
        return "empty response body";
    }
    return truncate(body, 200);
}

} // namespace relay::gemini

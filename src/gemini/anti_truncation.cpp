#include "anti_truncation.hpp"
#include "completion.hpp"
#include "continuation.hpp"
#include "prompt_augmenter.hpp"
#include "protocol.hpp"
#include "../logger.hpp"
#include <regex>

namespace relay::gemini {

using json = nlohmann::json;

namespace {

Reply json_reply(int status, const json& body) {
    Reply reply;
    reply.status = status;
    reply.content_type = "application/json";
    reply.body = body.dump();
    reply.headers = cors_headers();
    return reply;
}

// Upstream success bodies must be JSON; anything else is a gateway error.
json parse_upstream_body(const UpstreamReply& reply) {
    try {
        return json::parse(reply.body);
    } catch (const json::exception&) {
        throw UpstreamError(UpstreamErrorKind::Fatal, reply.status,
                            "Unexpected upstream response body: " + truncate(reply.body, 100));
    }
}

void require_target_model(const std::string& model) {
    if (!is_target_model(model)) {
        throw InvalidRequestError("Model not supported",
                                  "Model '" + model + "' is not supported for anti-truncation");
    }
}

long elapsed_ms(std::chrono::steady_clock::time_point start) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

} // namespace

bool is_target_model(const std::string& model) {
    return TARGET_MODELS.count(model) > 0;
}

std::optional<std::string> extract_model(const std::string& path) {
    static const std::regex model_pattern("/models/([^:]+):");
    std::smatch match;
    if (!std::regex_search(path, match, model_pattern)) {
        return std::nullopt;
    }
    return match[1].str();
}

// ========== StreamSession ==========

StreamSession::StreamSession(const UpstreamClient& client, Logger& logger, GenerationRequest request,
                             std::string model, std::string query, size_t channel_capacity)
    : client_(client)
    , logger_(logger)
    , request_(std::move(request))
    , model_(std::move(model))
    , query_(std::move(query))
    , transformer_(logger)
    , channel_(channel_capacity) {}

StreamSession::~StreamSession() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void StreamSession::start() {
    worker_ = std::thread(&StreamSession::run, this);

    std::unique_lock<std::mutex> lock(state_mutex_);
    state_changed_.wait(lock, [this] { return state_ != State::Pending; });
    if (failure_) {
        std::rethrow_exception(failure_);
    }
}

bool StreamSession::next(std::string& chunk) {
    return channel_.pop(chunk);
}

void StreamSession::cancel() {
    channel_.close();
}

void StreamSession::set_state(State state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != state) {
        state_ = state;
        state_changed_.notify_all();
    }
}

void StreamSession::run() {
    try {
        client_.stream_generate(request_, model_, query_, [this](const std::string& chunk) {
            set_state(State::Streaming);
            std::string out = transformer_.transform(chunk);
            if (out.empty()) {
                return !channel_.closed();
            }
            return channel_.push(std::move(out));
        });

        std::string tail = transformer_.finish();
        if (!tail.empty()) {
            channel_.push(std::move(tail));
        }
    } catch (const std::exception& e) {
        bool delivered = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ == State::Pending) {
                failure_ = std::current_exception();
            } else {
                delivered = true;
            }
        }
        if (delivered) {
            logger_.error("Gemini stream for " + model_ + " ended with error: " + e.what());
            // A partial line held by the transformer still reaches the client.
            std::string tail = transformer_.finish();
            if (!tail.empty()) {
                channel_.push(std::move(tail));
            }
        }
    }

    channel_.close();
    set_state(State::Finished);
}

// ========== AntiTruncationHandler ==========

AntiTruncationHandler::AntiTruncationHandler(const UpstreamClient& client, Logger& logger,
                                             const ErrorResponder& responder, size_t channel_capacity)
    : client_(client)
    , logger_(logger)
    , responder_(responder)
    , channel_capacity_(channel_capacity) {}

Reply AntiTruncationHandler::handle(const std::string& path, const std::string& query,
                                    const std::string& body) const {
    auto model = extract_model(path);
    if (!model) {
        return responder_.make("Invalid model path", 400,
                               std::string("Expected format: ") + SPECIAL_PATH_PREFIX +
                               "/v1beta/models/{model}:generateContent");
    }
    if (!is_target_model(*model)) {
        return responder_.make("Model not supported", 400,
                               "Model '" + *model + "' is not supported for anti-truncation");
    }

    GenerationRequest request;
    try {
        request = GenerationRequest::from_json(json::parse(body));
    } catch (const json::exception& e) {
        return responder_.make("Invalid request body", 400, std::string(e.what()));
    } catch (const InvalidRequestError& e) {
        return responder_.make("Invalid request body", 400, std::string(e.what()));
    }

    if (path.find("streamGenerateContent") != std::string::npos) {
        return stream(request, *model, query);
    }
    return generate(request, *model, query);
}

Reply AntiTruncationHandler::generate(const GenerationRequest& request, const std::string& model,
                                      const std::string& query) const {
    auto start = std::chrono::steady_clock::now();
    try {
        require_target_model(model);

        GenerationRequest augmented = augment_request(request);
        UpstreamReply first = client_.generate(augmented, model, query);
        json first_json = parse_upstream_body(first);
        GenerationResponse first_response = GenerationResponse::from_json(first_json);

        if (is_response_complete(first_response)) {
            logger_.request("GEMINI-ANTI", model, client_.build_url(model, "generateContent", query),
                            first.status);
            return json_reply(first.status, strip_markers(first_response).to_json());
        }

        logger_.debug("Handling incomplete response for " + model + ", attempting continuation");
        try {
            GenerationRequest continuation = build_continuation_request(first_response, augmented);
            UpstreamReply second = client_.generate(continuation, model, query);
            GenerationResponse second_response = GenerationResponse::from_json(parse_upstream_body(second));
            GenerationResponse combined = strip_markers(combine_responses(first_response, second_response));

            logger_.request("GEMINI-ANTI", model, client_.build_url(model, "generateContent", query),
                            second.status);
            return json_reply(second.status, combined.to_json());
        } catch (const std::exception& e) {
            logger_.error("Continuation failed for " + model + ", returning partial response: " + e.what());
            return json_reply(200, first_json);
        }
    } catch (const std::exception&) {
        return failure_reply("Gemini request failed", start);
    }
}

Reply AntiTruncationHandler::stream(const GenerationRequest& request, const std::string& model,
                                    const std::string& query) const {
    auto start = std::chrono::steady_clock::now();
    try {
        require_target_model(model);

        auto session = std::make_shared<StreamSession>(client_, logger_, augment_request(request),
                                                       model, query, channel_capacity_);
        session->start();

        logger_.request("GEMINI-ANTI-STREAM", model,
                        client_.build_url(model, "streamGenerateContent", query), 200);

        Reply reply;
        reply.status = 200;
        reply.content_type = "text/event-stream";
        reply.headers = cors_headers();
        reply.headers.emplace_back("Cache-Control", "no-cache");
        reply.headers.emplace_back("Connection", "keep-alive");
        reply.stream = session;
        return reply;
    } catch (const std::exception&) {
        return failure_reply("Gemini streaming failed", start);
    }
}

Reply AntiTruncationHandler::failure_reply(const std::string& summary,
                                           std::chrono::steady_clock::time_point start) const {
    std::string duration = " (" + std::to_string(elapsed_ms(start)) + "ms)";
    try {
        throw;
    } catch (const InvalidRequestError& e) {
        std::optional<std::string> details;
        if (!e.details().empty()) {
            details = e.details();
        }
        return responder_.make(e.what(), 400, details);
    } catch (const UpstreamError& e) {
        logger_.error(summary + ": " + e.what());
        int status = 502;
        std::string message = summary;
        switch (e.kind()) {
            case UpstreamErrorKind::Fatal:
                status = 502;
                break;
            case UpstreamErrorKind::Exhausted:
                status = 503;
                break;
            case UpstreamErrorKind::Transient: {
                ErrorClassification classification = classify_error(e.what());
                status = classification.status;
                message = classification.message;
                break;
            }
        }
        return responder_.make(message, status, std::string(e.what()) + duration);
    } catch (const ConfigurationError& e) {
        logger_.error(summary + ": " + e.what());
        return responder_.make(summary, 500, std::string(e.what()) + duration);
    } catch (const std::exception& e) {
        logger_.error(summary + ": " + e.what());
        return responder_.make("Internal server error", 500, std::string(e.what()) + duration);
    }
}

} // namespace relay::gemini

#pragma once

/**
 * Anti-truncation request handling for /api/gemini-anti.
 *
 * Non-streaming calls are augmented with the completion mandate, checked
 * for the finished marker and, when cut off, continued once and merged.
 * Streaming calls are augmented and piped through StreamTransformer.
 */

#include "types.hpp"
#include "upstream_client.hpp"
#include "stream_transformer.hpp"
#include "../chunk_channel.hpp"
#include "../errors.hpp"
#include "../http_types.hpp"
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace relay {
class Logger;
}

namespace relay::gemini {

// True if the protocol is enabled for `model`.
bool is_target_model(const std::string& model);

// Extracts the model from ".../models/{model}:{method}".
std::optional<std::string> extract_model(const std::string& path);

/**
 * Runs one upstream streaming call on a worker thread and exposes the
 * cleaned event stream as a ReplyStream.
 */
class StreamSession : public ReplyStream {
public:
    StreamSession(const UpstreamClient& client, Logger& logger, GenerationRequest request,
                  std::string model, std::string query, size_t channel_capacity);
    ~StreamSession() override;

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    // Starts the worker and blocks until the first body chunk of a successful
    // upstream response arrives or the upstream call ends. No reply headers
    // go out before that point. Rethrows the upstream failure if nothing was
    // delivered.
    void start();

    bool next(std::string& chunk) override;
    void cancel() override;

private:
    enum class State { Pending, Streaming, Finished };

    const UpstreamClient& client_;
    Logger& logger_;
    GenerationRequest request_;
    std::string model_;
    std::string query_;
    StreamTransformer transformer_;
    ChunkChannel channel_;
    std::thread worker_;

    std::mutex state_mutex_;
    std::condition_variable state_changed_;
    State state_ = State::Pending;
    std::exception_ptr failure_;

    void run();
    void set_state(State state);
};

class AntiTruncationHandler {
public:
    AntiTruncationHandler(const UpstreamClient& client, Logger& logger, const ErrorResponder& responder,
                          size_t channel_capacity);

    // Entry point for a request under the special path prefix.
    Reply handle(const std::string& path, const std::string& query, const std::string& body) const;

    // Non-streaming protocol.
    Reply generate(const GenerationRequest& request, const std::string& model,
                   const std::string& query) const;

    // Streaming protocol.
    Reply stream(const GenerationRequest& request, const std::string& model,
                 const std::string& query) const;

private:
    const UpstreamClient& client_;
    Logger& logger_;
    const ErrorResponder& responder_;
    size_t channel_capacity_;

    // Maps the active exception to an error reply. Call only from a catch block.
    Reply failure_reply(const std::string& summary, std::chrono::steady_clock::time_point start) const;
};

} // namespace relay::gemini

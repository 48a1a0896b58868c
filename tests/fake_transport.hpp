#pragma once

#include "errors.hpp"
#include "http_transport.hpp"
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Scripted HttpTransport. Each call consumes the next step; every request
// is recorded for inspection.
class FakeTransport : public relay::HttpTransport {
public:
    struct Step {
        int status = 200;
        relay::HeaderList headers;
        std::vector<std::string> chunks;  // Body, split the way it should arrive.
        std::optional<relay::TransportFailure> failure;
        std::string failure_message;
    };

    void push_response(int status, const std::string& body, relay::HeaderList headers = {}) {
        Step step;
        step.status = status;
        step.headers = std::move(headers);
        step.chunks.push_back(body);
        push(std::move(step));
    }

    void push_stream(int status, std::vector<std::string> chunks) {
        Step step;
        step.status = status;
        step.chunks = std::move(chunks);
        push(std::move(step));
    }

    void push_error(relay::TransportFailure kind, const std::string& message) {
        Step step;
        step.failure = kind;
        step.failure_message = message;
        push(std::move(step));
    }

    // Delivers `chunks` and then fails, as a connection dropping mid-stream.
    void push_broken_stream(std::vector<std::string> chunks, relay::TransportFailure kind,
                            const std::string& message) {
        Step step;
        step.chunks = std::move(chunks);
        step.failure = kind;
        step.failure_message = message;
        push(std::move(step));
    }

    relay::HttpResponse send(const relay::HttpRequest& request) override {
        Step step = next(request);
        if (step.failure) {
            throw relay::TransportError(*step.failure, step.failure_message);
        }
        relay::HttpResponse response;
        response.status = step.status;
        response.headers = step.headers;
        for (const auto& chunk : step.chunks) {
            response.body += chunk;
        }
        return response;
    }

    relay::HttpResponse stream(const relay::HttpRequest& request,
                               const relay::ChunkCallback& on_chunk) override {
        Step step = next(request);
        relay::HttpResponse response;
        response.status = step.status;
        response.headers = step.headers;

        if (step.status >= 400) {
            for (const auto& chunk : step.chunks) {
                response.body += chunk;
            }
            return response;
        }

        for (const auto& chunk : step.chunks) {
            if (!on_chunk(chunk)) {
                return response;
            }
        }
        if (step.failure) {
            throw relay::TransportError(*step.failure, step.failure_message);
        }
        return response;
    }

    std::vector<relay::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    size_t remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return steps_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Step> steps_;
    std::vector<relay::HttpRequest> requests_;

    void push(Step step) {
        std::lock_guard<std::mutex> lock(mutex_);
        steps_.push_back(std::move(step));
    }

    Step next(const relay::HttpRequest& request) {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (steps_.empty()) {
            throw std::logic_error("FakeTransport: no scripted step for " + request.url);
        }
        Step step = std::move(steps_.front());
        steps_.pop_front();
        return step;
    }
};

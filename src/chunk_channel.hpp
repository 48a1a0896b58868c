#pragma once

/**
 * Bounded blocking queue of body chunks between a producer thread (the
 * upstream transfer) and the thread writing the downstream response.
 *
 * push() blocks while the queue is full, so a slow client slows down the
 * upstream read. Closing wakes both sides: push() then fails, pop() drains
 * what is left and then reports end of stream.
 */

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>

namespace relay {

class ChunkChannel {
public:
    explicit ChunkChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // Returns false if the channel was closed.
    bool push(std::string chunk) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(chunk));
        not_empty_.notify_one();
        return true;
    }

    // Returns false once the channel is closed and empty.
    bool pop(std::string& chunk) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return false;
        }
        chunk = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<std::string> queue_;
    bool closed_ = false;
};

} // namespace relay

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file channel.hpp
 * @brief Closeable hand-off channel between threads
 */

#ifndef PARCP_CHANNEL_HPP
#define PARCP_CHANNEL_HPP

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace parcp {

/**
 * Multi-producer multi-consumer channel
 *
 * With capacity 0 the channel is unbuffered: send() returns only once a
 * receiver has taken the value, so a producer runs at most one item ahead of
 * its consumers. With capacity N, send() blocks while N items are queued.
 *
 * close() wakes every blocked sender and receiver. Items already queued are
 * still delivered; receive() returns std::nullopt only when the channel is
 * closed and empty.
 *
 * @tparam T Value type (must be movable)
 */
template <typename T> class Channel {
  public:
    explicit Channel(size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel &) = delete;
    Channel &operator=(const Channel &) = delete;

    /**
     * Send a value, blocking for space (or for a receiver when unbuffered)
     *
     * @param value Value to send
     * @return false if the channel was closed before the value was queued
     */
    bool send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        const size_t limit = std::max<size_t>(capacity_, 1);
        space_.wait(lock, [&] { return closed_ || queue_.size() < limit; });
        if (closed_) return false;

        queue_.push_back(std::move(value));
        const uint64_t ticket = ++pushed_;
        ready_.notify_one();

        if (capacity_ == 0) {
            space_.wait(lock, [&] { return popped_ >= ticket || closed_; });
        }
        return true;
    }

    /**
     * Receive the next value, blocking until one is available
     *
     * @return The value, or std::nullopt once closed and drained
     */
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [&] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;

        std::optional<T> value(std::move(queue_.front()));
        queue_.pop_front();
        ++popped_;
        space_.notify_all();
        return value;
    }

    /// Close the channel. Further sends fail; calling again is a no-op.
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        ready_.notify_all();
        space_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

  private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable ready_; // queue non-empty or closed
    std::condition_variable space_; // room in queue, item taken, or closed
    std::deque<T> queue_;
    uint64_t pushed_ = 0;
    uint64_t popped_ = 0;
    bool closed_ = false;
};

} // namespace parcp

#endif // PARCP_CHANNEL_HPP

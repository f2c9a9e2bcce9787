// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace surge::core {

// Unbounded multi-producer / single-consumer message channel
template<typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false once the channel is closed
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    // Block until a value arrives, the channel closes, or stop is requested
    [[nodiscard]] std::optional<T> pop(std::stop_token stoken) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, stoken, [this] { return !items_.empty() || closed_; });
        return take_locked();
    }

    [[nodiscard]] std::optional<T> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        return take_locked();
    }

    [[nodiscard]] std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    std::optional<T> take_locked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    std::deque<T> items_;
    bool closed_{false};
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

} // namespace surge::core

#pragma once

#include "session.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

// Single-producer / single-consumer queue between two pipeline stages.
// An empty optional in the queue is the end-of-stream sentinel.
template <typename T>
class BoundedQueue {
public:
    enum class PopStatus { Item, EndOfStream, Timeout };

    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) throw std::invalid_argument("queue capacity must be positive");
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Blocks while full. Returns false (item dropped) once the token fires.
    bool push(T item, const CancellationToken& cancel,
              std::chrono::milliseconds poll = std::chrono::milliseconds(100)) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (items_.size() >= capacity_) {
            if (cancel.cancelled()) return false;
            not_full_.wait_for(lock, poll);
        }
        if (cancel.cancelled()) return false;
        items_.emplace_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    // Enqueues the sentinel even when the queue is full so the consumer
    // never blocks forever.
    void push_end() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.emplace_back(std::nullopt);
        }
        not_empty_.notify_one();
    }

    PopStatus pop(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return !items_.empty(); }))
            return PopStatus::Timeout;

        std::optional<T> front = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();

        if (!front) return PopStatus::EndOfStream;
        out = std::move(*front);
        return PopStatus::Item;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::deque<std::optional<T>> items_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace voxturn {

/**
 * Blocking FIFO with a fixed capacity.
 * push() waits while the queue is full, so a fast producer is throttled by a
 * slow consumer instead of dropping data. close() wakes everybody: pending
 * items can still be popped, further pushes are refused.
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

    // Returns false if the queue was closed before the item could be queued.
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) return false;
        items_.push(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Blocks until an item is available. Returns false once closed and drained.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return takeLocked(out);
    }

    bool pop(T& out, int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                 [this] { return closed_ || !items_.empty(); })) {
            return false;
        }
        return takeLocked(out);
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

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    bool takeLocked(T& out) {
        if (items_.empty()) return false;
        out = std::move(items_.front());
        items_.pop();
        not_full_.notify_one();
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::queue<T> items_;
    size_t capacity_;
    bool closed_ = false;
};

} // namespace voxturn

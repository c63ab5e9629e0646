// Bounded blocking queue used as the channel between relay threads.
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace relay {

// Producers block while the queue is full. interruptProducers() wakes and rejects them
// without closing the consumer side; close() then lets consumers drain what is left.
template <typename T>
class BoundedQueue {
   public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Returns false once producers are interrupted or the queue is closed.
    bool push(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, [this]() {
            return interrupted_ || closed_ || items_.size() < capacity_;
        });
        if (interrupted_ || closed_) {
            return false;
        }
        items_.push_back(std::move(value));
        notEmpty_.notify_one();
        return true;
    }

    // Non-blocking push. Returns false when full, interrupted or closed.
    bool tryPush(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (interrupted_ || closed_ || items_.size() >= capacity_) {
            return false;
        }
        items_.push_back(std::move(value));
        notEmpty_.notify_one();
        return true;
    }

    // Blocks until an item is available. Returns false once closed and drained.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        notFull_.notify_one();
        return true;
    }

    // Like pop, but gives up after timeout or once producers are interrupted.
    bool popFor(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait_for(lock, timeout,
                           [this]() { return closed_ || interrupted_ || !items_.empty(); });
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        notFull_.notify_one();
        return true;
    }

    void interruptProducers() {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
        notFull_.notify_all();
        notEmpty_.notify_all();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        notFull_.notify_all();
        notEmpty_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

   private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notFull_;
    std::condition_variable notEmpty_;
    std::deque<T> items_;
    bool interrupted_ = false;
    bool closed_ = false;
};

}  // namespace relay

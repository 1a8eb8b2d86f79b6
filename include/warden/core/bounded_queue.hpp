#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace warden::core {

// Multi-producer / single-consumer queue. Producers on periodic paths use
// TryPush and lose the item when the queue is full; ForcePush ignores the
// capacity and is reserved for completions that must never be dropped.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

    bool TryPush(T item) {
        {
            std::scoped_lock lk(mu_);
            if (items_.size() >= capacity_) { ++dropped_; return false; }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    void ForcePush(T item) {
        {
            std::scoped_lock lk(mu_);
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    // Blocks until an item is available or the timeout expires
    bool WaitFor(std::chrono::milliseconds timeout) {
        std::unique_lock lk(mu_);
        return cv_.wait_for(lk, timeout, [&]{ return !items_.empty() || woken_; })
               && !items_.empty();
    }

    std::optional<T> TryPop() {
        std::scoped_lock lk(mu_);
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::deque<T> Drain() {
        std::scoped_lock lk(mu_);
        std::deque<T> out;
        out.swap(items_);
        woken_ = false;
        return out;
    }

    // Releases a consumer blocked in WaitFor (used on shutdown)
    void Wake() {
        {
            std::scoped_lock lk(mu_);
            woken_ = true;
        }
        cv_.notify_all();
    }

    std::size_t Size() const {
        std::scoped_lock lk(mu_);
        return items_.size();
    }

    std::size_t Dropped() const {
        std::scoped_lock lk(mu_);
        return dropped_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> items_;
    std::size_t dropped_{0};
    bool woken_{false};
};

} // namespace warden::core

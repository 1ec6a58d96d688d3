#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace jugsync::ipc {

enum class PushResult {
    Ok,
    DroppedOldest,
    Full,
};

// Bounded multi-producer queue with a drop-oldest overflow policy. Producers
// never block; the consumer drains in push order.
template <typename T>
class SampleQueue {
public:
    explicit SampleQueue(std::size_t capacity)
        : capacity_(capacity) {}

    bool valid() const { return capacity_ >= 1; }
    std::size_t capacity() const { return capacity_; }

    PushResult pushDropOldest(T value) {
        if (!valid()) {
            return PushResult::Full;
        }

        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.size() >= capacity_) {
                items_.pop_front();
                dropped = true;
                dropped_ += 1;
            }
            items_.push_back(std::move(value));
            pushed_ += 1;
        }
        cv_.notify_one();
        return dropped ? PushResult::DroppedOldest : PushResult::Ok;
    }

    bool pop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        return takeAllLocked();
    }

    // Blocks until at least one item is queued, the timeout elapses or
    // wakeAll() is called.
    std::vector<T> waitAndDrain(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        const uint64_t wake_epoch = wake_epoch_;
        cv_.wait_for(lock, timeout, [&] { return !items_.empty() || wake_epoch_ != wake_epoch; });
        return takeAllLocked();
    }

    void wakeAll() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            wake_epoch_ += 1;
        }
        cv_.notify_all();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    uint64_t dropCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    uint64_t pushCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pushed_;
    }

private:
    std::vector<T> takeAllLocked() {
        std::vector<T> out;
        out.reserve(items_.size());
        for (auto& item : items_) {
            out.push_back(std::move(item));
        }
        items_.clear();
        return out;
    }

    std::size_t capacity_{0};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    uint64_t pushed_{0};
    uint64_t dropped_{0};
    uint64_t wake_epoch_{0};
};

}  // namespace jugsync::ipc

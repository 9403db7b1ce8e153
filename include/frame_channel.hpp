#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

enum class ReceiveStatus { Item, Timeout, Closed };

// Bounded queue between the capture thread and the consumer. try_send never
// blocks: a full queue, a closed queue or a contended lock drop the item and
// bump dropped().
template <typename T>
class FrameChannel {
public:
    explicit FrameChannel(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

    bool try_send(T&& item) {
        std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
        if (!lock.owns_lock() || closed_ || pending_.size() >= capacity_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        pending_.push_back(std::move(item));
        lock.unlock();
        cv_.notify_one();
        return true;
    }

    // Queued items are still delivered after close(); Closed is reported once
    // the queue is empty.
    ReceiveStatus receive(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [&] { return !pending_.empty() || closed_; })) {
            return ReceiveStatus::Timeout;
        }
        if (pending_.empty()) return ReceiveStatus::Closed;

        out = std::move(pending_.front());
        pending_.pop_front();
        return ReceiveStatus::Item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    std::size_t capacity() const { return capacity_; }
    std::size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> pending_;
    bool closed_{false};
    std::atomic<std::size_t> dropped_{0};
};

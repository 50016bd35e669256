#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace rh {

// Multi-producer queue with a fixed capacity. Producers never block: a push onto a
// full queue drops the oldest element (recency over completeness). Consumers may
// poll or wait with a timeout. close() wakes every waiter; queued elements remain
// poppable after close.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Returns false when the queue is closed. *dropped_oldest reports an overflow drop.
    bool push(T value, bool* dropped_oldest = nullptr) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (closed_) return false;
            if (items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_count_;
                dropped = true;
            }
            items_.push_back(std::move(value));
        }
        if (dropped_oldest) *dropped_oldest = dropped;
        cv_.notify_one();
        return true;
    }

    bool tryPop(T* out) {
        std::lock_guard<std::mutex> lock(mu_);
        if (items_.empty()) return false;
        if (out) *out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    // Waits up to timeout_s. Returns false on timeout, or when closed and empty.
    bool popFor(T* out, double timeout_s) {
        std::unique_lock<std::mutex> lock(mu_);
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                  std::chrono::duration<double>(timeout_s > 0.0 ? timeout_s : 0.0));
        cv_.wait_until(lock, deadline, [&] { return closed_ || !items_.empty(); });
        if (items_.empty()) return false;
        if (out) *out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    // Removes and returns everything currently queued, oldest first.
    std::vector<T> drainAll() {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<T> out;
        out.reserve(items_.size());
        for (auto& v : items_) out.push_back(std::move(v));
        items_.clear();
        return out;
    }

    // Copy of the queued elements, oldest first.
    std::vector<T> snapshot() const {
        std::lock_guard<std::mutex> lock(mu_);
        return std::vector<T>(items_.begin(), items_.end());
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mu_);
        items_.clear();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Re-opens a closed queue (used when a pipeline restarts).
    void reopen() {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = false;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mu_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return items_.size();
    }

    std::size_t capacity() const noexcept { return capacity_; }

    std::uint64_t droppedCount() const {
        std::lock_guard<std::mutex> lock(mu_);
        return dropped_count_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
    std::uint64_t dropped_count_ = 0;
};

} // namespace rh

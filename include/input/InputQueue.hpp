#pragma once
#include "input/KeyEvent.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

// Bounded FIFO between the input poller thread and the frame loop.
// The producer never blocks: when full, either the oldest queued event
// or the incoming one is dropped.
class InputQueue {
public:
    enum class DropPolicy {
        DropOldest,
        DropNewest
    };

    explicit InputQueue(size_t capacity = 100,
                        DropPolicy policy = DropPolicy::DropOldest)
        : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

    // Returns false if an event was dropped to make this push fit
    bool push(const KeyEvent& ev) {
        std::lock_guard lock(mtx_);
        bool dropped = false;
        if (events_.size() >= capacity_) {
            dropped = true;
            dropped_++;
            if (policy_ == DropPolicy::DropNewest)
                return false;
            events_.pop_front();
        }
        events_.push_back(ev);
        cv_.notify_one();
        return !dropped;
    }

    // Everything queued, in arrival order
    std::vector<KeyEvent> drain() {
        std::lock_guard lock(mtx_);
        std::vector<KeyEvent> out(events_.begin(), events_.end());
        events_.clear();
        return out;
    }

    bool tryPop(KeyEvent& out) {
        std::lock_guard lock(mtx_);
        if (events_.empty()) return false;
        out = events_.front();
        events_.pop_front();
        return true;
    }

    // Blocks until an event arrives or the timeout passes
    bool waitFor(int timeoutMs) {
        std::unique_lock lock(mtx_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                            [this] { return !events_.empty(); });
    }

    size_t size() const {
        std::lock_guard lock(mtx_);
        return events_.size();
    }

    size_t capacity() const { return capacity_; }

    DropPolicy policy() const {
        std::lock_guard lock(mtx_);
        return policy_;
    }

    // Total events dropped since construction
    size_t droppedCount() const {
        std::lock_guard lock(mtx_);
        return dropped_;
    }

    // Drop counter since the last call; the frame loop logs this
    size_t takeDroppedSinceLast() {
        std::lock_guard lock(mtx_);
        size_t n = dropped_ - reported_;
        reported_ = dropped_;
        return n;
    }

private:
    const size_t capacity_;
    DropPolicy policy_;
    std::deque<KeyEvent> events_;
    size_t dropped_  = 0;
    size_t reported_ = 0;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

#pragma once
#include "session/SessionEvent.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// Hand-off of hook events from the receiving side to the session monitor.
// Any number of producers, one consumer.
class EventChannel {
public:
    explicit EventChannel(size_t capacity = 256) : capacity_(capacity) {}

    // Returns false once closed. Drops the oldest event when full.
    bool push(SessionEvent ev) {
        {
            std::lock_guard lock(mtx_);
            if (closed_) return false;
            events_.push_back(std::move(ev));
            while (events_.size() > capacity_)
                events_.pop_front();
        }
        cv_.notify_one();
        return true;
    }

    // Waits up to timeoutMs for an event. nullopt on timeout or once
    // closed and drained.
    std::optional<SessionEvent> pop(int timeoutMs) {
        std::unique_lock lock(mtx_);
        cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                     [this] { return !events_.empty() || closed_; });
        if (events_.empty()) return std::nullopt;
        SessionEvent ev = std::move(events_.front());
        events_.pop_front();
        return ev;
    }

    void close() {
        {
            std::lock_guard lock(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard lock(mtx_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard lock(mtx_);
        return events_.size();
    }

private:
    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    std::deque<SessionEvent> events_;
    size_t capacity_;
    bool   closed_ = false;
};

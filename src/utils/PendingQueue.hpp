#pragma once

#include <chrono>
#include <condition_variable>
#include <vector>
#include <mutex>
#include <iterator>
#include <utility>
#include <cstddef>

// Multi-producer queue drained by a single consumer. Workers push finished
// items; the consumer drains everything that is ready, optionally waiting for
// the first item to arrive.
template <typename T>
class PendingQueue {
public:
    void push(T&& item) {
        {
            std::lock_guard<std::mutex> lock(m_);
            q_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    void drain(std::vector<T>& out) {
        std::lock_guard<std::mutex> lock(m_);
        drainLocked(out);
    }

    // Waits until at least one item is queued or the timeout expires.
    // Returns false on timeout with nothing drained.
    template <typename Rep, typename Period>
    bool waitDrain(std::vector<T>& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(m_);
        if (!cv_.wait_for(lock, timeout, [this] { return !q_.empty(); }))
            return false;
        drainLocked(out);
        return true;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_);
        return q_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_);
        return q_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_);
        q_.clear();
    }

private:
    void drainLocked(std::vector<T>& out) {
        out.insert(out.end(), std::make_move_iterator(q_.begin()), std::make_move_iterator(q_.end()));
        q_.clear();
    }

    mutable std::mutex m_;
    std::condition_variable cv_;
    std::vector<T> q_;
};

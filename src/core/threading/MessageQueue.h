// =============================================================================
// Runnel - Message Queue
// =============================================================================
// Unbounded FIFO for handing move-only messages between threads.
// Any number of producers, one consumer. Producers never block on the
// consumer; the consumer may block with an optional deadline.
// =============================================================================

#pragma once

#include "../Types.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

namespace Runnel {

template<typename T>
class MessageQueue : public NonCopyable {
public:
    using Clock = std::chrono::steady_clock;

    MessageQueue() = default;
    ~MessageQueue() = default;

    // Returns false if the queue has been closed (message is dropped)
    bool push(T&& message) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            m_queue.push_back(std::move(message));
        }
        m_cv.notify_one();
        return true;
    }

    bool tryPop(T& out) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return false;
        }
        out = std::move(m_queue.front());
        m_queue.pop_front();
        return true;
    }

    // Move all pending messages into out, in arrival order
    usize popAll(std::vector<T>& out) {
        std::lock_guard<std::mutex> lock(m_mutex);
        usize count = m_queue.size();
        out.insert(out.end(),
                   std::make_move_iterator(m_queue.begin()),
                   std::make_move_iterator(m_queue.end()));
        m_queue.clear();
        return count;
    }

    // Blocks until a message is available or the queue is closed.
    // Messages pushed before close() are still delivered.
    bool waitPop(T& out) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this]() { return m_closed || !m_queue.empty(); });
        return popLocked(out);
    }

    // Same as waitPop() but gives up at deadline
    bool waitPopUntil(T& out, Clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_until(lock, deadline, [this]() { return m_closed || !m_queue.empty(); });
        return popLocked(out);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    usize size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

private:
    bool popLocked(T& out) {
        if (m_queue.empty()) {
            return false;
        }
        out = std::move(m_queue.front());
        m_queue.pop_front();
        return true;
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<T> m_queue;
    bool m_closed = false;
};

} // namespace Runnel

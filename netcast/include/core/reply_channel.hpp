#ifndef NETCAST_REPLY_CHANNEL_HPP
#define NETCAST_REPLY_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

// Multi-producer queue. Consumers that need to merge in arrival order
// serialize tryPop themselves. When full, the oldest entry is dropped.
template <typename T> class ReplyChannel {
public:
    explicit ReplyChannel(size_t maxQueueSize = 256) : m_maxQueueSize(maxQueueSize) {}

    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_queue.push_back(std::move(item));

            while (m_queue.size() > m_maxQueueSize) {
                m_queue.pop_front();
            }
        }
        m_cond.notify_one();
    }

    // Waits until an item is queued or the deadline passes, without taking it.
    bool waitUntil(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cond.wait_until(lock, deadline, [this]() { return !m_queue.empty(); });
    }

    bool tryPop(T& out) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) return false;
        out = std::move(m_queue.front());
        m_queue.pop_front();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

private:
    std::deque<T> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    size_t m_maxQueueSize;
};

#endif

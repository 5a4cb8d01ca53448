#ifndef NETCAST_READY_EVENT_HPP
#define NETCAST_READY_EVENT_HPP

#include <condition_variable>
#include <mutex>

// Latch that is set once and stays set.
class ReadyEvent {
public:
    void set() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_set = true;
        }
        m_cond.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cond.wait(lock, [this]() { return m_set; });
    }

    bool isSet() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_set;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    bool m_set = false;
};

#endif

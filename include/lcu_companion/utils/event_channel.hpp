#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace lcu_companion::utils {

// Unbounded multi-producer FIFO. After close() producers are refused while
// consumers still drain whatever was queued before it.
template<typename T>
class EventChannel {
public:
    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    // Returns false once the channel is closed
    bool push(T value) {
        {
            std::lock_guard lock(m_mutex);
            if (m_closed) {
                return false;
            }
            m_queue.push_back(std::move(value));
        }
        m_condition.notify_one();
        return true;
    }

    // Blocks until a value arrives, the channel is closed and drained, or
    // stop is requested
    std::optional<T> pop(std::stop_token stop_token = {}) {
        std::unique_lock lock(m_mutex);
        m_condition.wait(lock, stop_token, [this] {
            return !m_queue.empty() || m_closed;
        });

        if (m_queue.empty()) {
            return std::nullopt;
        }

        T value = std::move(m_queue.front());
        m_queue.pop_front();
        return value;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(m_mutex);
        if (m_queue.empty()) {
            return std::nullopt;
        }

        T value = std::move(m_queue.front());
        m_queue.pop_front();
        return value;
    }

    void close() {
        {
            std::lock_guard lock(m_mutex);
            m_closed = true;
        }
        m_condition.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard lock(m_mutex);
        return m_closed;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(m_mutex);
        return m_queue.size();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable_any m_condition;
    std::deque<T> m_queue;
    bool m_closed = false;
};

} // namespace lcu_companion::utils

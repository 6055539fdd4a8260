#pragma once

#include "lcu_companion/utils/threading.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace lcu_companion::core {

// Publish/subscribe hub keyed by event type. publish() runs the handlers on
// the calling thread in subscription order; publish_async() hands a copy of
// the event to the attached pool. A handler that throws is logged and does
// not stop the others.
class EventBus : public std::enable_shared_from_this<EventBus> {
public:
    using HandlerId = std::size_t;

    explicit EventBus(std::shared_ptr<utils::ThreadPool> executor = nullptr);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Later publish_async calls are dropped
    void shutdown();

    template<typename Event>
    HandlerId subscribe(std::function<void(const Event&)> handler) {
        return add_handler(typeid(Event), [handler = std::move(handler)](const void* event) {
            handler(*static_cast<const Event*>(event));
        });
    }

    template<typename Event>
    void publish(const Event& event) {
        dispatch(typeid(Event), &event);
    }

    // Synchronous when no executor is attached. Requires the bus to be owned
    // by a shared_ptr when an executor is present.
    template<typename Event>
    void publish_async(const Event& event) {
        if (m_stopped) {
            return;
        }
        if (!m_executor) {
            publish(event);
            return;
        }

        auto queued = m_executor->try_submit(
            [self = shared_from_this(), copy = std::make_shared<const Event>(event)] {
                if (!self->m_stopped) {
                    self->publish(*copy);
                }
            });
        if (!queued) {
            report_dropped(typeid(Event), queued.error());
        }
    }

    void unsubscribe(HandlerId id);
    void clear();

    template<typename Event>
    std::size_t subscriber_count() const {
        return count(typeid(Event));
    }

private:
    using ErasedHandler = std::function<void(const void*)>;

    struct Subscription {
        HandlerId id;
        ErasedHandler handler;
    };

    HandlerId add_handler(std::type_index type, ErasedHandler handler);
    void dispatch(std::type_index type, const void* event) const;
    std::size_t count(std::type_index type) const;
    void report_dropped(std::type_index type, utils::ThreadPoolError error) const;

    mutable std::mutex m_mutex;
    std::unordered_map<std::type_index, std::vector<Subscription>> m_subscriptions;
    HandlerId m_last_id = 0;
    std::atomic<bool> m_stopped{false};
    std::shared_ptr<utils::ThreadPool> m_executor;
};

} // namespace lcu_companion::core

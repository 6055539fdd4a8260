#include "lcu_companion/core/event_bus.hpp"
#include "lcu_companion/utils/logger.hpp"

#include <algorithm>

namespace lcu_companion::core {

EventBus::EventBus(std::shared_ptr<utils::ThreadPool> executor)
    : m_executor(std::move(executor)) {}

EventBus::~EventBus() {
    shutdown();
}

void EventBus::shutdown() {
    m_stopped = true;
}

EventBus::HandlerId EventBus::add_handler(std::type_index type, ErasedHandler handler) {
    std::lock_guard lock(m_mutex);
    const HandlerId id = ++m_last_id;
    m_subscriptions[type].push_back(Subscription{id, std::move(handler)});
    return id;
}

void EventBus::dispatch(std::type_index type, const void* event) const {
    // Handlers may subscribe or unsubscribe, so run them on a snapshot
    std::vector<ErasedHandler> handlers;
    {
        std::lock_guard lock(m_mutex);
        const auto it = m_subscriptions.find(type);
        if (it == m_subscriptions.end()) {
            return;
        }
        handlers.reserve(it->second.size());
        for (const auto& subscription : it->second) {
            handlers.push_back(subscription.handler);
        }
    }

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            LCU_LOG_ERROR("EventBus", std::string("Handler for ") + type.name() + " threw: " + e.what());
        }
    }
}

void EventBus::unsubscribe(HandlerId id) {
    std::lock_guard lock(m_mutex);
    for (auto& [type, subscriptions] : m_subscriptions) {
        const auto removed = std::erase_if(subscriptions,
                                           [id](const Subscription& s) { return s.id == id; });
        if (removed > 0) {
            return;
        }
    }
}

void EventBus::clear() {
    std::lock_guard lock(m_mutex);
    m_subscriptions.clear();
}

std::size_t EventBus::count(std::type_index type) const {
    std::lock_guard lock(m_mutex);
    const auto it = m_subscriptions.find(type);
    return it == m_subscriptions.end() ? 0 : it->second.size();
}

void EventBus::report_dropped(std::type_index type, utils::ThreadPoolError error) const {
    LCU_LOG_WARNING("EventBus", std::string("Dropped ") + type.name() + ": " + utils::to_string(error));
}

} // namespace lcu_companion::core

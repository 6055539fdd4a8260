#include "lcu_companion/core/connection_state.hpp"
#include "lcu_companion/utils/logger.hpp"

namespace lcu_companion::core {

ConnectionStateStore::ConnectionStateStore(std::shared_ptr<EventBus> event_bus)
    : m_event_bus(std::move(event_bus)) {}

ConnectionState ConnectionStateStore::snapshot() const {
    std::lock_guard lock(m_mutex);
    return m_state;
}

bool ConnectionStateStore::is_connected() const {
    std::lock_guard lock(m_mutex);
    return m_state.connected;
}

std::optional<GatewayEndpointInfo> ConnectionStateStore::endpoint() const {
    std::lock_guard lock(m_mutex);
    return m_state.endpoint_info;
}

void ConnectionStateStore::apply(const events::ClientLifecycleChanged& event) {
    ConnectionState updated;
    if (event.kind == events::ClientLifecycleChanged::Kind::Connected && event.endpoint_info) {
        updated.connected = true;
        updated.endpoint_info = event.endpoint_info;
    }

    {
        std::lock_guard lock(m_mutex);
        m_state = updated;
    }

    if (updated.connected) {
        // Tokens of an earlier client process are dead by now
        utils::LoggerManager::get_instance().set_secrets({updated.endpoint_info->remoting_token,
                                                          updated.endpoint_info->app_token});
        LCU_LOG_INFO("ConnectionState", "Game client connected (pid " +
                     std::to_string(updated.endpoint_info->pid) + ", region " +
                     updated.endpoint_info->region + ")");
    } else {
        LCU_LOG_INFO("ConnectionState", "Game client disconnected");
    }

    if (m_event_bus) {
        m_event_bus->publish(events::GatewayConnectionChanged{updated.connected, updated.endpoint_info});
    }
}

} // namespace lcu_companion::core

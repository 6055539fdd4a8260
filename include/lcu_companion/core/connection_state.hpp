#pragma once

#include "lcu_companion/core/event_bus.hpp"
#include "lcu_companion/core/events.hpp"
#include "lcu_companion/core/models.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace lcu_companion::core {

// Process-wide view of the game client connection. apply() is the only
// writer and is driven by the lifecycle consumer thread.
class ConnectionStateStore {
public:
    explicit ConnectionStateStore(std::shared_ptr<EventBus> event_bus = nullptr);

    ConnectionStateStore(const ConnectionStateStore&) = delete;
    ConnectionStateStore& operator=(const ConnectionStateStore&) = delete;

    [[nodiscard]] ConnectionState snapshot() const;
    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] std::optional<GatewayEndpointInfo> endpoint() const;

    // Updates the state, then broadcasts GatewayConnectionChanged outside the lock.
    // A Connected event carrying no endpoint is treated as a disconnect.
    void apply(const events::ClientLifecycleChanged& event);

private:
    mutable std::mutex m_mutex;
    ConnectionState m_state;
    std::shared_ptr<EventBus> m_event_bus;
};

} // namespace lcu_companion::core

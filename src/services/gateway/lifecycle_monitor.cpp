#include "lcu_companion/services/gateway/lifecycle_monitor.hpp"
#include "lcu_companion/utils/logger.hpp"

namespace lcu_companion::services {

using core::events::ClientLifecycleChanged;

ClientLifecycleMonitor::ClientLifecycleMonitor(std::unique_ptr<ProcessScanner> scanner,
                                               core::ConnectionStateStore& connection_state,
                                               std::chrono::milliseconds poll_interval)
    : m_scanner(std::move(scanner))
    , m_connection_state(connection_state)
    , m_poll_interval(poll_interval) {}

ClientLifecycleMonitor::~ClientLifecycleMonitor() {
    stop();
}

void ClientLifecycleMonitor::start() {
    if (m_running.exchange(true)) {
        return;
    }
    if (m_channel.is_closed()) {
        LCU_LOG_ERROR("LifecycleMonitor", "Cannot restart a stopped monitor");
        m_running = false;
        return;
    }

    LCU_LOG_INFO("LifecycleMonitor", "Watching for the game client every " +
                 std::to_string(m_poll_interval.count()) + "ms");

    m_consumer = std::jthread([this](std::stop_token token) { consumer_loop(token); });
    m_producer = std::jthread([this](std::stop_token token) { producer_loop(token); });
}

void ClientLifecycleMonitor::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    if (m_producer.joinable()) {
        m_producer.request_stop();
        m_wait_cv.notify_all();
        m_producer.join();
    }

    m_channel.close();
    if (m_consumer.joinable()) {
        m_consumer.join();
    }

    LCU_LOG_INFO("LifecycleMonitor", "Stopped");
}

void ClientLifecycleMonitor::poll_once() {
    std::lock_guard lock(m_scan_mutex);

    auto current = m_scanner->find_client();
    if (current == m_last_seen) {
        return;
    }

    if (current) {
        LCU_LOG_DEBUG("LifecycleMonitor", "Client process found (pid " + std::to_string(current->pid) + ")");
        m_channel.push(ClientLifecycleChanged::connected(*current));
    } else {
        LCU_LOG_DEBUG("LifecycleMonitor", "Client process gone");
        m_channel.push(ClientLifecycleChanged::disconnected());
    }
    m_last_seen = std::move(current);
}

void ClientLifecycleMonitor::producer_loop(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        poll_once();

        std::unique_lock lock(m_wait_mutex);
        m_wait_cv.wait_for(lock, stop_token, m_poll_interval, [] { return false; });
    }
}

void ClientLifecycleMonitor::consumer_loop(std::stop_token) {
    // Ends only once the channel is closed and drained
    while (auto event = m_channel.pop()) {
        m_connection_state.apply(*event);
    }
}

} // namespace lcu_companion::services

#pragma once

#include "lcu_companion/core/connection_state.hpp"
#include "lcu_companion/core/events.hpp"
#include "lcu_companion/services/gateway/process_scanner.hpp"
#include "lcu_companion/utils/event_channel.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace lcu_companion::services {

using LifecycleChannel = utils::EventChannel<core::events::ClientLifecycleChanged>;

// Producer side: polls the scanner and emits Connected/Disconnected on every
// observed change. Consumer side: applies events to the connection state in
// arrival order. Each side owns one thread.
class ClientLifecycleMonitor {
public:
    ClientLifecycleMonitor(std::unique_ptr<ProcessScanner> scanner,
                           core::ConnectionStateStore& connection_state,
                           std::chrono::milliseconds poll_interval);
    ~ClientLifecycleMonitor();

    ClientLifecycleMonitor(const ClientLifecycleMonitor&) = delete;
    ClientLifecycleMonitor& operator=(const ClientLifecycleMonitor&) = delete;

    void start();
    // Closes the channel; the consumer drains queued events before exiting
    void stop();

    [[nodiscard]] bool is_running() const { return m_running.load(); }

    // Runs one scan synchronously; used on startup and by tests
    void poll_once();

private:
    void producer_loop(std::stop_token stop_token);
    void consumer_loop(std::stop_token stop_token);

    std::unique_ptr<ProcessScanner> m_scanner;
    core::ConnectionStateStore& m_connection_state;
    std::chrono::milliseconds m_poll_interval;

    LifecycleChannel m_channel;
    std::optional<core::GatewayEndpointInfo> m_last_seen;
    std::mutex m_scan_mutex;

    std::mutex m_wait_mutex;
    std::condition_variable_any m_wait_cv;

    std::atomic<bool> m_running{false};
    std::jthread m_producer;
    std::jthread m_consumer;
};

} // namespace lcu_companion::services

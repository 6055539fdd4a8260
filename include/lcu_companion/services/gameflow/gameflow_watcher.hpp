#pragma once

#include "lcu_companion/core/config_service.hpp"
#include "lcu_companion/core/connection_state.hpp"
#include "lcu_companion/core/event_bus.hpp"
#include "lcu_companion/core/models.hpp"
#include "lcu_companion/services/dodge/dodge_watch.hpp"
#include "lcu_companion/services/gateway/client_gateway.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace lcu_companion::services {

// Follows the client's gameflow phase while connected and runs the automatic
// actions: ready check accept, stats link on entering champ select, the
// Ivern pick and the dodge watch evaluation.
class GameflowWatcher {
public:
    using ChampSelectCallback = std::function<void()>;

    GameflowWatcher(ClientGateway& gateway,
                    const core::ConnectionStateStore& connection_state,
                    const core::ConfigurationService& config,
                    DodgeWatch& dodge_watch,
                    std::chrono::milliseconds poll_interval,
                    std::shared_ptr<core::EventBus> event_bus = nullptr,
                    ChampSelectCallback on_champ_select = {});
    ~GameflowWatcher();

    GameflowWatcher(const GameflowWatcher&) = delete;
    GameflowWatcher& operator=(const GameflowWatcher&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool is_running() const { return m_running.load(); }

    // One polling step; the background thread calls this every poll interval
    void tick(std::stop_token stop_token = {});

    [[nodiscard]] core::GameflowPhase current_phase() const { return m_phase.load(); }

private:
    void run(std::stop_token stop_token);
    void set_phase(core::GameflowPhase phase);
    void handle_ready_check(std::stop_token stop_token);
    void handle_auto_pick();
    // False when stop was requested during the wait
    bool wait(std::stop_token stop_token, std::chrono::milliseconds duration);

    ClientGateway& m_gateway;
    const core::ConnectionStateStore& m_connection_state;
    const core::ConfigurationService& m_config;
    DodgeWatch& m_dodge_watch;
    std::chrono::milliseconds m_poll_interval;
    std::shared_ptr<core::EventBus> m_event_bus;
    ChampSelectCallback m_on_champ_select;

    std::mutex m_tick_mutex;
    std::atomic<core::GameflowPhase> m_phase{core::GameflowPhase::None};
    bool m_ready_check_handled = false;
    bool m_auto_pick_done = false;

    std::mutex m_wait_mutex;
    std::condition_variable_any m_wait_cv;

    std::atomic<bool> m_running{false};
    std::jthread m_thread;
};

} // namespace lcu_companion::services

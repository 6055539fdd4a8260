#include "lcu_companion/services/gameflow/gameflow_watcher.hpp"
#include "lcu_companion/core/events.hpp"
#include "lcu_companion/services/champ_select/champ_select_session.hpp"
#include "lcu_companion/utils/logger.hpp"

#include <algorithm>

namespace lcu_companion::services {

using core::GameflowPhase;

GameflowWatcher::GameflowWatcher(ClientGateway& gateway,
                                 const core::ConnectionStateStore& connection_state,
                                 const core::ConfigurationService& config,
                                 DodgeWatch& dodge_watch,
                                 std::chrono::milliseconds poll_interval,
                                 std::shared_ptr<core::EventBus> event_bus,
                                 ChampSelectCallback on_champ_select)
    : m_gateway(gateway)
    , m_connection_state(connection_state)
    , m_config(config)
    , m_dodge_watch(dodge_watch)
    , m_poll_interval(poll_interval)
    , m_event_bus(std::move(event_bus))
    , m_on_champ_select(std::move(on_champ_select)) {}

GameflowWatcher::~GameflowWatcher() {
    stop();
}

void GameflowWatcher::start() {
    if (m_running.exchange(true)) {
        return;
    }
    LCU_LOG_INFO("GameflowWatcher", "Polling gameflow every " + std::to_string(m_poll_interval.count()) + "ms");
    m_thread = std::jthread([this](std::stop_token token) { run(token); });
}

void GameflowWatcher::stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    if (m_thread.joinable()) {
        m_thread.request_stop();
        m_wait_cv.notify_all();
        m_thread.join();
    }
    LCU_LOG_INFO("GameflowWatcher", "Stopped");
}

void GameflowWatcher::run(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        tick(stop_token);
        if (!wait(stop_token, m_poll_interval)) {
            break;
        }
    }
}

void GameflowWatcher::tick(std::stop_token stop_token) {
    std::lock_guard lock(m_tick_mutex);

    if (!m_connection_state.is_connected()) {
        set_phase(GameflowPhase::None);
        return;
    }

    auto phase = fetch_gameflow_phase(m_gateway);
    if (!phase) {
        LCU_LOG_DEBUG("GameflowWatcher", "Gameflow phase unavailable: " + core::to_string(phase.error()));
        return;
    }
    set_phase(*phase);

    switch (*phase) {
        case GameflowPhase::ReadyCheck:
            handle_ready_check(stop_token);
            break;
        case GameflowPhase::ChampSelect: {
            handle_auto_pick();
            const auto outcome = m_dodge_watch.evaluate(m_gateway);
            if (outcome != EvaluateOutcome::Idle && outcome != EvaluateOutcome::Waiting) {
                LCU_LOG_DEBUG("GameflowWatcher", "Dodge watch: " + to_string(outcome));
            }
            break;
        }
        default:
            break;
    }
}

void GameflowWatcher::set_phase(GameflowPhase phase) {
    const auto previous = m_phase.exchange(phase);
    if (previous == phase) {
        return;
    }

    LCU_LOG_INFO("GameflowWatcher", "Phase " + core::to_string(previous) + " -> " + core::to_string(phase));

    if (previous == GameflowPhase::ReadyCheck) {
        m_ready_check_handled = false;
    }
    if (previous == GameflowPhase::ChampSelect) {
        // The watched game can not outlive its champ select
        m_dodge_watch.disarm();
        m_auto_pick_done = false;
    }

    // Subscribers run on the pool so a slow one cannot stall polling
    if (m_event_bus) {
        m_event_bus->publish_async(core::events::GameflowPhaseChanged{previous, phase});
    }

    if (phase == GameflowPhase::ChampSelect && m_config.get().auto_open && m_on_champ_select) {
        m_on_champ_select();
    }
}

void GameflowWatcher::handle_ready_check(std::stop_token stop_token) {
    const auto config = m_config.get();
    if (!config.auto_accept || m_ready_check_handled) {
        return;
    }
    m_ready_check_handled = true;

    const auto delay = std::clamp(config.accept_delay, std::chrono::milliseconds::zero(),
                                  core::ConfigLimits::MAX_ACCEPT_DELAY);
    if (delay.count() > 0) {
        LCU_LOG_INFO("GameflowWatcher", "Accepting ready check in " + std::to_string(delay.count()) + "ms");
        if (!wait(stop_token, delay)) {
            return;
        }

        // The check may have been declined or timed out meanwhile
        auto phase = fetch_gameflow_phase(m_gateway);
        if (!phase || *phase != GameflowPhase::ReadyCheck) {
            LCU_LOG_INFO("GameflowWatcher", "Ready check ended before it was accepted");
            return;
        }
    }

    auto result = accept_ready_check(m_gateway);
    if (!result) {
        LCU_LOG_WARNING("GameflowWatcher", "Failed to accept ready check: " + core::to_string(result.error()));
        return;
    }

    LCU_LOG_INFO("GameflowWatcher", "Ready check accepted");
    if (m_event_bus) {
        m_event_bus->publish_async(core::events::ReadyCheckAccepted{delay});
    }
}

void GameflowWatcher::handle_auto_pick() {
    const auto config = m_config.get();
    if (!config.auto_select_ivern || m_auto_pick_done) {
        return;
    }

    // Retried on the next tick until the pick turn shows up
    auto session = fetch_session(m_gateway);
    if (!session) {
        return;
    }
    const auto action = find_pick_action(*session);
    if (!action) {
        return;
    }
    if (config.auto_lock_ivern && !action->is_in_progress) {
        return;
    }

    if (!select_champion(m_gateway, action->id, IVERN_CHAMPION_ID, config.auto_lock_ivern)) {
        return;
    }
    m_auto_pick_done = true;

    LCU_LOG_INFO("GameflowWatcher", config.auto_lock_ivern ? "Ivern locked in" : "Hovering Ivern");
    if (m_event_bus) {
        m_event_bus->publish_async(core::events::ChampionSelected{IVERN_CHAMPION_ID, config.auto_lock_ivern});
    }
}

bool GameflowWatcher::wait(std::stop_token stop_token, std::chrono::milliseconds duration) {
    std::unique_lock lock(m_wait_mutex);
    m_wait_cv.wait_for(lock, stop_token, duration, [] { return false; });
    return !stop_token.stop_requested();
}

} // namespace lcu_companion::services

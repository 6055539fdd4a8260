#include "lcu_companion/services/dodge/dodge_watch.hpp"
#include "lcu_companion/core/events.hpp"
#include "lcu_companion/services/champ_select/champ_select_session.hpp"
#include "lcu_companion/utils/logger.hpp"

namespace lcu_companion::services {

using core::DodgeWatchPhase;
using core::DodgeWatchStatus;

std::string to_string(EvaluateOutcome outcome) {
    switch (outcome) {
        case EvaluateOutcome::Idle: return "idle";
        case EvaluateOutcome::Waiting: return "waiting";
        case EvaluateOutcome::Disarmed: return "disarmed";
        case EvaluateOutcome::Fired: return "fired";
        case EvaluateOutcome::FireFailed: return "fire failed";
        case EvaluateOutcome::Retry: return "retry";
    }
    return "idle";
}

DodgeWatch::DodgeWatch(std::chrono::milliseconds trigger_threshold,
                       std::shared_ptr<core::EventBus> event_bus)
    : m_trigger_threshold(trigger_threshold)
    , m_event_bus(std::move(event_bus)) {}

std::expected<DodgeWatchStatus, core::GatewayError> DodgeWatch::toggle_watch(ClientGateway& gateway) {
    DodgeWatchStatus previous;
    std::uint64_t generation = 0;
    {
        std::lock_guard lock(m_mutex);
        previous = status_locked();

        if (m_phase != DodgeWatchPhase::Disarmed) {
            m_phase = DodgeWatchPhase::Disarmed;
            m_game_id.reset();
            ++m_generation;
            LCU_LOG_INFO("DodgeWatch", "Watch disarmed");
        } else {
            m_phase = DodgeWatchPhase::Arming;
            generation = ++m_generation;
        }
    }

    if (previous.phase != DodgeWatchPhase::Disarmed) {
        const DodgeWatchStatus current{};
        publish_change(previous, current);
        return current;
    }

    auto session = fetch_session(gateway);

    DodgeWatchStatus current;
    bool changed = false;
    {
        std::lock_guard lock(m_mutex);
        const bool still_arming = m_generation == generation && m_phase == DodgeWatchPhase::Arming;

        if (still_arming && session) {
            m_phase = DodgeWatchPhase::Armed;
            m_game_id = session->game_id;
            changed = true;
        } else if (still_arming) {
            m_phase = DodgeWatchPhase::Disarmed;
        }
        current = status_locked();
    }

    if (!session) {
        LCU_LOG_WARNING("DodgeWatch", "Cannot arm watch: " + core::to_string(session.error()));
        return std::unexpected(session.error());
    }

    if (changed) {
        LCU_LOG_INFO("DodgeWatch", "Watching game " + std::to_string(session->game_id));
        publish_change(previous, current);
    }
    return current;
}

std::expected<void, core::GatewayError> DodgeWatch::trigger_leave(ClientGateway& gateway) {
    return send_leave_request(gateway);
}

EvaluateOutcome DodgeWatch::evaluate(ClientGateway& gateway) {
    std::uint64_t generation = 0;
    std::int64_t watched_game = 0;
    {
        std::lock_guard lock(m_mutex);
        if (m_phase != DodgeWatchPhase::Armed || !m_game_id) {
            return EvaluateOutcome::Idle;
        }
        generation = m_generation;
        watched_game = *m_game_id;
    }

    auto session = fetch_session(gateway);
    if (!session) {
        if (session.error() == core::GatewayError::Parse) {
            return EvaluateOutcome::Retry;
        }
        // Champ select has ended or the client went away
        if (compare_and_clear(generation, watched_game)) {
            LCU_LOG_INFO("DodgeWatch", "Game " + std::to_string(watched_game) +
                         " is no longer in champ select, watch disarmed");
            return EvaluateOutcome::Disarmed;
        }
        return EvaluateOutcome::Idle;
    }

    if (session->game_id != watched_game) {
        if (compare_and_clear(generation, watched_game)) {
            LCU_LOG_INFO("DodgeWatch", "Session moved to game " + std::to_string(session->game_id) +
                         ", watch for " + std::to_string(watched_game) + " disarmed");
            return EvaluateOutcome::Disarmed;
        }
        return EvaluateOutcome::Idle;
    }

    if (!is_leave_window(*session, m_trigger_threshold)) {
        return EvaluateOutcome::Waiting;
    }

    if (!compare_and_clear(generation, watched_game)) {
        return EvaluateOutcome::Idle;
    }

    LCU_LOG_INFO("DodgeWatch", "Leaving game " + std::to_string(watched_game) + " with " +
                 std::to_string(session->timer.adjusted_time_left_ms) + "ms left");
    auto result = send_leave_request(gateway);
    if (m_event_bus) {
        m_event_bus->publish(core::events::DodgeTriggered{watched_game, result.has_value()});
    }
    return result ? EvaluateOutcome::Fired : EvaluateOutcome::FireFailed;
}

void DodgeWatch::disarm() {
    DodgeWatchStatus previous;
    {
        std::lock_guard lock(m_mutex);
        if (m_phase == DodgeWatchPhase::Disarmed) {
            return;
        }
        previous = status_locked();
        m_phase = DodgeWatchPhase::Disarmed;
        m_game_id.reset();
        ++m_generation;
    }
    publish_change(previous, DodgeWatchStatus{});
}

DodgeWatchStatus DodgeWatch::status() const {
    std::lock_guard lock(m_mutex);
    return status_locked();
}

bool DodgeWatch::is_armed() const {
    std::lock_guard lock(m_mutex);
    return m_phase == DodgeWatchPhase::Armed;
}

DodgeWatchStatus DodgeWatch::status_locked() const {
    DodgeWatchStatus status;
    status.phase = m_phase;
    if (m_phase == DodgeWatchPhase::Armed) {
        status.game_id = m_game_id;
    }
    return status;
}

bool DodgeWatch::compare_and_clear(std::uint64_t generation, std::int64_t game_id) {
    DodgeWatchStatus previous;
    {
        std::lock_guard lock(m_mutex);
        if (m_phase != DodgeWatchPhase::Armed || m_generation != generation ||
            m_game_id != game_id) {
            return false;
        }
        previous = status_locked();
        m_phase = DodgeWatchPhase::Disarmed;
        m_game_id.reset();
    }
    publish_change(previous, DodgeWatchStatus{});
    return true;
}

void DodgeWatch::publish_change(const DodgeWatchStatus& previous, const DodgeWatchStatus& current) {
    if (m_event_bus && previous != current) {
        m_event_bus->publish(core::events::DodgeWatchChanged{previous, current});
    }
}

} // namespace lcu_companion::services

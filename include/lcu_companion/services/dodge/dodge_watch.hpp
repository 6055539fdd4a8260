#pragma once

#include "lcu_companion/core/event_bus.hpp"
#include "lcu_companion/core/models.hpp"
#include "lcu_companion/services/gateway/client_gateway.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>

namespace lcu_companion::services {

enum class EvaluateOutcome {
    Idle,        // not armed, or another caller already fired
    Waiting,     // armed, leave window not reached
    Disarmed,    // watched game ended or was replaced; nothing fired
    Fired,       // this call sent the leave request
    FireFailed,  // this call won the transition but the request failed
    Retry        // session unreadable this time; still armed
};

std::string to_string(EvaluateOutcome outcome);

// Single authority over the auto-dodge watch. Every read-modify-write of the
// state happens under m_mutex; no gateway call is made while holding it.
//
// Each transition into Arming bumps a generation counter. A fetch that
// completes after the watch was toggled off, or re-armed, sees a different
// generation and leaves the state alone.
class DodgeWatch {
public:
    explicit DodgeWatch(std::chrono::milliseconds trigger_threshold,
                        std::shared_ptr<core::EventBus> event_bus = nullptr);

    DodgeWatch(const DodgeWatch&) = delete;
    DodgeWatch& operator=(const DodgeWatch&) = delete;

    // Armed/Arming -> Disarmed. Disarmed -> Armed(current game id), or stays
    // Disarmed and returns the fetch error.
    std::expected<core::DodgeWatchStatus, core::GatewayError> toggle_watch(ClientGateway& gateway);

    // Sends one leave request regardless of the watch state
    std::expected<void, core::GatewayError> trigger_leave(ClientGateway& gateway);

    // Automatic path, called periodically while in champ select. At most one
    // caller per armed watch ever gets Fired or FireFailed.
    EvaluateOutcome evaluate(ClientGateway& gateway);

    // Used when the client goes away
    void disarm();

    [[nodiscard]] core::DodgeWatchStatus status() const;
    [[nodiscard]] bool is_armed() const;

private:
    core::DodgeWatchStatus status_locked() const;
    // Clears an Armed watch only if it is still the one identified by
    // (generation, game_id); returns whether this call cleared it
    bool compare_and_clear(std::uint64_t generation, std::int64_t game_id);
    void publish_change(const core::DodgeWatchStatus& previous, const core::DodgeWatchStatus& current);

    mutable std::mutex m_mutex;
    core::DodgeWatchPhase m_phase = core::DodgeWatchPhase::Disarmed;
    std::optional<std::int64_t> m_game_id;
    std::uint64_t m_generation = 0;

    std::chrono::milliseconds m_trigger_threshold;
    std::shared_ptr<core::EventBus> m_event_bus;
};

} // namespace lcu_companion::services

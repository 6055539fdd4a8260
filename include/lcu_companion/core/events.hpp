#pragma once

#include "lcu_companion/core/models.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lcu_companion::core::events {

struct Event {
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
    Event() = default;
    virtual ~Event() = default;
};

// Raw lifecycle notification produced by the process monitor. Consumed in
// arrival order; only the consumer turns it into ConnectionState.
struct ClientLifecycleChanged : Event {
    enum class Kind {
        Connected,
        Disconnected
    };

    Kind kind;
    std::optional<GatewayEndpointInfo> endpoint_info;  // Connected only

    static ClientLifecycleChanged connected(GatewayEndpointInfo info) {
        ClientLifecycleChanged event;
        event.kind = Kind::Connected;
        event.endpoint_info = std::move(info);
        return event;
    }

    static ClientLifecycleChanged disconnected() {
        ClientLifecycleChanged event;
        event.kind = Kind::Disconnected;
        return event;
    }

private:
    ClientLifecycleChanged() = default;
};

// Broadcast after ConnectionState has been updated
struct GatewayConnectionChanged : Event {
    bool connected;
    std::optional<GatewayEndpointInfo> endpoint_info;

    GatewayConnectionChanged(bool is_connected, std::optional<GatewayEndpointInfo> info)
        : connected(is_connected), endpoint_info(std::move(info)) {}
};

struct ConfigurationUpdated : Event {
    UserConfig previous_config;
    UserConfig new_config;

    ConfigurationUpdated(UserConfig prev, UserConfig curr)
        : previous_config(std::move(prev)), new_config(std::move(curr)) {}
};

struct ConfigurationError : Event {
    ConfigError error;
    std::string message;

    ConfigurationError(ConfigError err, std::string msg)
        : error(err), message(std::move(msg)) {}
};

struct DodgeWatchChanged : Event {
    DodgeWatchStatus previous;
    DodgeWatchStatus current;

    DodgeWatchChanged(DodgeWatchStatus prev, DodgeWatchStatus curr)
        : previous(std::move(prev)), current(std::move(curr)) {}
};

struct DodgeTriggered : Event {
    std::int64_t game_id;
    bool succeeded;

    DodgeTriggered(std::int64_t id, bool ok)
        : game_id(id), succeeded(ok) {}
};

struct GameflowPhaseChanged : Event {
    GameflowPhase previous_phase;
    GameflowPhase current_phase;

    GameflowPhaseChanged(GameflowPhase prev, GameflowPhase curr)
        : previous_phase(prev), current_phase(curr) {}
};

struct ReadyCheckAccepted : Event {
    std::chrono::milliseconds delay;

    explicit ReadyCheckAccepted(std::chrono::milliseconds d)
        : delay(d) {}
};

struct ChampionSelected : Event {
    std::int64_t champion_id;
    bool locked;

    ChampionSelected(std::int64_t id, bool lock)
        : champion_id(id), locked(lock) {}
};

struct ApplicationStateChanged : Event {
    ApplicationState previous_state;
    ApplicationState current_state;

    ApplicationStateChanged(ApplicationState prev, ApplicationState curr)
        : previous_state(prev), current_state(curr) {}
};

struct ApplicationReady : Event {
    std::chrono::milliseconds startup_time;

    explicit ApplicationReady(std::chrono::milliseconds time)
        : startup_time(time) {}
};

struct ApplicationShuttingDown : Event {
    std::string reason;

    explicit ApplicationShuttingDown(std::string r = "User requested")
        : reason(std::move(r)) {}
};

} // namespace lcu_companion::core::events

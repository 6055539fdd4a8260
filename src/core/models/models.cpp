#include "lcu_companion/core/models.hpp"

namespace lcu_companion::core {

std::string to_string(ApplicationState state) {
    switch (state) {
        case ApplicationState::NotInitialized: return "not initialized";
        case ApplicationState::Initializing: return "initializing";
        case ApplicationState::Running: return "running";
        case ApplicationState::Stopping: return "stopping";
        case ApplicationState::Stopped: return "stopped";
        case ApplicationState::Error: return "error";
    }
    return "unknown";
}

std::string to_string(ApplicationError error) {
    switch (error) {
        case ApplicationError::InitializationFailed: return "initialization failed";
        case ApplicationError::ConfigurationError: return "configuration error";
        case ApplicationError::AlreadyRunning: return "already running";
        case ApplicationError::ServiceUnavailable: return "service unavailable";
    }
    return "unknown application error";
}

std::string to_string(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::InvalidFormat: return "invalid format";
        case ConfigError::ValidationError: return "validation error";
        case ConfigError::PermissionDenied: return "permission denied";
    }
    return "unknown config error";
}

std::string to_string(GatewayError error) {
    switch (error) {
        case GatewayError::Unavailable: return "game client not connected";
        case GatewayError::Transport: return "request to game client failed";
        case GatewayError::Parse: return "unexpected response from game client";
    }
    return "unknown gateway error";
}

std::string to_string(StatsApiError error) {
    switch (error) {
        case StatsApiError::NoResponse: return "no result or error from stats API";
        case StatsApiError::Transport: return "stats API request failed";
        case StatsApiError::Remote: return "stats API returned an error";
    }
    return "unknown stats API error";
}

std::string to_string(CommandError error) {
    switch (error) {
        case CommandError::GatewayUnavailable: return "GatewayUnavailable";
        case CommandError::TransportError: return "TransportError";
        case CommandError::ParseError: return "ParseError";
        case CommandError::PersistenceError: return "PersistenceError";
        case CommandError::RemoteApiError: return "RemoteApiError";
        case CommandError::NoResponse: return "NoResponse";
        case CommandError::LaunchFailed: return "LaunchFailed";
    }
    return "UnknownError";
}

std::string to_string(DodgeWatchPhase phase) {
    switch (phase) {
        case DodgeWatchPhase::Disarmed: return "disarmed";
        case DodgeWatchPhase::Arming: return "arming";
        case DodgeWatchPhase::Armed: return "armed";
    }
    return "disarmed";
}

GameflowPhase gameflow_phase_from_string(const std::string& phase) {
    if (phase == "None") return GameflowPhase::None;
    if (phase == "Lobby") return GameflowPhase::Lobby;
    if (phase == "Matchmaking") return GameflowPhase::Matchmaking;
    if (phase == "ReadyCheck") return GameflowPhase::ReadyCheck;
    if (phase == "ChampSelect") return GameflowPhase::ChampSelect;
    if (phase == "InProgress") return GameflowPhase::InProgress;
    return GameflowPhase::Other;
}

std::string to_string(GameflowPhase phase) {
    switch (phase) {
        case GameflowPhase::None: return "None";
        case GameflowPhase::Lobby: return "Lobby";
        case GameflowPhase::Matchmaking: return "Matchmaking";
        case GameflowPhase::ReadyCheck: return "ReadyCheck";
        case GameflowPhase::ChampSelect: return "ChampSelect";
        case GameflowPhase::InProgress: return "InProgress";
        case GameflowPhase::Other: return "Other";
    }
    return "Other";
}

} // namespace lcu_companion::core

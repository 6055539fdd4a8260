#pragma once

#include "lcu_companion/core/models.hpp"
#include "lcu_companion/services/network/http_types.hpp"

#include <expected>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lcu_companion::services {

// Authenticated request/response access to the running game client.
// Implementations must bound every call with a timeout.
class ClientGateway {
public:
    virtual ~ClientGateway() = default;

    // Empty 2xx bodies come back as a null JSON value
    virtual std::expected<nlohmann::json, core::GatewayError> request(
        core::ApiTarget target,
        HttpMethod method,
        const std::string& path,
        const std::optional<nlohmann::json>& body = std::nullopt) = 0;

    [[nodiscard]] virtual bool is_available() const = 0;
};

// Well-known paths on the game client
namespace lcu_paths {
inline constexpr const char* CHAT_PARTICIPANTS = "/chat/v5/participants";
inline constexpr const char* REGION_LOCALE = "/riotclient/region-locale";
inline constexpr const char* CHAMP_SELECT_SESSION = "/lol-champ-select/v1/session";
inline constexpr const char* GAMEFLOW_PHASE = "/lol-gameflow/v1/gameflow-phase";
inline constexpr const char* READY_CHECK_ACCEPT = "/lol-matchmaking/v1/ready-check/accept";
inline constexpr const char* LOGIN_SESSION_INVOKE = "/lol-login/v1/session/invoke";
} // namespace lcu_paths

} // namespace lcu_companion::services

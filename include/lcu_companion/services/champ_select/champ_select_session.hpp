#pragma once

#include "lcu_companion/core/models.hpp"
#include "lcu_companion/services/gateway/client_gateway.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace lcu_companion::services {

inline constexpr const char* FINALIZATION_PHASE = "FINALIZATION";
inline constexpr std::int64_t IVERN_CHAMPION_ID = 427;

// Strict parse of the current champ select session. Gateway failures are
// passed through; a body that does not parse is GatewayError::Parse.
std::expected<core::ChampSelectSession, core::GatewayError> fetch_session(ClientGateway& gateway);

// True once the session is in its last phase with at most `threshold` left
bool is_leave_window(const core::ChampSelectSession& session, std::chrono::milliseconds threshold);

std::expected<core::RegionInfo, core::GatewayError> fetch_region_info(ClientGateway& gateway);

std::expected<core::GameflowPhase, core::GatewayError> fetch_gameflow_phase(ClientGateway& gateway);

// Quits the current champ select through the login session proxy
std::expected<void, core::GatewayError> send_leave_request(ClientGateway& gateway);

std::expected<void, core::GatewayError> accept_ready_check(ClientGateway& gateway);

// The invoke path for the teambuilder quit call, with its args encoded
std::string leave_request_path();

std::string session_action_path(std::int64_t action_id);

// The local player's first pick that is not completed yet
std::optional<core::ChampSelectAction> find_pick_action(const core::ChampSelectSession& session);

// Hovers the champion on the action, or locks it in when `lock` is set
std::expected<void, core::GatewayError> select_champion(ClientGateway& gateway,
                                                        std::int64_t action_id,
                                                        std::int64_t champion_id,
                                                        bool lock);

} // namespace lcu_companion::services

#include "lcu_companion/services/champ_select/champ_select_session.hpp"
#include "lcu_companion/core/model_json.hpp"
#include "lcu_companion/utils/logger.hpp"
#include "lcu_companion/utils/url_utils.hpp"

namespace lcu_companion::services {

std::expected<core::ChampSelectSession, core::GatewayError> fetch_session(ClientGateway& gateway) {
    auto response = gateway.request(core::ApiTarget::LeagueClient, HttpMethod::GET,
                                     lcu_paths::CHAMP_SELECT_SESSION);
    if (!response) {
        return std::unexpected(response.error());
    }

    auto session = core::parse_champ_select_session(*response);
    if (!session) {
        LCU_LOG_WARNING("ChampSelect", "Unexpected session payload: " + session.error());
        return std::unexpected(core::GatewayError::Parse);
    }
    return std::move(*session);
}

bool is_leave_window(const core::ChampSelectSession& session, std::chrono::milliseconds threshold) {
    return session.timer.phase == FINALIZATION_PHASE &&
           !session.timer.is_infinite &&
           session.timer.adjusted_time_left_ms <= threshold.count();
}

std::expected<core::RegionInfo, core::GatewayError> fetch_region_info(ClientGateway& gateway) {
    auto response = gateway.request(core::ApiTarget::RiotClient, HttpMethod::GET,
                                    lcu_paths::REGION_LOCALE);
    if (!response) {
        return std::unexpected(response.error());
    }

    auto region = core::parse_region_info(*response);
    if (!region) {
        LCU_LOG_WARNING("ChampSelect", "Unexpected region payload: " + region.error());
        return std::unexpected(core::GatewayError::Parse);
    }
    return std::move(*region);
}

std::expected<core::GameflowPhase, core::GatewayError> fetch_gameflow_phase(ClientGateway& gateway) {
    auto response = gateway.request(core::ApiTarget::LeagueClient, HttpMethod::GET,
                                    lcu_paths::GAMEFLOW_PHASE);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->is_string()) {
        return std::unexpected(core::GatewayError::Parse);
    }
    return core::gameflow_phase_from_string(response->get<std::string>());
}

std::string leave_request_path() {
    return std::string(lcu_paths::LOGIN_SESSION_INVOKE) + "?" +
           utils::UrlUtils::build_query_string({
               {"destination", "lcdsServiceProxy"},
               {"method", "call"},
               {"args", R"(["","teambuilder-draft","quitV2",""])"}
           });
}

std::expected<void, core::GatewayError> send_leave_request(ClientGateway& gateway) {
    LCU_LOG_INFO("ChampSelect", "Attempting to quit champ select");

    auto response = gateway.request(core::ApiTarget::LeagueClient, HttpMethod::POST,
                                    leave_request_path(), nlohmann::json::object());
    if (!response) {
        LCU_LOG_ERROR("ChampSelect", "Leave request failed: " + core::to_string(response.error()));
        return std::unexpected(response.error());
    }
    return {};
}

std::string session_action_path(std::int64_t action_id) {
    return utils::UrlUtils::join_path(lcu_paths::CHAMP_SELECT_SESSION, "actions/" + std::to_string(action_id));
}

std::optional<core::ChampSelectAction> find_pick_action(const core::ChampSelectSession& session) {
    if (session.local_player_cell_id < 0) {
        return std::nullopt;
    }
    for (const auto& action : session.actions) {
        if (action.actor_cell_id == session.local_player_cell_id && action.type == "pick" && !action.completed) {
            return action;
        }
    }
    return std::nullopt;
}

std::expected<void, core::GatewayError> select_champion(ClientGateway& gateway,
                                                        std::int64_t action_id,
                                                        std::int64_t champion_id,
                                                        bool lock) {
    const nlohmann::json body = {
        {"championId", champion_id},
        {"completed", lock}
    };
    auto response = gateway.request(core::ApiTarget::LeagueClient, HttpMethod::PATCH,
                                    session_action_path(action_id), body);
    if (!response) {
        LCU_LOG_WARNING("ChampSelect", "Selecting champion " + std::to_string(champion_id) + " failed: " +
                        core::to_string(response.error()));
        return std::unexpected(response.error());
    }
    return {};
}

std::expected<void, core::GatewayError> accept_ready_check(ClientGateway& gateway) {
    auto response = gateway.request(core::ApiTarget::LeagueClient, HttpMethod::POST,
                                    lcu_paths::READY_CHECK_ACCEPT);
    if (!response) {
        return std::unexpected(response.error());
    }
    return {};
}

} // namespace lcu_companion::services

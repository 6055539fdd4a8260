#include "lcu_companion/core/model_json.hpp"
#include "lcu_companion/utils/json_helper.hpp"

#include <array>
#include <string_view>

namespace lcu_companion::core {

using utils::JsonHelper;

namespace {

constexpr std::string_view KEY_AUTO_OPEN = "autoOpen";
constexpr std::string_view KEY_AUTO_ACCEPT = "autoAccept";
constexpr std::string_view KEY_ACCEPT_DELAY = "acceptDelay";
constexpr std::string_view KEY_MULTI_PROVIDER = "multiProvider";
constexpr std::string_view KEY_REGION_OVERRIDE = "regionOverride";
constexpr std::string_view KEY_AUTO_SELECT_IVERN = "autoSelectIvern";
constexpr std::string_view KEY_AUTO_LOCK_IVERN = "autoLockIvern";

constexpr std::array<std::string_view, 7> KNOWN_CONFIG_KEYS = {
    KEY_AUTO_OPEN, KEY_AUTO_ACCEPT, KEY_ACCEPT_DELAY, KEY_MULTI_PROVIDER, KEY_REGION_OVERRIDE,
    KEY_AUTO_SELECT_IVERN, KEY_AUTO_LOCK_IVERN
};

bool is_known_config_key(const std::string& key) {
    for (const auto known : KNOWN_CONFIG_KEYS) {
        if (known == key) return true;
    }
    return false;
}

// Present-but-mistyped is an error; absent leaves the default in place
template<typename T>
std::expected<void, std::string> read_if_present(const nlohmann::json& json,
                                                 std::string_view key, T& out) {
    const std::string field(key);
    if (!JsonHelper::has_field(json, field)) {
        return {};
    }
    auto value = JsonHelper::get_required<T>(json, field);
    if (!value) {
        return std::unexpected(value.error());
    }
    out = std::move(*value);
    return {};
}

} // namespace

std::expected<Participant, std::string> parse_participant(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::unexpected("Participant is not an object");
    }

    auto cid = JsonHelper::get_required<std::string>(json, "cid");
    if (!cid) return std::unexpected(cid.error());

    auto game_name = JsonHelper::get_required<std::string>(json, "game_name");
    if (!game_name) return std::unexpected(game_name.error());

    auto game_tag = JsonHelper::get_required<std::string>(json, "game_tag");
    if (!game_tag) return std::unexpected(game_tag.error());

    auto puuid = JsonHelper::get_required<std::string>(json, "puuid");
    if (!puuid) return std::unexpected(puuid.error());

    Participant participant;
    participant.id = std::move(*cid);
    participant.display_name = std::move(*game_name);
    participant.name_tag = std::move(*game_tag);
    participant.puuid = std::move(*puuid);
    participant.name = JsonHelper::get_optional<std::string>(json, "name", "");
    participant.pid = JsonHelper::get_optional<std::string>(json, "pid", "");
    participant.region = JsonHelper::get_optional<std::string>(json, "region", "");
    participant.muted = JsonHelper::get_optional<bool>(json, "muted", false);
    return participant;
}

std::expected<std::vector<Participant>, std::string> parse_participants(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("participants") || !json.at("participants").is_array()) {
        return std::unexpected("Missing participants array");
    }

    std::vector<Participant> participants;
    participants.reserve(json.at("participants").size());
    for (const auto& element : json.at("participants")) {
        auto participant = parse_participant(element);
        if (!participant) {
            return std::unexpected(participant.error());
        }
        participants.push_back(std::move(*participant));
    }
    return participants;
}

std::expected<ChampSelectSession, std::string> parse_champ_select_session(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::unexpected("Champ select session is not an object");
    }

    auto game_id = JsonHelper::get_required<std::int64_t>(json, "gameId");
    if (!game_id) {
        return std::unexpected(game_id.error());
    }

    ChampSelectSession session;
    session.game_id = *game_id;
    session.local_player_cell_id = JsonHelper::get_optional<std::int64_t>(json, "localPlayerCellId", -1);

    if (JsonHelper::has_field(json, "timer")) {
        const auto& timer = json.at("timer");
        session.timer.phase = JsonHelper::get_optional<std::string>(timer, "phase", "");
        session.timer.adjusted_time_left_ms =
            JsonHelper::get_optional<std::int64_t>(timer, "adjustedTimeLeftInPhase", 0);
        session.timer.total_time_in_phase_ms =
            JsonHelper::get_optional<std::int64_t>(timer, "totalTimeInPhase", 0);
        session.timer.is_infinite = JsonHelper::get_optional<bool>(timer, "isInfinite", false);
    }

    JsonHelper::for_each_in_array(json, "myTeam", [&session](const nlohmann::json& member) {
        session.my_team.push_back(ChampSelectTeamMember{
            .cell_id = JsonHelper::get_optional<std::int64_t>(member, "cellId", 0),
            .summoner_id = JsonHelper::get_optional<std::int64_t>(member, "summonerId", 0),
            .champion_id = JsonHelper::get_optional<std::int64_t>(member, "championId", 0),
            .assigned_position = JsonHelper::get_optional<std::string>(member, "assignedPosition", "")
        });
    });

    // The client groups actions by turn; only the flat order matters here
    JsonHelper::for_each_in_array(json, "actions", [&session](const nlohmann::json& turn) {
        if (!turn.is_array()) {
            return;
        }
        for (const auto& action : turn) {
            if (!action.is_object()) {
                continue;
            }
            session.actions.push_back(ChampSelectAction{
                .id = JsonHelper::get_optional<std::int64_t>(action, "id", 0),
                .actor_cell_id = JsonHelper::get_optional<std::int64_t>(action, "actorCellId", -1),
                .champion_id = JsonHelper::get_optional<std::int64_t>(action, "championId", 0),
                .type = JsonHelper::get_optional<std::string>(action, "type", ""),
                .completed = JsonHelper::get_optional<bool>(action, "completed", false),
                .is_in_progress = JsonHelper::get_optional<bool>(action, "isInProgress", false)
            });
        }
    });

    return session;
}

std::expected<RegionInfo, std::string> parse_region_info(const nlohmann::json& json) {
    auto web_region = JsonHelper::get_required<std::string>(json, "webRegion");
    if (!web_region) {
        return std::unexpected(web_region.error());
    }

    RegionInfo info;
    info.web_region = std::move(*web_region);
    info.locale = JsonHelper::get_optional<std::string>(json, "locale", "");
    info.region = JsonHelper::get_optional<std::string>(json, "region", "");
    info.web_language = JsonHelper::get_optional<std::string>(json, "webLanguage", "");
    return info;
}

std::expected<UserConfig, std::string> parse_user_config(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::unexpected("Config root is not an object");
    }

    UserConfig config;

    if (auto r = read_if_present(json, KEY_AUTO_OPEN, config.auto_open); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = read_if_present(json, KEY_AUTO_ACCEPT, config.auto_accept); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = read_if_present(json, KEY_MULTI_PROVIDER, config.multi_provider); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = read_if_present(json, KEY_AUTO_SELECT_IVERN, config.auto_select_ivern); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = read_if_present(json, KEY_AUTO_LOCK_IVERN, config.auto_lock_ivern); !r) {
        return std::unexpected(r.error());
    }

    std::int64_t delay_ms = config.accept_delay.count();
    if (auto r = read_if_present(json, KEY_ACCEPT_DELAY, delay_ms); !r) {
        return std::unexpected(r.error());
    }
    if (delay_ms < 0) {
        return std::unexpected("acceptDelay must not be negative");
    }
    config.accept_delay = std::chrono::milliseconds(delay_ms);

    if (JsonHelper::has_field(json, std::string(KEY_REGION_OVERRIDE))) {
        std::string region;
        if (auto r = read_if_present(json, KEY_REGION_OVERRIDE, region); !r) {
            return std::unexpected(r.error());
        }
        if (!region.empty()) {
            config.region_override = std::move(region);
        }
    }

    for (const auto& [key, value] : json.items()) {
        if (!is_known_config_key(key)) {
            config.extra[key] = value;
        }
    }

    return config;
}

nlohmann::json to_json(const Participant& participant) {
    return {
        {"cid", participant.id},
        {"game_name", participant.display_name},
        {"game_tag", participant.name_tag},
        {"muted", participant.muted},
        {"name", participant.name},
        {"pid", participant.pid},
        {"puuid", participant.puuid},
        {"region", participant.region}
    };
}

nlohmann::json to_json(const Lobby& lobby) {
    auto participants = nlohmann::json::array();
    for (const auto& participant : lobby.participants) {
        participants.push_back(to_json(participant));
    }
    return {{"participants", std::move(participants)}};
}

nlohmann::json to_json(const ChampSelectSession& session) {
    auto team = nlohmann::json::array();
    for (const auto& member : session.my_team) {
        team.push_back({
            {"cellId", member.cell_id},
            {"summonerId", member.summoner_id},
            {"championId", member.champion_id},
            {"assignedPosition", member.assigned_position}
        });
    }

    auto turn = nlohmann::json::array();
    for (const auto& action : session.actions) {
        turn.push_back({
            {"id", action.id},
            {"actorCellId", action.actor_cell_id},
            {"championId", action.champion_id},
            {"type", action.type},
            {"completed", action.completed},
            {"isInProgress", action.is_in_progress}
        });
    }

    return {
        {"gameId", session.game_id},
        {"localPlayerCellId", session.local_player_cell_id},
        {"timer", {
            {"phase", session.timer.phase},
            {"adjustedTimeLeftInPhase", session.timer.adjusted_time_left_ms},
            {"totalTimeInPhase", session.timer.total_time_in_phase_ms},
            {"isInfinite", session.timer.is_infinite}
        }},
        {"myTeam", std::move(team)},
        {"actions", turn.empty() ? nlohmann::json::array() : nlohmann::json::array({std::move(turn)})}
    };
}

nlohmann::json to_json(const GatewayEndpointInfo& info) {
    return {
        {"pid", info.pid},
        {"remotingPort", info.remoting_port},
        {"remotingToken", info.remoting_token},
        {"appPort", info.app_port},
        {"appToken", info.app_token},
        {"region", info.region}
    };
}

nlohmann::json to_json(const UserConfig& config) {
    nlohmann::json json = config.extra.is_object() ? config.extra : nlohmann::json::object();

    json[std::string(KEY_AUTO_OPEN)] = config.auto_open;
    json[std::string(KEY_AUTO_ACCEPT)] = config.auto_accept;
    json[std::string(KEY_ACCEPT_DELAY)] = config.accept_delay.count();
    json[std::string(KEY_MULTI_PROVIDER)] = config.multi_provider;
    json[std::string(KEY_AUTO_SELECT_IVERN)] = config.auto_select_ivern;
    json[std::string(KEY_AUTO_LOCK_IVERN)] = config.auto_lock_ivern;
    if (config.region_override) {
        json[std::string(KEY_REGION_OVERRIDE)] = *config.region_override;
    }
    return json;
}

nlohmann::json to_json(const DodgeWatchStatus& status) {
    return {
        {"phase", to_string(status.phase)},
        {"gameId", status.game_id ? nlohmann::json(*status.game_id) : nlohmann::json(nullptr)}
    };
}

} // namespace lcu_companion::core

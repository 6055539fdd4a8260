#pragma once

#include "lcu_companion/core/models.hpp"

#include <expected>
#include <string>

#include <nlohmann/json.hpp>

// Conversions between the game client's wire payloads and the typed models.
// Parsers return an error message rather than throwing.
namespace lcu_companion::core {

std::expected<Participant, std::string> parse_participant(const nlohmann::json& json);

// Parses the {"participants": [...]} envelope without filtering
std::expected<std::vector<Participant>, std::string> parse_participants(const nlohmann::json& json);

std::expected<ChampSelectSession, std::string> parse_champ_select_session(const nlohmann::json& json);

std::expected<RegionInfo, std::string> parse_region_info(const nlohmann::json& json);

// Missing keys take their defaults; a known key with the wrong type is an error
std::expected<UserConfig, std::string> parse_user_config(const nlohmann::json& json);

nlohmann::json to_json(const Participant& participant);
nlohmann::json to_json(const Lobby& lobby);
nlohmann::json to_json(const ChampSelectSession& session);
nlohmann::json to_json(const GatewayEndpointInfo& info);
nlohmann::json to_json(const UserConfig& config);
nlohmann::json to_json(const DodgeWatchStatus& status);

} // namespace lcu_companion::core

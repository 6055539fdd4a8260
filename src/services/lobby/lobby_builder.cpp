#include "lcu_companion/services/lobby/lobby_builder.hpp"
#include "lcu_companion/core/model_json.hpp"
#include "lcu_companion/utils/logger.hpp"

#include <algorithm>
#include <iterator>

namespace lcu_companion::services {

LobbySnapshotBuilder::LobbySnapshotBuilder(std::string champ_select_marker)
    : m_marker(std::move(champ_select_marker)) {}

core::Lobby LobbySnapshotBuilder::build_lobby(ClientGateway& gateway) const {
    auto response = gateway.request(core::ApiTarget::RiotClient, HttpMethod::GET,
                                    lcu_paths::CHAT_PARTICIPANTS);
    if (!response) {
        LCU_LOG_WARNING("LobbyBuilder", "Error fetching lobby info: " + core::to_string(response.error()));
        return {};
    }

    auto participants = core::parse_participants(*response);
    if (!participants) {
        LCU_LOG_WARNING("LobbyBuilder", "Error parsing lobby response: " + participants.error());
        return {};
    }

    const auto total = participants->size();
    auto lobby = filter(std::move(*participants));
    LCU_LOG_DEBUG("LobbyBuilder", "Found " + std::to_string(lobby.size()) + " of " +
                  std::to_string(total) + " participants in champion select");

    for (const auto& participant : lobby.participants) {
        LCU_LOG_DEBUG("LobbyBuilder", "Participant: " + participant.display_name + "#" + participant.name_tag);
    }
    return lobby;
}

core::Lobby LobbySnapshotBuilder::filter(std::vector<core::Participant> participants) const {
    core::Lobby lobby;
    std::copy_if(std::make_move_iterator(participants.begin()),
                 std::make_move_iterator(participants.end()),
                 std::back_inserter(lobby.participants),
                 [this](const core::Participant& participant) {
                     return participant.id.find(m_marker) != std::string::npos;
                 });
    return lobby;
}

} // namespace lcu_companion::services

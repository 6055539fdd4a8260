#pragma once

#include "lcu_companion/core/models.hpp"
#include "lcu_companion/services/gateway/client_gateway.hpp"

#include <string>
#include <vector>

namespace lcu_companion::services {

// Builds the champ-select view of the chat participant list. Best effort:
// failures are logged and yield an empty lobby.
class LobbySnapshotBuilder {
public:
    explicit LobbySnapshotBuilder(std::string champ_select_marker = "champ-select");

    core::Lobby build_lobby(ClientGateway& gateway) const;

    // Keeps participants whose id contains the marker, in their original order
    core::Lobby filter(std::vector<core::Participant> participants) const;

    [[nodiscard]] const std::string& marker() const { return m_marker; }

private:
    std::string m_marker;
};

} // namespace lcu_companion::services

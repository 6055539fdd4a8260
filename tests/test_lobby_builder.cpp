#include <catch2/catch.hpp>

#include "lcu_companion/services/lobby/lobby_builder.hpp"
#include "utils/fake_gateway.hpp"

using namespace lcu_companion;
using namespace test_utils;
using services::LobbySnapshotBuilder;

namespace {

nlohmann::json participants(std::initializer_list<nlohmann::json> entries) {
    return {{"participants", nlohmann::json::array_t(entries)}};
}

void serve_participants(FakeGateway& gateway, GatewayResult result) {
    gateway.respond(HttpMethod::GET, services::lcu_paths::CHAT_PARTICIPANTS, std::move(result));
}

} // namespace

TEST_CASE("LobbySnapshotBuilder - keeps champ select participants in order", "[lobby]") {
    FakeGateway gateway;
    serve_participants(gateway, participants({
        make_participant_json("abc@champ-select.eu1.pvp.net", "Alpha", "EUW"),
        make_participant_json("lobby-1@sec.pvp.net", "Stranger", "EUW"),
        make_participant_json("abc@champ-select.eu1.pvp.net", "Bravo", "1234"),
        make_participant_json("post-game@pvp.net", "Other", "EUW"),
        make_participant_json("abc@champ-select.eu1.pvp.net", "Charlie", "EUNE")
    }));

    LobbySnapshotBuilder builder;
    const auto lobby = builder.build_lobby(gateway);

    REQUIRE(lobby.size() == 3);
    REQUIRE(lobby.participants[0].display_name == "Alpha");
    REQUIRE(lobby.participants[1].display_name == "Bravo");
    REQUIRE(lobby.participants[1].name_tag == "1234");
    REQUIRE(lobby.participants[2].display_name == "Charlie");

    const auto requests = gateway.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests.front().target == ApiTarget::RiotClient);
}

TEST_CASE("LobbySnapshotBuilder - degrades to an empty lobby", "[lobby]") {
    FakeGateway gateway;
    LobbySnapshotBuilder builder;

    SECTION("Transport failure") {
        serve_participants(gateway, std::unexpected(GatewayError::Transport));
        REQUIRE(builder.build_lobby(gateway).empty());
    }

    SECTION("Client not connected") {
        gateway.set_available(false);
        REQUIRE(builder.build_lobby(gateway).empty());
    }

    SECTION("Malformed participant") {
        auto broken = make_participant_json("abc@champ-select", "Alpha", "EUW");
        broken.erase("game_tag");
        serve_participants(gateway, participants({broken}));
        REQUIRE(builder.build_lobby(gateway).empty());
    }

    SECTION("Not an envelope") {
        serve_participants(gateway, nlohmann::json::array());
        REQUIRE(builder.build_lobby(gateway).empty());
    }
}

TEST_CASE("LobbySnapshotBuilder - marker is configurable", "[lobby]") {
    std::vector<core::Participant> all(4);
    all[0].id = "a@champ-select";
    all[1].id = "b@custom-marker";
    all[2].id = "c@champ-select";
    all[3].id = "d@custom-marker";

    SECTION("Default marker") {
        const auto lobby = LobbySnapshotBuilder().filter(all);
        REQUIRE(lobby.size() == 2);
        REQUIRE(lobby.participants[0].id == "a@champ-select");
        REQUIRE(lobby.participants[1].id == "c@champ-select");
    }

    SECTION("Custom marker") {
        LobbySnapshotBuilder builder("custom-marker");
        const auto lobby = builder.filter(all);
        REQUIRE(builder.marker() == "custom-marker");
        REQUIRE(lobby.size() == 2);
        REQUIRE(lobby.participants[0].id == "b@custom-marker");
    }

    SECTION("No participants match") {
        REQUIRE(LobbySnapshotBuilder("nothing").filter(all).empty());
    }
}

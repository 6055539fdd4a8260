#include <catch2/catch.hpp>

#include "lcu_companion/core/connection_state.hpp"
#include "lcu_companion/core/events.hpp"
#include "lcu_companion/services/gateway/lcu_gateway.hpp"
#include "utils/fake_http_client.hpp"

#include <memory>

using namespace lcu_companion;
using namespace test_utils;
using core::ApiTarget;
using core::GatewayError;
using services::HttpMethod;

namespace {

core::GatewayEndpointInfo endpoint() {
    core::GatewayEndpointInfo info;
    info.pid = 42;
    info.remoting_port = 61234;
    info.remoting_token = "lcu-token";
    info.app_port = 51234;
    info.app_token = "rc-token";
    return info;
}

struct GatewayFixture {
    core::ConnectionStateStore state;
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    services::LcuGateway gateway{state, http, std::chrono::seconds(7)};

    void connect(core::GatewayEndpointInfo info = endpoint()) {
        state.apply(core::events::ClientLifecycleChanged::connected(std::move(info)));
    }
};

} // namespace

TEST_CASE("LcuGateway - unavailable without a client", "[gateway]") {
    GatewayFixture fixture;

    auto result = fixture.gateway.request(ApiTarget::LeagueClient, HttpMethod::GET, "/lol-champ-select/v1/session");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error() == GatewayError::Unavailable);
    REQUIRE_FALSE(fixture.gateway.is_available());
    REQUIRE(fixture.http->request_count() == 0);
}

TEST_CASE("LcuGateway - addresses each API with its own credentials", "[gateway]") {
    GatewayFixture fixture;
    fixture.connect();
    fixture.http->set_handler([](const HttpRequest&) -> HttpResult {
        return make_response(200, R"({"ok":true})");
    });

    SECTION("League client") {
        auto result = fixture.gateway.request(ApiTarget::LeagueClient, HttpMethod::GET, "/lol-gameflow/v1/gameflow-phase");
        REQUIRE(result.has_value());

        const auto request = fixture.http->requests().back();
        REQUIRE(request.url == "https://127.0.0.1:61234/lol-gameflow/v1/gameflow-phase");
        REQUIRE(request.basic_auth == "riot:lcu-token");
        REQUIRE_FALSE(request.verify_tls);
        REQUIRE_FALSE(request.follow_redirects);
        REQUIRE(request.headers.at("Accept") == "application/json");
        REQUIRE(request.timeout == std::chrono::seconds(7));
    }

    SECTION("Riot client") {
        auto result = fixture.gateway.request(ApiTarget::RiotClient, HttpMethod::GET, "/chat/v5/participants");
        REQUIRE(result.has_value());

        const auto request = fixture.http->requests().back();
        REQUIRE(request.url == "https://127.0.0.1:51234/chat/v5/participants");
        REQUIRE(request.basic_auth == "riot:rc-token");
    }

    SECTION("Body is sent as JSON") {
        auto result = fixture.gateway.request(ApiTarget::LeagueClient, HttpMethod::POST, "/x",
                                              nlohmann::json::object());
        REQUIRE(result.has_value());

        const auto request = fixture.http->requests().back();
        REQUIRE(request.method == HttpMethod::POST);
        REQUIRE(request.body == "{}");
        REQUIRE(request.headers.at("Content-Type") == "application/json");
    }
}

TEST_CASE("LcuGateway - missing Riot client credentials", "[gateway]") {
    GatewayFixture fixture;
    auto info = endpoint();
    info.app_port = 0;
    fixture.connect(info);

    auto result = fixture.gateway.request(ApiTarget::RiotClient, HttpMethod::GET, "/riotclient/region-locale");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error() == GatewayError::Unavailable);
}

TEST_CASE("LcuGateway - maps responses", "[gateway]") {
    GatewayFixture fixture;
    fixture.connect();

    SECTION("JSON body") {
        fixture.http->enqueue(make_response(200, R"({"gameId":5})"));
        auto result = fixture.gateway.request(ApiTarget::LeagueClient, HttpMethod::GET, "/s");
        REQUIRE(result.has_value());
        REQUIRE(result->at("gameId") == 5);
    }

    SECTION("Empty body") {
        fixture.http->enqueue(make_response(204, ""));
        auto result = fixture.gateway.request(ApiTarget::LeagueClient, HttpMethod::POST, "/s");
        REQUIRE(result.has_value());
        REQUIRE(result->is_null());
    }

    SECTION("Not found") {
        fixture.http->enqueue(make_response(404, R"({"message":"No active delegate"})"));
        auto result = fixture.gateway.request(ApiTarget::LeagueClient, HttpMethod::GET, "/s");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == GatewayError::Transport);
    }

    SECTION("Network failure") {
        fixture.http->enqueue(std::unexpected(NetworkError::Timeout));
        auto result = fixture.gateway.request(ApiTarget::LeagueClient, HttpMethod::GET, "/s");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == GatewayError::Transport);
    }

    SECTION("Garbage body") {
        fixture.http->enqueue(make_response(200, "<html>"));
        auto result = fixture.gateway.request(ApiTarget::LeagueClient, HttpMethod::GET, "/s");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == GatewayError::Parse);
    }
}

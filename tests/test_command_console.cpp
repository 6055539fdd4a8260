#include <catch2/catch.hpp>

#include "lcu_companion/services/commands/command_console.hpp"
#include "utils/fake_gateway.hpp"
#include "utils/fake_http_client.hpp"
#include "utils/fake_services.hpp"

#include <memory>

using namespace lcu_companion;
using namespace test_utils;
using namespace std::chrono_literals;

namespace {

struct ConsoleFixture {
    std::shared_ptr<core::EventBus> bus = std::make_shared<core::EventBus>();
    core::ConnectionStateStore state{bus};
    std::shared_ptr<MemoryConfigStore> store = std::make_shared<MemoryConfigStore>();
    core::ConfigurationService config{store, bus};
    FakeGateway gateway;
    services::LobbySnapshotBuilder lobby_builder;
    services::DodgeWatch dodge{1000ms, bus};
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    services::StatsApiClient stats{http, [] {
        core::StatsApiSettings settings;
        settings.min_interval = 0ms;
        return settings;
    }()};
    FakeBrowserLauncher browser;
    services::CommandService commands{state, config, gateway, lobby_builder, dodge, stats, browser, bus};
    services::CommandConsole console{commands};
};

} // namespace

TEST_CASE("CommandConsole - replies", "[console]") {
    ConsoleFixture fixture;

    SECTION("Plain value") {
        const auto reply = fixture.console.execute("get_connection_status");
        REQUIRE(reply.at("ok") == true);
        REQUIRE(reply.at("result") == false);
    }

    SECTION("Failure carries the error kind") {
        const auto reply = fixture.console.execute("  dodge  ");
        REQUIRE(reply.at("ok") == false);
        REQUIRE(reply.at("error") == "GatewayUnavailable");
        REQUIRE(reply.at("message").is_string());
        REQUIRE_FALSE(reply.contains("detail"));
    }

    SECTION("Dodge watch state") {
        const auto reply = fixture.console.execute("get_dodge_watch_state");
        REQUIRE(reply.at("result").at("phase") == "disarmed");
        REQUIRE(reply.at("result").at("gameId").is_null());
    }

    SECTION("Unknown command") {
        const auto reply = fixture.console.execute("fly");
        REQUIRE(reply.at("error") == "UnknownCommand");
    }

    SECTION("Non UTF-8 input is rejected before dispatch") {
        const auto reply = fixture.console.execute("\xff");
        REQUIRE(reply.at("ok") == false);
        REQUIRE(reply.at("error") == "InvalidArguments");
        REQUIRE_NOTHROW(reply.dump());
    }

    SECTION("Multibyte command names are echoed back") {
        const auto reply = fixture.console.execute("h\xc3\xa9lp");
        REQUIRE(reply.at("error") == "UnknownCommand");
        REQUIRE_NOTHROW(reply.dump());
    }

    SECTION("Help") {
        const auto reply = fixture.console.execute("help");
        REQUIRE(reply.at("result") == services::CommandConsole::help_text());
    }
}

TEST_CASE("CommandConsole - set_config merges into the current config", "[console]") {
    ConsoleFixture fixture;

    auto reply = fixture.console.execute(R"(set_config {"autoOpen": true, "regionOverride": "EUW"})");
    REQUIRE(reply.at("ok") == true);

    reply = fixture.console.execute(R"(set_config {"multiProvider": "ugg"})");
    REQUIRE(reply.at("ok") == true);

    const auto config = fixture.console.execute("get_config").at("result");
    REQUIRE(config.at("autoOpen") == true);
    REQUIRE(config.at("multiProvider") == "ugg");
    REQUIRE(config.at("regionOverride") == "EUW");

    SECTION("Null clears the override") {
        REQUIRE(fixture.console.execute(R"(set_config {"regionOverride": null})").at("ok") == true);
        REQUIRE_FALSE(fixture.config.get().region_override.has_value());
    }

    SECTION("Malformed arguments") {
        REQUIRE(fixture.console.execute("set_config {oops").at("error") == "InvalidArguments");
        REQUIRE(fixture.console.execute("set_config [1]").at("error") == "InvalidArguments");
        REQUIRE(fixture.console.execute(R"(set_config {"autoOpen": 1})").at("error") == "InvalidArguments");
        REQUIRE(fixture.config.get().auto_open);
    }
}

TEST_CASE("CommandConsole - call_stats_api", "[console]") {
    ConsoleFixture fixture;

    SECTION("Function and arguments") {
        fixture.http->enqueue(make_response(200, R"({"result":"done"})"));
        const auto reply = fixture.console.execute(R"(call_stats_api lol_list_champions {"lang": "en_US"})");
        REQUIRE(reply.at("result") == "done");

        const auto body = nlohmann::json::parse(fixture.http->requests().at(0).body);
        REQUIRE(body.at("params").at("name") == "lol_list_champions");
        REQUIRE(body.at("params").at("arguments").at("lang") == "en_US");
    }

    SECTION("Remote error detail") {
        fixture.http->enqueue(make_response(200, R"({"error":{"code":7}})"));
        const auto reply = fixture.console.execute("call_stats_api fn");
        REQUIRE(reply.at("error") == "RemoteApiError");
        REQUIRE(reply.at("detail").at("code") == 7);
    }

    SECTION("Missing function name") {
        REQUIRE(fixture.console.execute("call_stats_api").at("error") == "InvalidArguments");
    }

    SECTION("Function name that is not UTF-8") {
        const auto reply = fixture.console.execute("call_stats_api \xfe {}");
        REQUIRE(reply.at("error") == "InvalidArguments");
        REQUIRE(fixture.http->request_count() == 0);
    }
}

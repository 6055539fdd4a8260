#include <catch2/catch.hpp>

#include "lcu_companion/services/stats/stats_api_client.hpp"
#include "utils/fake_http_client.hpp"

#include <memory>

using namespace lcu_companion;
using namespace test_utils;
using core::StatsApiError;
using services::StatsApiClient;
using namespace std::chrono_literals;

namespace {

core::StatsApiSettings fast_settings() {
    core::StatsApiSettings settings;
    settings.endpoint = "https://stats.example.invalid/mcp";
    settings.timeout = 4s;
    settings.min_interval = 0ms;
    settings.cache_ttl = 300s;
    return settings;
}

HttpResult rpc_result(const nlohmann::json& result) {
    return make_response(200, nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", result}}.dump());
}

} // namespace

TEST_CASE("StatsApiClient - request shape", "[stats_api]") {
    auto http = std::make_shared<FakeHttpClient>();
    http->enqueue(rpc_result({{"content", "ok"}}));
    StatsApiClient client(http, fast_settings());

    auto result = client.call("lol_get_summoner_profile", {{"game_name", "Faker"}, {"tag_line", "KR1"}});
    REQUIRE(result.has_value());
    REQUIRE(result->at("content") == "ok");

    const auto requests = http->requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].method == services::HttpMethod::POST);
    REQUIRE(requests[0].url == "https://stats.example.invalid/mcp");
    REQUIRE(requests[0].timeout == 4s);

    const auto body = nlohmann::json::parse(requests[0].body);
    REQUIRE(body.at("jsonrpc") == "2.0");
    REQUIRE(body.at("method") == "tools/call");
    REQUIRE(body.at("id").is_number_unsigned());
    REQUIRE(body.at("params").at("name") == "lol_get_summoner_profile");
    REQUIRE(body.at("params").at("arguments").at("tag_line") == "KR1");
}

TEST_CASE("StatsApiClient - strings that are not UTF-8 are replaced in the request", "[stats_api]") {
    auto http = std::make_shared<FakeHttpClient>();
    http->enqueue(rpc_result("ok"));
    StatsApiClient client(http, fast_settings());

    nlohmann::json arguments = {{"game_name", std::string("Fa\xffker")}};
    auto result = client.call("\xfe", arguments);
    REQUIRE(result.has_value());

    const auto body = nlohmann::json::parse(http->requests().at(0).body);
    REQUIRE(body.at("params").at("name") == "\xef\xbf\xbd");
    REQUIRE(body.at("params").at("arguments").at("game_name") == "Fa\xef\xbf\xbdker");
}

TEST_CASE("StatsApiClient::interpret_response", "[stats_api]") {
    SECTION("Result") {
        auto result = StatsApiClient::interpret_response(R"({"jsonrpc":"2.0","id":1,"result":[1,2]})");
        REQUIRE(result.has_value());
        REQUIRE(result->size() == 2);
    }

    SECTION("Error wins over result") {
        auto result = StatsApiClient::interpret_response(
            R"({"result":{"a":1},"error":{"code":-32602,"message":"Invalid params"}})");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().error == StatsApiError::Remote);
        REQUIRE(result.error().remote_error.at("code") == -32602);
        REQUIRE(result.error().remote_error.at("message") == "Invalid params");
    }

    SECTION("Null error is ignored") {
        auto result = StatsApiClient::interpret_response(R"({"result":"fine","error":null})");
        REQUIRE(result.has_value());
        REQUIRE(*result == "fine");
    }

    SECTION("Neither result nor error") {
        auto result = StatsApiClient::interpret_response(R"({"jsonrpc":"2.0","id":1})");
        REQUIRE(result.error().error == StatsApiError::NoResponse);
    }

    SECTION("Unreadable body") {
        REQUIRE(StatsApiClient::interpret_response("<html>").error().error == StatsApiError::NoResponse);
        REQUIRE(StatsApiClient::interpret_response("[]").error().error == StatsApiError::NoResponse);
    }
}

TEST_CASE("StatsApiClient - transport failures", "[stats_api]") {
    auto http = std::make_shared<FakeHttpClient>();
    StatsApiClient client(http, fast_settings());

    SECTION("Network error") {
        http->enqueue(std::unexpected(NetworkError::Timeout));
        auto result = client.call("fn", nlohmann::json::object());
        REQUIRE(result.error().error == StatsApiError::Transport);
    }

    SECTION("Non-2xx status") {
        http->enqueue(make_response(503, "busy"));
        auto result = client.call("fn", nlohmann::json::object());
        REQUIRE(result.error().error == StatsApiError::Transport);
        REQUIRE(result.error().message == "HTTP 503");
    }

    REQUIRE(client.cache_size() == 0);
}

TEST_CASE("StatsApiClient - caches successful calls", "[stats_api]") {
    auto http = std::make_shared<FakeHttpClient>();
    http->set_handler([](const HttpRequest&) { return rpc_result("fresh"); });
    StatsApiClient client(http, fast_settings());

    REQUIRE(client.call("fn", {{"q", 1}}).value() == "fresh");
    REQUIRE(client.call("fn", {{"q", 1}}).value() == "fresh");
    REQUIRE(http->request_count() == 1);
    REQUIRE(client.cache_size() == 1);

    SECTION("Different arguments miss the cache") {
        REQUIRE(client.call("fn", {{"q", 2}}).has_value());
        REQUIRE(http->request_count() == 2);
    }

    SECTION("Clearing the cache forces a new request") {
        client.clear_cache();
        REQUIRE(client.call("fn", {{"q", 1}}).has_value());
        REQUIRE(http->request_count() == 2);
    }
}

TEST_CASE("StatsApiClient - failures are not cached", "[stats_api]") {
    auto http = std::make_shared<FakeHttpClient>();
    http->enqueue(make_response(200, R"({"error":{"code":1}})"));
    http->enqueue(rpc_result("second"));
    StatsApiClient client(http, fast_settings());

    REQUIRE(client.call("fn", nlohmann::json::object()).error().error == StatsApiError::Remote);
    REQUIRE(client.call("fn", nlohmann::json::object()).value() == "second");
    REQUIRE(http->request_count() == 2);
}

TEST_CASE("StatsApiClient - spaces requests by the minimum interval", "[stats_api]") {
    auto http = std::make_shared<FakeHttpClient>();
    http->set_handler([](const HttpRequest&) { return rpc_result(1); });

    auto settings = fast_settings();
    settings.min_interval = 100ms;
    StatsApiClient client(http, settings);

    const auto start = std::chrono::steady_clock::now();
    REQUIRE(client.call("fn", {{"q", 1}}).has_value());
    REQUIRE(client.call("fn", {{"q", 2}}).has_value());
    REQUIRE(client.call("fn", {{"q", 3}}).has_value());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(elapsed >= 200ms);
    REQUIRE(http->request_count() == 3);
}

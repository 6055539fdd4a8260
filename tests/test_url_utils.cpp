#include <catch2/catch.hpp>

#include "lcu_companion/utils/url_utils.hpp"

using lcu_companion::utils::UrlUtils;

TEST_CASE("UrlUtils::encode", "[url]") {
    REQUIRE(UrlUtils::encode("abcXYZ019-_.~") == "abcXYZ019-_.~");
    REQUIRE(UrlUtils::encode("Faker#KR1") == "Faker%23KR1");
    REQUIRE(UrlUtils::encode("a b,c") == "a%20b%2Cc");
    REQUIRE(UrlUtils::encode(R"(["x"])") == "%5B%22x%22%5D");
    REQUIRE(UrlUtils::encode("\xC3\xA9") == "%C3%A9");
    REQUIRE(UrlUtils::encode("").empty());
}

TEST_CASE("UrlUtils::join_path", "[url]") {
    REQUIRE(UrlUtils::join_path("https://127.0.0.1:1234", "/lol-gameflow/v1/gameflow-phase") ==
            "https://127.0.0.1:1234/lol-gameflow/v1/gameflow-phase");
    REQUIRE(UrlUtils::join_path("https://host/", "/path") == "https://host/path");
    REQUIRE(UrlUtils::join_path("https://host", "path") == "https://host/path");
    REQUIRE(UrlUtils::join_path("", "/path") == "/path");
    REQUIRE(UrlUtils::join_path("https://host", "") == "https://host");
}

TEST_CASE("UrlUtils::build_query_string keeps order", "[url]") {
    REQUIRE(UrlUtils::build_query_string({{"z", "1"}, {"a", "two words"}}) == "z=1&a=two%20words");
    REQUIRE(UrlUtils::build_query_string({}).empty());
}

TEST_CASE("UrlUtils - url inspection", "[url]") {
    REQUIRE(UrlUtils::is_valid_url("https://www.op.gg/multisearch/euw?summoners=a"));
    REQUIRE(UrlUtils::is_valid_url("http://localhost:8080"));
    REQUIRE_FALSE(UrlUtils::is_valid_url("file:///etc/passwd"));
    REQUIRE_FALSE(UrlUtils::is_valid_url("not a url"));
    REQUIRE_FALSE(UrlUtils::is_valid_url("https://"));

    REQUIRE_FALSE(UrlUtils::is_valid_url("https://host:notaport/"));
}

TEST_CASE("UrlUtils::parse", "[url]") {
    const auto stats = UrlUtils::parse("https://u.gg/multisearch?x=1");
    REQUIRE(stats.has_value());
    REQUIRE(stats->scheme == "https");
    REQUIRE(stats->host == "u.gg");
    REQUIRE_FALSE(stats->port.has_value());

    const auto loopback = UrlUtils::parse("https://127.0.0.1:51234/lol-gameflow/v1/gameflow-phase");
    REQUIRE(loopback.has_value());
    REQUIRE(loopback->host == "127.0.0.1");
    REQUIRE(loopback->port == 51234);

    REQUIRE_FALSE(UrlUtils::parse("://u.gg").has_value());
    REQUIRE_FALSE(UrlUtils::parse("https://host:99999").has_value());
}

#include <catch2/catch.hpp>

#include "lcu_companion/utils/yaml_config.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace lcu_companion;
using lcu_companion::utils::YamlConfigHelper;
using namespace std::chrono_literals;

namespace {

std::filesystem::path temp_settings_path(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("lcu-companion-yaml-" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    return dir / name;
}

} // namespace

TEST_CASE("YamlConfigHelper - missing keys keep defaults", "[yaml_config]") {
    const auto settings = YamlConfigHelper::from_yaml(YAML::Load("log_level: debug\n"));
    const core::AppSettings defaults;

    REQUIRE(settings.log_level == "debug");
    REQUIRE(settings.gateway.process_name == defaults.gateway.process_name);
    REQUIRE(settings.gateway.poll_interval == defaults.gateway.poll_interval);
    REQUIRE(settings.lobby.champ_select_marker == "champ-select");
    REQUIRE(settings.dodge.trigger_threshold == 1000ms);
    REQUIRE(settings.stats_api.endpoint == defaults.stats_api.endpoint);
}

TEST_CASE("YamlConfigHelper - nested values", "[yaml_config]") {
    const auto settings = YamlConfigHelper::from_yaml(YAML::Load(
        "gateway:\n"
        "  process_name: LeagueClientUxRender\n"
        "  request_timeout_s: 5\n"
        "lobby:\n"
        "  champ_select_marker: champ-select-v2\n"
        "dodge:\n"
        "  trigger_threshold_ms: 1500\n"
        "stats_api:\n"
        "  min_interval_ms: 0\n"
        "  cache_ttl_s: 60\n"));

    REQUIRE(settings.gateway.process_name == "LeagueClientUxRender");
    REQUIRE(settings.gateway.request_timeout == 5s);
    REQUIRE(settings.lobby.champ_select_marker == "champ-select-v2");
    REQUIRE(settings.dodge.trigger_threshold == 1500ms);
    REQUIRE(settings.dodge.poll_interval == 500ms);
    REQUIRE(settings.stats_api.min_interval == 0ms);
    REQUIRE(settings.stats_api.cache_ttl == 60s);
}

TEST_CASE("YamlConfigHelper - out of range values are clamped", "[yaml_config]") {
    const auto settings = YamlConfigHelper::from_yaml(YAML::Load(
        "gateway:\n"
        "  poll_interval_ms: 1\n"
        "  request_timeout_s: 100000\n"
        "dodge:\n"
        "  trigger_threshold_ms: -50\n"
        "lobby:\n"
        "  champ_select_marker: ''\n"
        "stats_api:\n"
        "  endpoint: 'ftp://stats'\n"));

    REQUIRE(settings.gateway.poll_interval == core::ConfigLimits::MIN_POLL_INTERVAL);
    REQUIRE(settings.gateway.request_timeout == core::ConfigLimits::MAX_REQUEST_TIMEOUT);
    REQUIRE(settings.dodge.trigger_threshold == 0ms);
    REQUIRE(settings.lobby.champ_select_marker == "champ-select");
    REQUIRE(settings.stats_api.endpoint == core::AppSettings{}.stats_api.endpoint);
}

TEST_CASE("YamlConfigHelper - file round trip", "[yaml_config]") {
    const auto path = temp_settings_path("settings.yaml");

    core::AppSettings settings;
    settings.log_level = "warning";
    settings.dodge.trigger_threshold = 2500ms;
    settings.stats_api.endpoint = "https://example.invalid/rpc";

    REQUIRE(YamlConfigHelper::save_to_file(settings, path).has_value());

    auto loaded = YamlConfigHelper::load_from_file(path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->log_level == "warning");
    REQUIRE(loaded->dodge.trigger_threshold == 2500ms);
    REQUIRE(loaded->stats_api.endpoint == "https://example.invalid/rpc");

    std::filesystem::remove_all(path.parent_path());
}

TEST_CASE("YamlConfigHelper - file errors", "[yaml_config]") {
    SECTION("Missing file") {
        auto loaded = YamlConfigHelper::load_from_file(temp_settings_path("absent.yaml"));
        REQUIRE(loaded.error() == core::ConfigError::FileNotFound);
    }

    SECTION("Malformed file") {
        const auto path = temp_settings_path("broken.yaml");
        {
            std::ofstream file(path);
            file << "gateway: [unterminated\n";
        }
        auto loaded = YamlConfigHelper::load_from_file(path);
        REQUIRE(loaded.error() == core::ConfigError::InvalidFormat);
        std::filesystem::remove(path);
    }

    SECTION("Wrong value type") {
        const auto path = temp_settings_path("mistyped.yaml");
        {
            std::ofstream file(path);
            file << "dodge:\n  trigger_threshold_ms: soon\n";
        }
        auto loaded = YamlConfigHelper::load_from_file(path);
        REQUIRE(loaded.error() == core::ConfigError::InvalidFormat);
        std::filesystem::remove(path);
    }
}

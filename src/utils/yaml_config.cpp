#include "lcu_companion/utils/yaml_config.hpp"
#include "lcu_companion/utils/logger.hpp"
#include "lcu_companion/utils/url_utils.hpp"

#include <algorithm>
#include <fstream>

namespace lcu_companion {
namespace utils {

namespace {

constexpr const char* SETTINGS_HEADER =
    "# LCU Companion operator settings\n"
    "# This file was automatically generated on first run\n"
    "#\n"
    "# log_level: debug, info, warning, error or none\n"
    "# gateway.process_name: executable name of the game client UX process\n"
    "# gateway.poll_interval_ms: how often to look for the client process\n"
    "# gateway.request_timeout_s: timeout for every request to the client\n"
    "# lobby.champ_select_marker: participants whose id contains this are in champ select\n"
    "# dodge.poll_interval_ms: how often an armed watch re-checks the session\n"
    "# dodge.trigger_threshold_ms: leave when this much time is left in finalization\n"
    "# stats_api.endpoint: JSON-RPC endpoint of the stats service\n"
    "# stats_api.timeout_s: timeout for stats service calls\n"
    "# stats_api.min_interval_ms: minimum spacing between stats service calls\n"
    "# stats_api.cache_ttl_s: how long identical calls are answered from cache\n\n";

template<typename Duration>
Duration read_duration(const YAML::Node& node, const char* key, Duration fallback) {
    if (!node[key]) {
        return fallback;
    }
    return Duration(node[key].as<typename Duration::rep>());
}

template<typename Duration>
Duration clamp_duration(Duration value, Duration min, Duration max) {
    return std::clamp(value, min, max);
}

} // namespace

std::expected<core::AppSettings, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        LCU_LOG_DEBUG("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        const YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        LCU_LOG_ERROR("YamlConfig", "Parse error in " + path.string() + ": " + e.what());
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<void, core::ConfigError>
YamlConfigHelper::save_to_file(const core::AppSettings& settings, const std::filesystem::path& path) {
    std::error_code ec;
    const auto dir = path.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            LCU_LOG_ERROR("YamlConfig", "Cannot create " + dir.string() + ": " + ec.message());
            return std::unexpected(core::ConfigError::PermissionDenied);
        }
    }

    std::ofstream file(path);
    if (!file) {
        LCU_LOG_ERROR("YamlConfig", "Cannot open file for writing: " + path.string());
        return std::unexpected(core::ConfigError::PermissionDenied);
    }

    YAML::Emitter emitter;
    emitter << to_yaml(settings);
    file << SETTINGS_HEADER << emitter.c_str() << '\n';
    if (!file) {
        return std::unexpected(core::ConfigError::PermissionDenied);
    }
    return {};
}

core::AppSettings YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::AppSettings settings;

    if (node["log_level"]) {
        settings.log_level = node["log_level"].as<std::string>();
    }
    if (node["gateway"]) {
        settings.gateway = parse_gateway_settings(node["gateway"]);
    }
    if (node["lobby"] && node["lobby"]["champ_select_marker"]) {
        settings.lobby.champ_select_marker = node["lobby"]["champ_select_marker"].as<std::string>();
    }
    if (node["dodge"]) {
        settings.dodge = parse_dodge_settings(node["dodge"]);
    }
    if (node["stats_api"]) {
        settings.stats_api = parse_stats_api_settings(node["stats_api"]);
    }

    return clamp_to_limits(std::move(settings));
}

YAML::Node YamlConfigHelper::to_yaml(const core::AppSettings& settings) {
    YAML::Node node;

    node["log_level"] = settings.log_level;

    node["gateway"]["process_name"] = settings.gateway.process_name;
    node["gateway"]["poll_interval_ms"] = settings.gateway.poll_interval.count();
    node["gateway"]["request_timeout_s"] = settings.gateway.request_timeout.count();

    node["lobby"]["champ_select_marker"] = settings.lobby.champ_select_marker;

    node["dodge"]["poll_interval_ms"] = settings.dodge.poll_interval.count();
    node["dodge"]["trigger_threshold_ms"] = settings.dodge.trigger_threshold.count();

    node["stats_api"]["endpoint"] = settings.stats_api.endpoint;
    node["stats_api"]["timeout_s"] = settings.stats_api.timeout.count();
    node["stats_api"]["min_interval_ms"] = settings.stats_api.min_interval.count();
    node["stats_api"]["cache_ttl_s"] = settings.stats_api.cache_ttl.count();

    return node;
}

core::AppSettings YamlConfigHelper::clamp_to_limits(core::AppSettings settings) {
    using Limits = core::ConfigLimits;
    const core::AppSettings defaults;

    settings.gateway.poll_interval = clamp_duration(
        settings.gateway.poll_interval, Limits::MIN_POLL_INTERVAL, Limits::MAX_POLL_INTERVAL);
    settings.gateway.request_timeout = clamp_duration(
        settings.gateway.request_timeout, Limits::MIN_REQUEST_TIMEOUT, Limits::MAX_REQUEST_TIMEOUT);
    settings.dodge.poll_interval = clamp_duration(
        settings.dodge.poll_interval, Limits::MIN_POLL_INTERVAL, Limits::MAX_POLL_INTERVAL);
    settings.dodge.trigger_threshold = clamp_duration(
        settings.dodge.trigger_threshold, std::chrono::milliseconds(0), Limits::MAX_TRIGGER_THRESHOLD);
    settings.stats_api.timeout = clamp_duration(
        settings.stats_api.timeout, Limits::MIN_REQUEST_TIMEOUT, Limits::MAX_REQUEST_TIMEOUT);
    settings.stats_api.min_interval = clamp_duration(
        settings.stats_api.min_interval, std::chrono::milliseconds(0), Limits::MAX_MIN_INTERVAL);
    settings.stats_api.cache_ttl = clamp_duration(
        settings.stats_api.cache_ttl, std::chrono::seconds(0), Limits::MAX_CACHE_TTL);

    // An empty marker would match every participant
    if (settings.lobby.champ_select_marker.empty()) {
        settings.lobby.champ_select_marker = defaults.lobby.champ_select_marker;
    }
    if (settings.gateway.process_name.empty()) {
        settings.gateway.process_name = defaults.gateway.process_name;
    }
    if (!UrlUtils::is_valid_url(settings.stats_api.endpoint)) {
        settings.stats_api.endpoint = defaults.stats_api.endpoint;
    }

    return settings;
}

core::GatewaySettings YamlConfigHelper::parse_gateway_settings(const YAML::Node& node) {
    core::GatewaySettings settings;

    if (node["process_name"]) {
        settings.process_name = node["process_name"].as<std::string>();
    }
    settings.poll_interval = read_duration(node, "poll_interval_ms", settings.poll_interval);
    settings.request_timeout = read_duration(node, "request_timeout_s", settings.request_timeout);

    return settings;
}

core::DodgeSettings YamlConfigHelper::parse_dodge_settings(const YAML::Node& node) {
    core::DodgeSettings settings;

    settings.poll_interval = read_duration(node, "poll_interval_ms", settings.poll_interval);
    settings.trigger_threshold = read_duration(node, "trigger_threshold_ms", settings.trigger_threshold);

    return settings;
}

core::StatsApiSettings YamlConfigHelper::parse_stats_api_settings(const YAML::Node& node) {
    core::StatsApiSettings settings;

    if (node["endpoint"]) {
        settings.endpoint = node["endpoint"].as<std::string>();
    }
    settings.timeout = read_duration(node, "timeout_s", settings.timeout);
    settings.min_interval = read_duration(node, "min_interval_ms", settings.min_interval);
    settings.cache_ttl = read_duration(node, "cache_ttl_s", settings.cache_ttl);

    return settings;
}

} // namespace utils
} // namespace lcu_companion

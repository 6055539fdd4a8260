#pragma once

#include "lcu_companion/core/models.hpp"

#include <yaml-cpp/yaml.h>

#include <expected>
#include <filesystem>

namespace lcu_companion {
namespace utils {

// Operator settings live in settings.yaml next to config.json
class YamlConfigHelper {
public:
    static std::expected<core::AppSettings, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    // Writes the settings with a commented header describing each key
    static std::expected<void, core::ConfigError>
    save_to_file(const core::AppSettings& settings, const std::filesystem::path& path);

    // Missing keys keep their defaults; out-of-range values are clamped
    static core::AppSettings from_yaml(const YAML::Node& node);
    static YAML::Node to_yaml(const core::AppSettings& settings);

    static core::AppSettings clamp_to_limits(core::AppSettings settings);

private:
    static core::GatewaySettings parse_gateway_settings(const YAML::Node& node);
    static core::DodgeSettings parse_dodge_settings(const YAML::Node& node);
    static core::StatsApiSettings parse_stats_api_settings(const YAML::Node& node);
};

} // namespace utils
} // namespace lcu_companion

#include "lcu_companion/core/config_service.hpp"
#include "lcu_companion/core/events.hpp"
#include "lcu_companion/core/model_json.hpp"
#include "lcu_companion/utils/json_helper.hpp"
#include "lcu_companion/utils/logger.hpp"
#include "lcu_companion/utils/yaml_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace lcu_companion::core {

std::filesystem::path default_config_directory() {
    std::filesystem::path config_dir;

#ifdef _WIN32
    if (const char* app_data = std::getenv("APPDATA")) {
        config_dir = std::filesystem::path(app_data) / "LCU Companion";
    }
#else
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME"); xdg_config && *xdg_config) {
        config_dir = std::filesystem::path(xdg_config) / "lcu-companion";
    } else if (const char* home = std::getenv("HOME")) {
        config_dir = std::filesystem::path(home) / ".config" / "lcu-companion";
    }
#endif

    if (config_dir.empty()) {
        config_dir = std::filesystem::current_path() / "lcu-companion";
    }
    return config_dir;
}

JsonConfigStore::JsonConfigStore(std::filesystem::path path)
    : m_path(std::move(path)) {}

std::expected<UserConfig, ConfigError> JsonConfigStore::load() {
    if (!std::filesystem::exists(m_path)) {
        return std::unexpected(ConfigError::FileNotFound);
    }

    std::ifstream file(m_path);
    if (!file) {
        LCU_LOG_ERROR("ConfigStore", "Cannot open " + m_path.string());
        return std::unexpected(ConfigError::PermissionDenied);
    }

    const std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto json = utils::JsonHelper::safe_parse(content);
    if (!json) {
        LCU_LOG_ERROR("ConfigStore", "Malformed " + m_path.string() + ": " + json.error());
        return std::unexpected(ConfigError::InvalidFormat);
    }

    auto config = parse_user_config(*json);
    if (!config) {
        LCU_LOG_ERROR("ConfigStore", "Invalid configuration in " + m_path.string() + ": " + config.error());
        return std::unexpected(ConfigError::ValidationError);
    }
    return std::move(*config);
}

std::expected<void, ConfigError> JsonConfigStore::save(const UserConfig& config) {
    std::error_code ec;
    const auto dir = m_path.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            LCU_LOG_ERROR("ConfigStore", "Cannot create " + dir.string() + ": " + ec.message());
            return std::unexpected(ConfigError::PermissionDenied);
        }
    }

    auto temp_path = m_path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            LCU_LOG_ERROR("ConfigStore", "Cannot open file for writing: " + temp_path.string());
            return std::unexpected(ConfigError::PermissionDenied);
        }
        file << to_json(config).dump(2) << '\n';
        if (!file.flush()) {
            return std::unexpected(ConfigError::PermissionDenied);
        }
    }

    std::filesystem::rename(temp_path, m_path, ec);
    if (ec) {
        LCU_LOG_ERROR("ConfigStore", "Cannot replace " + m_path.string() + ": " + ec.message());
        std::filesystem::remove(temp_path, ec);
        return std::unexpected(ConfigError::PermissionDenied);
    }
    return {};
}

ConfigurationService::ConfigurationService(std::shared_ptr<ConfigStore> store,
                                           std::shared_ptr<EventBus> event_bus)
    : m_store(std::move(store))
    , m_event_bus(std::move(event_bus)) {}

std::expected<void, ConfigError> ConfigurationService::load() {
    LCU_LOG_INFO("ConfigService", "Loading configuration");

    auto result = m_store->load();
    if (result) {
        std::unique_lock lock(m_mutex);
        m_config = std::move(*result);
        return {};
    }

    {
        std::unique_lock lock(m_mutex);
        m_config = UserConfig{};
    }

    if (result.error() == ConfigError::FileNotFound) {
        LCU_LOG_INFO("ConfigService", "No configuration found, writing defaults");
        return persist_current();
    }

    LCU_LOG_ERROR("ConfigService", "Using default configuration: " + to_string(result.error()));
    if (m_event_bus) {
        m_event_bus->publish(events::ConfigurationError{
            result.error(), "Configuration could not be read; defaults are in use"});
    }
    return std::unexpected(result.error());
}

UserConfig ConfigurationService::get() const {
    std::shared_lock lock(m_mutex);
    return m_config;
}

std::expected<void, ConfigError> ConfigurationService::update(const UserConfig& config) {
    UserConfig old_config;
    {
        std::unique_lock lock(m_mutex);
        old_config = m_config;
        m_config = config;
    }

    // Save and publish outside of the state lock
    auto result = persist_current();
    if (!result) {
        LCU_LOG_ERROR("ConfigService", "Failed to save configuration: " + to_string(result.error()));
        return result;
    }

    LCU_LOG_INFO("ConfigService", "Configuration updated");
    if (m_event_bus) {
        m_event_bus->publish(events::ConfigurationUpdated{std::move(old_config), config});
    }
    return {};
}

std::expected<void, ConfigError> ConfigurationService::persist_current() {
    // Serialized so the file always ends up holding the latest value
    std::lock_guard persist_lock(m_persist_mutex);
    return m_store->save(get());
}

AppSettings load_or_create_settings(const std::filesystem::path& path) {
    auto settings = utils::YamlConfigHelper::load_from_file(path);
    if (settings) {
        return std::move(*settings);
    }

    if (settings.error() == ConfigError::FileNotFound) {
        AppSettings defaults;
        if (auto saved = utils::YamlConfigHelper::save_to_file(defaults, path); !saved) {
            LCU_LOG_WARNING("ConfigService", "Could not write default settings to " + path.string());
        }
        return defaults;
    }

    LCU_LOG_ERROR("ConfigService", "Using default settings: " + to_string(settings.error()));
    return AppSettings{};
}

} // namespace lcu_companion::core

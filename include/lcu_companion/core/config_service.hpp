#pragma once

#include "lcu_companion/core/event_bus.hpp"
#include "lcu_companion/core/models.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace lcu_companion::core {

// $XDG_CONFIG_HOME/lcu-companion, ~/.config/lcu-companion or %APPDATA%\LCU Companion
std::filesystem::path default_config_directory();

// Persistence collaborator for UserConfig
class ConfigStore {
public:
    virtual ~ConfigStore() = default;
    virtual std::expected<UserConfig, ConfigError> load() = 0;
    virtual std::expected<void, ConfigError> save(const UserConfig& config) = 0;
};

// config.json; writes go through a temporary file and a rename
class JsonConfigStore : public ConfigStore {
public:
    explicit JsonConfigStore(std::filesystem::path path);

    std::expected<UserConfig, ConfigError> load() override;
    std::expected<void, ConfigError> save(const UserConfig& config) override;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

// Owns the in-memory UserConfig. Last write wins.
class ConfigurationService {
public:
    ConfigurationService(std::shared_ptr<ConfigStore> store,
                         std::shared_ptr<EventBus> event_bus = nullptr);

    ConfigurationService(const ConfigurationService&) = delete;
    ConfigurationService& operator=(const ConfigurationService&) = delete;

    // Missing file: defaults are written. Malformed file: defaults are used and
    // the file is left untouched for the user to fix.
    std::expected<void, ConfigError> load();

    [[nodiscard]] UserConfig get() const;

    // Replaces the value under lock, then persists outside it. The in-memory
    // value stays replaced even when persisting fails.
    std::expected<void, ConfigError> update(const UserConfig& config);

private:
    std::expected<void, ConfigError> persist_current();

    mutable std::shared_mutex m_mutex;
    std::mutex m_persist_mutex;
    UserConfig m_config;
    std::shared_ptr<ConfigStore> m_store;
    std::shared_ptr<EventBus> m_event_bus;
};

// Reads settings.yaml, creating it with defaults when absent. Never fails:
// unreadable files fall back to defaults with an error logged.
AppSettings load_or_create_settings(const std::filesystem::path& path);

} // namespace lcu_companion::core

#pragma once

#include "lcu_companion/core/config_service.hpp"
#include "lcu_companion/platform/browser_launcher.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace test_utils {

// In-memory config.json; saves can be made to fail
class MemoryConfigStore : public lcu_companion::core::ConfigStore {
public:
    std::expected<lcu_companion::core::UserConfig, lcu_companion::core::ConfigError> load() override {
        std::lock_guard lock(m_mutex);
        if (!stored) {
            return std::unexpected(lcu_companion::core::ConfigError::FileNotFound);
        }
        return *stored;
    }

    std::expected<void, lcu_companion::core::ConfigError> save(
        const lcu_companion::core::UserConfig& config) override {
        std::lock_guard lock(m_mutex);
        if (fail_saves) {
            return std::unexpected(lcu_companion::core::ConfigError::PermissionDenied);
        }
        stored = config;
        return {};
    }

    bool fail_saves = false;
    std::optional<lcu_companion::core::UserConfig> stored;

private:
    std::mutex m_mutex;
};

class FakeBrowserLauncher : public lcu_companion::platform::BrowserLauncher {
public:
    std::expected<void, lcu_companion::platform::BrowserLaunchError> open_url(const std::string& url) override {
        std::lock_guard lock(m_mutex);
        m_opened.push_back(url);
        if (fail) {
            return std::unexpected(lcu_companion::platform::BrowserLaunchError::LaunchFailed);
        }
        return {};
    }

    std::vector<std::string> opened() const {
        std::lock_guard lock(m_mutex);
        return m_opened;
    }

    bool fail = false;

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_opened;
};

} // namespace test_utils

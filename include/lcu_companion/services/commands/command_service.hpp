#pragma once

#include "lcu_companion/core/config_service.hpp"
#include "lcu_companion/core/connection_state.hpp"
#include "lcu_companion/core/event_bus.hpp"
#include "lcu_companion/core/models.hpp"
#include "lcu_companion/platform/browser_launcher.hpp"
#include "lcu_companion/services/dodge/dodge_watch.hpp"
#include "lcu_companion/services/gateway/client_gateway.hpp"
#include "lcu_companion/services/lobby/lobby_builder.hpp"
#include "lcu_companion/services/stats/stats_api_client.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <memory>
#include <string>

namespace lcu_companion::services {

struct CommandFailure {
    core::CommandError error;
    std::string message;
    // Remote error object for RemoteApiError, null otherwise
    nlohmann::json detail;
};

template<typename T>
using CommandResult = std::expected<T, CommandFailure>;

CommandFailure to_command_failure(core::GatewayError error);
CommandFailure to_command_failure(const StatsApiFailure& failure);
CommandFailure to_command_failure(core::ConfigError error);
CommandFailure to_command_failure(platform::BrowserLaunchError error);

// The operations offered to the UI layer. Every failure names its kind so
// "no client running" is never reported as "request failed".
class CommandService {
public:
    CommandService(const core::ConnectionStateStore& connection_state,
                   core::ConfigurationService& config,
                   ClientGateway& gateway,
                   const LobbySnapshotBuilder& lobby_builder,
                   DodgeWatch& dodge_watch,
                   StatsApiClient& stats_api,
                   platform::BrowserLauncher& browser,
                   std::shared_ptr<core::EventBus> event_bus = nullptr);

    CommandService(const CommandService&) = delete;
    CommandService& operator=(const CommandService&) = delete;

    // Rebroadcasts the connection status for a freshly started UI and
    // returns the current config
    CommandResult<core::UserConfig> app_ready();

    CommandResult<bool> get_connection_status() const;
    CommandResult<core::UserConfig> get_config() const;
    CommandResult<void> set_config(const core::UserConfig& config);

    // Opens the multi-search page for the current lobby; returns the URL
    CommandResult<std::string> open_stats_link();

    CommandResult<core::GatewayEndpointInfo> get_client_info() const;

    CommandResult<void> dodge();
    CommandResult<core::DodgeWatchStatus> toggle_dodge_watch();
    CommandResult<core::DodgeWatchStatus> get_dodge_watch_state() const;

    CommandResult<nlohmann::json> call_stats_api(const std::string& function_name,
                                                 const nlohmann::json& arguments);

private:
    CommandResult<void> require_connection() const;
    CommandResult<std::string> resolve_region();

    const core::ConnectionStateStore& m_connection_state;
    core::ConfigurationService& m_config;
    ClientGateway& m_gateway;
    const LobbySnapshotBuilder& m_lobby_builder;
    DodgeWatch& m_dodge_watch;
    StatsApiClient& m_stats_api;
    platform::BrowserLauncher& m_browser;
    std::shared_ptr<core::EventBus> m_event_bus;
};

} // namespace lcu_companion::services

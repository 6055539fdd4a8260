#include "lcu_companion/services/commands/command_service.hpp"
#include "lcu_companion/core/events.hpp"
#include "lcu_companion/services/champ_select/champ_select_session.hpp"
#include "lcu_companion/services/stats/stats_link_builder.hpp"
#include "lcu_companion/utils/logger.hpp"

namespace lcu_companion::services {

using core::CommandError;

CommandFailure to_command_failure(core::GatewayError error) {
    switch (error) {
        case core::GatewayError::Unavailable:
            return {CommandError::GatewayUnavailable, "Game client is not running", nullptr};
        case core::GatewayError::Transport:
            return {CommandError::TransportError, "Game client request failed", nullptr};
        case core::GatewayError::Parse:
            return {CommandError::ParseError, "Unexpected response from the game client", nullptr};
    }
    return {CommandError::TransportError, core::to_string(error), nullptr};
}

CommandFailure to_command_failure(const StatsApiFailure& failure) {
    switch (failure.error) {
        case core::StatsApiError::Remote:
            return {CommandError::RemoteApiError, failure.message, failure.remote_error};
        case core::StatsApiError::Transport:
            return {CommandError::TransportError, failure.message, nullptr};
        case core::StatsApiError::NoResponse:
            break;
    }
    return {CommandError::NoResponse, failure.message, nullptr};
}

CommandFailure to_command_failure(core::ConfigError error) {
    return {CommandError::PersistenceError, "Could not save config: " + core::to_string(error), nullptr};
}

CommandFailure to_command_failure(platform::BrowserLaunchError error) {
    return {CommandError::LaunchFailed, "Could not open browser: " + platform::to_string(error), nullptr};
}

CommandService::CommandService(const core::ConnectionStateStore& connection_state,
                               core::ConfigurationService& config,
                               ClientGateway& gateway,
                               const LobbySnapshotBuilder& lobby_builder,
                               DodgeWatch& dodge_watch,
                               StatsApiClient& stats_api,
                               platform::BrowserLauncher& browser,
                               std::shared_ptr<core::EventBus> event_bus)
    : m_connection_state(connection_state)
    , m_config(config)
    , m_gateway(gateway)
    , m_lobby_builder(lobby_builder)
    , m_dodge_watch(dodge_watch)
    , m_stats_api(stats_api)
    , m_browser(browser)
    , m_event_bus(std::move(event_bus)) {}

CommandResult<core::UserConfig> CommandService::app_ready() {
    const auto state = m_connection_state.snapshot();
    LCU_LOG_INFO("Commands", std::string("UI ready, client ") + (state.connected ? "connected" : "not connected"));

    if (m_event_bus) {
        m_event_bus->publish(core::events::GatewayConnectionChanged{state.connected, state.endpoint_info});
    }
    return m_config.get();
}

CommandResult<bool> CommandService::get_connection_status() const {
    return m_connection_state.is_connected();
}

CommandResult<core::UserConfig> CommandService::get_config() const {
    return m_config.get();
}

CommandResult<void> CommandService::set_config(const core::UserConfig& config) {
    auto result = m_config.update(config);
    if (!result) {
        return std::unexpected(to_command_failure(result.error()));
    }
    return {};
}

CommandResult<std::string> CommandService::open_stats_link() {
    if (auto connected = require_connection(); !connected) {
        return std::unexpected(connected.error());
    }

    auto region = resolve_region();
    if (!region) {
        return std::unexpected(region.error());
    }

    const auto lobby = m_lobby_builder.build_lobby(m_gateway);
    if (lobby.empty()) {
        LCU_LOG_WARNING("Commands", "No champ select participants found");
    }

    const auto url = StatsLinkBuilder::build_multisearch_url(m_config.get().multi_provider, *region, lobby);
    if (auto opened = m_browser.open_url(url); !opened) {
        return std::unexpected(to_command_failure(opened.error()));
    }
    return url;
}

CommandResult<core::GatewayEndpointInfo> CommandService::get_client_info() const {
    auto endpoint = m_connection_state.endpoint();
    if (!endpoint) {
        return std::unexpected(to_command_failure(core::GatewayError::Unavailable));
    }
    return std::move(*endpoint);
}

CommandResult<void> CommandService::dodge() {
    if (auto connected = require_connection(); !connected) {
        return connected;
    }

    auto result = m_dodge_watch.trigger_leave(m_gateway);
    if (!result) {
        return std::unexpected(to_command_failure(result.error()));
    }
    return {};
}

CommandResult<core::DodgeWatchStatus> CommandService::toggle_dodge_watch() {
    // Disarming never needs the client
    if (m_dodge_watch.status().phase == core::DodgeWatchPhase::Disarmed) {
        if (auto connected = require_connection(); !connected) {
            return std::unexpected(connected.error());
        }
    }

    auto result = m_dodge_watch.toggle_watch(m_gateway);
    if (!result) {
        return std::unexpected(to_command_failure(result.error()));
    }
    return *result;
}

CommandResult<core::DodgeWatchStatus> CommandService::get_dodge_watch_state() const {
    return m_dodge_watch.status();
}

CommandResult<nlohmann::json> CommandService::call_stats_api(const std::string& function_name,
                                                             const nlohmann::json& arguments) {
    auto result = m_stats_api.call(function_name, arguments);
    if (!result) {
        return std::unexpected(to_command_failure(result.error()));
    }
    return std::move(*result);
}

CommandResult<void> CommandService::require_connection() const {
    if (!m_connection_state.is_connected()) {
        return std::unexpected(to_command_failure(core::GatewayError::Unavailable));
    }
    return {};
}

CommandResult<std::string> CommandService::resolve_region() {
    if (const auto override_region = m_config.get().region_override;
        override_region && !override_region->empty()) {
        return *override_region;
    }

    auto region = fetch_region_info(m_gateway);
    if (!region) {
        return std::unexpected(to_command_failure(region.error()));
    }
    return StatsLinkBuilder::region_short_code(region->web_region);
}

} // namespace lcu_companion::services

#include "lcu_companion/core/application.hpp"
#include "lcu_companion/core/config_service.hpp"
#include "lcu_companion/core/connection_state.hpp"
#include "lcu_companion/core/event_bus.hpp"
#include "lcu_companion/core/events.hpp"
#include "lcu_companion/platform/browser_launcher.hpp"
#include "lcu_companion/services/commands/command_service.hpp"
#include "lcu_companion/services/dodge/dodge_watch.hpp"
#include "lcu_companion/services/gameflow/gameflow_watcher.hpp"
#include "lcu_companion/services/gateway/lcu_gateway.hpp"
#include "lcu_companion/services/gateway/lifecycle_monitor.hpp"
#include "lcu_companion/services/gateway/process_scanner.hpp"
#include "lcu_companion/services/lobby/lobby_builder.hpp"
#include "lcu_companion/services/network/http_client.hpp"
#include "lcu_companion/services/stats/stats_api_client.hpp"
#include "lcu_companion/utils/logger.hpp"
#include "lcu_companion/utils/threading.hpp"
#include "version.h"

#include <atomic>
#include <chrono>
#include <vector>

namespace lcu_companion {
namespace core {

class ApplicationImpl : public Application {
public:
    explicit ApplicationImpl(ApplicationOptions options)
        : m_options(std::move(options)) {
        LCU_LOG_DEBUG("Application", "Application created");
    }

    ~ApplicationImpl() override {
        if (m_state != ApplicationState::NotInitialized && m_state != ApplicationState::Stopped) {
            stop();
            shutdown();
        }
        LCU_LOG_DEBUG("Application", "Application destroyed");
    }

    std::expected<void, ApplicationError> initialize() override {
        LCU_LOG_INFO("Application", "Initializing...");

        if (m_state != ApplicationState::NotInitialized) {
            LCU_LOG_WARNING("Application", "Already initialized");
            return std::unexpected(ApplicationError::AlreadyRunning);
        }
        m_started_at = std::chrono::steady_clock::now();
        set_state(ApplicationState::Initializing);

        try {
            initialize_settings();
            initialize_core();
            if (!initialize_configuration()) {
                set_state(ApplicationState::Error);
                return std::unexpected(ApplicationError::ConfigurationError);
            }
            initialize_services();
            connect_services();

            set_state(ApplicationState::Running);
            LCU_LOG_INFO("Application", "Initialization complete");
            return {};

        } catch (const std::exception& e) {
            LCU_LOG_ERROR("Application", "Initialization failed: " + std::string(e.what()));
            set_state(ApplicationState::Error);
            return std::unexpected(ApplicationError::InitializationFailed);
        }
    }

    std::expected<void, ApplicationError> start() override {
        LCU_LOG_INFO("Application", "Starting services...");

        if (m_state != ApplicationState::Running) {
            LCU_LOG_ERROR("Application", "Not initialized");
            return std::unexpected(ApplicationError::InitializationFailed);
        }
        if (m_running.exchange(true)) {
            return std::unexpected(ApplicationError::AlreadyRunning);
        }

        // Pick up a client that is already running before the UI asks for state
        m_lifecycle_monitor->start();
        m_gameflow_watcher->start();

        const auto startup = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_started_at);
        m_event_bus->publish(events::ApplicationReady{startup});

        LCU_LOG_INFO("Application", "Services started in " + std::to_string(startup.count()) + "ms");
        return {};
    }

    void stop() override {
        if (m_state == ApplicationState::Stopping || m_state == ApplicationState::Stopped) {
            return;
        }
        LCU_LOG_INFO("Application", "Stopping...");
        m_running = false;
        set_state(ApplicationState::Stopping);
    }

    void shutdown() override {
        if (m_state == ApplicationState::Stopped) {
            return;
        }
        LCU_LOG_INFO("Application", "Shutting down...");

        if (m_event_bus) {
            m_event_bus->publish(events::ApplicationShuttingDown{});
        }

        // The watcher uses the connection state, so it goes first
        if (m_gameflow_watcher) {
            m_gameflow_watcher->stop();
        }
        if (m_lifecycle_monitor) {
            m_lifecycle_monitor->stop();
        }

        cleanup_event_subscriptions();

        if (m_thread_pool) {
            m_thread_pool->shutdown();
        }

        set_state(ApplicationState::Stopped);
        LCU_LOG_INFO("Application", "Shutdown complete");
    }

    ApplicationState get_state() const override {
        return m_state;
    }

    bool is_running() const override {
        return m_running && m_state == ApplicationState::Running;
    }

    void quit() override {
        LCU_LOG_INFO("Application", "Quitting");
        stop();
        shutdown();
    }

    std::expected<std::reference_wrapper<services::CommandService>, ApplicationError> get_commands() override {
        if (!m_commands) {
            return std::unexpected(ApplicationError::ServiceUnavailable);
        }
        return std::ref(*m_commands);
    }

    std::expected<std::reference_wrapper<EventBus>, ApplicationError> get_event_bus() override {
        if (!m_event_bus) {
            return std::unexpected(ApplicationError::ServiceUnavailable);
        }
        return std::ref(*m_event_bus);
    }

    const AppSettings& get_settings() const override {
        return m_settings;
    }

private:
    void set_state(ApplicationState state) {
        const auto previous = m_state.exchange(state);
        if (previous != state && m_event_bus) {
            m_event_bus->publish(events::ApplicationStateChanged{previous, state});
        }
    }

    void initialize_settings() {
        if (m_options.config_directory.empty()) {
            m_options.config_directory = default_config_directory();
        }

        std::error_code ec;
        std::filesystem::create_directories(m_options.config_directory, ec);
        if (ec) {
            LCU_LOG_WARNING("Application", "Cannot create " + m_options.config_directory.string() +
                            ": " + ec.message());
        }

        m_settings = m_options.settings
            ? *m_options.settings
            : load_or_create_settings(m_options.config_directory / "settings.yaml");
    }

    void initialize_core() {
        m_thread_pool = std::make_shared<utils::ThreadPool>(2);
        m_event_bus = std::make_shared<EventBus>(m_thread_pool);
        m_connection_state = std::make_unique<ConnectionStateStore>(m_event_bus);
    }

    bool initialize_configuration() {
        auto store = std::make_shared<JsonConfigStore>(m_options.config_directory / "config.json");
        m_config_service = std::make_unique<ConfigurationService>(store, m_event_bus);

        if (auto loaded = m_config_service->load(); !loaded) {
            LCU_LOG_WARNING("Application", "Using default configuration: " + to_string(loaded.error()));
        }
        return true;
    }

    void initialize_services() {
        services::HttpClientConfig http_config;
        http_config.default_timeout = m_settings.gateway.request_timeout;
        http_config.user_agent = std::string("lcu-companion/") + LCU_COMPANION_VERSION_STRING;
        m_http_client = services::create_http_client(http_config);

        m_gateway = std::make_unique<services::LcuGateway>(
            *m_connection_state, m_http_client, m_settings.gateway.request_timeout);

        m_lobby_builder = std::make_unique<services::LobbySnapshotBuilder>(m_settings.lobby.champ_select_marker);
        m_dodge_watch = std::make_unique<services::DodgeWatch>(m_settings.dodge.trigger_threshold, m_event_bus);
        m_stats_api = std::make_unique<services::StatsApiClient>(m_http_client, m_settings.stats_api);
        m_browser = platform::create_browser_launcher();

        m_commands = std::make_unique<services::CommandService>(
            *m_connection_state, *m_config_service, *m_gateway, *m_lobby_builder,
            *m_dodge_watch, *m_stats_api, *m_browser, m_event_bus);

        m_lifecycle_monitor = std::make_unique<services::ClientLifecycleMonitor>(
            std::make_unique<services::ProcClientProcessScanner>(m_settings.gateway.process_name),
            *m_connection_state,
            m_settings.gateway.poll_interval);

        m_gameflow_watcher = std::make_unique<services::GameflowWatcher>(
            *m_gateway, *m_connection_state, *m_config_service, *m_dodge_watch,
            m_settings.dodge.poll_interval, m_event_bus,
            [this]() { open_stats_link_in_background(); });

        LCU_LOG_INFO("Application", "Services initialized");
    }

    void connect_services() {
        m_event_subscriptions.push_back(m_event_bus->subscribe<events::GatewayConnectionChanged>(
            [this](const events::GatewayConnectionChanged& event) {
                if (!event.connected) {
                    m_dodge_watch->disarm();
                }
            }));

        m_event_subscriptions.push_back(m_event_bus->subscribe<events::ConfigurationUpdated>(
            [](const events::ConfigurationUpdated& event) {
                LCU_LOG_INFO("Application", "Configuration updated (provider " +
                             event.new_config.multi_provider + ")");
            }));

        m_event_subscriptions.push_back(m_event_bus->subscribe<events::DodgeTriggered>(
            [](const events::DodgeTriggered& event) {
                if (!event.succeeded) {
                    LCU_LOG_ERROR("Application", "Auto dodge for game " + std::to_string(event.game_id) +
                                  " failed");
                }
            }));

        LCU_LOG_INFO("Application", "Services connected");
    }

    void open_stats_link_in_background() {
        auto submitted = m_thread_pool->try_submit([this]() {
            auto url = m_commands->open_stats_link();
            if (!url) {
                LCU_LOG_WARNING("Application", "Auto open failed: " + url.error().message);
            }
        });
        if (!submitted) {
            LCU_LOG_WARNING("Application", "Auto open skipped: " + utils::to_string(submitted.error()));
        }
    }

    void cleanup_event_subscriptions() {
        if (!m_event_bus) return;

        for (auto id : m_event_subscriptions) {
            m_event_bus->unsubscribe(id);
        }
        m_event_subscriptions.clear();
    }

    ApplicationOptions m_options;
    AppSettings m_settings;
    std::atomic<ApplicationState> m_state{ApplicationState::NotInitialized};
    std::atomic<bool> m_running{false};
    std::chrono::steady_clock::time_point m_started_at;

    std::shared_ptr<utils::ThreadPool> m_thread_pool;
    std::shared_ptr<EventBus> m_event_bus;
    std::vector<EventBus::HandlerId> m_event_subscriptions;

    std::unique_ptr<ConnectionStateStore> m_connection_state;
    std::unique_ptr<ConfigurationService> m_config_service;

    std::shared_ptr<services::HttpClient> m_http_client;
    std::unique_ptr<services::LcuGateway> m_gateway;
    std::unique_ptr<services::LobbySnapshotBuilder> m_lobby_builder;
    std::unique_ptr<services::DodgeWatch> m_dodge_watch;
    std::unique_ptr<services::StatsApiClient> m_stats_api;
    std::unique_ptr<platform::BrowserLauncher> m_browser;
    std::unique_ptr<services::CommandService> m_commands;

    std::unique_ptr<services::ClientLifecycleMonitor> m_lifecycle_monitor;
    std::unique_ptr<services::GameflowWatcher> m_gameflow_watcher;
};

std::expected<std::unique_ptr<Application>, ApplicationError> create_application(ApplicationOptions options) {
    try {
        return std::make_unique<ApplicationImpl>(std::move(options));
    } catch (const std::exception& e) {
        LCU_LOG_ERROR("Application", "Failed to create application: " + std::string(e.what()));
        return std::unexpected(ApplicationError::InitializationFailed);
    }
}

} // namespace core
} // namespace lcu_companion

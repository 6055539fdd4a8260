#pragma once

#include "lcu_companion/core/models.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

namespace lcu_companion {
namespace core {
    class EventBus;
}

namespace services {
    class CommandService;
}
}

namespace lcu_companion {
namespace core {

struct ApplicationOptions {
    // Holds config.json and settings.yaml; empty means default_config_directory()
    std::filesystem::path config_directory;
    // Already loaded settings; read from settings.yaml when empty
    std::optional<AppSettings> settings;
};

// Owns every state object and service and starts or stops background work in order
class Application {
public:
    virtual ~Application() = default;

    virtual std::expected<void, ApplicationError> initialize() = 0;
    virtual std::expected<void, ApplicationError> start() = 0;
    virtual void stop() = 0;
    virtual void shutdown() = 0;

    virtual ApplicationState get_state() const = 0;
    virtual bool is_running() const = 0;

    virtual void quit() = 0;

    virtual std::expected<std::reference_wrapper<services::CommandService>, ApplicationError> get_commands() = 0;
    virtual std::expected<std::reference_wrapper<EventBus>, ApplicationError> get_event_bus() = 0;
    virtual const AppSettings& get_settings() const = 0;
};

std::expected<std::unique_ptr<Application>, ApplicationError> create_application(ApplicationOptions options = {});

} // namespace core
} // namespace lcu_companion

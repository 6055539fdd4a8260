#include <catch2/catch.hpp>

#include "lcu_companion/core/config_service.hpp"
#include "lcu_companion/core/events.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <unistd.h>

using namespace lcu_companion::core;
using namespace std::chrono_literals;

namespace {

class TempConfigDir {
public:
    TempConfigDir() {
        static std::atomic<int> counter{0};
        m_path = std::filesystem::temp_directory_path() /
                 ("lcu-companion-config-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(m_path);
    }

    ~TempConfigDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    std::filesystem::path file(const std::string& name) const { return m_path / name; }

    void write(const std::string& name, const std::string& content) const {
        std::ofstream out(file(name));
        out << content;
    }

    nlohmann::json read_json(const std::string& name) const {
        std::ifstream in(file(name));
        return nlohmann::json::parse(in);
    }

private:
    std::filesystem::path m_path;
};

// Store whose saves can be made to fail
class FailingStore : public ConfigStore {
public:
    std::expected<UserConfig, ConfigError> load() override {
        return std::unexpected(ConfigError::FileNotFound);
    }

    std::expected<void, ConfigError> save(const UserConfig& config) override {
        last_saved = config;
        if (fail_saves) {
            return std::unexpected(ConfigError::PermissionDenied);
        }
        return {};
    }

    bool fail_saves = false;
    std::optional<UserConfig> last_saved;
};

} // namespace

TEST_CASE("ConfigurationService - missing file writes defaults", "[config]") {
    TempConfigDir dir;
    auto store = std::make_shared<JsonConfigStore>(dir.file("config.json"));
    ConfigurationService service(store);

    REQUIRE(service.load().has_value());
    REQUIRE(service.get() == UserConfig{});
    REQUIRE(std::filesystem::exists(dir.file("config.json")));

    const auto written = dir.read_json("config.json");
    REQUIRE(written.at("multiProvider") == "opgg");
    REQUIRE(written.at("autoOpen") == false);
}

TEST_CASE("ConfigurationService - malformed file falls back to defaults", "[config]") {
    TempConfigDir dir;
    dir.write("config.json", "{ not json");

    auto bus = std::make_shared<EventBus>();
    std::optional<ConfigError> reported;
    bus->subscribe<events::ConfigurationError>([&](const events::ConfigurationError& event) {
        reported = event.error;
    });

    ConfigurationService service(std::make_shared<JsonConfigStore>(dir.file("config.json")), bus);
    auto loaded = service.load();

    REQUIRE_FALSE(loaded.has_value());
    REQUIRE(loaded.error() == ConfigError::InvalidFormat);
    REQUIRE(reported == ConfigError::InvalidFormat);
    REQUIRE(service.get() == UserConfig{});

    // Left for the user to fix
    std::ifstream in(dir.file("config.json"));
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content == "{ not json");
}

TEST_CASE("ConfigurationService - mistyped value is a validation error", "[config]") {
    TempConfigDir dir;
    dir.write("config.json", R"({"autoAccept": "sometimes"})");

    ConfigurationService service(std::make_shared<JsonConfigStore>(dir.file("config.json")));
    REQUIRE(service.load().error() == ConfigError::ValidationError);
    REQUIRE_FALSE(service.get().auto_accept);
}

TEST_CASE("ConfigurationService - update persists and preserves unknown keys", "[config]") {
    TempConfigDir dir;
    dir.write("config.json", R"({"autoOpen": true, "theme": "dark"})");

    auto bus = std::make_shared<EventBus>();
    std::optional<UserConfig> previous;
    std::optional<UserConfig> current;
    bus->subscribe<events::ConfigurationUpdated>([&](const events::ConfigurationUpdated& event) {
        previous = event.previous_config;
        current = event.new_config;
    });

    ConfigurationService service(std::make_shared<JsonConfigStore>(dir.file("config.json")), bus);
    REQUIRE(service.load().has_value());
    REQUIRE(service.get().auto_open);

    auto config = service.get();
    config.multi_provider = "ugg";
    config.accept_delay = 3500ms;
    REQUIRE(service.update(config).has_value());

    REQUIRE(service.get().multi_provider == "ugg");
    REQUIRE(previous->multi_provider == "opgg");
    REQUIRE(current->accept_delay == 3500ms);

    const auto written = dir.read_json("config.json");
    REQUIRE(written.at("multiProvider") == "ugg");
    REQUIRE(written.at("acceptDelay") == 3500);
    REQUIRE(written.at("theme") == "dark");
    REQUIRE_FALSE(std::filesystem::exists(dir.file("config.json.tmp")));

    SECTION("A fresh service reads the saved value") {
        ConfigurationService reloaded(std::make_shared<JsonConfigStore>(dir.file("config.json")));
        REQUIRE(reloaded.load().has_value());
        REQUIRE(reloaded.get() == service.get());
    }
}

TEST_CASE("ConfigurationService - failed persist keeps the new value", "[config]") {
    auto store = std::make_shared<FailingStore>();
    auto bus = std::make_shared<EventBus>();
    int updates = 0;
    bus->subscribe<events::ConfigurationUpdated>([&](const events::ConfigurationUpdated&) { ++updates; });

    ConfigurationService service(store, bus);
    REQUIRE(service.load().has_value());

    store->fail_saves = true;
    UserConfig config;
    config.auto_accept = true;

    auto result = service.update(config);
    REQUIRE(result.error() == ConfigError::PermissionDenied);
    REQUIRE(service.get().auto_accept);
    REQUIRE(store->last_saved->auto_accept);
    REQUIRE(updates == 0);
}

TEST_CASE("load_or_create_settings", "[config]") {
    TempConfigDir dir;

    SECTION("Creates the file with defaults") {
        const auto settings = load_or_create_settings(dir.file("settings.yaml"));
        REQUIRE(settings.log_level == "info");
        REQUIRE(std::filesystem::exists(dir.file("settings.yaml")));
    }

    SECTION("Reads an existing file") {
        dir.write("settings.yaml", "log_level: debug\ndodge:\n  trigger_threshold_ms: 800\n");
        const auto settings = load_or_create_settings(dir.file("settings.yaml"));
        REQUIRE(settings.log_level == "debug");
        REQUIRE(settings.dodge.trigger_threshold == 800ms);
    }

    SECTION("Unreadable file falls back to defaults") {
        dir.write("settings.yaml", "dodge: [oops\n");
        const auto settings = load_or_create_settings(dir.file("settings.yaml"));
        REQUIRE(settings.dodge.trigger_threshold == AppSettings{}.dodge.trigger_threshold);
    }
}

#include "lcu_companion/core/application.hpp"
#include "lcu_companion/core/config_service.hpp"
#include "lcu_companion/services/commands/command_console.hpp"
#include "lcu_companion/utils/json_helper.hpp"
#include "lcu_companion/utils/logger.hpp"
#include "version.h"

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace {
    std::atomic<bool> g_shutdown_requested{false};

    void handle_shutdown_signal(int /* signal */) {
        g_shutdown_requested = true;
    }

    void register_signal_handlers() {
        std::signal(SIGINT, handle_shutdown_signal);
        std::signal(SIGTERM, handle_shutdown_signal);
    }

    std::unique_ptr<lcu_companion::utils::Logger> setup_logging(const std::string& log_level_str,
                                                               const std::filesystem::path& config_dir) {
        using namespace lcu_companion::utils;

        auto logger = std::make_unique<Logger>(log_level_from_string(log_level_str));

        // stdout carries command replies, so the console log goes to stderr
        logger->add_sink(std::make_unique<ConsoleSink>(true));

        const auto log_path = config_dir / "lcu-companion.log";
        auto file_sink = std::make_unique<FileSink>(log_path);
        if (file_sink->is_open()) {
            logger->add_sink(std::move(file_sink));
            std::cerr << "Logging to: " << log_path << std::endl;
        }

        return logger;
    }

    struct CommandLine {
        std::filesystem::path config_dir;
        bool show_version = false;
        bool show_help = false;
    };

    std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
        CommandLine options;
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if (arg == "--config-dir" && i + 1 < argc) {
                options.config_dir = argv[++i];
            } else if (arg == "--version") {
                options.show_version = true;
            } else if (arg == "--help" || arg == "-h") {
                options.show_help = true;
            } else {
                std::cerr << "Unknown argument: " << arg << std::endl;
                return std::nullopt;
            }
        }
        return options;
    }

    void print_usage() {
        std::cout << "Usage: lcu-companion [--config-dir <path>] [--version]\n\n"
                  << "Commands are read from stdin, one per line:\n  "
                  << lcu_companion::services::CommandConsole::help_text() << std::endl;
    }

    // Reads stdin without blocking shutdown; one JSON reply per command line
    void run_console(std::stop_token stop_token, lcu_companion::services::CommandConsole& console) {
        std::string pending;
        char buffer[4096];

        while (!stop_token.stop_requested()) {
            pollfd fd{STDIN_FILENO, POLLIN, 0};
            const int ready = poll(&fd, 1, 200);
            if (ready < 0) {
                if (errno == EINTR) continue;
                LCU_LOG_ERROR("Console", "poll() failed, console disabled");
                return;
            }
            if (ready == 0) continue;

            const ssize_t count = read(STDIN_FILENO, buffer, sizeof(buffer));
            if (count < 0) {
                if (errno == EINTR) continue;
                LCU_LOG_ERROR("Console", "Failed to read stdin, console disabled");
                return;
            }
            if (count == 0) {
                LCU_LOG_DEBUG("Console", "stdin closed");
                return;
            }
            pending.append(buffer, static_cast<size_t>(count));

            size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, newline);
                pending.erase(0, newline + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (line.empty()) continue;

                if (line == "quit" || line == "exit") {
                    g_shutdown_requested = true;
                    return;
                }
                std::cout << lcu_companion::utils::JsonHelper::dump(console.execute(line)) << std::endl;
            }
        }
    }
} // anonymous namespace

int main(int argc, char* argv[]) {
    auto options = parse_command_line(argc, argv);
    if (!options) {
        print_usage();
        return 2;
    }
    if (options->show_help) {
        print_usage();
        return 0;
    }
    if (options->show_version) {
        std::cout << "lcu-companion " << LCU_COMPANION_VERSION_STRING << std::endl;
        return 0;
    }

    auto config_dir = options->config_dir.empty()
        ? lcu_companion::core::default_config_directory()
        : options->config_dir;

    std::error_code ec;
    std::filesystem::create_directories(config_dir, ec);
    if (ec) {
        std::cerr << "Cannot create " << config_dir << ": " << ec.message() << std::endl;
    }

    auto settings = lcu_companion::core::load_or_create_settings(config_dir / "settings.yaml");
    lcu_companion::utils::LoggerManager::set_instance(setup_logging(settings.log_level, config_dir));

    LCU_LOG_INFO("Main", std::string("lcu-companion v") + LCU_COMPANION_VERSION_STRING + " starting...");
    LCU_LOG_DEBUG("Main", "Log level: " + settings.log_level);

    register_signal_handlers();

    try {
        auto app_result = lcu_companion::core::create_application({config_dir, settings});
        if (!app_result) {
            LCU_LOG_ERROR("Main", "Application creation failed");
            return 1;
        }
        auto app = std::move(*app_result);

        if (auto initialized = app->initialize(); !initialized) {
            LCU_LOG_ERROR("Main", "Application initialization failed: " +
                          lcu_companion::core::to_string(initialized.error()));
            return 1;
        }

        if (auto started = app->start(); !started) {
            LCU_LOG_ERROR("Main", "Application start failed: " +
                          lcu_companion::core::to_string(started.error()));
            return 1;
        }

        auto commands = app->get_commands();
        if (!commands) {
            LCU_LOG_ERROR("Main", "Command service unavailable");
            return 1;
        }

        lcu_companion::services::CommandConsole console(commands->get());
        std::jthread console_thread([&console](std::stop_token token) { run_console(token, console); });

        LCU_LOG_INFO("Main", "Running, type 'help' for commands or press Ctrl+C to exit");

        while (!g_shutdown_requested && app->is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        LCU_LOG_INFO("Main", "Shutting down...");
        console_thread.request_stop();
        console_thread.join();

        app->stop();
        app->shutdown();

        LCU_LOG_INFO("Main", "Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        LCU_LOG_ERROR("Main", "Fatal: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

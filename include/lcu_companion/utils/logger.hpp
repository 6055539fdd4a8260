#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace lcu_companion::utils {

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    None = 4
};

std::string to_string(LogLevel level);
// Unknown names map to Info
LogLevel log_level_from_string(std::string_view name);

struct SourceLocation {
    const char* file = "unknown";
    int line = 0;
};

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::chrono::system_clock::time_point timestamp;
    std::string component;
    std::string message;
    SourceLocation location;
};

// "[12:34:56.789] [INFO] [Component] message", plus " (file.cpp:42)" when
// with_location is set
std::string format_record(const LogRecord& record, bool with_location);

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Writes to stderr; stdout is reserved for command replies
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// Appends to a file, starting a new one once it grows past max_bytes. The
// previous file is kept as "<name>.1".
class FileSink : public LogSink {
public:
    static constexpr std::uintmax_t DEFAULT_MAX_BYTES = 5 * 1024 * 1024;

    explicit FileSink(std::filesystem::path path, std::uintmax_t max_bytes = DEFAULT_MAX_BYTES);

    void write(const LogRecord& record) override;
    void flush() override;
    [[nodiscard]] bool is_open() const { return m_file.is_open(); }

private:
    void open();
    void rotate();

    std::filesystem::path m_path;
    std::uintmax_t m_max_bytes;
    std::uintmax_t m_written = 0;
    std::ofstream m_file;
};

class Logger {
public:
    explicit Logger(LogLevel min_level = LogLevel::Info);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    // Occurrences of a registered secret are masked in every later message.
    // Used for the game client's auth tokens.
    void add_secret(std::string secret);
    // Replaces every registered secret, so stale tokens stop being scanned
    void set_secrets(std::vector<std::string> secrets);
    [[nodiscard]] std::size_t secret_count() const;

    void log(LogLevel level, std::string_view component, std::string_view message,
             SourceLocation location = {});
    void flush();

private:
    std::string redact(std::string_view message) const;

    mutable std::mutex m_mutex;
    LogLevel m_min_level;
    std::vector<std::unique_ptr<LogSink>> m_sinks;
    std::vector<std::string> m_secrets;
};

// Process-wide logger. main() installs the configured one; until then a
// console logger at Info is used.
class LoggerManager {
public:
    static Logger& get_instance();
    static void set_instance(std::unique_ptr<Logger> logger);

private:
    static std::unique_ptr<Logger> s_logger;
    static std::mutex s_mutex;
};

} // namespace lcu_companion::utils

#define LCU_LOG_AT(level, component, message)                                \
    lcu_companion::utils::LoggerManager::get_instance().log(                 \
        level, component, message,                                           \
        lcu_companion::utils::SourceLocation{__FILE__, __LINE__})

#define LCU_LOG_DEBUG(component, message) LCU_LOG_AT(lcu_companion::utils::LogLevel::Debug, component, message)
#define LCU_LOG_INFO(component, message) LCU_LOG_AT(lcu_companion::utils::LogLevel::Info, component, message)
#define LCU_LOG_WARNING(component, message) LCU_LOG_AT(lcu_companion::utils::LogLevel::Warning, component, message)
#define LCU_LOG_ERROR(component, message) LCU_LOG_AT(lcu_companion::utils::LogLevel::Error, component, message)

#include "lcu_companion/utils/logger.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#include <io.h>
#else
#include <unistd.h>
#endif

namespace lcu_companion::utils {

namespace {

constexpr std::string_view MASK = "***";

std::tm to_local_tm(std::chrono::system_clock::time_point tp) {
    const std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm result{};
#ifdef _WIN32
    localtime_s(&result, &time);
#else
    localtime_r(&time, &result);
#endif
    return result;
}

std::string_view level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::None: break;
    }
    return "?";
}

std::string_view level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warning: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::None: break;
    }
    return {};
}

std::string_view base_name(const char* path) {
    const std::string_view view(path ? path : "unknown");
    const auto slash = view.find_last_of("/\\");
    return slash == std::string_view::npos ? view : view.substr(slash + 1);
}

bool stderr_supports_color() {
#ifdef _WIN32
    if (!_isatty(_fileno(stderr))) return false;
    HANDLE handle = GetStdHandle(STD_ERROR_HANDLE);
    DWORD mode = 0;
    if (handle == INVALID_HANDLE_VALUE || !GetConsoleMode(handle, &mode)) return false;
    return SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

} // namespace

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::None: return "none";
    }
    return "info";
}

LogLevel log_level_from_string(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "none") return LogLevel::None;
    return LogLevel::Info;
}

std::string format_record(const LogRecord& record, bool with_location) {
    const auto tm = to_local_tm(record.timestamp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()).count() % 1000;

    std::ostringstream out;
    out << '[' << std::put_time(&tm, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << "] "
        << '[' << level_tag(record.level) << "] "
        << '[' << record.component << "] "
        << record.message;
    if (with_location) {
        out << " (" << base_name(record.location.file) << ':' << record.location.line << ')';
    }
    return out.str();
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------

ConsoleSink::ConsoleSink(bool use_colors)
    : m_use_colors(use_colors && stderr_supports_color()) {}

void ConsoleSink::write(const LogRecord& record) {
    if (m_use_colors) {
        std::cerr << level_color(record.level) << format_record(record, false) << "\033[0m\n";
    } else {
        std::cerr << format_record(record, false) << '\n';
    }
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(std::filesystem::path path, std::uintmax_t max_bytes)
    : m_path(std::move(path))
    , m_max_bytes(max_bytes) {
    std::error_code ec;
    if (m_path.has_parent_path()) {
        std::filesystem::create_directories(m_path.parent_path(), ec);
    }
    open();

    if (m_file.is_open()) {
        const auto tm = to_local_tm(std::chrono::system_clock::now());
        m_file << "\n=== Session started " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " ===\n";
        m_file.flush();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!m_file.is_open()) {
        return;
    }
    if (m_max_bytes > 0 && m_written >= m_max_bytes) {
        rotate();
        if (!m_file.is_open()) {
            return;
        }
    }

    const auto line = format_record(record, true);
    m_file << line << '\n';
    m_written += line.size() + 1;
}

void FileSink::flush() {
    if (m_file.is_open()) {
        m_file.flush();
    }
}

void FileSink::open() {
    std::error_code ec;
    const auto size = std::filesystem::file_size(m_path, ec);
    m_written = ec ? 0 : size;
    m_file.open(m_path, std::ios::out | std::ios::app);
}

void FileSink::rotate() {
    m_file.close();

    auto backup = m_path;
    backup += ".1";
    std::error_code ec;
    std::filesystem::remove(backup, ec);
    std::filesystem::rename(m_path, backup, ec);
    if (ec) {
        // Keep appending to the current file rather than losing output
        std::cerr << "Log rotation failed for " << m_path << ": " << ec.message() << '\n';
    }
    open();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

Logger::Logger(LogLevel min_level)
    : m_min_level(min_level) {}

void Logger::set_level(LogLevel level) {
    std::lock_guard lock(m_mutex);
    m_min_level = level;
}

LogLevel Logger::level() const {
    std::lock_guard lock(m_mutex);
    return m_min_level;
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard lock(m_mutex);
    m_sinks.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(m_mutex);
    m_sinks.clear();
}

void Logger::add_secret(std::string secret) {
    if (secret.empty()) {
        return;
    }
    std::lock_guard lock(m_mutex);
    for (const auto& known : m_secrets) {
        if (known == secret) return;
    }
    m_secrets.push_back(std::move(secret));
}

void Logger::set_secrets(std::vector<std::string> secrets) {
    std::erase_if(secrets, [](const std::string& secret) { return secret.empty(); });
    // Longest first so a secret containing another is masked whole
    std::sort(secrets.begin(), secrets.end(), [](const std::string& a, const std::string& b) {
        return a.size() != b.size() ? a.size() > b.size() : a < b;
    });
    secrets.erase(std::unique(secrets.begin(), secrets.end()), secrets.end());

    std::lock_guard lock(m_mutex);
    m_secrets = std::move(secrets);
}

std::size_t Logger::secret_count() const {
    std::lock_guard lock(m_mutex);
    return m_secrets.size();
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message,
                 SourceLocation location) {
    std::lock_guard lock(m_mutex);
    if (level < m_min_level || level == LogLevel::None || m_sinks.empty()) {
        return;
    }

    const LogRecord record{level, std::chrono::system_clock::now(), std::string(component),
                           redact(message), location};
    for (auto& sink : m_sinks) {
        sink->write(record);
    }
}

void Logger::flush() {
    std::lock_guard lock(m_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

std::string Logger::redact(std::string_view message) const {
    std::string result(message);
    for (const auto& secret : m_secrets) {
        for (auto pos = result.find(secret); pos != std::string::npos;
             pos = result.find(secret, pos + MASK.size())) {
            result.replace(pos, secret.size(), MASK);
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// LoggerManager
// ---------------------------------------------------------------------------

std::unique_ptr<Logger> LoggerManager::s_logger;
std::mutex LoggerManager::s_mutex;

Logger& LoggerManager::get_instance() {
    std::lock_guard lock(s_mutex);
    if (!s_logger) {
        s_logger = std::make_unique<Logger>(LogLevel::Info);
        s_logger->add_sink(std::make_unique<ConsoleSink>());
    }
    return *s_logger;
}

void LoggerManager::set_instance(std::unique_ptr<Logger> logger) {
    std::lock_guard lock(s_mutex);
    s_logger = std::move(logger);
}

} // namespace lcu_companion::utils

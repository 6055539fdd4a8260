#include <catch2/catch.hpp>

#include "lcu_companion/utils/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace lcu_companion::utils;

namespace {

class CaptureSink : public LogSink {
public:
    explicit CaptureSink(std::vector<LogRecord>& records) : m_records(records) {}

    void write(const LogRecord& record) override { m_records.push_back(record); }
    void flush() override { ++flushes; }

    int flushes = 0;

private:
    std::vector<LogRecord>& m_records;
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

} // namespace

TEST_CASE("Logger - level names", "[logger]") {
    REQUIRE(log_level_from_string("debug") == LogLevel::Debug);
    REQUIRE(log_level_from_string("warn") == LogLevel::Warning);
    REQUIRE(log_level_from_string("warning") == LogLevel::Warning);
    REQUIRE(log_level_from_string("none") == LogLevel::None);
    REQUIRE(log_level_from_string("verbose") == LogLevel::Info);
    REQUIRE(to_string(LogLevel::Error) == "error");
}

TEST_CASE("Logger - filters below the minimum level", "[logger]") {
    std::vector<LogRecord> records;
    Logger logger(LogLevel::Warning);
    logger.add_sink(std::make_unique<CaptureSink>(records));

    logger.log(LogLevel::Debug, "Test", "dropped");
    logger.log(LogLevel::Info, "Test", "dropped");
    logger.log(LogLevel::Error, "Test", "kept", {"src/thing.cpp", 12});

    REQUIRE(records.size() == 1);
    REQUIRE(records[0].component == "Test");
    REQUIRE(records[0].message == "kept");
    REQUIRE(records[0].location.line == 12);

    logger.set_level(LogLevel::Debug);
    logger.log(LogLevel::Debug, "Test", "now kept");
    REQUIRE(records.size() == 2);
}

TEST_CASE("Logger - masks registered secrets", "[logger]") {
    std::vector<LogRecord> records;
    Logger logger(LogLevel::Debug);
    logger.add_sink(std::make_unique<CaptureSink>(records));

    logger.add_secret("s3cr3t");
    logger.add_secret("");
    logger.add_secret("s3cr3t");

    logger.log(LogLevel::Info, "Gateway", "riot:s3cr3t then s3cr3ts3cr3t");
    REQUIRE(records.back().message == "riot:*** then ******");

    logger.log(LogLevel::Info, "Gateway", "nothing to hide");
    REQUIRE(records.back().message == "nothing to hide");
}

TEST_CASE("Logger - replacing secrets drops the old ones", "[logger]") {
    std::vector<LogRecord> records;
    Logger logger(LogLevel::Debug);
    logger.add_sink(std::make_unique<CaptureSink>(records));

    logger.set_secrets({"old-token", "old-app"});
    logger.set_secrets({"new-token", "", "new-token", "new-token-long"});
    REQUIRE(logger.secret_count() == 2);

    logger.log(LogLevel::Info, "Gateway", "old-token new-token new-token-long");
    REQUIRE(records.back().message == "old-token *** ***");

    logger.set_secrets({});
    REQUIRE(logger.secret_count() == 0);
}

TEST_CASE("Logger - record formatting", "[logger]") {
    LogRecord record;
    record.level = LogLevel::Warning;
    record.timestamp = std::chrono::system_clock::now();
    record.component = "DodgeWatch";
    record.message = "armed";
    record.location = {"/build/src/services/dodge/dodge_watch.cpp", 88};

    const auto plain = format_record(record, false);
    REQUIRE(plain.find("[WARN] [DodgeWatch] armed") != std::string::npos);
    REQUIRE(plain.find("dodge_watch.cpp") == std::string::npos);

    const auto located = format_record(record, true);
    REQUIRE(located.ends_with("armed (dodge_watch.cpp:88)"));
}

TEST_CASE("Logger - flush reaches every sink", "[logger]") {
    std::vector<LogRecord> records;
    auto sink = std::make_unique<CaptureSink>(records);
    auto* raw = sink.get();

    Logger logger;
    logger.add_sink(std::move(sink));
    logger.flush();
    REQUIRE(raw->flushes == 1);

    logger.clear_sinks();
    logger.log(LogLevel::Error, "Test", "no sinks");
    REQUIRE(records.empty());
}

TEST_CASE("FileSink - rotates once the size limit is reached", "[logger]") {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("lcu_companion_logger_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    const auto path = dir / "nested" / "companion.log";

    {
        FileSink sink(path, 256);
        REQUIRE(sink.is_open());

        LogRecord record;
        record.timestamp = std::chrono::system_clock::now();
        record.component = "Rotation";
        for (int i = 0; i < 20; ++i) {
            record.message = "line " + std::to_string(i);
            sink.write(record);
        }
        sink.flush();
    }

    auto backup = path;
    backup += ".1";
    REQUIRE(std::filesystem::exists(path));
    REQUIRE(std::filesystem::exists(backup));
    REQUIRE(read_file(path).find("line 19") != std::string::npos);
    REQUIRE(read_file(backup).find("line 19") == std::string::npos);
    REQUIRE(std::filesystem::file_size(path) < 512);

    std::filesystem::remove_all(dir);
}

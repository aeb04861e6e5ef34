#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace ledger {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    uint64_t timestamp;
};

class Logger {
public:
    // Opens `path` for appending. Console output works without init().
    static bool init(const std::string& path);
    static void shutdown();
    static bool isInitialized();
    static std::string getLogPath();

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static void enableConsole(bool enable);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void log(LogLevel level, const std::string& category, const std::string& msg);
    static void flush();

    // Most recent entries that passed the level filter, oldest first.
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();

    static const char* levelName(LogLevel level);
    static bool parseLevel(const std::string& name, LogLevel& out);
};

#define LOG_DEBUG(msg) do { if (ledger::utils::Logger::getLevel() <= ledger::utils::LogLevel::DEBUG) ledger::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) ledger::utils::Logger::info(msg)
#define LOG_WARN(msg) ledger::utils::Logger::warn(msg)
#define LOG_ERROR(msg) ledger::utils::Logger::error(msg)

}
}

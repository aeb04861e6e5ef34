#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <filesystem>
#include <deque>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <utility>

namespace ledger {
namespace utils {

static constexpr size_t MAX_RECENT_LOGS = 1000;
static constexpr const char* TIME_FORMAT = "%Y-%m-%d %H:%M:%S";

namespace {

struct LogState {
    std::atomic<LogLevel> level{LogLevel::INFO};
    std::atomic<bool> console{true};
    std::mutex mtx;
    std::ofstream file;
    std::string path;
    std::deque<LogEntry> recent;
};

LogState& state() {
    static LogState s;
    return s;
}

std::string formatLine(const LogEntry& entry) {
    time_t now = static_cast<time_t>(entry.timestamp);
    struct tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), TIME_FORMAT, &local);

    std::ostringstream line;
    line << stamp << " [" << Logger::levelName(entry.level) << "]";
    if (!entry.category.empty()) line << " [" << entry.category << "]";
    line << " " << entry.message << "\n";
    return line.str();
}

void emit(LogLevel level, const std::string& category, const std::string& msg) {
    LogState& s = state();
    if (level == LogLevel::OFF || level < s.level.load()) return;

    LogEntry entry{level, msg, category, static_cast<uint64_t>(std::time(nullptr))};
    std::string line = formatLine(entry);

    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.console) {
        std::ostream& out = level >= LogLevel::ERROR ? std::cerr : std::cout;
        out << line;
    }
    if (s.file.is_open()) s.file << line;

    s.recent.push_back(std::move(entry));
    if (s.recent.size() > MAX_RECENT_LOGS) s.recent.pop_front();
}

}

bool Logger::init(const std::string& path) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) s.file.close();
    s.path = path;

    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) return false;
    }
    s.file.open(path, std::ios::app);
    return s.file.is_open();
}

void Logger::shutdown() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (!s.file.is_open()) return;
    s.file.flush();
    s.file.close();
}

bool Logger::isInitialized() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    return s.file.is_open();
}

std::string Logger::getLogPath() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    return s.path;
}

void Logger::setLevel(LogLevel level) {
    state().level = level;
}

LogLevel Logger::getLevel() {
    return state().level;
}

void Logger::enableConsole(bool enable) {
    state().console = enable;
}

void Logger::debug(const std::string& msg) { emit(LogLevel::DEBUG, "", msg); }
void Logger::info(const std::string& msg) { emit(LogLevel::INFO, "", msg); }
void Logger::warn(const std::string& msg) { emit(LogLevel::WARN, "", msg); }
void Logger::error(const std::string& msg) { emit(LogLevel::ERROR, "", msg); }

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    emit(level, category, msg);
}

void Logger::flush() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    std::cout.flush();
    if (s.file.is_open()) s.file.flush();
}

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    size_t skip = s.recent.size() > count ? s.recent.size() - count : 0;
    return std::vector<LogEntry>(s.recent.begin() + static_cast<std::ptrdiff_t>(skip), s.recent.end());
}

void Logger::clearLogs() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.recent.clear();
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
    }
    return "?????";
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    static const std::pair<const char*, LogLevel> names[] = {
        {"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG}, {"info", LogLevel::INFO},
        {"warn", LogLevel::WARN}, {"warning", LogLevel::WARN}, {"error", LogLevel::ERROR},
        {"fatal", LogLevel::FATAL}, {"off", LogLevel::OFF}, {"none", LogLevel::OFF}
    };
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& [key, level] : names) {
        if (lower == key) {
            out = level;
            return true;
        }
    }
    return false;
}

}
}

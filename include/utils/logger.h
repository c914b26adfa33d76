#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace qkdsim {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    std::string runTag;
    uint64_t timestamp;
};

/**
 * Process-wide logger. Console output goes to stderr so that stdout carries
 * only run results. Each thread may carry a run tag (for example "E91#42")
 * which prefixes its lines, keeping concurrent protocol runs apart.
 */
class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static bool isInitialized();

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static void enableConsole(bool enable);
    static void enableFile(bool enable);

    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void log(LogLevel level, const std::string& category, const std::string& msg);

    static void setRunTag(const std::string& tag);
    static std::string runTag();

    static void onLog(std::function<void(const LogEntry&)> callback);
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();

    // Key bits are replaced by their length unless sensitive logging is on
    // (QKDSIM_ALLOW_SENSITIVE_LOGS=1).
    static void setAllowSensitiveLogging(bool allow);
    static std::string redactKey(const std::string& bits);
};

// Sets the calling thread's run tag for the lifetime of the scope.
class ScopedRunTag {
public:
    explicit ScopedRunTag(const std::string& tag);
    ~ScopedRunTag();
    ScopedRunTag(const ScopedRunTag&) = delete;
    ScopedRunTag& operator=(const ScopedRunTag&) = delete;

private:
    std::string previous_;
};

#define LOG_TRACE(msg) do { if (qkdsim::utils::Logger::getLevel() <= qkdsim::utils::LogLevel::TRACE) qkdsim::utils::Logger::trace(msg); } while(0)
#define LOG_DEBUG(msg) do { if (qkdsim::utils::Logger::getLevel() <= qkdsim::utils::LogLevel::DEBUG) qkdsim::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) qkdsim::utils::Logger::info(msg)
#define LOG_WARN(msg) qkdsim::utils::Logger::warn(msg)
#define LOG_ERROR(msg) qkdsim::utils::Logger::error(msg)
#define LOG_CAT(level, cat, msg) qkdsim::utils::Logger::log(level, cat, msg)

}
}

#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <cstdlib>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <deque>

namespace qkdsim {
namespace utils {

static std::atomic<LogLevel> currentLevel{LogLevel::WARN};
static std::ofstream logFile;
static std::string logPath;
static std::mutex logMutex;
static std::atomic<bool> consoleEnabled{true};
static std::atomic<bool> fileEnabled{true};
static std::function<void(const LogEntry&)> logCallback;
static std::deque<LogEntry> recentLogs;
static bool initialized = false;
static std::atomic<bool> allowSensitive{false};
static thread_local std::string threadRunTag;

static constexpr uint64_t MAX_FILE_SIZE = 10 * 1024 * 1024;
static constexpr int MAX_ROTATED_FILES = 3;
static constexpr size_t MAX_RECENT_LOGS = 1000;

static const char* levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "?????";
    }
}

// Masks the value following a key-bearing field name.
static std::string sanitize(const std::string& in) {
    std::string s = in;
    static const char* const fields[] = {"final_key", "secret", "private_key", "amplified_key"};
    for (const char* field : fields) {
        std::string k(field);
        size_t pos = 0;
        while ((pos = s.find(k, pos)) != std::string::npos) {
            size_t i = pos + k.size();
            while (i < s.size() && (s[i] == ' ' || s[i] == '"' || s[i] == ':' || s[i] == '=')) i++;
            size_t end = i;
            while (end < s.size() && s[end] != '"' && s[end] != ' ' && s[end] != ',' && s[end] != '\n') end++;
            if (i < end) {
                s.replace(i, end - i, "[REDACTED]");
                pos = i + 10;
            } else {
                pos += k.size();
            }
        }
    }
    return s;
}

// Keeps run.log, run.log.1 .. run.log.N.
static void rotateLocked() {
    if (logPath.empty()) return;
    logFile.close();

    std::error_code ec;
    std::filesystem::remove(logPath + "." + std::to_string(MAX_ROTATED_FILES), ec);
    for (int i = MAX_ROTATED_FILES - 1; i >= 1; i--) {
        std::string oldPath = logPath + "." + std::to_string(i);
        if (std::filesystem::exists(oldPath, ec)) {
            std::filesystem::rename(oldPath, logPath + "." + std::to_string(i + 1), ec);
        }
    }
    std::filesystem::rename(logPath, logPath + ".1", ec);
    logFile.open(logPath, std::ios::app);
}

static void writeLog(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel.load() || currentLevel.load() == LogLevel::OFF) return;

    std::function<void(const LogEntry&)> callback;
    LogEntry entry;
    entry.level = level;
    entry.message = allowSensitive ? msg : sanitize(msg);
    entry.category = category;
    entry.runTag = threadRunTag;
    entry.timestamp = static_cast<uint64_t>(std::time(nullptr));

    std::ostringstream oss;
    {
        time_t now = static_cast<time_t>(entry.timestamp);
        char timeBuf[64];
        std::tm tmBuf{};
        localtime_r(&now, &tmBuf);
        std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmBuf);
        oss << timeBuf << " [" << levelToString(level) << "]";
    }
    if (!entry.runTag.empty()) oss << " (" << entry.runTag << ")";
    if (!category.empty()) oss << " [" << category << "]";
    oss << " " << entry.message << "\n";
    std::string line = oss.str();

    {
        std::lock_guard<std::mutex> lock(logMutex);
        if (consoleEnabled) {
            std::cerr << line;
        }
        if (fileEnabled && logFile.is_open()) {
            logFile << line;
            logFile.flush();
            if (logFile.tellp() > static_cast<std::streampos>(MAX_FILE_SIZE)) {
                rotateLocked();
            }
        }

        recentLogs.push_back(entry);
        while (recentLogs.size() > MAX_RECENT_LOGS) {
            recentLogs.pop_front();
        }
        callback = logCallback;
    }

    if (callback) {
        callback(entry);
    }
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    logPath = path;

    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    logFile.open(path, std::ios::app);
    initialized = logFile.is_open();
    const char* env = std::getenv("QKDSIM_ALLOW_SENSITIVE_LOGS");
    if (env && *env) {
        std::string v(env);
        if (v == "1" || v == "true" || v == "TRUE") allowSensitive = true;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
    initialized = false;
}

bool Logger::isInitialized() {
    std::lock_guard<std::mutex> lock(logMutex);
    return initialized;
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "trace") out = LogLevel::TRACE;
    else if (v == "debug") out = LogLevel::DEBUG;
    else if (v == "info") out = LogLevel::INFO;
    else if (v == "warn" || v == "warning") out = LogLevel::WARN;
    else if (v == "error") out = LogLevel::ERROR;
    else if (v == "off" || v == "none") out = LogLevel::OFF;
    else return false;
    return true;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::enableFile(bool enable) {
    fileEnabled = enable;
}

void Logger::trace(const std::string& msg) {
    writeLog(LogLevel::TRACE, "", msg);
}

void Logger::debug(const std::string& msg) {
    writeLog(LogLevel::DEBUG, "", msg);
}

void Logger::info(const std::string& msg) {
    writeLog(LogLevel::INFO, "", msg);
}

void Logger::warn(const std::string& msg) {
    writeLog(LogLevel::WARN, "", msg);
}

void Logger::error(const std::string& msg) {
    writeLog(LogLevel::ERROR, "", msg);
}

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    writeLog(level, category, msg);
}

void Logger::setRunTag(const std::string& tag) {
    threadRunTag = tag;
}

std::string Logger::runTag() {
    return threadRunTag;
}

void Logger::onLog(std::function<void(const LogEntry&)> callback) {
    std::lock_guard<std::mutex> lock(logMutex);
    logCallback = std::move(callback);
}

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    std::lock_guard<std::mutex> lock(logMutex);
    size_t start = recentLogs.size() > count ? recentLogs.size() - count : 0;
    return std::vector<LogEntry>(recentLogs.begin() + static_cast<std::ptrdiff_t>(start), recentLogs.end());
}

void Logger::clearLogs() {
    std::lock_guard<std::mutex> lock(logMutex);
    recentLogs.clear();
}

void Logger::setAllowSensitiveLogging(bool allow) {
    allowSensitive = allow;
}

std::string Logger::redactKey(const std::string& bits) {
    if (allowSensitive) return bits;
    return "[REDACTED_KEY " + std::to_string(bits.size()) + " bits]";
}

ScopedRunTag::ScopedRunTag(const std::string& tag) : previous_(Logger::runTag()) {
    Logger::setRunTag(tag);
}

ScopedRunTag::~ScopedRunTag() {
    Logger::setRunTag(previous_);
}

}
}

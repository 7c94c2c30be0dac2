#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <thread>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <deque>

namespace snipbox {
namespace utils {

static std::atomic<LogLevel> currentLevel{LogLevel::INFO};
static std::ofstream logFile;
static std::string logPath;
static const char* logPattern = "%Y-%m-%d %H:%M:%S";
static std::mutex logMutex;
static std::atomic<bool> consoleEnabled{true};
static std::atomic<bool> fileEnabled{true};
static uint64_t maxFileSize = 10 * 1024 * 1024;
static uint32_t maxFiles = 5;
static std::atomic<uint64_t> logCount{0};
static std::atomic<uint64_t> errorCount{0};
static std::function<void(const LogEntry&)> logCallback;
static std::deque<LogEntry> recentLogs;
static size_t maxRecentLogs = 1000;
static bool initialized = false;

static const char* levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

static uint64_t getThreadId() {
    std::hash<std::thread::id> hasher;
    return hasher(std::this_thread::get_id());
}

static void rotateLocked() {
    if (logPath.empty()) return;

    if (logFile.is_open()) {
        logFile.close();
    }

    std::error_code ec;
    for (int i = static_cast<int>(maxFiles) - 1; i >= 1; i--) {
        std::string oldPath = logPath + "." + std::to_string(i);
        std::string newPath = logPath + "." + std::to_string(i + 1);
        if (std::filesystem::exists(oldPath, ec)) {
            if (i == static_cast<int>(maxFiles) - 1) {
                std::filesystem::remove(oldPath, ec);
            } else {
                std::filesystem::rename(oldPath, newPath, ec);
            }
        }
    }

    if (std::filesystem::exists(logPath, ec)) {
        std::filesystem::rename(logPath, logPath + ".1", ec);
    }

    logFile.open(logPath, std::ios::app);
}

static void writeLog(LogLevel level, const std::string& msg) {
    if (level < currentLevel.load() || level == LogLevel::OFF) return;

    std::lock_guard<std::mutex> lock(logMutex);

    time_t now = std::time(nullptr);
    struct tm tmNow;
    localtime_r(&now, &tmNow);
    char timeBuf[64];
    std::strftime(timeBuf, sizeof(timeBuf), logPattern, &tmNow);

    std::ostringstream oss;
    oss << timeBuf << " [" << levelToString(level) << "] " << msg << "\n";

    std::string line = oss.str();

    if (consoleEnabled) {
        std::cerr << line;
    }

    if (fileEnabled && logFile.is_open()) {
        logFile << line;
        logFile.flush();

        if (logFile.tellp() > static_cast<std::streampos>(maxFileSize)) {
            rotateLocked();
        }
    }

    logCount++;
    if (level >= LogLevel::ERROR) errorCount++;

    LogEntry entry;
    entry.level = level;
    entry.message = msg;
    entry.timestamp = static_cast<uint64_t>(now);
    entry.threadId = getThreadId();

    recentLogs.push_back(entry);
    while (recentLogs.size() > maxRecentLogs) {
        recentLogs.pop_front();
    }

    if (logCallback) {
        logCallback(entry);
    }
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    logPath = path;

    if (!path.empty()) {
        std::filesystem::path p(path);
        std::error_code ec;
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path(), ec);
        }
        logFile.open(path, std::ios::app);
    }
    initialized = true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
    initialized = false;
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::enableFile(bool enable) {
    fileEnabled = enable;
}

void Logger::setMaxFileSize(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(logMutex);
    maxFileSize = bytes;
}

void Logger::setMaxFiles(uint32_t count) {
    std::lock_guard<std::mutex> lock(logMutex);
    maxFiles = std::max<uint32_t>(count, 1);
}

void Logger::trace(const std::string& msg) {
    writeLog(LogLevel::TRACE, msg);
}

void Logger::debug(const std::string& msg) {
    writeLog(LogLevel::DEBUG, msg);
}

void Logger::info(const std::string& msg) {
    writeLog(LogLevel::INFO, msg);
}

void Logger::warn(const std::string& msg) {
    writeLog(LogLevel::WARN, msg);
}

void Logger::error(const std::string& msg) {
    writeLog(LogLevel::ERROR, msg);
}

void Logger::fatal(const std::string& msg) {
    writeLog(LogLevel::FATAL, msg);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
    }
    std::cerr.flush();
}

void Logger::rotate() {
    std::lock_guard<std::mutex> lock(logMutex);
    rotateLocked();
}

void Logger::onLog(std::function<void(const LogEntry&)> callback) {
    std::lock_guard<std::mutex> lock(logMutex);
    logCallback = callback;
}

uint64_t Logger::getLogCount() {
    return logCount;
}

uint64_t Logger::getErrorCount() {
    return errorCount;
}

std::string Logger::getLogPath() {
    std::lock_guard<std::mutex> lock(logMutex);
    return logPath;
}

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::vector<LogEntry> result;
    size_t start = recentLogs.size() > count ? recentLogs.size() - count : 0;
    for (size_t i = start; i < recentLogs.size(); i++) {
        result.push_back(recentLogs[i]);
    }
    return result;
}

void Logger::clearLogs() {
    std::lock_guard<std::mutex> lock(logMutex);
    recentLogs.clear();
    logCount = 0;
    errorCount = 0;
}

bool Logger::isInitialized() {
    std::lock_guard<std::mutex> lock(logMutex);
    return initialized;
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel def) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    if (lower == "off" || lower == "none") return LogLevel::OFF;
    return def;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::FATAL: return "fatal";
        case LogLevel::OFF: return "off";
    }
    return "info";
}

}
}

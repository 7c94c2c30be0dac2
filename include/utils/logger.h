#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace snipbox {
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
    uint64_t timestamp;
    uint64_t threadId;
};

// Process-wide logger. Console output goes to stderr; stdout belongs to
// whoever consumes execution results.
class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static void enableConsole(bool enable);
    static void enableFile(bool enable);
    static void setMaxFileSize(uint64_t bytes);
    static void setMaxFiles(uint32_t count);

    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void fatal(const std::string& msg);

    static void flush();
    static void rotate();

    static void onLog(std::function<void(const LogEntry&)> callback);

    static uint64_t getLogCount();
    static uint64_t getErrorCount();

    static std::string getLogPath();
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();
    static bool isInitialized();

    static LogLevel parseLevel(const std::string& name, LogLevel def = LogLevel::INFO);
    static const char* levelName(LogLevel level);
};

#define LOG_TRACE(msg) snipbox::utils::Logger::trace(msg)
#define LOG_DEBUG(msg) do { if (snipbox::utils::Logger::getLevel() <= snipbox::utils::LogLevel::DEBUG) snipbox::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) snipbox::utils::Logger::info(msg)
#define LOG_WARN(msg) snipbox::utils::Logger::warn(msg)
#define LOG_ERROR(msg) snipbox::utils::Logger::error(msg)
#define LOG_FATAL(msg) snipbox::utils::Logger::fatal(msg)

}
}

#include "utils/config.h"
#include "utils/logger.h"
#include "tools/code_execution_tool.h"
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace snipbox;
using namespace snipbox::utils;

static std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

static void testDefaults() {
    Config& config = Config::instance();
    config.reset();

    SandboxConfig sandbox = config.getSandboxConfig();
    assert(sandbox.timeoutSeconds == 5);
    assert(sandbox.maxMemoryMb == 100);
    assert(sandbox.isolation == "in_process");
    assert(sandbox.sentinelName == "_");
    assert(sandbox.maxOutputBytes == 1024 * 1024);
    assert(sandbox.killGraceMs == 1000);
    assert(sandbox.allowedModules.size() == 17);
    assert(sandbox.allowedModules.front() == "math");

    LogConfig log = config.getLogConfig();
    assert(log.level == "info");
    assert(log.file.empty());
    assert(log.console);
    assert(log.maxFileSize == 10u * 1024 * 1024);
    assert(log.maxFiles == 5);
}

static void testLoadFile() {
    std::string path = tempPath("snipbox_test_config.conf");
    {
        std::ofstream file(path);
        file << "# comment line\n";
        file << "sandbox.timeout_seconds = 12\n";
        file << "sandbox.allowed_modules = math, json ,re\n";
        file << "sandbox.isolation=subprocess\n";
        file << "log.level=debug\n";
        file << "not a key value line\n";
    }

    Config& config = Config::instance();
    config.reset();
    assert(config.load(path));
    assert(config.getConfigPath() == path);

    SandboxConfig sandbox = config.getSandboxConfig();
    assert(sandbox.timeoutSeconds == 12);
    assert(sandbox.allowedModules.size() == 3);
    assert(sandbox.allowedModules[1] == "json");
    assert(sandbox.isolation == "subprocess");
    assert(sandbox.maxMemoryMb == 100);
    assert(config.getLogConfig().level == "debug");

    assert(!config.load(tempPath("snipbox_missing_config.conf")));
    std::remove(path.c_str());
}

static void testTypedAccessors() {
    Config& config = Config::instance();
    config.reset();

    config.set("custom.flag", true);
    config.set("custom.count", 42);
    config.set("custom.big", static_cast<int64_t>(1) << 40);
    config.set("custom.name", "value");
    config.set("custom.bad", "abc");

    assert(config.getBool("custom.flag"));
    assert(config.getInt("custom.count") == 42);
    assert(config.getInt64("custom.big") == (static_cast<int64_t>(1) << 40));
    assert(config.getString("custom.name") == "value");
    assert(config.getInt("custom.bad", 7) == 7);
    assert(config.getString("custom.missing", "def") == "def");

    auto keys = config.keys("custom.");
    assert(keys.size() == 5);
    assert(keys.front() == "custom.bad");

    config.remove("custom.flag");
    assert(!config.has("custom.flag"));
    assert(!config.getBool("custom.flag"));
}

static void testSaveAndReload() {
    std::string path = tempPath("snipbox_saved_config.conf");
    Config& config = Config::instance();
    config.reset();

    SandboxConfig sandbox = config.getSandboxConfig();
    sandbox.timeoutSeconds = 3;
    sandbox.allowedModules = {"math", "random"};
    sandbox.killGraceMs = 250;
    config.setSandboxConfig(sandbox);
    assert(config.save(path));

    config.reset();
    assert(config.getSandboxConfig().timeoutSeconds == 5);
    assert(config.load(path));
    SandboxConfig reloaded = config.getSandboxConfig();
    assert(reloaded.timeoutSeconds == 3);
    assert(reloaded.allowedModules.size() == 2);
    assert(reloaded.killGraceMs == 250);
    std::remove(path.c_str());
}

static void testChangeCallback() {
    Config& config = Config::instance();
    config.reset();

    std::string lastKey;
    config.onChange([&lastKey](const std::string& key) { lastKey = key; });
    config.set("sandbox.timeout_seconds", 9);
    assert(lastKey == "sandbox.timeout_seconds");
    config.onChange(nullptr);
}

static void testToolConfigFromConfig() {
    Config& config = Config::instance();
    config.reset();
    config.set("sandbox.timeout_seconds", 7);
    config.set("sandbox.allowed_modules", "math,json");
    config.set("sandbox.isolation", "subprocess");
    config.set("sandbox.sentinel", "answer");
    config.set("sandbox.max_output_bytes", 64);

    tools::ToolConfig tc = tools::ToolConfig::fromConfig(config);
    assert(tc.defaultPolicy.timeoutSeconds == 7);
    assert(tc.defaultPolicy.allowedModules.size() == 2);
    assert(tc.defaultPolicy.allowsModule("json"));
    assert(tc.isolation == tools::IsolationMode::SUBPROCESS);
    assert(tc.runner.sentinelName == "answer");
    assert(tc.runner.maxOutputBytes == 64);

    assert(tools::parseIsolationMode("SUBPROCESS") == tools::IsolationMode::SUBPROCESS);
    assert(tools::parseIsolationMode("bogus") == tools::IsolationMode::IN_PROCESS);
    assert(std::string(tools::isolationModeName(tools::IsolationMode::SUBPROCESS)) == "subprocess");
    config.reset();
}

static void testLogLevelParsing() {
    assert(Logger::parseLevel("debug") == LogLevel::DEBUG);
    assert(Logger::parseLevel("WARN") == LogLevel::WARN);
    assert(Logger::parseLevel("off") == LogLevel::OFF);
    assert(Logger::parseLevel("nonsense", LogLevel::ERROR) == LogLevel::ERROR);
    assert(std::string(Logger::levelName(LogLevel::FATAL)) == "fatal");
}

static void testLoggerFiltersAndRecords() {
    Logger::enableConsole(false);
    Logger::clearLogs();
    Logger::setLevel(LogLevel::WARN);

    std::vector<std::string> seen;
    Logger::onLog([&seen](const LogEntry& entry) { seen.push_back(entry.message); });

    LOG_INFO("hidden");
    LOG_DEBUG("hidden too");
    LOG_WARN("visible");
    LOG_ERROR("broken");

    assert(seen.size() == 2);
    assert(seen[0] == "visible");
    assert(Logger::getLogCount() == 2);
    assert(Logger::getErrorCount() == 1);

    auto recent = Logger::getRecentLogs(1);
    assert(recent.size() == 1);
    assert(recent[0].message == "broken");
    assert(recent[0].level == LogLevel::ERROR);

    Logger::onLog(nullptr);
    Logger::setLevel(LogLevel::INFO);
    Logger::enableConsole(true);
}

static size_t countLines(const std::string& path) {
    std::ifstream in(path);
    size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) lines++;
    return lines;
}

static void testLoggerRotatesFile() {
    std::string path = tempPath("snipbox_rotation_test.log");
    std::filesystem::remove(path);
    std::filesystem::remove(path + ".1");
    std::filesystem::remove(path + ".2");

    Config& config = Config::instance();
    config.reset();
    config.set("log.max_file_size", static_cast<int64_t>(200));
    config.set("log.max_files", 2);
    LogConfig logConfig = config.getLogConfig();
    assert(logConfig.maxFileSize == 200);
    assert(logConfig.maxFiles == 2);

    Logger::enableConsole(false);
    Logger::setMaxFileSize(logConfig.maxFileSize);
    Logger::setMaxFiles(logConfig.maxFiles);
    Logger::init(path);
    Logger::enableFile(true);
    assert(Logger::isInitialized());
    assert(Logger::getLogPath() == path);

    for (int i = 0; i < 10; i++) {
        LOG_WARN("rotation line " + std::to_string(i));
    }
    Logger::flush();
    assert(std::filesystem::exists(path + ".1"));
    assert(!std::filesystem::exists(path + ".2"));

    LOG_WARN("before manual rotate");
    Logger::rotate();
    assert(countLines(path) == 0);
    assert(countLines(path + ".1") == 1);

    Logger::shutdown();
    assert(!Logger::isInitialized());

    Logger::init("");
    Logger::setMaxFileSize(10 * 1024 * 1024);
    Logger::setMaxFiles(5);
    Logger::enableConsole(true);
    config.reset();
    std::filesystem::remove(path);
    std::filesystem::remove(path + ".1");
}

static void testErrorFormatting() {
    Error err = makeError(ErrorCode::INVALID_ARGUMENT, "bad timeout", "cli");
    assert(err.toString() == "Invalid argument: bad timeout [cli]");
    assert(std::string(errorToString(ErrorCode::PARSE_ERROR)) == "Parse error");
}

int main() {
    testDefaults();
    testLoadFile();
    testTypedAccessors();
    testSaveAndReload();
    testChangeCallback();
    testToolConfigFromConfig();
    testLogLevelParsing();
    testLoggerFiltersAndRecords();
    testLoggerRotatesFile();
    testErrorFormatting();
    return 0;
}

#include "utils/config.h"
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <mutex>

namespace snipbox {
namespace utils {

static const char* DEFAULT_ALLOWED_MODULES =
    "math,random,datetime,time,json,re,collections,itertools,functools,operator,"
    "statistics,decimal,fractions,numpy,pandas,matplotlib,seaborn";

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;

    void notifyChange(const std::string& key) {
        if (changeCallback) changeCallback(key);
    }
};

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("sandbox.timeout_seconds", 5);
    set("sandbox.allowed_modules", DEFAULT_ALLOWED_MODULES);
    set("sandbox.max_memory_mb", 100);
    set("sandbox.isolation", "in_process");
    set("sandbox.sentinel", "_");
    set("sandbox.max_output_bytes", static_cast<int64_t>(1024 * 1024));
    set("sandbox.kill_grace_ms", 1000);

    set("log.level", "info");
    set("log.file", "");
    set("log.console", true);
    set("log.max_file_size", static_cast<int64_t>(10 * 1024 * 1024));
    set("log.max_files", 5);

    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;

        auto pos = stripped.find('=');
        if (pos == std::string::npos) continue;

        std::string key = trim(stripped.substr(0, pos));
        std::string value = trim(stripped.substr(pos + 1));
        if (key.empty()) continue;

        impl_->data[key] = value;
        impl_->notifyChange(key);
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# snipbox configuration\n\n";

    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());

    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return file.good();
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoi(it->second); }
    catch (const std::exception&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoll(it->second); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    std::string val = it->second;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return result;

    std::istringstream iss(it->second);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = value;
    impl_->notifyChange(key);
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value ? value : ""));
}

void Config::set(const std::string& key, int value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = std::to_string(value);
    impl_->notifyChange(key);
}

void Config::set(const std::string& key, int64_t value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = std::to_string(value);
    impl_->notifyChange(key);
}

void Config::set(const std::string& key, bool value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = value ? "true" : "false";
    impl_->notifyChange(key);
}

void Config::setList(const std::string& key, const std::vector<std::string>& values) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string joined;
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) joined += ",";
        joined += values[i];
    }
    impl_->data[key] = joined;
    impl_->notifyChange(key);
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.erase(key);
    impl_->notifyChange(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

SandboxConfig Config::getSandboxConfig() const {
    SandboxConfig cfg;
    int timeout = getInt("sandbox.timeout_seconds", 5);
    cfg.timeoutSeconds = timeout > 0 ? static_cast<uint32_t>(timeout) : 0;
    cfg.allowedModules = getList("sandbox.allowed_modules");
    int memory = getInt("sandbox.max_memory_mb", 100);
    cfg.maxMemoryMb = memory > 0 ? static_cast<uint32_t>(memory) : 0;
    cfg.isolation = getString("sandbox.isolation", "in_process");
    cfg.sentinelName = getString("sandbox.sentinel", "_");
    int64_t maxOutput = getInt64("sandbox.max_output_bytes", 1024 * 1024);
    cfg.maxOutputBytes = maxOutput > 0 ? static_cast<uint64_t>(maxOutput) : 0;
    int grace = getInt("sandbox.kill_grace_ms", 1000);
    cfg.killGraceMs = grace > 0 ? static_cast<uint32_t>(grace) : 0;
    return cfg;
}

LogConfig Config::getLogConfig() const {
    LogConfig cfg;
    cfg.level = getString("log.level", "info");
    cfg.file = getString("log.file", "");
    cfg.console = getBool("log.console", true);
    int64_t maxSize = getInt64("log.max_file_size", 10 * 1024 * 1024);
    cfg.maxFileSize = maxSize > 0 ? static_cast<uint64_t>(maxSize) : cfg.maxFileSize;
    int files = getInt("log.max_files", 5);
    cfg.maxFiles = files > 0 ? static_cast<uint32_t>(files) : 1;
    return cfg;
}

void Config::setSandboxConfig(const SandboxConfig& cfg) {
    set("sandbox.timeout_seconds", static_cast<int64_t>(cfg.timeoutSeconds));
    setList("sandbox.allowed_modules", cfg.allowedModules);
    set("sandbox.max_memory_mb", static_cast<int64_t>(cfg.maxMemoryMb));
    set("sandbox.isolation", cfg.isolation);
    set("sandbox.sentinel", cfg.sentinelName);
    set("sandbox.max_output_bytes", static_cast<int64_t>(cfg.maxOutputBytes));
    set("sandbox.kill_grace_ms", static_cast<int64_t>(cfg.killGraceMs));
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = callback;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

size_t Config::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.size();
}

}
}

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace snipbox {
namespace utils {

struct SandboxConfig {
    uint32_t timeoutSeconds = 5;
    std::vector<std::string> allowedModules;
    uint32_t maxMemoryMb = 100;
    std::string isolation = "in_process";
    std::string sentinelName = "_";
    uint64_t maxOutputBytes = 1024 * 1024;
    uint32_t killGraceMs = 1000;
};

struct LogConfig {
    std::string level = "info";
    std::string file;
    bool console = true;
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, bool value);
    void setList(const std::string& key, const std::vector<std::string>& values);

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;

    SandboxConfig getSandboxConfig() const;
    LogConfig getLogConfig() const;
    void setSandboxConfig(const SandboxConfig& config);

    void onChange(std::function<void(const std::string&)> callback);

    std::string getConfigPath() const;
    size_t size() const;

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <cstdint>
#include "infrastructure/error_handling.h"
#include "sandbox/policy.h"
#include "sandbox/runner.h"
#include "sandbox/isolated_runner.h"

namespace snipbox {
namespace utils {
class Config;
}

namespace tools {

enum class IsolationMode {
    IN_PROCESS,
    SUBPROCESS
};

IsolationMode parseIsolationMode(const std::string& name, IsolationMode def = IsolationMode::IN_PROCESS);
const char* isolationModeName(IsolationMode mode);

struct ToolConfig {
    sandbox::Policy defaultPolicy = sandbox::Policy::defaults();
    IsolationMode isolation = IsolationMode::IN_PROCESS;
    sandbox::RunnerOptions runner;
    sandbox::IsolationOptions isolationOptions;

    static ToolConfig fromConfig(const utils::Config& config);
};

// One call into the tool. Unset fields fall back to the tool's default policy.
struct ExecutionRequest {
    std::string source;
    std::optional<uint32_t> timeoutSeconds;
    std::optional<std::vector<std::string>> allowedModules;

    // Accepts {"source"|"code", "timeout_seconds"|"timeout",
    // "allowed_modules"|"allowed_imports"}.
    static Result<ExecutionRequest> fromJson(const std::string& text);
};

struct SandboxStats {
    uint64_t totalExecutions = 0;
    uint64_t successfulExecutions = 0;
    uint64_t failedExecutions = 0;
    uint64_t rejectedExecutions = 0;
    uint64_t timeouts = 0;
    uint64_t totalExecutionTimeMs = 0;
    uint64_t avgExecutionTimeMs = 0;
};

class CodeExecutionTool {
public:
    explicit CodeExecutionTool(const ToolConfig& config = ToolConfig{});
    ~CodeExecutionTool();

    sandbox::ExecutionResult execute(const ExecutionRequest& request);
    sandbox::ExecutionResult execute(const std::string& source);

    sandbox::Policy resolvePolicy(const ExecutionRequest& request) const;
    const ToolConfig& config() const;

    void onViolation(std::function<void(const std::vector<sandbox::Violation>&)> callback);
    void onTimeout(std::function<void(uint32_t)> callback);

    SandboxStats getStats() const;
    void resetStats();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}

#include "tools/code_execution_tool.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <mutex>

namespace snipbox {
namespace tools {

using json = nlohmann::json;
using sandbox::ExecutionResult;
using sandbox::ExecutionStatus;

IsolationMode parseIsolationMode(const std::string& name, IsolationMode def) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "in_process" || lower == "inprocess") return IsolationMode::IN_PROCESS;
    if (lower == "subprocess" || lower == "isolated") return IsolationMode::SUBPROCESS;
    return def;
}

const char* isolationModeName(IsolationMode mode) {
    switch (mode) {
        case IsolationMode::IN_PROCESS: return "in_process";
        case IsolationMode::SUBPROCESS: return "subprocess";
    }
    return "in_process";
}

ToolConfig ToolConfig::fromConfig(const utils::Config& config) {
    utils::SandboxConfig sc = config.getSandboxConfig();

    ToolConfig tc;
    tc.defaultPolicy.timeoutSeconds = sc.timeoutSeconds;
    tc.defaultPolicy.maxMemoryMb = sc.maxMemoryMb;
    tc.defaultPolicy.allowedModules = std::set<std::string>(sc.allowedModules.begin(), sc.allowedModules.end());
    tc.isolation = parseIsolationMode(sc.isolation);
    if (!sc.sentinelName.empty()) tc.runner.sentinelName = sc.sentinelName;
    tc.runner.maxOutputBytes = static_cast<size_t>(sc.maxOutputBytes);
    tc.isolationOptions.killGraceMs = sc.killGraceMs;
    return tc;
}

static Error requestError(const std::string& message) {
    return makeError(ErrorCode::INVALID_ARGUMENT, message);
}

static const json* firstField(const json& doc, const char* primary, const char* alias) {
    if (doc.contains(primary)) return &doc[primary];
    if (doc.contains(alias)) return &doc[alias];
    return nullptr;
}

Result<ExecutionRequest> ExecutionRequest::fromJson(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Result<ExecutionRequest>(requestError("request is not a JSON object"));
    }

    ExecutionRequest request;
    const json* source = firstField(parsed, "source", "code");
    if (!source || !source->is_string()) {
        return Result<ExecutionRequest>(requestError("request needs a string 'source'"));
    }
    request.source = source->get<std::string>();

    const json* timeout = firstField(parsed, "timeout_seconds", "timeout");
    if (timeout && !timeout->is_null()) {
        if (!timeout->is_number_integer() || timeout->get<int64_t>() <= 0 ||
            timeout->get<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
            return Result<ExecutionRequest>(requestError("'timeout_seconds' must be a positive integer"));
        }
        request.timeoutSeconds = static_cast<uint32_t>(timeout->get<int64_t>());
    }

    const json* modules = firstField(parsed, "allowed_modules", "allowed_imports");
    if (modules && !modules->is_null()) {
        if (!modules->is_array()) {
            return Result<ExecutionRequest>(requestError("'allowed_modules' must be a list of names"));
        }
        std::vector<std::string> names;
        for (const auto& item : *modules) {
            if (!item.is_string() || item.get<std::string>().empty()) {
                return Result<ExecutionRequest>(requestError("'allowed_modules' must be a list of names"));
            }
            names.push_back(item.get<std::string>());
        }
        request.allowedModules = names;
    }
    return request;
}

struct CodeExecutionTool::Impl {
    ToolConfig config;
    sandbox::ExecutionRunner runner;
    sandbox::IsolatedRunner isolatedRunner;

    mutable std::mutex mtx;
    SandboxStats stats;
    std::function<void(const std::vector<sandbox::Violation>&)> violationCallback;
    std::function<void(uint32_t)> timeoutCallback;

    explicit Impl(const ToolConfig& cfg)
        : config(cfg), runner(cfg.runner), isolatedRunner(cfg.runner, cfg.isolationOptions) {}

    void record(const ExecutionResult& result) {
        std::lock_guard<std::mutex> lock(mtx);
        stats.totalExecutions++;
        switch (result.status) {
            case ExecutionStatus::COMPLETED: stats.successfulExecutions++; break;
            case ExecutionStatus::REJECTED: stats.rejectedExecutions++; break;
            case ExecutionStatus::TIMED_OUT: stats.timeouts++; break;
            case ExecutionStatus::FAILED: stats.failedExecutions++; break;
        }
        stats.totalExecutionTimeMs += static_cast<uint64_t>(result.executionTime * 1000.0);
        stats.avgExecutionTimeMs = stats.totalExecutionTimeMs / stats.totalExecutions;
    }
};

CodeExecutionTool::CodeExecutionTool(const ToolConfig& config) : impl_(std::make_unique<Impl>(config)) {}

CodeExecutionTool::~CodeExecutionTool() = default;

const ToolConfig& CodeExecutionTool::config() const {
    return impl_->config;
}

sandbox::Policy CodeExecutionTool::resolvePolicy(const ExecutionRequest& request) const {
    sandbox::Policy policy = impl_->config.defaultPolicy;
    if (request.timeoutSeconds) {
        policy.timeoutSeconds = *request.timeoutSeconds;
    }
    if (request.allowedModules) {
        policy.allowedModules = std::set<std::string>(request.allowedModules->begin(), request.allowedModules->end());
    }
    return policy;
}

ExecutionResult CodeExecutionTool::execute(const std::string& source) {
    ExecutionRequest request;
    request.source = source;
    return execute(request);
}

ExecutionResult CodeExecutionTool::execute(const ExecutionRequest& request) {
    sandbox::Policy policy = resolvePolicy(request);

    LOG_INFO("Executing code with timeout=" + std::to_string(policy.timeoutSeconds) + "s and " +
             std::to_string(policy.allowedModules.size()) + " allowed imports");

    ExecutionResult result = impl_->config.isolation == IsolationMode::SUBPROCESS
        ? impl_->isolatedRunner.run(request.source, policy)
        : impl_->runner.run(request.source, policy);

    if (result.success) {
        LOG_INFO("Code execution completed successfully");
    } else {
        LOG_WARN("Code execution failed: " + result.error.value_or("Unknown error"));
    }

    impl_->record(result);

    std::function<void(const std::vector<sandbox::Violation>&)> violationCb;
    std::function<void(uint32_t)> timeoutCb;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        violationCb = impl_->violationCallback;
        timeoutCb = impl_->timeoutCallback;
    }
    if (result.status == ExecutionStatus::REJECTED && violationCb) violationCb(result.violations);
    if (result.status == ExecutionStatus::TIMED_OUT && timeoutCb) timeoutCb(policy.timeoutSeconds);

    return result;
}

void CodeExecutionTool::onViolation(std::function<void(const std::vector<sandbox::Violation>&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->violationCallback = callback;
}

void CodeExecutionTool::onTimeout(std::function<void(uint32_t)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->timeoutCallback = callback;
}

SandboxStats CodeExecutionTool::getStats() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->stats;
}

void CodeExecutionTool::resetStats() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->stats = SandboxStats{};
}

}
}

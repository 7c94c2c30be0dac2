#include "sandbox/runner.h"
#include "sandbox/analyzer.h"
#include "sandbox/environment.h"
#include "sandbox/output_capture.h"
#include "sandbox/timeout_guard.h"
#include "python/convert.h"
#include "utils/logger.h"
#include <chrono>
#include <mutex>

namespace snipbox {
namespace sandbox {

namespace py = pybind11;

static std::mutex executionMutex;

static const char* TRUNCATION_MARKER = "\n[output truncated]";

ExecutionResult ExecutionResult::failure(ExecutionStatus status, const std::string& error) {
    ExecutionResult result;
    result.success = false;
    result.status = status;
    result.error = error;
    return result;
}

ExecutionResult ExecutionResult::rejected(const std::vector<Violation>& violations) {
    ExecutionResult result = failure(ExecutionStatus::REJECTED, "Safety violations: " + joinViolations(violations));
    result.violations = violations;
    return result;
}

const char* executionStatusName(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::COMPLETED: return "completed";
        case ExecutionStatus::REJECTED: return "rejected";
        case ExecutionStatus::FAILED: return "failed";
        case ExecutionStatus::TIMED_OUT: return "timed_out";
    }
    return "failed";
}

std::string truncateOutput(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return text.substr(0, cut) + TRUNCATION_MARKER;
}

namespace {

static double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}

ExecutionRunner::ExecutionRunner(const RunnerOptions& options) : options_(options) {}

const RunnerOptions& ExecutionRunner::options() const {
    return options_;
}

ExecutionResult ExecutionRunner::run(const std::string& source, const Policy& policy) const {
    std::lock_guard<std::mutex> lock(executionMutex);
    try {
        return runExclusive(source, policy);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Execution aborted: ") + e.what());
        return ExecutionResult::failure(ExecutionStatus::FAILED, std::string("Internal error: ") + e.what());
    }
}

ExecutionResult ExecutionRunner::runExclusive(const std::string& source, const Policy& policy) const {
    auto init = python::PythonRuntime::init();
    if (!init.ok()) {
        return ExecutionResult::failure(ExecutionStatus::FAILED, init.error().message);
    }

    auto valid = policy.validate();
    if (!valid.ok()) {
        return ExecutionResult::failure(ExecutionStatus::FAILED, "Invalid policy: " + valid.error().message);
    }

    LOG_DEBUG("Analyzing snippet (" + std::to_string(source.size()) + " bytes)");
    std::vector<Violation> violations = StaticSafetyAnalyzer::analyze(source, policy);
    if (!violations.empty()) {
        ExecutionResult rejected = ExecutionResult::rejected(violations);
        LOG_WARN("Rejected snippet: " + *rejected.error);
        return rejected;
    }

    py::gil_scoped_acquire gil;

    py::object builtins = py::module_::import("builtins");
    py::object code;
    try {
        code = builtins.attr("compile")(py::bytes(source), options_.filename, "exec", 0, true);
    } catch (const py::error_already_set& e) {
        python::PythonError err = python::describeError(e, false);
        return ExecutionResult::failure(ExecutionStatus::FAILED, "Syntax error in code: " + err.message);
    }

    LOG_DEBUG("Building restricted environment");
    auto env = RestrictedEnvironmentBuilder::build(policy);
    if (!env.ok()) {
        return ExecutionResult::failure(ExecutionStatus::FAILED, env.error().message);
    }
    py::dict ns = env.value().globals();
    py::object exec = builtins.attr("exec");

    ScopedOutputCapture capture;
    if (!capture.ok()) {
        return ExecutionResult::failure(ExecutionStatus::FAILED, capture.error());
    }

    ExecutionResult result;
    std::optional<python::ScriptValue> value;
    auto start = std::chrono::steady_clock::now();

    LOG_DEBUG("Executing snippet with " + std::to_string(policy.timeoutSeconds) + "s deadline");
    try {
        value = runWithDeadline(policy.timeoutSeconds, [&]() {
            std::optional<python::ScriptValue> produced;
            exec(code, ns, ns);

            if (ns.contains(options_.sentinelName)) {
                py::object sentinel = ns[options_.sentinelName.c_str()];
                auto converted = python::toScriptValue(sentinel);
                if (converted.ok()) {
                    produced = std::move(converted.value());
                } else {
                    LOG_WARN("Result value dropped: " + converted.error().message);
                }
            }
            return produced;
        });
    } catch (const TimeoutError& e) {
        result.executionTime = secondsSince(start);
        result.output = truncateOutput(capture.text(), options_.maxOutputBytes);
        result.status = ExecutionStatus::TIMED_OUT;
        result.error = std::string(e.what());
        LOG_WARN(*result.error);
        return result;
    } catch (const DeadlineArmError& e) {
        return ExecutionResult::failure(ExecutionStatus::FAILED,
                                        std::string("Cannot arm execution deadline: ") + e.what());
    } catch (const py::error_already_set& e) {
        python::PythonError err = python::describeError(e);
        result.executionTime = secondsSince(start);
        result.output = truncateOutput(capture.text(), options_.maxOutputBytes);
        result.status = ExecutionStatus::FAILED;
        result.error = "Error during execution: " + err.message + "\n" + err.traceback;
        LOG_DEBUG("Snippet raised " + err.typeName + ": " + err.message);
        return result;
    }

    result.executionTime = secondsSince(start);
    result.output = truncateOutput(capture.text(), options_.maxOutputBytes);
    result.success = true;
    result.status = ExecutionStatus::COMPLETED;
    result.resultValue = std::move(value);
    LOG_DEBUG("Snippet completed in " + std::to_string(result.executionTime) + "s");
    return result;
}

}
}

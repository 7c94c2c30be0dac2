#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include "python/value.h"
#include "sandbox/policy.h"
#include "sandbox/violation.h"

namespace snipbox {
namespace sandbox {

enum class ExecutionStatus {
    COMPLETED,
    REJECTED,
    FAILED,
    TIMED_OUT
};

struct ExecutionResult {
    bool success = false;
    std::string output;
    std::optional<std::string> error;
    std::optional<python::ScriptValue> resultValue;
    double executionTime = 0.0;
    ExecutionStatus status = ExecutionStatus::FAILED;
    std::vector<Violation> violations;

    static ExecutionResult failure(ExecutionStatus status, const std::string& error);
    static ExecutionResult rejected(const std::vector<Violation>& violations);
};

struct RunnerOptions {
    std::string sentinelName = "_";
    std::string filename = "<sandbox>";
    size_t maxOutputBytes = 1024 * 1024;
};

// analyze -> build -> execute under deadline -> result. Never throws; every
// outcome is reported through ExecutionResult.
class ExecutionRunner {
public:
    explicit ExecutionRunner(const RunnerOptions& options = RunnerOptions{});

    // Serialized process-wide. Must be called on the interpreter's main
    // thread, or the deadline cannot arm and the run fails without executing.
    ExecutionResult run(const std::string& source, const Policy& policy) const;

    // Same pipeline without the process-wide lock, for callers that already
    // own the interpreter exclusively.
    ExecutionResult runExclusive(const std::string& source, const Policy& policy) const;

    const RunnerOptions& options() const;

private:
    RunnerOptions options_;
};

const char* executionStatusName(ExecutionStatus status);

// Cuts text to at most maxBytes on a UTF-8 boundary and marks the cut.
std::string truncateOutput(const std::string& text, size_t maxBytes);

}
}

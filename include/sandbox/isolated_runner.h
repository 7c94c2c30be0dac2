#pragma once

#include <cstdint>
#include <string>
#include "sandbox/policy.h"
#include "sandbox/runner.h"

namespace snipbox {
namespace sandbox {

struct IsolationOptions {
    uint32_t killGraceMs = 1000;
    bool enforceMemoryLimit = true;
};

// Runs each execution in a forked child: the parent analyzes (a rejection
// never forks), the child runs the in-process pipeline under RLIMIT_AS,
// RLIMIT_CPU and RLIMIT_FSIZE and reports back over a pipe. A child that
// has not reported within timeout + killGraceMs is killed with SIGKILL.
// Callable from any thread.
class IsolatedRunner {
public:
    explicit IsolatedRunner(const RunnerOptions& runnerOptions = RunnerOptions{},
                            const IsolationOptions& isolation = IsolationOptions{});

    ExecutionResult run(const std::string& source, const Policy& policy) const;

private:
    RunnerOptions runnerOptions_;
    IsolationOptions isolation_;
};

}
}

#include "sandbox/isolated_runner.h"
#include "sandbox/analyzer.h"
#include "sandbox/result_codec.h"
#include "python/runtime.h"
#include "utils/logger.h"
#include <chrono>
#include <thread>
#include <algorithm>
#include <fstream>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/wait.h>

namespace snipbox {
namespace sandbox {

namespace {

constexpr int CHILD_REPORT_FAILED = 3;
constexpr size_t MAX_REPORT_BYTES = 64 * 1024 * 1024;

static double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

static uint64_t currentAddressSpace() {
    std::ifstream statm("/proc/self/statm");
    uint64_t pages = 0;
    if (!(statm >> pages)) return 0;
    long pageSize = sysconf(_SC_PAGESIZE);
    return pages * static_cast<uint64_t>(pageSize > 0 ? pageSize : 4096);
}

static bool writeAll(int fd, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

static bool setLimit(int resource, rlim_t soft, rlim_t hard, const char* name, std::string& error) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    if (setrlimit(resource, &rl) == 0) return true;
    error = std::string("cannot set ") + name + ": " + std::strerror(errno);
    return false;
}

static bool applyLimits(const Policy& policy, bool enforceMemory, std::string& error) {
    if (!setLimit(RLIMIT_CPU, policy.timeoutSeconds + 1, policy.timeoutSeconds + 2, "RLIMIT_CPU", error)) return false;
    if (!setLimit(RLIMIT_FSIZE, 0, 0, "RLIMIT_FSIZE", error)) return false;
    if (enforceMemory && policy.maxMemoryMb > 0) {
        uint64_t limit = currentAddressSpace() + static_cast<uint64_t>(policy.maxMemoryMb) * 1024 * 1024;
        if (!setLimit(RLIMIT_AS, limit, limit, "RLIMIT_AS", error)) return false;
    }
    return true;
}

static bool detachStdio(std::string& error) {
    int devNull = open("/dev/null", O_RDWR);
    if (devNull < 0) {
        error = std::string("cannot open /dev/null: ") + std::strerror(errno);
        return false;
    }
    bool ok = dup2(devNull, STDIN_FILENO) >= 0 &&
              dup2(devNull, STDOUT_FILENO) >= 0 &&
              dup2(devNull, STDERR_FILENO) >= 0;
    if (!ok) error = std::string("cannot redirect stdio: ") + std::strerror(errno);
    if (devNull > STDERR_FILENO) close(devNull);
    return ok;
}

// Runs in the forked child and never returns.
[[noreturn]] static void runChild(int reportFd, const std::string& source, const Policy& policy,
                                  const RunnerOptions& runnerOptions, bool enforceMemory) {
    PyOS_AfterFork_Child();
    utils::Logger::setLevel(utils::LogLevel::OFF);

    ExecutionResult result;
    std::string setupError;
    // Writes past RLIMIT_FSIZE fail with EFBIG instead of killing the child.
    if (signal(SIGXFSZ, SIG_IGN) == SIG_ERR) {
        setupError = std::string("cannot ignore SIGXFSZ: ") + std::strerror(errno);
    }
    if (setupError.empty() && detachStdio(setupError) && applyLimits(policy, enforceMemory, setupError)) {
        try {
            ExecutionRunner runner(runnerOptions);
            result = runner.runExclusive(source, policy);
        } catch (const std::exception& e) {
            result = ExecutionResult::failure(ExecutionStatus::FAILED, std::string("Internal error: ") + e.what());
        }
    } else {
        result = ExecutionResult::failure(ExecutionStatus::FAILED, "Isolation setup failed: " + setupError);
    }

    std::string report;
    try {
        report = encodeTransport(result);
    } catch (const std::exception&) {
        _exit(CHILD_REPORT_FAILED);
    }
    bool written = writeAll(reportFd, report);
    close(reportFd);
    _exit(written ? 0 : CHILD_REPORT_FAILED);
}

static void drain(int fd, std::string& report, bool& eof) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            report.append(buffer, static_cast<size_t>(n));
            if (report.size() > MAX_REPORT_BYTES) {
                eof = true;
                return;
            }
            continue;
        }
        if (n == 0) {
            eof = true;
            return;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) eof = true;
        return;
    }
}

}

IsolatedRunner::IsolatedRunner(const RunnerOptions& runnerOptions, const IsolationOptions& isolation)
    : runnerOptions_(runnerOptions), isolation_(isolation) {}

ExecutionResult IsolatedRunner::run(const std::string& source, const Policy& policy) const {
    auto init = python::PythonRuntime::init();
    if (!init.ok()) {
        return ExecutionResult::failure(ExecutionStatus::FAILED, init.error().message);
    }

    auto valid = policy.validate();
    if (!valid.ok()) {
        return ExecutionResult::failure(ExecutionStatus::FAILED, "Invalid policy: " + valid.error().message);
    }

    std::vector<Violation> violations = StaticSafetyAnalyzer::analyze(source, policy);
    if (!violations.empty()) {
        ExecutionResult rejected = ExecutionResult::rejected(violations);
        LOG_WARN("Rejected snippet: " + *rejected.error);
        return rejected;
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
        return ExecutionResult::failure(ExecutionStatus::FAILED,
                                        std::string("Failed to create pipe: ") + std::strerror(errno));
    }

    auto startTime = std::chrono::steady_clock::now();
    pid_t pid;
    int forkErrno = 0;
    {
        pybind11::gil_scoped_acquire gil;
        PyOS_BeforeFork();
        pid = fork();
        if (pid == 0) {
            close(fds[0]);
            runChild(fds[1], source, policy, runnerOptions_, isolation_.enforceMemoryLimit);
        }
        forkErrno = errno;
        PyOS_AfterFork_Parent();
    }

    close(fds[1]);
    if (pid < 0) {
        close(fds[0]);
        return ExecutionResult::failure(ExecutionStatus::FAILED,
                                        std::string("Failed to fork process: ") + std::strerror(forkErrno));
    }
    LOG_DEBUG("Isolated execution started in pid " + std::to_string(pid));

    if (fcntl(fds[0], F_SETFL, O_NONBLOCK) < 0) {
        LOG_WARN(std::string("Cannot make result pipe non-blocking: ") + std::strerror(errno));
    }

    auto deadline = startTime + std::chrono::seconds(policy.timeoutSeconds) +
                    std::chrono::milliseconds(isolation_.killGraceMs);

    std::string report;
    bool eof = false;
    bool exited = false;
    int status = 0;

    while (!exited) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline || report.size() > MAX_REPORT_BYTES) {
            if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
                LOG_ERROR("Failed to kill isolated process " + std::to_string(pid) + ": " + std::strerror(errno));
            }
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            close(fds[0]);
            if (report.size() > MAX_REPORT_BYTES) {
                return ExecutionResult::failure(ExecutionStatus::FAILED, "Isolated execution result too large");
            }
            ExecutionResult timedOut = ExecutionResult::failure(
                ExecutionStatus::TIMED_OUT,
                "Code execution timed out after " + std::to_string(policy.timeoutSeconds) + " seconds");
            timedOut.executionTime = secondsSince(startTime);
            LOG_WARN("Isolated execution killed after deadline (pid " + std::to_string(pid) + ")");
            return timedOut;
        }

        if (!eof) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            struct pollfd pfd;
            pfd.fd = fds[0];
            pfd.events = POLLIN;
            pfd.revents = 0;
            int ready = poll(&pfd, 1, static_cast<int>(std::min<int64_t>(remaining, 50)));
            if (ready > 0) drain(fds[0], report, eof);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        int waitResult = waitpid(pid, &status, WNOHANG);
        if (waitResult == pid) {
            exited = true;
        } else if (waitResult < 0 && errno != EINTR) {
            close(fds[0]);
            return ExecutionResult::failure(ExecutionStatus::FAILED,
                                            std::string("Lost isolated process: ") + std::strerror(errno));
        }
    }

    if (!eof) drain(fds[0], report, eof);
    close(fds[0]);

    if (WIFEXITED(status)) {
        int exitCode = WEXITSTATUS(status);
        if (exitCode == 0) {
            auto decoded = decodeTransport(report);
            if (!decoded.ok()) {
                return ExecutionResult::failure(ExecutionStatus::FAILED,
                                                "Malformed result from isolated execution: " + decoded.error().message);
            }
            return decoded.value();
        }
        if (exitCode == CHILD_REPORT_FAILED) {
            return ExecutionResult::failure(ExecutionStatus::FAILED, "Isolated execution could not report its result");
        }
        return ExecutionResult::failure(ExecutionStatus::FAILED,
                                        "Isolated execution failed with exit code " + std::to_string(exitCode));
    }

    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        ExecutionResult failed = ExecutionResult::failure(
            ExecutionStatus::FAILED,
            (sig == SIGKILL || sig == SIGXCPU) ? std::string("Resource limit exceeded")
                                               : "Process terminated by signal " + std::to_string(sig));
        failed.executionTime = secondsSince(startTime);
        return failed;
    }

    return ExecutionResult::failure(ExecutionStatus::FAILED, "Isolated execution ended abnormally");
}

}
}

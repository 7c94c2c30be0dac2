#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace snipbox {
namespace sandbox {

class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(uint32_t seconds)
        : std::runtime_error("Code execution timed out after " + std::to_string(seconds) + " seconds"),
          seconds_(seconds) {}

    uint32_t seconds() const { return seconds_; }

private:
    uint32_t seconds_;
};

class DeadlineArmError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Preemptive wall-clock deadline for code running in the embedded
// interpreter. Arming installs a SIGALRM handler through the interpreter's
// signal module and starts ITIMER_REAL; on expiry the interpreter raises
// DeadlineExceeded (a BaseException) at the next bytecode boundary and again
// every 100 ms until disarmed. The first expiry also installs a trace
// function that raises DeadlineExceeded on every line and call, so a bare
// except: cannot keep the snippet alive. Disarming removes the trace,
// restores the previous handler and the previous timer, minus the time
// spent here.
//
// An exception raised by some other Python signal handler while alarms are
// drained (KeyboardInterrupt from SIGINT, say) is kept and handed back by
// rethrowPendingSignal().
//
// One guard per process. Construct and destroy with the GIL held, on the
// interpreter's main thread.
class TimeoutGuard {
public:
    explicit TimeoutGuard(uint32_t seconds);
    ~TimeoutGuard();

    TimeoutGuard(const TimeoutGuard&) = delete;
    TimeoutGuard& operator=(const TimeoutGuard&) = delete;

    bool armed() const;
    bool expired() const;
    const std::string& armError() const;

    void disarm();
    void rethrowPendingSignal();

    // Disarms, then throws in order of precedence: a foreign signal
    // exception, TimeoutError when the deadline fired, and finally failure.
    void finish(std::exception_ptr failure);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Runs body under a deadline. Throws TimeoutError when the deadline fired,
// even if body returned or raised, and DeadlineArmError when the guard could
// not arm. Anything else body throws comes back out unchanged. GIL required.
template <typename Body>
auto runWithDeadline(uint32_t seconds, Body&& body) -> decltype(body()) {
    using R = decltype(body());
    TimeoutGuard guard(seconds);
    if (!guard.armed()) throw DeadlineArmError(guard.armError());

    std::exception_ptr failure;
    if constexpr (std::is_void<R>::value) {
        try {
            body();
        } catch (...) {
            failure = std::current_exception();
        }
        guard.finish(failure);
    } else {
        std::optional<R> result;
        try {
            result.emplace(body());
        } catch (...) {
            failure = std::current_exception();
        }
        guard.finish(failure);
        return std::move(*result);
    }
}

}
}

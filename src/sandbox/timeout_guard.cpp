#include "sandbox/timeout_guard.h"
#include "python/runtime.h"
#include "utils/logger.h"
#include <frameobject.h>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <sys/time.h>

namespace snipbox {
namespace sandbox {

namespace py = pybind11;

namespace {

constexpr suseconds_t REPEAT_INTERVAL_USEC = 100 * 1000;
constexpr int MAX_DRAIN_ROUNDS = 16;

static std::atomic<bool> guardInFlight{false};
static std::atomic<bool> deadlineFired{false};
static bool traceInstalled = false;
static bool draining = false;
static py::handle deadlineExceededType;

static int raiseOnTrace(PyObject*, PyFrameObject*, int what, PyObject*) {
    if (what != PyTrace_CALL && what != PyTrace_LINE) return 0;
    PyErr_SetString(deadlineExceededType.ptr(), "execution deadline exceeded");
    return -1;
}

[[noreturn]] static void raiseDeadline() {
    deadlineFired = true;
    if (!traceInstalled && !draining) {
        PyEval_SetTrace(raiseOnTrace, nullptr);
        traceInstalled = true;
    }
    PyErr_SetString(deadlineExceededType.ptr(), "execution deadline exceeded");
    throw py::error_already_set();
}

static std::string ensureExceptionType() {
    if (deadlineExceededType) return "";
    PyObject* type = PyErr_NewException("snipbox.DeadlineExceeded", PyExc_BaseException, nullptr);
    if (!type) {
        py::error_already_set e;
        return python::describeError(e, false).message;
    }
    deadlineExceededType = type;
    return "";
}

static int64_t toMicros(const timeval& tv) {
    return static_cast<int64_t>(tv.tv_sec) * 1000000 + tv.tv_usec;
}

static timeval fromMicros(int64_t us) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(us / 1000000);
    tv.tv_usec = static_cast<suseconds_t>(us % 1000000);
    return tv;
}

}

struct TimeoutGuard::Impl {
    uint32_t seconds = 0;
    bool armed = false;
    bool expired = false;
    std::string error;

    py::object signalModule;
    py::object sysModule;
    py::object previousHandler;
    py::object previousTrace;
    std::unique_ptr<py::error_already_set> foreignSignal;
    struct sigaction previousAction;
    itimerval previousTimer;
    std::chrono::steady_clock::time_point armedAt;

    void arm();
    void stopTimer();
    void removeTrace();
    void drainPending();
    void restoreHandler();
    void restoreTimer();
    void fail(const std::string& what);
};

void TimeoutGuard::Impl::fail(const std::string& what) {
    error = what;
    signalModule = py::object();
    sysModule = py::object();
    previousHandler = py::object();
    previousTrace = py::object();
    guardInFlight = false;
}

void TimeoutGuard::Impl::arm() {
    if (seconds == 0) {
        error = "deadline must be a positive number of seconds";
        return;
    }
    if (guardInFlight.exchange(true)) {
        error = "another deadline is already armed in this process";
        return;
    }

    std::string typeError = ensureExceptionType();
    if (!typeError.empty()) {
        fail("cannot create deadline exception: " + typeError);
        return;
    }

    std::memset(&previousAction, 0, sizeof(previousAction));
    if (sigaction(SIGALRM, nullptr, &previousAction) != 0) {
        fail(std::string("cannot query SIGALRM disposition: ") + std::strerror(errno));
        return;
    }

    try {
        signalModule = py::module_::import("signal");
        sysModule = py::module_::import("sys");
        previousTrace = sysModule.attr("gettrace")();
        py::cpp_function handler([](py::args) { raiseDeadline(); }, py::name("_deadline_handler"));
        // Raises ValueError off the main thread.
        previousHandler = signalModule.attr("signal")(SIGALRM, handler);
    } catch (const py::error_already_set& e) {
        fail("cannot install deadline handler: " + python::describeError(e, false).message);
        return;
    }

    deadlineFired = false;
    traceInstalled = false;
    itimerval timer;
    timer.it_value.tv_sec = static_cast<time_t>(seconds);
    timer.it_value.tv_usec = 0;
    timer.it_interval.tv_sec = 0;
    timer.it_interval.tv_usec = REPEAT_INTERVAL_USEC;

    armedAt = std::chrono::steady_clock::now();
    if (setitimer(ITIMER_REAL, &timer, &previousTimer) != 0) {
        std::string why = std::strerror(errno);
        restoreHandler();
        fail("cannot start deadline timer: " + why);
        return;
    }

    armed = true;
}

void TimeoutGuard::Impl::stopTimer() {
    itimerval zero;
    std::memset(&zero, 0, sizeof(zero));
    if (setitimer(ITIMER_REAL, &zero, nullptr) != 0) {
        LOG_ERROR(std::string("Failed to stop deadline timer: ") + std::strerror(errno));
    }
}

// Puts back whatever sys.settrace() reported when the guard armed.
void TimeoutGuard::Impl::removeTrace() {
    if (!traceInstalled) return;
    PyEval_SetTrace(nullptr, nullptr);
    traceInstalled = false;
    if (!previousTrace || previousTrace.is_none()) return;
    try {
        sysModule.attr("settrace")(previousTrace);
    } catch (const py::error_already_set& e) {
        LOG_WARN("Cannot restore previous trace function: " + python::describeError(e, false).message);
    }
}

// Runs handlers for signals that arrived before the timer stopped. The
// deadline's own exception is dropped here; the expired flag already
// records it. The first exception any other handler raises is kept.
void TimeoutGuard::Impl::drainPending() {
    draining = true;
    for (int round = 0; round < MAX_DRAIN_ROUNDS; round++) {
        if (PyErr_CheckSignals() == 0) break;
        py::error_already_set raised;
        if (raised.matches(deadlineExceededType)) continue;
        if (!foreignSignal) {
            foreignSignal = std::make_unique<py::error_already_set>(std::move(raised));
            continue;
        }
        python::PythonError err = python::describeError(raised, false);
        LOG_WARN("Signal handler raised during deadline disarm: " + err.typeName + ": " + err.message);
    }
    draining = false;
}

// The signal module's bookkeeping is reset first, then the exact native
// disposition is put back. signal.signal() reports None for handlers that were
// installed natively; those are only recoverable through sigaction.
void TimeoutGuard::Impl::restoreHandler() {
    try {
        py::object previous = previousHandler;
        if (!previous || previous.is_none()) previous = signalModule.attr("SIG_DFL");
        signalModule.attr("signal")(SIGALRM, previous);
    } catch (const py::error_already_set& e) {
        LOG_WARN("Restoring SIGALRM handler through signal module failed: " +
                 python::describeError(e, false).message);
    }
    if (sigaction(SIGALRM, &previousAction, nullptr) != 0) {
        LOG_ERROR(std::string("Failed to restore SIGALRM disposition: ") + std::strerror(errno));
    }
}

void TimeoutGuard::Impl::restoreTimer() {
    int64_t remaining = toMicros(previousTimer.it_value);
    if (remaining == 0) return;

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - armedAt).count();
    remaining -= elapsed;
    if (remaining <= 0) remaining = 1;

    itimerval timer;
    timer.it_value = fromMicros(remaining);
    timer.it_interval = previousTimer.it_interval;
    if (setitimer(ITIMER_REAL, &timer, nullptr) != 0) {
        LOG_ERROR(std::string("Failed to re-arm previous timer: ") + std::strerror(errno));
    }
}

TimeoutGuard::TimeoutGuard(uint32_t seconds) : impl_(std::make_unique<Impl>()) {
    impl_->seconds = seconds;
    impl_->arm();
    if (!impl_->armed) {
        LOG_WARN("Deadline not armed: " + impl_->error);
    }
}

TimeoutGuard::~TimeoutGuard() {
    disarm();
    if (impl_->foreignSignal) {
        python::PythonError err = python::describeError(*impl_->foreignSignal, false);
        LOG_WARN("Dropping signal exception after disarm: " + err.typeName + ": " + err.message);
        impl_->foreignSignal.reset();
    }
}

bool TimeoutGuard::armed() const {
    return impl_->armed;
}

bool TimeoutGuard::expired() const {
    return impl_->expired;
}

const std::string& TimeoutGuard::armError() const {
    return impl_->error;
}

void TimeoutGuard::disarm() {
    if (!impl_->armed) return;

    py::error_scope pending;
    impl_->stopTimer();
    impl_->removeTrace();
    impl_->drainPending();
    impl_->expired = deadlineFired.exchange(false);
    impl_->restoreHandler();
    impl_->restoreTimer();

    impl_->previousHandler = py::object();
    impl_->previousTrace = py::object();
    impl_->sysModule = py::object();
    impl_->signalModule = py::object();
    impl_->armed = false;
    guardInFlight = false;
}

void TimeoutGuard::rethrowPendingSignal() {
    if (!impl_->foreignSignal) return;
    py::error_already_set raised = std::move(*impl_->foreignSignal);
    impl_->foreignSignal.reset();
    throw raised;
}

void TimeoutGuard::finish(std::exception_ptr failure) {
    disarm();
    rethrowPendingSignal();
    if (impl_->expired) throw TimeoutError(impl_->seconds);
    if (failure) std::rethrow_exception(failure);
}

}
}

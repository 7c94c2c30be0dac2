#include "python/runtime.h"
#include "utils/logger.h"
#include <memory>
#include <mutex>

namespace snipbox {
namespace python {

static std::mutex runtimeMutex;
static bool runtimeReady = false;
static bool ownsInterpreter = false;
static std::unique_ptr<py::gil_scoped_release> mainThreadRelease;

Result<void> PythonRuntime::init() {
    std::lock_guard<std::mutex> lock(runtimeMutex);
    if (runtimeReady) return Result<void>();

    if (!Py_IsInitialized()) {
        try {
            // No signal handlers and no script directory on sys.path.
            py::initialize_interpreter(false, 0, nullptr, false);
        } catch (const std::exception& e) {
            return Result<void>(makeError(ErrorCode::INTERPRETER_ERROR,
                                          std::string("Failed to initialize Python interpreter: ") + e.what()));
        }
        ownsInterpreter = true;
        mainThreadRelease = std::make_unique<py::gil_scoped_release>();
    }

    runtimeReady = true;
    LOG_DEBUG("Python runtime initialized: " + std::string(Py_GetVersion()));
    return Result<void>();
}

void PythonRuntime::shutdown() {
    std::lock_guard<std::mutex> lock(runtimeMutex);
    if (!runtimeReady) return;

    if (ownsInterpreter) {
        mainThreadRelease.reset();
        py::finalize_interpreter();
        ownsInterpreter = false;
    }
    runtimeReady = false;
}

bool PythonRuntime::isInitialized() {
    std::lock_guard<std::mutex> lock(runtimeMutex);
    return runtimeReady;
}

std::string PythonRuntime::version() {
    return Py_GetVersion();
}

std::string toUtf8(py::handle text) {
    if (!text || !py::isinstance<py::str>(text)) return "";
    return text.attr("encode")("utf-8", "backslashreplace").cast<std::string>();
}

static std::string unprintable(py::handle obj) {
    return "<unprintable " + std::string(Py_TYPE(obj.ptr())->tp_name) + ">";
}

std::string objectToString(py::handle obj) {
    if (!obj) return "";
    try {
        return toUtf8(py::str(obj));
    } catch (const py::error_already_set&) {
        return unprintable(obj);
    }
}

std::string objectRepr(py::handle obj) {
    if (!obj) return "";
    try {
        return toUtf8(py::repr(obj));
    } catch (const py::error_already_set&) {
        return unprintable(obj);
    }
}

static std::string formatTraceback(const py::error_already_set& e) {
    try {
        py::object trace = e.trace();
        if (!trace) trace = py::none();
        py::object lines = py::module_::import("traceback").attr("format_exception")(e.type(), e.value(), trace);
        return toUtf8(py::str("").attr("join")(lines));
    } catch (const py::error_already_set& inner) {
        LOG_DEBUG(std::string("Cannot format traceback: ") + inner.what());
        return "";
    }
}

PythonError describeError(const py::error_already_set& e, bool withTraceback) {
    PythonError err;
    py::handle type = e.type();
    if (!type) {
        err.typeName = "Exception";
        err.message = e.what();
        return err;
    }

    try {
        err.typeName = toUtf8(type.attr("__name__"));
    } catch (const py::error_already_set&) {
        err.typeName.clear();
    }
    if (err.typeName.empty()) err.typeName = "Exception";

    err.message = objectToString(e.value());
    if (withTraceback) err.traceback = formatTraceback(e);
    return err;
}

}
}

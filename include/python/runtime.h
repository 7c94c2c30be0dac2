#pragma once

#include <pybind11/embed.h>

#include <string>
#include "infrastructure/error_handling.h"

namespace snipbox {
namespace python {

namespace py = pybind11;

struct PythonError {
    std::string typeName;
    std::string message;
    std::string traceback;

    bool empty() const { return typeName.empty(); }
};

// Interpreter lifecycle. init() leaves the GIL released; every later entry
// into the interpreter goes through py::gil_scoped_acquire.
class PythonRuntime {
public:
    static Result<void> init();
    static void shutdown();
    static bool isInitialized();
    static std::string version();
};

// Type name, str() of the value and, when asked, the formatted traceback.
// Never throws. GIL required.
PythonError describeError(const py::error_already_set& e, bool withTraceback = true);

// UTF-8 bytes of a str; lone surrogates come out backslash-escaped instead of
// failing the whole conversion. GIL required.
std::string toUtf8(py::handle text);

// str() / repr() of an object, never raising. GIL required.
std::string objectToString(py::handle obj);
std::string objectRepr(py::handle obj);

}
}

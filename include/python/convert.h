#pragma once

#include "python/runtime.h"
#include "python/value.h"

namespace snipbox {
namespace python {

constexpr int MAX_CONVERSION_DEPTH = 32;

// Copies a live object into a ScriptValue. Containers nested deeper than
// MAX_CONVERSION_DEPTH, integers outside int64 and unknown types become
// OBJECT with their repr. Checks for pending signals while walking large
// containers, so a deadline can interrupt the copy. GIL required.
Result<ScriptValue> toScriptValue(py::handle obj);

}
}

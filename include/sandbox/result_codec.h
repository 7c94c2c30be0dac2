#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "infrastructure/error_handling.h"
#include "python/value.h"
#include "sandbox/runner.h"

namespace snipbox {
namespace sandbox {

using json = nlohmann::json;

// Boundary form: plain JSON values, OBJECT as its repr string.
json toJson(const python::ScriptValue& value);
json toJson(const Violation& violation);
json toJson(const ExecutionResult& result);

// Prints a boundary document; invalid UTF-8 is replaced instead of thrown.
std::string dumpJson(const json& doc, int indent = -1);

// Lossless, type-tagged form used between an isolated child and its parent.
json encodeTaggedValue(const python::ScriptValue& value);
Result<python::ScriptValue> decodeTaggedValue(const json& doc);

std::string encodeTransport(const ExecutionResult& result);
Result<ExecutionResult> decodeTransport(const std::string& data);

}
}

#include "sandbox/result_codec.h"
#include <cmath>
#include <limits>

namespace snipbox {
namespace sandbox {

using python::ScriptValue;
using python::ScriptValueType;

json toJson(const ScriptValue& value) {
    switch (value.type) {
        case ScriptValueType::NONE: return nullptr;
        case ScriptValueType::BOOL: return value.boolVal;
        case ScriptValueType::INT: return value.intVal;
        case ScriptValueType::FLOAT: return value.floatVal;
        case ScriptValueType::STRING:
        case ScriptValueType::OBJECT: return value.stringVal;
        case ScriptValueType::LIST: {
            json arr = json::array();
            for (const auto& item : value.listVal) arr.push_back(toJson(item));
            return arr;
        }
        case ScriptValueType::DICT: {
            json obj = json::object();
            for (const auto& [key, item] : value.dictVal) obj[key] = toJson(item);
            return obj;
        }
    }
    return nullptr;
}

json toJson(const Violation& violation) {
    json out = json::object();
    out["kind"] = violationKindName(violation.kind);
    out["subject"] = violation.subject;
    out["category"] = riskCategoryName(violation.category);
    out["line"] = violation.line;
    out["message"] = violation.describe();
    return out;
}

json toJson(const ExecutionResult& result) {
    json out = json::object();
    out["success"] = result.success;
    out["output"] = result.output;
    out["error"] = result.error ? json(*result.error) : json(nullptr);
    out["result_value"] = result.resultValue ? toJson(*result.resultValue) : json(nullptr);
    out["execution_time"] = result.executionTime;
    out["status"] = executionStatusName(result.status);
    json violations = json::array();
    for (const auto& v : result.violations) violations.push_back(toJson(v));
    out["violations"] = violations;
    return out;
}

std::string dumpJson(const json& doc, int indent) {
    return doc.dump(indent, ' ', false, json::error_handler_t::replace);
}

json encodeTaggedValue(const ScriptValue& value) {
    json out = json::object();
    out["t"] = python::scriptValueTypeName(value.type);
    switch (value.type) {
        case ScriptValueType::NONE:
            break;
        case ScriptValueType::BOOL:
            out["v"] = value.boolVal;
            break;
        case ScriptValueType::INT:
            out["v"] = value.intVal;
            break;
        case ScriptValueType::FLOAT:
            if (std::isfinite(value.floatVal)) {
                out["v"] = value.floatVal;
            } else if (std::isnan(value.floatVal)) {
                out["s"] = "nan";
            } else {
                out["s"] = value.floatVal > 0 ? "inf" : "-inf";
            }
            break;
        case ScriptValueType::STRING:
        case ScriptValueType::OBJECT:
            out["v"] = value.stringVal;
            break;
        case ScriptValueType::LIST: {
            json arr = json::array();
            for (const auto& item : value.listVal) arr.push_back(encodeTaggedValue(item));
            out["v"] = arr;
            break;
        }
        case ScriptValueType::DICT: {
            json obj = json::object();
            for (const auto& [key, item] : value.dictVal) obj[key] = encodeTaggedValue(item);
            out["v"] = obj;
            break;
        }
    }
    return out;
}

namespace {

static Error codecError(const std::string& message) {
    return makeError(ErrorCode::SERIALIZATION_ERROR, message);
}

static double specialFloat(const std::string& name) {
    if (name == "inf") return std::numeric_limits<double>::infinity();
    if (name == "-inf") return -std::numeric_limits<double>::infinity();
    return std::numeric_limits<double>::quiet_NaN();
}

static bool parseStatus(const std::string& name, ExecutionStatus& out) {
    for (auto status : {ExecutionStatus::COMPLETED, ExecutionStatus::REJECTED,
                        ExecutionStatus::FAILED, ExecutionStatus::TIMED_OUT}) {
        if (name == executionStatusName(status)) {
            out = status;
            return true;
        }
    }
    return false;
}

static bool parseKind(const std::string& name, ViolationKind& out) {
    for (auto kind : {ViolationKind::UNAUTHORIZED_IMPORT, ViolationKind::UNAUTHORIZED_CALL,
                      ViolationKind::UNAUTHORIZED_ATTRIBUTE, ViolationKind::PARSE_ERROR}) {
        if (name == violationKindName(kind)) {
            out = kind;
            return true;
        }
    }
    return false;
}

static RiskCategory parseCategory(const std::string& name) {
    for (auto category : {RiskCategory::DYNAMIC_CODE, RiskCategory::SCOPE_ACCESS,
                          RiskCategory::INTROSPECTION, RiskCategory::INTERACTIVE_IO,
                          RiskCategory::TYPE_CONSTRUCTION, RiskCategory::FILESYSTEM,
                          RiskCategory::PROCESS, RiskCategory::NETWORK}) {
        if (name == riskCategoryName(category)) return category;
    }
    return RiskCategory::NONE;
}

}

Result<ScriptValue> decodeTaggedValue(const json& doc) {
    if (!doc.is_object() || !doc.contains("t") || !doc["t"].is_string()) {
        return Result<ScriptValue>(codecError("tagged value without type"));
    }
    std::string tag = doc["t"].get<std::string>();
    const json* v = doc.contains("v") ? &doc["v"] : nullptr;

    if (tag == "none") return ScriptValue::none();
    if (tag == "bool" && v && v->is_boolean()) return ScriptValue::fromBool(v->get<bool>());
    if (tag == "int" && v && v->is_number_integer()) return ScriptValue::fromInt(v->get<int64_t>());
    if (tag == "float") {
        if (v && v->is_number()) return ScriptValue::fromFloat(v->get<double>());
        if (doc.contains("s") && doc["s"].is_string()) {
            return ScriptValue::fromFloat(specialFloat(doc["s"].get<std::string>()));
        }
    }
    if (tag == "string" && v && v->is_string()) return ScriptValue::fromString(v->get<std::string>());
    if (tag == "object" && v && v->is_string()) return ScriptValue::fromObject(v->get<std::string>());
    if (tag == "list" && v && v->is_array()) {
        std::vector<ScriptValue> items;
        for (const auto& item : *v) {
            auto decoded = decodeTaggedValue(item);
            if (!decoded.ok()) return decoded;
            items.push_back(std::move(decoded.value()));
        }
        return ScriptValue::fromList(items);
    }
    if (tag == "dict" && v && v->is_object()) {
        std::map<std::string, ScriptValue> items;
        for (auto it = v->begin(); it != v->end(); ++it) {
            auto decoded = decodeTaggedValue(it.value());
            if (!decoded.ok()) return decoded;
            items[it.key()] = std::move(decoded.value());
        }
        return ScriptValue::fromDict(items);
    }
    return Result<ScriptValue>(codecError("malformed tagged value of type '" + tag + "'"));
}

std::string encodeTransport(const ExecutionResult& result) {
    json out = json::object();
    out["success"] = result.success;
    out["output"] = result.output;
    out["error"] = result.error ? json(*result.error) : json(nullptr);
    out["value"] = result.resultValue ? encodeTaggedValue(*result.resultValue) : json(nullptr);
    out["execution_time"] = result.executionTime;
    out["status"] = executionStatusName(result.status);
    json violations = json::array();
    for (const auto& v : result.violations) {
        json entry = json::object();
        entry["kind"] = violationKindName(v.kind);
        entry["subject"] = v.subject;
        entry["category"] = riskCategoryName(v.category);
        entry["line"] = v.line;
        violations.push_back(entry);
    }
    out["violations"] = violations;
    return dumpJson(out);
}

Result<ExecutionResult> decodeTransport(const std::string& data) {
    json parsed = json::parse(data, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Result<ExecutionResult>(codecError("malformed execution result"));
    }

    ExecutionResult result;
    if (!parsed.contains("success") || !parsed["success"].is_boolean() ||
        !parsed.contains("status") || !parsed["status"].is_string()) {
        return Result<ExecutionResult>(codecError("execution result missing success or status"));
    }
    result.success = parsed["success"].get<bool>();
    if (!parseStatus(parsed["status"].get<std::string>(), result.status)) {
        return Result<ExecutionResult>(codecError("unknown execution status"));
    }

    if (parsed.contains("output") && parsed["output"].is_string()) {
        result.output = parsed["output"].get<std::string>();
    }
    if (parsed.contains("error") && parsed["error"].is_string()) {
        result.error = parsed["error"].get<std::string>();
    }
    if (parsed.contains("execution_time") && parsed["execution_time"].is_number()) {
        result.executionTime = parsed["execution_time"].get<double>();
    }
    if (parsed.contains("value") && !parsed["value"].is_null()) {
        auto value = decodeTaggedValue(parsed["value"]);
        if (!value.ok()) return Result<ExecutionResult>(value.error());
        result.resultValue = std::move(value.value());
    }
    if (parsed.contains("violations") && parsed["violations"].is_array()) {
        for (const auto& entry : parsed["violations"]) {
            if (!entry.is_object()) {
                return Result<ExecutionResult>(codecError("malformed violation entry"));
            }
            Violation v;
            if (!parseKind(entry.value("kind", ""), v.kind)) {
                return Result<ExecutionResult>(codecError("unknown violation kind"));
            }
            v.subject = entry.value("subject", "");
            v.category = parseCategory(entry.value("category", ""));
            v.line = entry.value("line", 0);
            result.violations.push_back(v);
        }
    }
    return Result<ExecutionResult>(std::move(result));
}

}
}

#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace snipbox {
namespace python {

enum class ScriptValueType {
    NONE,
    BOOL,
    INT,
    FLOAT,
    STRING,
    LIST,
    DICT,
    OBJECT
};

// Interpreter-independent copy of a script value. OBJECT carries the repr of
// anything that has no structural mapping.
struct ScriptValue {
    ScriptValueType type = ScriptValueType::NONE;
    bool boolVal = false;
    int64_t intVal = 0;
    double floatVal = 0.0;
    std::string stringVal;
    std::vector<ScriptValue> listVal;
    std::map<std::string, ScriptValue> dictVal;

    static ScriptValue none() { return ScriptValue{}; }
    static ScriptValue fromBool(bool v) { ScriptValue s; s.type = ScriptValueType::BOOL; s.boolVal = v; return s; }
    static ScriptValue fromInt(int64_t v) { ScriptValue s; s.type = ScriptValueType::INT; s.intVal = v; return s; }
    static ScriptValue fromFloat(double v) { ScriptValue s; s.type = ScriptValueType::FLOAT; s.floatVal = v; return s; }
    static ScriptValue fromString(const std::string& v) { ScriptValue s; s.type = ScriptValueType::STRING; s.stringVal = v; return s; }
    static ScriptValue fromList(const std::vector<ScriptValue>& v) { ScriptValue s; s.type = ScriptValueType::LIST; s.listVal = v; return s; }
    static ScriptValue fromDict(const std::map<std::string, ScriptValue>& v) { ScriptValue s; s.type = ScriptValueType::DICT; s.dictVal = v; return s; }
    static ScriptValue fromObject(const std::string& repr) { ScriptValue s; s.type = ScriptValueType::OBJECT; s.stringVal = repr; return s; }

    bool isNone() const { return type == ScriptValueType::NONE; }
    bool toBool() const { return type == ScriptValueType::BOOL ? boolVal : (type == ScriptValueType::INT ? intVal != 0 : false); }
    int64_t toInt() const { return type == ScriptValueType::INT ? intVal : (type == ScriptValueType::FLOAT ? static_cast<int64_t>(floatVal) : 0); }
    double toFloat() const { return type == ScriptValueType::FLOAT ? floatVal : (type == ScriptValueType::INT ? static_cast<double>(intVal) : 0.0); }
    std::string toString() const { return (type == ScriptValueType::STRING || type == ScriptValueType::OBJECT) ? stringVal : ""; }

    bool operator==(const ScriptValue& other) const;
    bool operator!=(const ScriptValue& other) const { return !(*this == other); }
};

const char* scriptValueTypeName(ScriptValueType type);

}
}

#include "python/value.h"

namespace snipbox {
namespace python {

bool ScriptValue::operator==(const ScriptValue& other) const {
    if (type != other.type) return false;
    switch (type) {
        case ScriptValueType::NONE: return true;
        case ScriptValueType::BOOL: return boolVal == other.boolVal;
        case ScriptValueType::INT: return intVal == other.intVal;
        case ScriptValueType::FLOAT: return floatVal == other.floatVal;
        case ScriptValueType::STRING:
        case ScriptValueType::OBJECT: return stringVal == other.stringVal;
        case ScriptValueType::LIST: return listVal == other.listVal;
        case ScriptValueType::DICT: return dictVal == other.dictVal;
    }
    return false;
}

const char* scriptValueTypeName(ScriptValueType type) {
    switch (type) {
        case ScriptValueType::NONE: return "none";
        case ScriptValueType::BOOL: return "bool";
        case ScriptValueType::INT: return "int";
        case ScriptValueType::FLOAT: return "float";
        case ScriptValueType::STRING: return "string";
        case ScriptValueType::LIST: return "list";
        case ScriptValueType::DICT: return "dict";
        case ScriptValueType::OBJECT: return "object";
    }
    return "unknown";
}

}
}

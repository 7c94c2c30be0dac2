#include "python/convert.h"

namespace snipbox {
namespace python {

namespace {

constexpr size_t SIGNAL_CHECK_INTERVAL = 1024;

struct ConversionState {
    size_t visited = 0;
};

ScriptValue convert(py::handle obj, int depth, ConversionState& state) {
    if (++state.visited % SIGNAL_CHECK_INTERVAL == 0 && PyErr_CheckSignals() < 0) {
        throw py::error_already_set();
    }

    if (obj.is_none()) return ScriptValue::none();

    if (py::isinstance<py::bool_>(obj)) return ScriptValue::fromBool(obj.cast<bool>());

    if (py::isinstance<py::int_>(obj)) {
        try {
            return ScriptValue::fromInt(obj.cast<int64_t>());
        } catch (const py::cast_error&) {
            return ScriptValue::fromObject(objectRepr(obj));
        }
    }

    if (py::isinstance<py::float_>(obj)) return ScriptValue::fromFloat(obj.cast<double>());

    if (py::isinstance<py::str>(obj)) return ScriptValue::fromString(toUtf8(obj));

    bool sequence = py::isinstance<py::list>(obj) || py::isinstance<py::tuple>(obj);
    bool mapping = py::isinstance<py::dict>(obj);
    if ((sequence || mapping) && depth >= MAX_CONVERSION_DEPTH) {
        return ScriptValue::fromObject(objectRepr(obj));
    }

    if (sequence) {
        // Snapshot first: element conversion may run user code that mutates the list.
        py::tuple items(py::reinterpret_borrow<py::object>(obj));
        std::vector<ScriptValue> out;
        out.reserve(items.size());
        for (py::handle item : items) {
            out.push_back(convert(item, depth + 1, state));
        }
        return ScriptValue::fromList(out);
    }

    if (mapping) {
        py::object items = py::reinterpret_steal<py::object>(PyDict_Items(obj.ptr()));
        if (!items) throw py::error_already_set();

        std::map<std::string, ScriptValue> out;
        for (py::handle pair : items) {
            py::tuple entry = py::reinterpret_borrow<py::tuple>(pair);
            py::object key = entry[0];
            py::object value = entry[1];
            std::string keyText = py::isinstance<py::str>(key) ? toUtf8(key) : objectToString(key);
            out[keyText] = convert(value, depth + 1, state);
        }
        return ScriptValue::fromDict(out);
    }

    return ScriptValue::fromObject(toUtf8(py::repr(obj)));
}

}

Result<ScriptValue> toScriptValue(py::handle obj) {
    if (!obj) {
        return Result<ScriptValue>(makeError(ErrorCode::INVALID_ARGUMENT, "null object"));
    }
    ConversionState state;
    try {
        return Result<ScriptValue>(convert(obj, 0, state));
    } catch (const py::error_already_set& e) {
        PythonError err = describeError(e, false);
        return Result<ScriptValue>(makeError(ErrorCode::SERIALIZATION_ERROR, err.typeName + ": " + err.message));
    }
}

}
}

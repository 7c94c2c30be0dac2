#include "sandbox/environment.h"
#include "sandbox/deny_list.h"
#include "utils/logger.h"
#include <set>

namespace snipbox {
namespace sandbox {

namespace py = pybind11;

struct RestrictedEnvironment::Impl {
    py::object globals;
    std::vector<std::string> boundModules;
    std::vector<std::string> skippedModules;
};

RestrictedEnvironment::RestrictedEnvironment() : impl_(std::make_unique<Impl>()) {}

RestrictedEnvironment::~RestrictedEnvironment() {
    clear();
}

RestrictedEnvironment::RestrictedEnvironment(RestrictedEnvironment&& other) noexcept = default;

RestrictedEnvironment& RestrictedEnvironment::operator=(RestrictedEnvironment&& other) noexcept {
    if (this != &other) {
        clear();
        impl_ = std::move(other.impl_);
    }
    return *this;
}

py::dict RestrictedEnvironment::globals() const {
    if (!valid()) return py::dict();
    return py::reinterpret_borrow<py::dict>(impl_->globals);
}

bool RestrictedEnvironment::valid() const {
    return impl_ && impl_->globals;
}

const std::vector<std::string>& RestrictedEnvironment::boundModules() const {
    return impl_->boundModules;
}

const std::vector<std::string>& RestrictedEnvironment::skippedModules() const {
    return impl_->skippedModules;
}

bool RestrictedEnvironment::hasBuiltin(const std::string& name) const {
    if (!valid()) return false;
    py::gil_scoped_acquire gil;
    py::dict ns = globals();
    if (!ns.contains("__builtins__")) return false;
    py::object builtins = ns["__builtins__"];
    return py::isinstance<py::dict>(builtins) && builtins.cast<py::dict>().contains(name);
}

bool RestrictedEnvironment::hasBinding(const std::string& name) const {
    if (!valid()) return false;
    py::gil_scoped_acquire gil;
    return globals().contains(name);
}

void RestrictedEnvironment::clear() {
    if (!valid()) return;
    if (!Py_IsInitialized()) {
        // Interpreter already finalized; the reference is gone with it.
        impl_->globals.release();
        return;
    }
    py::gil_scoped_acquire gil;
    PyDict_Clear(impl_->globals.ptr());
    impl_->globals = py::object();
}

namespace {

static Error environmentError(const std::string& what, const py::error_already_set& e) {
    python::PythonError err = python::describeError(e, false);
    return makeError(ErrorCode::ENVIRONMENT_ERROR, what + ": " + err.typeName + ": " + err.message);
}

// Replacement __import__: absolute imports of allowed top-level packages only.
static py::cpp_function makeImportHook(std::set<std::string> allowed, py::object realImport) {
    return py::cpp_function(
        [allowed, realImport](const std::string& name, py::object globals, py::object locals,
                              py::object fromlist, int level) -> py::object {
            if (level > 0 || name.empty() || allowed.count(topLevelModule(name)) == 0) {
                throw py::import_error("Import of '" + name + "' is not allowed");
            }
            return realImport(name, globals, locals, fromlist, 0);
        },
        py::name("__import__"),
        py::arg("name"), py::arg("globals") = py::none(), py::arg("locals") = py::none(),
        py::arg("fromlist") = py::tuple(), py::arg("level") = 0);
}

static py::dict buildSafeBuiltins(const std::set<std::string>& allowed) {
    py::module_ builtinsModule = py::module_::import("builtins");
    py::dict source = builtinsModule.attr("__dict__");

    py::dict safe;
    for (auto item : source) {
        if (!py::isinstance<py::str>(item.first)) continue;
        std::string name = python::toUtf8(item.first);
        if (name.compare(0, 2, "__") == 0 || isRestrictedBuiltin(name)) continue;
        safe[item.first] = item.second;
    }

    safe["__import__"] = makeImportHook(allowed, builtinsModule.attr("__import__"));
    return safe;
}

}

Result<RestrictedEnvironment> RestrictedEnvironmentBuilder::build(const Policy& policy) {
    auto init = python::PythonRuntime::init();
    if (!init.ok()) return Result<RestrictedEnvironment>(init.error());

    std::set<std::string> topLevel;
    for (const auto& name : policy.allowedModules) {
        if (!name.empty()) topLevel.insert(topLevelModule(name));
    }

    py::gil_scoped_acquire gil;

    RestrictedEnvironment env;
    try {
        py::dict ns;
        ns["__builtins__"] = buildSafeBuiltins(topLevel);
        env.impl_->globals = ns;
    } catch (const py::error_already_set& e) {
        return Result<RestrictedEnvironment>(environmentError("cannot build namespace", e));
    }

    for (const auto& name : topLevel) {
        try {
            py::module_ module = py::module_::import(name.c_str());
            env.globals()[name.c_str()] = module;
        } catch (const py::error_already_set& e) {
            python::PythonError err = python::describeError(e, false);
            LOG_DEBUG("Skipping module " + name + ": " + err.typeName + ": " + err.message);
            env.impl_->skippedModules.push_back(name);
            continue;
        }
        env.impl_->boundModules.push_back(name);
    }

    return Result<RestrictedEnvironment>(std::move(env));
}

}
}

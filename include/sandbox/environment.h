#pragma once

#include <string>
#include <vector>
#include <memory>
#include "python/runtime.h"
#include "sandbox/policy.h"

namespace snipbox {
namespace sandbox {

// A fresh namespace for one execution: filtered built-ins, a guarded
// __import__ and the allowed modules pre-bound by name. Owned by exactly one
// run; clearing it on destruction breaks reference cycles the snippet built.
class RestrictedEnvironment {
public:
    RestrictedEnvironment();
    ~RestrictedEnvironment();

    RestrictedEnvironment(RestrictedEnvironment&& other) noexcept;
    RestrictedEnvironment& operator=(RestrictedEnvironment&& other) noexcept;
    RestrictedEnvironment(const RestrictedEnvironment&) = delete;
    RestrictedEnvironment& operator=(const RestrictedEnvironment&) = delete;

    // The namespace dict itself, not a copy. GIL required.
    pybind11::dict globals() const;
    bool valid() const;

    const std::vector<std::string>& boundModules() const;
    const std::vector<std::string>& skippedModules() const;

    bool hasBuiltin(const std::string& name) const;
    bool hasBinding(const std::string& name) const;

    void clear();

private:
    friend class RestrictedEnvironmentBuilder;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class RestrictedEnvironmentBuilder {
public:
    static Result<RestrictedEnvironment> build(const Policy& policy);
};

}
}

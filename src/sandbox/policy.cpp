#include "sandbox/policy.h"

namespace snipbox {
namespace sandbox {

const std::set<std::string>& defaultAllowedModules() {
    static const std::set<std::string> modules = {
        "math", "random", "datetime", "time", "json", "re",
        "collections", "itertools", "functools", "operator",
        "statistics", "decimal", "fractions",
        "numpy", "pandas", "matplotlib", "seaborn"
    };
    return modules;
}

Policy Policy::defaults() {
    Policy policy;
    policy.allowedModules = defaultAllowedModules();
    return policy;
}

std::string topLevelModule(const std::string& moduleName) {
    auto pos = moduleName.find('.');
    return pos == std::string::npos ? moduleName : moduleName.substr(0, pos);
}

bool Policy::allowsModule(const std::string& moduleName) const {
    if (moduleName.empty()) return false;
    return allowedModules.count(topLevelModule(moduleName)) > 0;
}

Result<void> Policy::validate() const {
    SNIPBOX_CHECK(timeoutSeconds > 0, ErrorCode::INVALID_ARGUMENT, "timeout must be a positive number of seconds");
    for (const auto& name : allowedModules) {
        SNIPBOX_CHECK(!name.empty(), ErrorCode::INVALID_ARGUMENT, "allowed module names must not be empty");
    }
    return Result<void>();
}

}
}

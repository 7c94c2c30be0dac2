#pragma once

#include <set>
#include <string>
#include <cstdint>
#include "infrastructure/error_handling.h"

namespace snipbox {
namespace sandbox {

struct Policy {
    std::set<std::string> allowedModules;
    uint32_t timeoutSeconds = 5;
    uint32_t maxMemoryMb = 100;

    static Policy defaults();

    bool allowsModule(const std::string& moduleName) const;
    Result<void> validate() const;
};

// "a.b.c" -> "a"
std::string topLevelModule(const std::string& moduleName);

const std::set<std::string>& defaultAllowedModules();

}
}

#pragma once

#include <string>
#include <vector>
#include <optional>
#include "sandbox/violation.h"

namespace snipbox {
namespace sandbox {

struct DenyEntry {
    std::string name;
    RiskCategory category;
};

// Built-in names that are neither callable by name nor exposed in the
// restricted namespace.
const std::vector<DenyEntry>& restrictedBuiltins();

// Attribute names whose access is treated as a file, process or network
// operation regardless of the receiver.
const std::vector<DenyEntry>& riskyAttributes();

std::optional<RiskCategory> restrictedBuiltinCategory(const std::string& name);
std::optional<RiskCategory> riskyAttributeCategory(const std::string& name);

bool isRestrictedBuiltin(const std::string& name);
bool isDunderName(const std::string& name);

}
}

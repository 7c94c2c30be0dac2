#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace snipbox {
namespace sandbox {

enum class ViolationKind {
    UNAUTHORIZED_IMPORT,
    UNAUTHORIZED_CALL,
    UNAUTHORIZED_ATTRIBUTE,
    PARSE_ERROR
};

enum class RiskCategory {
    NONE = 0,
    DYNAMIC_CODE,
    SCOPE_ACCESS,
    INTROSPECTION,
    INTERACTIVE_IO,
    TYPE_CONSTRUCTION,
    FILESYSTEM,
    PROCESS,
    NETWORK
};

struct Violation {
    ViolationKind kind = ViolationKind::PARSE_ERROR;
    std::string subject;
    RiskCategory category = RiskCategory::NONE;
    int line = 0;

    std::string describe() const;
    bool operator==(const Violation& other) const;
};

const char* violationKindName(ViolationKind kind);
const char* riskCategoryName(RiskCategory category);

std::string joinViolations(const std::vector<Violation>& violations, const std::string& separator = "; ");

}
}

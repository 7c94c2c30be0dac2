#include "sandbox/violation.h"

namespace snipbox {
namespace sandbox {

static const char* operationLabel(RiskCategory category) {
    switch (category) {
        case RiskCategory::FILESYSTEM: return "file";
        case RiskCategory::PROCESS: return "system";
        case RiskCategory::NETWORK: return "network";
        default: return "file/system/network";
    }
}

std::string Violation::describe() const {
    switch (kind) {
        case ViolationKind::UNAUTHORIZED_IMPORT:
            return "Unauthorized import: " + subject;
        case ViolationKind::UNAUTHORIZED_CALL:
            return "Unauthorized function call: " + subject;
        case ViolationKind::UNAUTHORIZED_ATTRIBUTE:
            return std::string("Potentially unsafe ") + operationLabel(category) + " operation: " + subject;
        case ViolationKind::PARSE_ERROR:
            return "Syntax error in code: " + subject;
    }
    return subject;
}

bool Violation::operator==(const Violation& other) const {
    return kind == other.kind && subject == other.subject &&
           category == other.category && line == other.line;
}

const char* violationKindName(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::UNAUTHORIZED_IMPORT: return "unauthorized_import";
        case ViolationKind::UNAUTHORIZED_CALL: return "unauthorized_call";
        case ViolationKind::UNAUTHORIZED_ATTRIBUTE: return "unauthorized_attribute";
        case ViolationKind::PARSE_ERROR: return "parse_error";
    }
    return "unknown";
}

const char* riskCategoryName(RiskCategory category) {
    switch (category) {
        case RiskCategory::NONE: return "none";
        case RiskCategory::DYNAMIC_CODE: return "dynamic_code";
        case RiskCategory::SCOPE_ACCESS: return "scope_access";
        case RiskCategory::INTROSPECTION: return "introspection";
        case RiskCategory::INTERACTIVE_IO: return "interactive_io";
        case RiskCategory::TYPE_CONSTRUCTION: return "type_construction";
        case RiskCategory::FILESYSTEM: return "filesystem";
        case RiskCategory::PROCESS: return "process";
        case RiskCategory::NETWORK: return "network";
    }
    return "unknown";
}

std::string joinViolations(const std::vector<Violation>& violations, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < violations.size(); i++) {
        if (i > 0) out += separator;
        out += violations[i].describe();
    }
    return out;
}

}
}

#include "sandbox/deny_list.h"
#include <unordered_map>

namespace snipbox {
namespace sandbox {

namespace {

using CategoryIndex = std::unordered_map<std::string, RiskCategory>;

static CategoryIndex buildIndex(const std::vector<DenyEntry>& entries) {
    CategoryIndex index;
    for (const auto& entry : entries) {
        index.emplace(entry.name, entry.category);
    }
    return index;
}

static std::optional<RiskCategory> lookup(const CategoryIndex& index, const std::string& name) {
    auto it = index.find(name);
    if (it == index.end()) return std::nullopt;
    return it->second;
}

}

const std::vector<DenyEntry>& restrictedBuiltins() {
    static const std::vector<DenyEntry> entries = {
        {"eval", RiskCategory::DYNAMIC_CODE},
        {"exec", RiskCategory::DYNAMIC_CODE},
        {"compile", RiskCategory::DYNAMIC_CODE},
        {"__import__", RiskCategory::DYNAMIC_CODE},
        {"globals", RiskCategory::SCOPE_ACCESS},
        {"locals", RiskCategory::SCOPE_ACCESS},
        {"vars", RiskCategory::SCOPE_ACCESS},
        {"getattr", RiskCategory::INTROSPECTION},
        {"setattr", RiskCategory::INTROSPECTION},
        {"delattr", RiskCategory::INTROSPECTION},
        {"open", RiskCategory::INTERACTIVE_IO},
        {"input", RiskCategory::INTERACTIVE_IO},
        {"breakpoint", RiskCategory::INTERACTIVE_IO},
        {"memoryview", RiskCategory::TYPE_CONSTRUCTION},
        {"classmethod", RiskCategory::TYPE_CONSTRUCTION},
        {"staticmethod", RiskCategory::TYPE_CONSTRUCTION},
        {"property", RiskCategory::TYPE_CONSTRUCTION},
        {"super", RiskCategory::TYPE_CONSTRUCTION},
        {"type", RiskCategory::TYPE_CONSTRUCTION},
        {"object", RiskCategory::TYPE_CONSTRUCTION},
        {"__build_class__", RiskCategory::TYPE_CONSTRUCTION}
    };
    return entries;
}

const std::vector<DenyEntry>& riskyAttributes() {
    static const std::vector<DenyEntry> entries = {
        {"read", RiskCategory::FILESYSTEM},
        {"write", RiskCategory::FILESYSTEM},
        {"open", RiskCategory::FILESYSTEM},
        {"close", RiskCategory::FILESYSTEM},
        {"remove", RiskCategory::FILESYSTEM},
        {"unlink", RiskCategory::FILESYSTEM},
        {"system", RiskCategory::PROCESS},
        {"popen", RiskCategory::PROCESS},
        {"spawn", RiskCategory::PROCESS},
        {"exec", RiskCategory::PROCESS},
        {"eval", RiskCategory::PROCESS},
        {"connect", RiskCategory::NETWORK},
        {"bind", RiskCategory::NETWORK},
        {"listen", RiskCategory::NETWORK},
        {"accept", RiskCategory::NETWORK},
        {"socket", RiskCategory::NETWORK}
    };
    return entries;
}

std::optional<RiskCategory> restrictedBuiltinCategory(const std::string& name) {
    static const CategoryIndex index = buildIndex(restrictedBuiltins());
    return lookup(index, name);
}

std::optional<RiskCategory> riskyAttributeCategory(const std::string& name) {
    static const CategoryIndex index = buildIndex(riskyAttributes());
    return lookup(index, name);
}

bool isRestrictedBuiltin(const std::string& name) {
    return restrictedBuiltinCategory(name).has_value();
}

bool isDunderName(const std::string& name) {
    return name.size() >= 4 && name.compare(0, 2, "__") == 0 &&
           name.compare(name.size() - 2, 2, "__") == 0;
}

}
}

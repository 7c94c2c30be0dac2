#pragma once

#include <string>
#include <vector>
#include "sandbox/policy.h"
#include "sandbox/syntax_tree.h"
#include "sandbox/violation.h"

namespace snipbox {
namespace sandbox {

// Screens source for imports outside the policy, calls to restricted
// built-ins and risky attribute names. Never executes the source. An empty
// result means nothing was found, not that the source is safe.
class StaticSafetyAnalyzer {
public:
    static std::vector<Violation> analyze(const std::string& source, const Policy& policy);
    static std::vector<Violation> analyzeTree(const SyntaxNode& tree, const Policy& policy);
};

}
}

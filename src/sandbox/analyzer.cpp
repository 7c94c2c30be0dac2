#include "sandbox/analyzer.h"
#include "sandbox/deny_list.h"
#include "python/runtime.h"
#include "utils/logger.h"

namespace snipbox {
namespace sandbox {

namespace {

class ViolationCollector : public SyntaxVisitor {
public:
    explicit ViolationCollector(const Policy& policy) : policy_(policy) {}

    std::vector<Violation> take() { return std::move(violations_); }

protected:
    void visitImport(const SyntaxNode& node) override {
        for (const auto& module : node.modules) {
            checkModule(module, node.line);
        }
    }

    void visitImportFrom(const SyntaxNode& node) override {
        // Relative imports carry no module name; the runtime hook rejects them.
        if (node.name.empty()) return;
        checkModule(node.name, node.line);
    }

    void visitCall(const SyntaxNode& node) override {
        if (node.name.empty()) return;
        auto category = restrictedBuiltinCategory(node.name);
        if (!category) return;
        add(ViolationKind::UNAUTHORIZED_CALL, node.name, *category, node.line);
    }

    void visitAttribute(const SyntaxNode& node) override {
        auto category = riskyAttributeCategory(node.name);
        if (!category) return;
        add(ViolationKind::UNAUTHORIZED_ATTRIBUTE, node.name, *category, node.line);
    }

private:
    void checkModule(const std::string& module, int line) {
        if (policy_.allowsModule(module)) return;
        add(ViolationKind::UNAUTHORIZED_IMPORT, module, RiskCategory::NONE, line);
    }

    void add(ViolationKind kind, const std::string& subject, RiskCategory category, int line) {
        Violation v;
        v.kind = kind;
        v.subject = subject;
        v.category = category;
        v.line = line;
        violations_.push_back(v);
    }

    const Policy& policy_;
    std::vector<Violation> violations_;
};

static Violation parseViolation(const std::string& message) {
    Violation v;
    v.kind = ViolationKind::PARSE_ERROR;
    v.subject = message;
    return v;
}

}

std::vector<Violation> StaticSafetyAnalyzer::analyze(const std::string& source, const Policy& policy) {
    auto init = python::PythonRuntime::init();
    if (!init.ok()) {
        return {parseViolation(init.error().message)};
    }

    auto tree = parseSyntaxTree(source);
    if (!tree.ok()) {
        LOG_DEBUG("Snippet failed to parse: " + tree.error().message);
        return {parseViolation(tree.error().message)};
    }
    return analyzeTree(tree.value(), policy);
}

std::vector<Violation> StaticSafetyAnalyzer::analyzeTree(const SyntaxNode& tree, const Policy& policy) {
    ViolationCollector collector(policy);
    collector.walk(tree);
    return collector.take();
}

}
}

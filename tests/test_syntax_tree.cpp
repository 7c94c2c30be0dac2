#include "sandbox/syntax_tree.h"
#include "python/runtime.h"
#include <cassert>
#include <string>
#include <vector>

using namespace snipbox;
using namespace snipbox::sandbox;

namespace {

class KindRecorder : public SyntaxVisitor {
public:
    std::vector<NodeKind> kinds;
    std::vector<std::string> names;

protected:
    void visitModule(const SyntaxNode& node) override { record(node); }
    void visitImport(const SyntaxNode& node) override { record(node); }
    void visitImportFrom(const SyntaxNode& node) override { record(node); }
    void visitCall(const SyntaxNode& node) override { record(node); }
    void visitAttribute(const SyntaxNode& node) override { record(node); }
    void visitName(const SyntaxNode& node) override { record(node); }

private:
    void record(const SyntaxNode& node) {
        kinds.push_back(node.kind);
        names.push_back(node.name);
    }
};

static const SyntaxNode* findFirst(const SyntaxNode& node, NodeKind kind) {
    if (node.kind == kind) return &node;
    for (const auto& child : node.children) {
        const SyntaxNode* found = findFirst(child, kind);
        if (found) return found;
    }
    return nullptr;
}

}

static void testImportLowering() {
    auto tree = parseSyntaxTree("import os.path, json\nfrom collections import deque as dq\n");
    assert(tree.ok());
    assert(tree.value().kind == NodeKind::MODULE);
    assert(tree.value().children.size() == 2);

    const SyntaxNode& imp = tree.value().children[0];
    assert(imp.kind == NodeKind::IMPORT);
    assert(imp.line == 1);
    assert(imp.modules.size() == 2);
    assert(imp.modules[0] == "os.path");
    assert(imp.modules[1] == "json");

    const SyntaxNode& from = tree.value().children[1];
    assert(from.kind == NodeKind::IMPORT_FROM);
    assert(from.line == 2);
    assert(from.name == "collections");
    assert(from.level == 0);
    assert(from.modules.size() == 1);
    assert(from.modules[0] == "deque");
}

static void testRelativeImport() {
    auto tree = parseSyntaxTree("from . import sibling\n");
    assert(tree.ok());
    const SyntaxNode* from = findFirst(tree.value(), NodeKind::IMPORT_FROM);
    assert(from);
    assert(from->name.empty());
    assert(from->level == 1);
}

static void testCallAndAttribute() {
    auto tree = parseSyntaxTree("x = eval('1')\nf.write(x)\n");
    assert(tree.ok());

    const SyntaxNode* call = findFirst(tree.value(), NodeKind::CALL);
    assert(call);
    assert(call->name == "eval");
    assert(call->line == 1);

    const SyntaxNode* attr = findFirst(tree.value(), NodeKind::ATTRIBUTE);
    assert(attr);
    assert(attr->name == "write");
    assert(attr->line == 2);
}

static void testCalleeThatIsNotAName() {
    auto tree = parseSyntaxTree("obj.method()\n");
    assert(tree.ok());
    const SyntaxNode* call = findFirst(tree.value(), NodeKind::CALL);
    assert(call);
    assert(call->name.empty());
}

static void testVisitorOrder() {
    auto tree = parseSyntaxTree("import math\nprint(math.pi)\n");
    assert(tree.ok());

    KindRecorder recorder;
    recorder.walk(tree.value());

    std::vector<NodeKind> expected = {
        NodeKind::MODULE, NodeKind::IMPORT, NodeKind::CALL, NodeKind::NAME,
        NodeKind::ATTRIBUTE, NodeKind::NAME
    };
    assert(recorder.kinds == expected);
    assert(recorder.names[3] == "print");
    assert(recorder.names[4] == "pi");
    assert(recorder.names[5] == "math");
}

static void testParseErrors() {
    auto bad = parseSyntaxTree("def broken(:\n    pass\n");
    assert(!bad.ok());
    assert(bad.error().code == ErrorCode::PARSE_ERROR);
    assert(!bad.error().message.empty());

    auto outside = parseSyntaxTree("return 5\n");
    assert(!outside.ok());
    assert(outside.error().message.find("outside function") != std::string::npos);

    auto nul = parseSyntaxTree(std::string("x = 1\0", 6));
    assert(!nul.ok());
    assert(nul.error().code == ErrorCode::PARSE_ERROR);
}

static void testDeepNesting() {
    std::string source = "x = " + std::string(1200, '[') + std::string(1200, ']') + "\n";
    auto tree = parseSyntaxTree(source);
    assert(!tree.ok());
    assert(tree.error().code == ErrorCode::PARSE_ERROR);
}

static void testKindNames() {
    assert(std::string(nodeKindName(NodeKind::IMPORT_FROM)) == "import_from");
    assert(std::string(nodeKindName(NodeKind::OTHER)) == "other");
}

int main() {
    auto init = python::PythonRuntime::init();
    assert(init.ok());

    testImportLowering();
    testRelativeImport();
    testCallAndAttribute();
    testCalleeThatIsNotAName();
    testVisitorOrder();
    testParseErrors();
    testDeepNesting();
    testKindNames();
    return 0;
}

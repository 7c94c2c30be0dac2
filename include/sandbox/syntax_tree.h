#pragma once

#include <string>
#include <vector>
#include "infrastructure/error_handling.h"

namespace snipbox {
namespace sandbox {

enum class NodeKind {
    MODULE,
    IMPORT,
    IMPORT_FROM,
    CALL,
    ATTRIBUTE,
    NAME,
    OTHER
};

// One node of a parsed snippet, reduced to what the safety checks need.
//   IMPORT       modules = imported dotted names
//   IMPORT_FROM  name = source module ("" for "from . import x"), level = dots,
//                modules = imported symbols
//   CALL         name = callee when it is a bare name, "" otherwise
//   ATTRIBUTE    name = attribute
//   NAME         name = identifier
struct SyntaxNode {
    NodeKind kind = NodeKind::OTHER;
    std::string typeName;
    std::string name;
    std::vector<std::string> modules;
    int level = 0;
    int line = 0;
    std::vector<SyntaxNode> children;
};

constexpr int MAX_SYNTAX_DEPTH = 1000;

class SyntaxVisitor {
public:
    virtual ~SyntaxVisitor() = default;

    // Pre-order, source order. Iterative, so tree depth never costs native stack.
    void walk(const SyntaxNode& root);

protected:
    virtual void visitModule(const SyntaxNode& node) { (void)node; }
    virtual void visitImport(const SyntaxNode& node) { (void)node; }
    virtual void visitImportFrom(const SyntaxNode& node) { (void)node; }
    virtual void visitCall(const SyntaxNode& node) { (void)node; }
    virtual void visitAttribute(const SyntaxNode& node) { (void)node; }
    virtual void visitName(const SyntaxNode& node) { (void)node; }
    virtual void visitOther(const SyntaxNode& node) { (void)node; }

private:
    void dispatch(const SyntaxNode& node);
};

const char* nodeKindName(NodeKind kind);

// Parses with the embedded interpreter's own parser and lowers the result.
// Syntax errors, compile-time errors and over-deep trees come back as
// ErrorCode::PARSE_ERROR carrying the interpreter's message. Needs an
// initialized PythonRuntime; takes the GIL itself.
Result<SyntaxNode> parseSyntaxTree(const std::string& source, const std::string& filename = "<sandbox>");

}
}

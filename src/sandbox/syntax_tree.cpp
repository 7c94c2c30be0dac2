#include "sandbox/syntax_tree.h"
#include "python/runtime.h"
#include <unordered_map>
#include <utility>

namespace snipbox {
namespace sandbox {

namespace py = pybind11;

void SyntaxVisitor::walk(const SyntaxNode& root) {
    std::vector<const SyntaxNode*> stack;
    stack.push_back(&root);
    while (!stack.empty()) {
        const SyntaxNode* node = stack.back();
        stack.pop_back();
        dispatch(*node);
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            stack.push_back(&*it);
        }
    }
}

void SyntaxVisitor::dispatch(const SyntaxNode& node) {
    switch (node.kind) {
        case NodeKind::MODULE: visitModule(node); break;
        case NodeKind::IMPORT: visitImport(node); break;
        case NodeKind::IMPORT_FROM: visitImportFrom(node); break;
        case NodeKind::CALL: visitCall(node); break;
        case NodeKind::ATTRIBUTE: visitAttribute(node); break;
        case NodeKind::NAME: visitName(node); break;
        case NodeKind::OTHER: visitOther(node); break;
    }
}

const char* nodeKindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::MODULE: return "module";
        case NodeKind::IMPORT: return "import";
        case NodeKind::IMPORT_FROM: return "import_from";
        case NodeKind::CALL: return "call";
        case NodeKind::ATTRIBUTE: return "attribute";
        case NodeKind::NAME: return "name";
        case NodeKind::OTHER: return "other";
    }
    return "other";
}

namespace {

static NodeKind classify(const std::string& typeName) {
    static const std::unordered_map<std::string, NodeKind> kinds = {
        {"Module", NodeKind::MODULE},
        {"Import", NodeKind::IMPORT},
        {"ImportFrom", NodeKind::IMPORT_FROM},
        {"Call", NodeKind::CALL},
        {"Attribute", NodeKind::ATTRIBUTE},
        {"Name", NodeKind::NAME}
    };
    auto it = kinds.find(typeName);
    return it == kinds.end() ? NodeKind::OTHER : it->second;
}

static Error parseError(const std::string& message) {
    return makeError(ErrorCode::PARSE_ERROR, message);
}

static Error parseError(const py::error_already_set& e) {
    python::PythonError err = python::describeError(e, false);
    return parseError(err.message.empty() ? err.typeName : err.message);
}

// Attribute of an AST node as text; "" when absent or None.
static std::string textAttr(py::handle node, const char* attr) {
    py::object value = py::getattr(node, attr, py::none());
    return py::isinstance<py::str>(value) ? python::toUtf8(value) : "";
}

static int intAttr(py::handle node, const char* attr) {
    py::object value = py::getattr(node, attr, py::none());
    if (!py::isinstance<py::int_>(value) || py::isinstance<py::bool_>(value)) return 0;
    return value.cast<int>();
}

static std::vector<std::string> aliasNames(py::handle node) {
    std::vector<std::string> names;
    py::object aliases = py::getattr(node, "names", py::none());
    if (!py::isinstance<py::list>(aliases)) return names;
    for (py::handle alias : aliases) {
        names.push_back(textAttr(alias, "name"));
    }
    return names;
}

// Interpreter failures while walking the tree surface as py::error_already_set.
class Lowering {
public:
    Lowering(py::object astBase, py::object astName)
        : astBase_(std::move(astBase)), astName_(std::move(astName)) {}

    Result<SyntaxNode> lower(py::handle obj, int depth) {
        if (depth > MAX_SYNTAX_DEPTH) {
            return Result<SyntaxNode>(parseError("code is nested too deeply"));
        }

        SyntaxNode node;
        node.typeName = python::toUtf8(py::type::handle_of(obj).attr("__name__"));
        node.kind = classify(node.typeName);
        node.line = intAttr(obj, "lineno");

        switch (node.kind) {
            case NodeKind::IMPORT:
                node.modules = aliasNames(obj);
                break;
            case NodeKind::IMPORT_FROM:
                node.name = textAttr(obj, "module");
                node.level = intAttr(obj, "level");
                node.modules = aliasNames(obj);
                break;
            case NodeKind::CALL: {
                py::object func = obj.attr("func");
                if (py::isinstance(func, astName_)) {
                    node.name = textAttr(func, "id");
                }
                break;
            }
            case NodeKind::ATTRIBUTE:
                node.name = textAttr(obj, "attr");
                break;
            case NodeKind::NAME:
                node.name = textAttr(obj, "id");
                break;
            default:
                break;
        }

        auto children = lowerChildren(obj, depth);
        if (!children.ok()) return Result<SyntaxNode>(children.error());
        node.children = std::move(children.value());
        return Result<SyntaxNode>(std::move(node));
    }

private:
    Result<std::vector<SyntaxNode>> lowerChildren(py::handle obj, int depth) {
        std::vector<SyntaxNode> children;
        py::object fields = py::getattr(obj, "_fields", py::none());
        if (!py::isinstance<py::tuple>(fields)) return children;

        for (py::handle fieldName : fields) {
            // Optional fields may be missing on hand-built nodes.
            py::object value = py::getattr(obj, fieldName, py::none());

            if (py::isinstance<py::list>(value)) {
                for (py::handle item : value) {
                    if (!py::isinstance(item, astBase_)) continue;
                    auto child = lower(item, depth + 1);
                    if (!child.ok()) return Result<std::vector<SyntaxNode>>(child.error());
                    children.push_back(std::move(child.value()));
                }
            } else if (py::isinstance(value, astBase_)) {
                auto child = lower(value, depth + 1);
                if (!child.ok()) return Result<std::vector<SyntaxNode>>(child.error());
                children.push_back(std::move(child.value()));
            }
        }
        return Result<std::vector<SyntaxNode>>(std::move(children));
    }

    py::object astBase_;
    py::object astName_;
};

}

Result<SyntaxNode> parseSyntaxTree(const std::string& source, const std::string& filename) {
    if (source.find('\0') != std::string::npos) {
        return Result<SyntaxNode>(parseError("source code string cannot contain null bytes"));
    }

    py::gil_scoped_acquire gil;
    try {
        py::module_ ast = py::module_::import("ast");
        py::object compile = py::module_::import("builtins").attr("compile");

        py::object tree = compile(py::bytes(source), filename, "exec", ast.attr("PyCF_ONLY_AST"), true);
        // Symbol-table errors ("'return' outside function") only surface in a full compile.
        compile(py::bytes(source), filename, "exec", 0, true);

        Lowering lowering(ast.attr("AST"), ast.attr("Name"));
        return lowering.lower(tree, 0);
    } catch (const py::error_already_set& e) {
        return Result<SyntaxNode>(parseError(e));
    }
}

}
}

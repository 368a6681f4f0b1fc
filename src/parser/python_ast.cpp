#include "parser/python_ast.hpp"

namespace execbox::python {

const char* node_kind_to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::Module:           return "Module";
        case NodeKind::FunctionDef:      return "FunctionDef";
        case NodeKind::AsyncFunctionDef: return "AsyncFunctionDef";
        case NodeKind::ClassDef:         return "ClassDef";
        case NodeKind::Return:           return "Return";
        case NodeKind::Delete:           return "Delete";
        case NodeKind::Assign:           return "Assign";
        case NodeKind::AugAssign:        return "AugAssign";
        case NodeKind::AnnAssign:        return "AnnAssign";
        case NodeKind::For:              return "For";
        case NodeKind::AsyncFor:         return "AsyncFor";
        case NodeKind::While:            return "While";
        case NodeKind::If:               return "If";
        case NodeKind::With:             return "With";
        case NodeKind::AsyncWith:        return "AsyncWith";
        case NodeKind::Match:            return "Match";
        case NodeKind::Raise:            return "Raise";
        case NodeKind::Try:              return "Try";
        case NodeKind::TryStar:          return "TryStar";
        case NodeKind::Assert:           return "Assert";
        case NodeKind::Import:           return "Import";
        case NodeKind::ImportFrom:       return "ImportFrom";
        case NodeKind::Global:           return "Global";
        case NodeKind::Nonlocal:         return "Nonlocal";
        case NodeKind::Expr:             return "Expr";
        case NodeKind::Pass:             return "Pass";
        case NodeKind::Break:            return "Break";
        case NodeKind::Continue:         return "Continue";
        case NodeKind::BoolOp:           return "BoolOp";
        case NodeKind::NamedExpr:        return "NamedExpr";
        case NodeKind::BinOp:            return "BinOp";
        case NodeKind::UnaryOp:          return "UnaryOp";
        case NodeKind::Lambda:           return "Lambda";
        case NodeKind::IfExp:            return "IfExp";
        case NodeKind::Dict:             return "Dict";
        case NodeKind::Set:              return "Set";
        case NodeKind::ListComp:         return "ListComp";
        case NodeKind::SetComp:          return "SetComp";
        case NodeKind::DictComp:         return "DictComp";
        case NodeKind::GeneratorExp:     return "GeneratorExp";
        case NodeKind::Await:            return "Await";
        case NodeKind::Yield:            return "Yield";
        case NodeKind::YieldFrom:        return "YieldFrom";
        case NodeKind::Compare:          return "Compare";
        case NodeKind::Call:             return "Call";
        case NodeKind::FormattedValue:   return "FormattedValue";
        case NodeKind::JoinedStr:        return "JoinedStr";
        case NodeKind::Constant:         return "Constant";
        case NodeKind::Attribute:        return "Attribute";
        case NodeKind::Subscript:        return "Subscript";
        case NodeKind::Starred:          return "Starred";
        case NodeKind::Name:             return "Name";
        case NodeKind::List:             return "List";
        case NodeKind::Tuple:            return "Tuple";
        case NodeKind::Slice:            return "Slice";
        case NodeKind::Comprehension:    return "comprehension";
        case NodeKind::ExceptHandler:    return "ExceptHandler";
        case NodeKind::Arguments:        return "arguments";
        case NodeKind::Arg:              return "arg";
        case NodeKind::Keyword:          return "keyword";
        case NodeKind::Alias:            return "alias";
        case NodeKind::WithItem:         return "withitem";
        case NodeKind::MatchCase:        return "match_case";
    }
    return "Unknown";
}

void walk(const Node& root, const std::function<void(const Node&)>& visitor) {
    // Explicit stack: deeply nested sources must not exhaust the call stack
    std::vector<const Node*> stack{&root};
    std::vector<const Node*> pending;

    while (!stack.empty()) {
        const Node* node = stack.back();
        stack.pop_back();
        visitor(*node);

        pending.clear();
        for (const auto* group : {&node->decorators, &node->children, &node->body,
                                  &node->handlers, &node->orelse, &node->finalbody}) {
            for (const auto& child : *group) {
                if (child) pending.push_back(child.get());
            }
        }
        // Reverse so the first child is visited first
        stack.insert(stack.end(), pending.rbegin(), pending.rend());
    }
}

std::string dotted_name(const Node& node) {
    if (node.kind == NodeKind::Name) return node.name;
    if (node.kind != NodeKind::Attribute || node.children.empty() || !node.children[0]) {
        return {};
    }
    std::string base = dotted_name(*node.children[0]);
    if (base.empty()) return {};
    base += '.';
    base += node.name;
    return base;
}

} // namespace execbox::python

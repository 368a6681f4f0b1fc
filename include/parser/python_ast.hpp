#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace execbox::python {

enum class NodeKind : uint8_t {
    // Module and statements
    Module,
    FunctionDef,
    AsyncFunctionDef,
    ClassDef,
    Return,
    Delete,
    Assign,
    AugAssign,
    AnnAssign,
    For,
    AsyncFor,
    While,
    If,
    With,
    AsyncWith,
    Match,
    Raise,
    Try,
    TryStar,
    Assert,
    Import,
    ImportFrom,
    Global,
    Nonlocal,
    Expr,
    Pass,
    Break,
    Continue,

    // Expressions
    BoolOp,
    NamedExpr,
    BinOp,
    UnaryOp,
    Lambda,
    IfExp,
    Dict,
    Set,
    ListComp,
    SetComp,
    DictComp,
    GeneratorExp,
    Await,
    Yield,
    YieldFrom,
    Compare,
    Call,
    FormattedValue,
    JoinedStr,
    Constant,
    Attribute,
    Subscript,
    Starred,
    Name,
    List,
    Tuple,
    Slice,

    // Auxiliary nodes
    Comprehension,
    ExceptHandler,
    Arguments,
    Arg,
    Keyword,
    Alias,
    WithItem,
    MatchCase
};

[[nodiscard]] const char* node_kind_to_string(NodeKind kind);

enum class ConstantKind : uint8_t {
    NONE,
    TRUE,
    FALSE,
    ELLIPSIS,
    INT,
    FLOAT,
    COMPLEX,
    STR,
    BYTES
};

/**
 * @brief One AST node.
 *
 * Field layout per kind (null entries in @c children mark absent optionals):
 *   Name            name = identifier
 *   Attribute       name = attribute, children = [value]
 *   Constant        constant, value = decoded text or literal spelling
 *   Call            children = [func, positional args..., Keyword...]
 *   Keyword         name = arg ("" for **kwargs), children = [value]
 *   Import          children = [Alias...]
 *   ImportFrom      name = module ("" for pure relative), level, children = [Alias...]
 *   Alias           name, asname
 *   If / While      children = [test], body, orelse
 *   For             children = [target, iter], body, orelse
 *   Try             body, handlers = [ExceptHandler...], orelse, finalbody
 *   ExceptHandler   name = bound name, children = [type | null], body
 *   With            children = [WithItem...], body
 *   WithItem        children = [context_expr, optional_vars | null]
 *   FunctionDef     name, decorators, children = [Arguments, returns | null], body
 *   ClassDef        name, decorators, children = [bases and Keyword...], body
 *   Arguments       children = [Arg...]
 *   Arg             name, value = "" | "*" | "**" | "/" marker, children = [annotation | null, default | null]
 *   Assign          children = [targets..., value]
 *   AugAssign       name = operator, children = [target, value]
 *   AnnAssign       children = [target, annotation, value | null]
 *   BinOp / BoolOp  name = operator, children = operands
 *   UnaryOp         name = operator, children = [operand]
 *   Compare         ops, children = [left, comparators...]
 *   Subscript       children = [value, slice]
 *   Slice           children = [lower | null, upper | null, step | null]
 *   Dict            children = key/value pairs, key null for ** unpacking
 *   Comprehension   is_async, children = [target, iter, ifs...]
 *   *Comp / GenExp  children = [elt (key, value for DictComp), Comprehension...]
 *   JoinedStr       children = [Constant | FormattedValue...]
 *   FormattedValue  value = conversion ("", "r", "s", "a"), children = [expr, format_spec | null]
 *   Match           children = [subject, MatchCase...]
 *   MatchCase       children = [pattern, guard | null], body
 */
struct Node {
    NodeKind kind = NodeKind::Module;
    uint32_t line = 0;
    uint32_t col = 0;

    std::string name;
    std::string asname;
    std::string value;
    ConstantKind constant = ConstantKind::NONE;
    uint32_t level = 0;
    bool is_async = false;
    std::vector<std::string> ops;

    std::vector<std::unique_ptr<Node>> children;
    std::vector<std::unique_ptr<Node>> decorators;
    std::vector<std::unique_ptr<Node>> body;
    std::vector<std::unique_ptr<Node>> orelse;
    std::vector<std::unique_ptr<Node>> finalbody;
    std::vector<std::unique_ptr<Node>> handlers;

    Node() = default;
    Node(NodeKind k, uint32_t ln, uint32_t c) : kind(k), line(ln), col(c) {}

    [[nodiscard]] const Node* child(size_t i) const {
        return i < children.size() ? children[i].get() : nullptr;
    }

    [[nodiscard]] bool is_constant(ConstantKind k) const {
        return kind == NodeKind::Constant && constant == k;
    }
};

using NodePtr = std::unique_ptr<Node>;

/**
 * @brief Visit @p root and every descendant depth-first, parents before children.
 */
void walk(const Node& root, const std::function<void(const Node&)>& visitor);

/**
 * @brief Dotted path of a Name/Attribute chain ("os.path.join"), empty if the
 * chain does not end in a Name.
 */
[[nodiscard]] std::string dotted_name(const Node& node);

/**
 * @brief Parsed module plus the per-line view of the source it came from.
 */
struct Module {
    NodePtr root;
    std::vector<std::string> lines;

    [[nodiscard]] std::string_view line_text(uint32_t line) const {
        if (line == 0 || line > lines.size()) return {};
        return lines[line - 1];
    }
};

} // namespace execbox::python

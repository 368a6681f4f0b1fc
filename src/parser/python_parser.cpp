#include "parser/python_parser.hpp"

#include <format>
#include <unordered_set>

namespace execbox::python {

namespace {

constexpr int kMaxNestingDepth = 200;

class DepthGuard {
public:
    DepthGuard(int& depth, const Token& at) : depth_(depth) {
        if (++depth_ > kMaxNestingDepth) {
            --depth_;
            throw SyntaxError("too many nested expressions", at.line, at.col);
        }
    }
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    int& depth_;
};

NodePtr make(NodeKind kind, const Token& at) {
    return std::make_unique<Node>(kind, at.line, at.col);
}

NodePtr make_at(NodeKind kind, const Node& at) {
    return std::make_unique<Node>(kind, at.line, at.col);
}

NodePtr make_constant(ConstantKind ck, std::string value, uint32_t line, uint32_t col) {
    auto node = std::make_unique<Node>(NodeKind::Constant, line, col);
    node->constant = ck;
    node->value = std::move(value);
    return node;
}

bool is_augassign(const Token& tok) {
    static const std::unordered_set<std::string_view> ops = {
        "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**=",
    };
    return tok.type == TokenType::OP && ops.contains(tok.text);
}

// Tokens that may begin an expression (used to tell trailing commas apart)
bool starts_expression(const Token& tok) {
    switch (tok.type) {
        case TokenType::NUMBER:
        case TokenType::STRING:
            return true;
        case TokenType::NAME:
            if (!Lexer::is_keyword(tok.text)) return true;
            return tok.text == "True" || tok.text == "False" || tok.text == "None" ||
                   tok.text == "not" || tok.text == "lambda" || tok.text == "await" ||
                   tok.text == "yield";
        case TokenType::OP:
            return tok.text == "(" || tok.text == "[" || tok.text == "{" || tok.text == "-" ||
                   tok.text == "+" || tok.text == "~" || tok.text == "*" || tok.text == "...";
        default:
            return false;
    }
}

const char* target_description(const Node& node) {
    switch (node.kind) {
        case NodeKind::Constant:
            switch (node.constant) {
                case ConstantKind::TRUE:     return "True";
                case ConstantKind::FALSE:    return "False";
                case ConstantKind::NONE:     return "None";
                case ConstantKind::ELLIPSIS: return "ellipsis";
                default:                     return "literal";
            }
        case NodeKind::Call:         return "function call";
        case NodeKind::Compare:      return "comparison";
        case NodeKind::Lambda:       return "lambda";
        case NodeKind::IfExp:        return "conditional expression";
        case NodeKind::NamedExpr:    return "named expression";
        case NodeKind::Await:        return "await expression";
        case NodeKind::Yield:
        case NodeKind::YieldFrom:    return "yield expression";
        case NodeKind::JoinedStr:    return "f-string expression";
        case NodeKind::Dict:         return "dict literal";
        case NodeKind::Set:          return "set display";
        case NodeKind::ListComp:     return "list comprehension";
        case NodeKind::SetComp:      return "set comprehension";
        case NodeKind::DictComp:     return "dict comprehension";
        case NodeKind::GeneratorExp: return "generator expression";
        case NodeKind::Tuple:        return "tuple";
        case NodeKind::List:         return "list";
        default:                     return "expression";
    }
}

void relocate(Node& node, uint32_t line) {
    node.line = line;
    for (auto* group : {&node.children, &node.decorators, &node.body,
                        &node.orelse, &node.finalbody, &node.handlers}) {
        for (auto& child : *group) {
            if (child) relocate(*child, line);
        }
    }
}

std::vector<std::string> split_lines(std::string_view source) {
    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < source.size(); ++i) {
        const char c = source[i];
        if (c == '\r' || c == '\n') {
            lines.emplace_back(std::move(current));
            current.clear();
            if (c == '\r' && i + 1 < source.size() && source[i + 1] == '\n') ++i;
        } else {
            current += c;
        }
    }
    if (!current.empty()) lines.emplace_back(std::move(current));
    return lines;
}

} // anonymous namespace

void validate_assign_target(const Node& target, bool augmented) {
    switch (target.kind) {
        case NodeKind::Name:
        case NodeKind::Attribute:
        case NodeKind::Subscript:
            return;
        case NodeKind::Starred:
        case NodeKind::Tuple:
        case NodeKind::List:
            if (augmented) {
                throw SyntaxError(std::format(
                    "'{}' is an illegal expression for augmented assignment",
                    target_description(target)), target.line, target.col);
            }
            for (const auto& child : target.children) {
                if (child) validate_assign_target(*child, false);
            }
            return;
        default:
            if (augmented) {
                throw SyntaxError(std::format(
                    "'{}' is an illegal expression for augmented assignment",
                    target_description(target)), target.line, target.col);
            }
            throw SyntaxError(std::format("cannot assign to {}", target_description(target)),
                              target.line, target.col);
    }
}

// ============================================================================
// Entry points
// ============================================================================

Result<Module> Parser::parse(std::string_view source) {
    Module module;
    module.lines = split_lines(source);
    try {
        Lexer lexer(source);
        Parser parser(lexer.tokenize());
        module.root = parser.parse_module();
    } catch (const SyntaxError& e) {
        return Result<Module>::error(ErrorCategory::SYNTAX_ERROR,
            std::format("Syntax error: {} at line {}", e.what(), e.line));
    }
    return Result<Module>::ok(std::move(module));
}

NodePtr Parser::parse_expression_text(std::string_view text, uint32_t line) {
    std::string wrapped;
    wrapped.reserve(text.size() + 2);
    wrapped += '(';
    wrapped += text;
    wrapped += ')';

    NodePtr expr;
    try {
        Lexer lexer(wrapped);
        Parser parser(lexer.tokenize());
        parser.expect_op("(");
        expr = parser.check_kw("yield") ? parser.parse_yield() : parser.parse_star_expressions();
        parser.expect_op(")");
        if (parser.peek().type != TokenType::NEWLINE) {
            throw SyntaxError("invalid syntax", 1, 0);
        }
    } catch (const SyntaxError& e) {
        throw SyntaxError(std::format("f-string: {}", e.what()), line, 0);
    }
    relocate(*expr, line);
    return expr;
}

// ============================================================================
// Token stream
// ============================================================================

const Token& Parser::peek(size_t ahead) const {
    const size_t idx = pos_ + ahead;
    return idx < tokens_.size() ? tokens_[idx] : tokens_.back();
}

const Token& Parser::advance() {
    const Token& tok = peek();
    if (pos_ < tokens_.size() - 1) ++pos_;
    return tok;
}

bool Parser::accept_op(std::string_view op) {
    if (!check_op(op)) return false;
    advance();
    return true;
}

bool Parser::accept_kw(std::string_view kw) {
    if (!check_kw(kw)) return false;
    advance();
    return true;
}

const Token& Parser::expect_op(std::string_view op) {
    if (!check_op(op)) {
        if (op == ":") fail("expected ':'");
        if (op == ")" || op == "]" || op == "}") {
            fail("invalid syntax. Perhaps you forgot a comma?");
        }
        fail(std::format("expected '{}'", op));
    }
    return advance();
}

const Token& Parser::expect_kw(std::string_view kw) {
    if (!check_kw(kw)) fail(std::format("expected '{}'", kw));
    return advance();
}

std::string Parser::expect_identifier() {
    const Token& tok = peek();
    if (tok.type != TokenType::NAME || Lexer::is_keyword(tok.text)) {
        fail("invalid syntax");
    }
    advance();
    return tok.text;
}

void Parser::fail(const std::string& message) const {
    fail_at(message, peek());
}

void Parser::fail_at(const std::string& message, const Token& tok) const {
    throw SyntaxError(message, tok.line, tok.col);
}

// ============================================================================
// Statements
// ============================================================================

NodePtr Parser::parse_module() {
    auto module = std::make_unique<Node>(NodeKind::Module, 1, 0);
    while (peek().type != TokenType::END) {
        if (peek().type == TokenType::NEWLINE) {
            advance();
            continue;
        }
        parse_statement(module->body);
    }
    return module;
}

void Parser::parse_statement(std::vector<NodePtr>& out) {
    const Token tok = peek();
    const DepthGuard guard(depth_, tok);

    if (tok.type == TokenType::INDENT) fail("unexpected indent");
    if (tok.type == TokenType::DEDENT) fail("unindent does not match any outer indentation level");

    if (tok.is_op("@")) {
        out.push_back(parse_decorated());
        return;
    }

    if (tok.type == TokenType::NAME) {
        if (tok.text == "def") {
            advance();
            out.push_back(parse_function(false, tok, {}));
            return;
        }
        if (tok.text == "class") {
            advance();
            out.push_back(parse_class({}));
            return;
        }
        if (tok.text == "if") {
            advance();
            out.push_back(parse_if(tok));
            return;
        }
        if (tok.text == "while") {
            out.push_back(parse_while());
            return;
        }
        if (tok.text == "for") {
            advance();
            out.push_back(parse_for(false, tok));
            return;
        }
        if (tok.text == "try") {
            out.push_back(parse_try());
            return;
        }
        if (tok.text == "with") {
            advance();
            out.push_back(parse_with(false, tok));
            return;
        }
        if (tok.text == "async") {
            const Token& next = peek(1);
            if (next.is_name("def")) {
                advance();
                advance();
                out.push_back(parse_function(true, tok, {}));
                return;
            }
            if (next.is_name("for")) {
                advance();
                advance();
                out.push_back(parse_for(true, tok));
                return;
            }
            if (next.is_name("with")) {
                advance();
                advance();
                out.push_back(parse_with(true, tok));
                return;
            }
            fail("invalid syntax");
        }
        if (tok.text == "match") {
            if (auto match = try_parse_match()) {
                out.push_back(std::move(match));
                return;
            }
        }
        if (tok.text == "elif" || tok.text == "else" || tok.text == "except" ||
            tok.text == "finally") {
            fail("invalid syntax");
        }
    }

    parse_simple_statements(out);
}

void Parser::parse_simple_statements(std::vector<NodePtr>& out) {
    for (;;) {
        out.push_back(parse_simple_statement());
        if (!accept_op(";")) break;
        if (peek().type == TokenType::NEWLINE) break;
    }
    if (peek().type != TokenType::NEWLINE) {
        fail("invalid syntax");
    }
    advance();
}

NodePtr Parser::parse_simple_statement() {
    const Token tok = peek();
    auto at_end = [this]() {
        return peek().type == TokenType::NEWLINE || check_op(";");
    };

    if (tok.type == TokenType::NAME) {
        if (tok.text == "pass") { advance(); return make(NodeKind::Pass, tok); }
        if (tok.text == "break") { advance(); return make(NodeKind::Break, tok); }
        if (tok.text == "continue") { advance(); return make(NodeKind::Continue, tok); }

        if (tok.text == "return") {
            advance();
            auto node = make(NodeKind::Return, tok);
            if (!at_end()) node->children.push_back(parse_star_expressions());
            return node;
        }
        if (tok.text == "raise") {
            advance();
            auto node = make(NodeKind::Raise, tok);
            if (!at_end()) {
                node->children.push_back(parse_expression());
                if (accept_kw("from")) node->children.push_back(parse_expression());
            }
            return node;
        }
        if (tok.text == "global" || tok.text == "nonlocal") {
            advance();
            auto node = make(tok.text == "global" ? NodeKind::Global : NodeKind::Nonlocal, tok);
            do {
                const Token& name_tok = peek();
                auto name = make(NodeKind::Name, name_tok);
                name->name = expect_identifier();
                node->children.push_back(std::move(name));
            } while (accept_op(","));
            return node;
        }
        if (tok.text == "del") {
            advance();
            auto node = make(NodeKind::Delete, tok);
            auto targets = parse_target_list();
            if (targets->kind == NodeKind::Tuple) {
                for (auto& t : targets->children) {
                    validate_assign_target(*t, false);
                    node->children.push_back(std::move(t));
                }
            } else {
                validate_assign_target(*targets, false);
                node->children.push_back(std::move(targets));
            }
            return node;
        }
        if (tok.text == "assert") {
            advance();
            auto node = make(NodeKind::Assert, tok);
            node->children.push_back(parse_expression());
            if (accept_op(",")) node->children.push_back(parse_expression());
            return node;
        }
        if (tok.text == "import") return parse_import();
        if (tok.text == "from") return parse_from_import();
    }

    return parse_expression_statement();
}

NodePtr Parser::parse_expression_statement() {
    auto value_expr = [this]() {
        return check_kw("yield") ? parse_yield() : parse_star_expressions();
    };

    NodePtr expr = value_expr();

    if (check_op("=")) {
        auto node = make_at(NodeKind::Assign, *expr);
        while (accept_op("=")) {
            validate_assign_target(*expr, false);
            node->children.push_back(std::move(expr));
            expr = value_expr();
        }
        node->children.push_back(std::move(expr));
        return node;
    }

    if (is_augassign(peek())) {
        validate_assign_target(*expr, true);
        std::string op = advance().text;
        op.pop_back();
        auto node = make_at(NodeKind::AugAssign, *expr);
        node->name = std::move(op);
        node->children.push_back(std::move(expr));
        node->children.push_back(value_expr());
        return node;
    }

    if (check_op(":")) {
        if (expr->kind != NodeKind::Name && expr->kind != NodeKind::Attribute &&
            expr->kind != NodeKind::Subscript) {
            fail(std::format("only single target (not {}) can be annotated",
                             target_description(*expr)));
        }
        advance();
        auto node = make_at(NodeKind::AnnAssign, *expr);
        node->children.push_back(std::move(expr));
        node->children.push_back(parse_expression());
        node->children.push_back(accept_op("=") ? value_expr() : nullptr);
        return node;
    }

    auto node = make_at(NodeKind::Expr, *expr);
    node->children.push_back(std::move(expr));
    return node;
}

NodePtr Parser::parse_import() {
    const Token& kw = advance();
    auto node = make(NodeKind::Import, kw);
    do {
        auto alias = make(NodeKind::Alias, peek());
        alias->name = expect_identifier();
        while (accept_op(".")) {
            alias->name += '.';
            alias->name += expect_identifier();
        }
        if (accept_kw("as")) alias->asname = expect_identifier();
        node->children.push_back(std::move(alias));
    } while (accept_op(","));
    return node;
}

NodePtr Parser::parse_from_import() {
    const Token& kw = advance();
    auto node = make(NodeKind::ImportFrom, kw);

    for (;;) {
        if (accept_op(".")) {
            node->level += 1;
        } else if (accept_op("...")) {
            node->level += 3;
        } else {
            break;
        }
    }

    if (!check_kw("import")) {
        node->name = expect_identifier();
        while (accept_op(".")) {
            node->name += '.';
            node->name += expect_identifier();
        }
    } else if (node->level == 0) {
        fail("invalid syntax");
    }
    expect_kw("import");

    if (check_op("*")) {
        auto alias = make(NodeKind::Alias, advance());
        alias->name = "*";
        node->children.push_back(std::move(alias));
        return node;
    }

    const bool parenthesized = accept_op("(");
    do {
        if (parenthesized && check_op(")")) break;
        auto alias = make(NodeKind::Alias, peek());
        alias->name = expect_identifier();
        if (accept_kw("as")) alias->asname = expect_identifier();
        node->children.push_back(std::move(alias));
    } while (accept_op(","));
    if (parenthesized) expect_op(")");
    if (node->children.empty()) fail("invalid syntax");
    return node;
}

std::vector<NodePtr> Parser::parse_block(std::string_view owner, uint32_t owner_line) {
    expect_op(":");
    std::vector<NodePtr> body;

    if (peek().type != TokenType::NEWLINE) {
        parse_simple_statements(body);
        return body;
    }
    advance();
    if (peek().type != TokenType::INDENT) {
        fail(std::format("expected an indented block after {} on line {}", owner, owner_line));
    }
    advance();
    while (peek().type != TokenType::DEDENT) {
        if (peek().type == TokenType::END) fail("unexpected end of input");
        parse_statement(body);
    }
    advance();
    return body;
}

NodePtr Parser::parse_if(const Token& kw) {
    auto node = make(NodeKind::If, kw);
    node->children.push_back(parse_named_expression());
    node->body = parse_block(std::format("'{}' statement", kw.text), kw.line);

    if (check_kw("elif")) {
        const Token elif = advance();
        node->orelse.push_back(parse_if(elif));
    } else if (check_kw("else")) {
        const Token& else_tok = advance();
        node->orelse = parse_block("'else' statement", else_tok.line);
    }
    return node;
}

NodePtr Parser::parse_while() {
    const Token& kw = advance();
    auto node = make(NodeKind::While, kw);
    node->children.push_back(parse_named_expression());
    node->body = parse_block("'while' statement", kw.line);
    if (check_kw("else")) {
        const Token& else_tok = advance();
        node->orelse = parse_block("'else' statement", else_tok.line);
    }
    return node;
}

NodePtr Parser::parse_for(bool is_async, const Token& start) {
    auto node = make(is_async ? NodeKind::AsyncFor : NodeKind::For, start);
    auto target = parse_target_list();
    validate_assign_target(*target, false);
    expect_kw("in");
    node->children.push_back(std::move(target));
    node->children.push_back(parse_star_expressions());
    node->body = parse_block("'for' statement", start.line);
    if (check_kw("else")) {
        const Token& else_tok = advance();
        node->orelse = parse_block("'else' statement", else_tok.line);
    }
    return node;
}

NodePtr Parser::parse_try() {
    const Token& kw = advance();
    auto node = make(NodeKind::Try, kw);
    node->body = parse_block("'try' statement", kw.line);

    bool star = false;
    while (check_kw("except")) {
        const Token& except_tok = advance();
        auto handler = make(NodeKind::ExceptHandler, except_tok);
        if (accept_op("*")) star = true;
        if (!check_op(":")) {
            handler->children.push_back(parse_expression());
            if (check_op(",")) fail("multiple exception types must be parenthesized");
            if (accept_kw("as")) handler->name = expect_identifier();
        } else {
            handler->children.push_back(nullptr);
        }
        handler->body = parse_block("'except' statement", except_tok.line);
        node->handlers.push_back(std::move(handler));
    }

    if (check_kw("else")) {
        if (node->handlers.empty()) fail("expected 'except' or 'finally' block");
        const Token& else_tok = advance();
        node->orelse = parse_block("'else' statement", else_tok.line);
    }
    if (check_kw("finally")) {
        const Token& fin = advance();
        node->finalbody = parse_block("'finally' statement", fin.line);
    }
    if (node->handlers.empty() && node->finalbody.empty()) {
        fail("expected 'except' or 'finally' block");
    }
    if (star) node->kind = NodeKind::TryStar;
    return node;
}

NodePtr Parser::parse_with(bool is_async, const Token& start) {
    auto node = make(is_async ? NodeKind::AsyncWith : NodeKind::With, start);

    auto parse_item = [this]() {
        auto item = make(NodeKind::WithItem, peek());
        item->children.push_back(parse_expression());
        if (accept_kw("as")) {
            // A single target; a comma here starts the next item
            auto target = parse_star_target();
            validate_assign_target(*target, false);
            item->children.push_back(std::move(target));
        } else {
            item->children.push_back(nullptr);
        }
        return item;
    };

    bool parsed = false;
    if (check_op("(")) {
        // Parenthesized item list; fall back to a plain expression item on mismatch
        const size_t save = pos_;
        try {
            advance();
            do {
                if (check_op(")")) break;
                node->children.push_back(parse_item());
            } while (accept_op(","));
            expect_op(")");
            if (!check_op(":")) throw SyntaxError("not a parenthesized with-item list", 0, 0);
            parsed = true;
        } catch (const SyntaxError&) {
            pos_ = save;
            node->children.clear();
        }
    }
    if (!parsed) {
        do {
            node->children.push_back(parse_item());
        } while (accept_op(","));
    }

    node->body = parse_block("'with' statement", start.line);
    return node;
}

NodePtr Parser::parse_parameters(std::string_view closer, bool allow_annotations) {
    auto args = make(NodeKind::Arguments, peek());
    bool seen_default = false;
    bool seen_star = false;
    bool seen_kwstar = false;
    bool seen_slash = false;

    auto annotation = [&]() -> NodePtr {
        if (allow_annotations && accept_op(":")) return parse_expression();
        return nullptr;
    };

    while (!check_op(closer)) {
        if (seen_kwstar) fail("arguments cannot follow var-keyword argument");

        const Token& tok = peek();
        auto arg = make(NodeKind::Arg, tok);

        if (accept_op("/")) {
            if (seen_slash || seen_star || args->children.empty()) {
                fail_at("/ must be ahead of *", tok);
            }
            seen_slash = true;
            arg->value = "/";
            arg->children.push_back(nullptr);
            arg->children.push_back(nullptr);
        } else if (accept_op("**")) {
            arg->value = "**";
            arg->name = expect_identifier();
            arg->children.push_back(annotation());
            arg->children.push_back(nullptr);
            seen_kwstar = true;
        } else if (accept_op("*")) {
            if (seen_star) fail_at("* argument may appear only once", tok);
            seen_star = true;
            arg->value = "*";
            if (!check_op(",") && !check_op(closer)) {
                arg->name = expect_identifier();
                arg->children.push_back(annotation());
            } else {
                arg->children.push_back(nullptr);
            }
            arg->children.push_back(nullptr);
        } else {
            arg->name = expect_identifier();
            arg->children.push_back(annotation());
            if (accept_op("=")) {
                arg->children.push_back(parse_expression());
                seen_default = true;
            } else {
                if (seen_default && !seen_star) {
                    fail_at("non-default argument follows default argument", tok);
                }
                arg->children.push_back(nullptr);
            }
        }
        args->children.push_back(std::move(arg));
        if (!accept_op(",")) break;
    }
    return args;
}

NodePtr Parser::parse_function(bool is_async, const Token& start,
                               std::vector<NodePtr> decorators) {
    auto node = make(is_async ? NodeKind::AsyncFunctionDef : NodeKind::FunctionDef, start);
    node->decorators = std::move(decorators);
    node->name = expect_identifier();
    expect_op("(");
    node->children.push_back(parse_parameters(")", true));
    expect_op(")");
    node->children.push_back(accept_op("->") ? parse_expression() : nullptr);
    node->body = parse_block("function definition", start.line);
    return node;
}

NodePtr Parser::parse_class(std::vector<NodePtr> decorators) {
    const Token& kw = tokens_[pos_ - 1];
    auto node = make(NodeKind::ClassDef, kw);
    node->decorators = std::move(decorators);
    node->name = expect_identifier();
    if (accept_op("(")) {
        parse_call_arguments(*node);
        expect_op(")");
    }
    node->body = parse_block("class definition", kw.line);
    return node;
}

NodePtr Parser::parse_decorated() {
    std::vector<NodePtr> decorators;
    while (accept_op("@")) {
        decorators.push_back(parse_named_expression());
        if (peek().type != TokenType::NEWLINE) fail("invalid syntax");
        advance();
    }

    const Token tok = peek();
    if (tok.is_name("def")) {
        advance();
        return parse_function(false, tok, std::move(decorators));
    }
    if (tok.is_name("async") && peek(1).is_name("def")) {
        advance();
        advance();
        return parse_function(true, tok, std::move(decorators));
    }
    if (tok.is_name("class")) {
        advance();
        return parse_class(std::move(decorators));
    }
    fail("invalid syntax");
}

NodePtr Parser::try_parse_match() {
    const size_t save = pos_;
    const Token start = advance();
    auto node = make(NodeKind::Match, start);

    // "match" is a soft keyword: only a subject followed by ':' NEWLINE INDENT commits
    try {
        node->children.push_back(parse_star_expressions());
        expect_op(":");
        if (peek().type != TokenType::NEWLINE || peek(1).type != TokenType::INDENT ||
            !peek(2).is_name("case")) {
            throw SyntaxError("not a match statement", start.line, start.col);
        }
    } catch (const SyntaxError&) {
        pos_ = save;
        return nullptr;
    }
    advance();
    advance();

    while (check_kw("case")) {
        const Token case_tok = advance();
        auto match_case = make(NodeKind::MatchCase, case_tok);
        match_case->children.push_back(parse_pattern());
        match_case->children.push_back(accept_kw("if") ? parse_named_expression() : nullptr);
        match_case->body = parse_block("'case' statement", case_tok.line);
        node->children.push_back(std::move(match_case));
    }
    if (peek().type != TokenType::DEDENT) fail("invalid syntax");
    advance();
    return node;
}

NodePtr Parser::parse_pattern() {
    auto closed_pattern = [this]() -> NodePtr {
        NodePtr pattern;
        if (check_op("*")) {
            pattern = make(NodeKind::Starred, advance());
            pattern->children.push_back(parse_bitwise_or());
        } else {
            pattern = parse_bitwise_or();
        }
        if (check_kw("as")) {
            advance();
            auto bound = make_at(NodeKind::NamedExpr, *pattern);
            auto name = make(NodeKind::Name, peek());
            name->name = expect_identifier();
            bound->children.push_back(std::move(name));
            bound->children.push_back(std::move(pattern));
            return bound;
        }
        return pattern;
    };

    auto first = closed_pattern();
    if (!check_op(",")) return first;

    auto tuple = make_at(NodeKind::Tuple, *first);
    tuple->children.push_back(std::move(first));
    while (accept_op(",")) {
        if (check_op(":") || check_kw("if")) break;
        tuple->children.push_back(closed_pattern());
    }
    return tuple;
}

// ============================================================================
// Expressions
// ============================================================================

NodePtr Parser::parse_star_expressions() {
    auto first = parse_star_expression();
    if (!check_op(",")) return first;

    auto tuple = make_at(NodeKind::Tuple, *first);
    tuple->children.push_back(std::move(first));
    while (accept_op(",")) {
        if (!starts_expression(peek())) break;
        tuple->children.push_back(parse_star_expression());
    }
    return tuple;
}

NodePtr Parser::parse_star_expression() {
    if (check_op("*")) {
        auto star = make(NodeKind::Starred, advance());
        star->children.push_back(parse_bitwise_or());
        return star;
    }
    return parse_expression();
}

NodePtr Parser::parse_named_expression() {
    const Token& tok = peek();
    if (tok.type == TokenType::NAME && !Lexer::is_keyword(tok.text) && peek(1).is_op(":=")) {
        auto node = make(NodeKind::NamedExpr, tok);
        auto target = make(NodeKind::Name, tok);
        target->name = tok.text;
        advance();
        advance();
        node->children.push_back(std::move(target));
        node->children.push_back(parse_expression());
        return node;
    }
    return parse_expression();
}

NodePtr Parser::parse_expression() {
    const DepthGuard guard(depth_, peek());
    if (check_kw("lambda")) return parse_lambda();

    auto body = parse_disjunction();
    if (!check_kw("if")) return body;

    advance();
    auto node = make_at(NodeKind::IfExp, *body);
    auto test = parse_disjunction();
    if (!check_kw("else")) fail("expected 'else' after 'if' expression");
    advance();
    node->children.push_back(std::move(test));
    node->children.push_back(std::move(body));
    node->children.push_back(parse_expression());
    return node;
}

NodePtr Parser::parse_disjunction() {
    auto left = parse_conjunction();
    if (!check_kw("or")) return left;

    auto node = make_at(NodeKind::BoolOp, *left);
    node->name = "or";
    node->children.push_back(std::move(left));
    while (accept_kw("or")) node->children.push_back(parse_conjunction());
    return node;
}

NodePtr Parser::parse_conjunction() {
    auto left = parse_inversion();
    if (!check_kw("and")) return left;

    auto node = make_at(NodeKind::BoolOp, *left);
    node->name = "and";
    node->children.push_back(std::move(left));
    while (accept_kw("and")) node->children.push_back(parse_inversion());
    return node;
}

NodePtr Parser::parse_inversion() {
    if (check_kw("not")) {
        const DepthGuard guard(depth_, peek());
        auto node = make(NodeKind::UnaryOp, advance());
        node->name = "not";
        node->children.push_back(parse_inversion());
        return node;
    }
    return parse_comparison();
}

NodePtr Parser::parse_comparison() {
    auto left = parse_bitwise_or();

    auto next_op = [this]() -> std::string {
        const Token& tok = peek();
        if (tok.type == TokenType::OP &&
            (tok.text == "==" || tok.text == "!=" || tok.text == "<" || tok.text == "<=" ||
             tok.text == ">" || tok.text == ">=")) {
            return tok.text;
        }
        if (tok.is_name("in")) return "in";
        if (tok.is_name("not") && peek(1).is_name("in")) return "not in";
        if (tok.is_name("is")) return peek(1).is_name("not") ? "is not" : "is";
        return {};
    };

    std::string op = next_op();
    if (op.empty()) return left;

    auto node = make_at(NodeKind::Compare, *left);
    node->children.push_back(std::move(left));
    while (!op.empty()) {
        advance();
        if (op == "not in" || op == "is not") advance();
        node->ops.push_back(op);
        node->children.push_back(parse_bitwise_or());
        op = next_op();
    }
    return node;
}

namespace {

template<typename Next>
NodePtr parse_binary_level(Next next, std::initializer_list<std::string_view> ops,
                           const std::function<const Token&()>& peek_tok,
                           const std::function<const Token&()>& advance_tok) {
    auto left = next();
    for (;;) {
        const Token& tok = peek_tok();
        bool matched = false;
        for (auto op : ops) {
            if (tok.is_op(op)) {
                matched = true;
                break;
            }
        }
        if (!matched) return left;
        auto node = make_at(NodeKind::BinOp, *left);
        node->name = advance_tok().text;
        node->children.push_back(std::move(left));
        node->children.push_back(next());
        left = std::move(node);
    }
}

} // anonymous namespace

NodePtr Parser::parse_bitwise_or() {
    return parse_binary_level([this] { return parse_bitwise_xor(); }, {"|"},
        [this]() -> const Token& { return peek(); },
        [this]() -> const Token& { return advance(); });
}

NodePtr Parser::parse_bitwise_xor() {
    return parse_binary_level([this] { return parse_bitwise_and(); }, {"^"},
        [this]() -> const Token& { return peek(); },
        [this]() -> const Token& { return advance(); });
}

NodePtr Parser::parse_bitwise_and() {
    return parse_binary_level([this] { return parse_shift(); }, {"&"},
        [this]() -> const Token& { return peek(); },
        [this]() -> const Token& { return advance(); });
}

NodePtr Parser::parse_shift() {
    return parse_binary_level([this] { return parse_sum(); }, {"<<", ">>"},
        [this]() -> const Token& { return peek(); },
        [this]() -> const Token& { return advance(); });
}

NodePtr Parser::parse_sum() {
    return parse_binary_level([this] { return parse_term(); }, {"+", "-"},
        [this]() -> const Token& { return peek(); },
        [this]() -> const Token& { return advance(); });
}

NodePtr Parser::parse_term() {
    return parse_binary_level([this] { return parse_factor(); },
        {"*", "/", "//", "%", "@"},
        [this]() -> const Token& { return peek(); },
        [this]() -> const Token& { return advance(); });
}

NodePtr Parser::parse_factor() {
    const Token& tok = peek();
    if (tok.is_op("+") || tok.is_op("-") || tok.is_op("~")) {
        const DepthGuard guard(depth_, tok);
        auto node = make(NodeKind::UnaryOp, tok);
        node->name = advance().text;
        node->children.push_back(parse_factor());
        return node;
    }
    return parse_power();
}

NodePtr Parser::parse_power() {
    auto base = parse_await_primary();
    if (!check_op("**")) return base;

    advance();
    auto node = make_at(NodeKind::BinOp, *base);
    node->name = "**";
    node->children.push_back(std::move(base));
    node->children.push_back(parse_factor());
    return node;
}

NodePtr Parser::parse_await_primary() {
    if (check_kw("await")) {
        auto node = make(NodeKind::Await, advance());
        node->children.push_back(parse_primary());
        return node;
    }
    return parse_primary();
}

NodePtr Parser::parse_primary() {
    auto node = parse_atom();
    for (;;) {
        if (check_op(".")) {
            advance();
            auto attr = make_at(NodeKind::Attribute, *node);
            attr->name = expect_identifier();
            attr->children.push_back(std::move(node));
            node = std::move(attr);
        } else if (check_op("(")) {
            node = parse_call(std::move(node));
        } else if (check_op("[")) {
            node = parse_subscript(std::move(node));
        } else {
            return node;
        }
    }
}

NodePtr Parser::parse_atom() {
    const Token& tok = peek();

    switch (tok.type) {
        case TokenType::NAME: {
            if (tok.text == "True") { advance(); return make_constant(ConstantKind::TRUE, "True", tok.line, tok.col); }
            if (tok.text == "False") { advance(); return make_constant(ConstantKind::FALSE, "False", tok.line, tok.col); }
            if (tok.text == "None") { advance(); return make_constant(ConstantKind::NONE, "None", tok.line, tok.col); }
            if (Lexer::is_keyword(tok.text)) fail("invalid syntax");
            auto name = make(NodeKind::Name, tok);
            name->name = advance().text;
            return name;
        }
        case TokenType::NUMBER: {
            const Token& num = advance();
            std::string digits;
            digits.reserve(num.text.size());
            for (char c : num.text) {
                if (c != '_') digits += c;
            }
            ConstantKind ck = ConstantKind::INT;
            const bool prefixed = digits.size() > 1 && digits[0] == '0' &&
                (digits[1] == 'x' || digits[1] == 'X' || digits[1] == 'o' ||
                 digits[1] == 'O' || digits[1] == 'b' || digits[1] == 'B');
            if (!prefixed) {
                if (digits.back() == 'j' || digits.back() == 'J') {
                    ck = ConstantKind::COMPLEX;
                } else if (digits.find_first_of(".eE") != std::string::npos) {
                    ck = ConstantKind::FLOAT;
                }
            }
            return make_constant(ck, std::move(digits), num.line, num.col);
        }
        case TokenType::STRING:
            return parse_strings();
        case TokenType::OP:
            if (tok.text == "(") return parse_paren_atom();
            if (tok.text == "[") return parse_list_atom();
            if (tok.text == "{") return parse_brace_atom();
            if (tok.text == "...") {
                advance();
                return make_constant(ConstantKind::ELLIPSIS, "...", tok.line, tok.col);
            }
            break;
        default:
            break;
    }
    fail("invalid syntax");
}

NodePtr Parser::parse_paren_atom() {
    const Token& open = advance();
    if (check_op(")")) {
        advance();
        return make(NodeKind::Tuple, open);
    }
    if (check_kw("yield")) {
        auto y = parse_yield();
        expect_op(")");
        return y;
    }

    auto element = [this]() -> NodePtr {
        if (check_op("*")) return parse_star_expression();
        return parse_named_expression();
    };

    auto first = element();
    if (check_kw("for") || (check_kw("async") && peek(1).is_name("for"))) {
        auto gen = make(NodeKind::GeneratorExp, open);
        gen->children.push_back(std::move(first));
        parse_comprehensions(*gen);
        expect_op(")");
        return gen;
    }
    if (!check_op(",")) {
        expect_op(")");
        return first;
    }

    auto tuple = make(NodeKind::Tuple, open);
    tuple->children.push_back(std::move(first));
    while (accept_op(",")) {
        if (check_op(")")) break;
        tuple->children.push_back(element());
    }
    expect_op(")");
    return tuple;
}

NodePtr Parser::parse_list_atom() {
    const Token& open = advance();
    if (check_op("]")) {
        advance();
        return make(NodeKind::List, open);
    }

    auto element = [this]() -> NodePtr {
        if (check_op("*")) return parse_star_expression();
        return parse_named_expression();
    };

    auto first = element();
    if (check_kw("for") || (check_kw("async") && peek(1).is_name("for"))) {
        auto comp = make(NodeKind::ListComp, open);
        comp->children.push_back(std::move(first));
        parse_comprehensions(*comp);
        expect_op("]");
        return comp;
    }

    auto list = make(NodeKind::List, open);
    list->children.push_back(std::move(first));
    while (accept_op(",")) {
        if (check_op("]")) break;
        list->children.push_back(element());
    }
    expect_op("]");
    return list;
}

NodePtr Parser::parse_brace_atom() {
    const Token& open = advance();
    if (check_op("}")) {
        advance();
        return make(NodeKind::Dict, open);
    }

    auto is_comprehension = [this]() {
        return check_kw("for") || (check_kw("async") && peek(1).is_name("for"));
    };

    auto dict_items = [this](Node& dict) {
        while (accept_op(",")) {
            if (check_op("}")) break;
            if (accept_op("**")) {
                dict.children.push_back(nullptr);
                dict.children.push_back(parse_bitwise_or());
            } else {
                dict.children.push_back(parse_expression());
                expect_op(":");
                dict.children.push_back(parse_expression());
            }
        }
        expect_op("}");
    };

    if (accept_op("**")) {
        auto dict = make(NodeKind::Dict, open);
        dict->children.push_back(nullptr);
        dict->children.push_back(parse_bitwise_or());
        dict_items(*dict);
        return dict;
    }

    NodePtr first = check_op("*") ? parse_star_expression() : parse_named_expression();

    if (accept_op(":")) {
        auto value = parse_expression();
        if (is_comprehension()) {
            auto comp = make(NodeKind::DictComp, open);
            comp->children.push_back(std::move(first));
            comp->children.push_back(std::move(value));
            parse_comprehensions(*comp);
            expect_op("}");
            return comp;
        }
        auto dict = make(NodeKind::Dict, open);
        dict->children.push_back(std::move(first));
        dict->children.push_back(std::move(value));
        dict_items(*dict);
        return dict;
    }

    if (is_comprehension()) {
        auto comp = make(NodeKind::SetComp, open);
        comp->children.push_back(std::move(first));
        parse_comprehensions(*comp);
        expect_op("}");
        return comp;
    }

    auto set = make(NodeKind::Set, open);
    set->children.push_back(std::move(first));
    while (accept_op(",")) {
        if (check_op("}")) break;
        set->children.push_back(check_op("*") ? parse_star_expression() : parse_named_expression());
    }
    expect_op("}");
    return set;
}

void Parser::parse_comprehensions(Node& owner) {
    while (check_kw("for") || (check_kw("async") && peek(1).is_name("for"))) {
        auto comp = make(NodeKind::Comprehension, peek());
        if (accept_kw("async")) comp->is_async = true;
        expect_kw("for");
        auto target = parse_target_list();
        validate_assign_target(*target, false);
        expect_kw("in");
        comp->children.push_back(std::move(target));
        comp->children.push_back(parse_disjunction());
        while (accept_kw("if")) {
            comp->children.push_back(parse_disjunction());
        }
        owner.children.push_back(std::move(comp));
    }
}

NodePtr Parser::parse_star_target() {
    if (check_op("*")) {
        auto star = make(NodeKind::Starred, advance());
        star->children.push_back(parse_bitwise_or());
        return star;
    }
    return parse_bitwise_or();
}

NodePtr Parser::parse_target_list() {
    auto first = parse_star_target();
    if (!check_op(",")) return first;

    auto tuple = make_at(NodeKind::Tuple, *first);
    tuple->children.push_back(std::move(first));
    while (accept_op(",")) {
        if (!starts_expression(peek()) || check_kw("in")) break;
        tuple->children.push_back(parse_star_target());
    }
    return tuple;
}

NodePtr Parser::parse_call(NodePtr func) {
    auto call = make_at(NodeKind::Call, *func);
    call->children.push_back(std::move(func));
    expect_op("(");
    parse_call_arguments(*call);
    expect_op(")");
    return call;
}

void Parser::parse_call_arguments(Node& owner) {
    bool seen_keyword = false;

    while (!check_op(")")) {
        const Token& tok = peek();
        if (accept_op("**")) {
            auto kw = make(NodeKind::Keyword, tok);
            kw->children.push_back(parse_expression());
            owner.children.push_back(std::move(kw));
            seen_keyword = true;
        } else if (check_op("*")) {
            owner.children.push_back(parse_star_expression());
        } else if (tok.type == TokenType::NAME && !Lexer::is_keyword(tok.text) &&
                   peek(1).is_op("=")) {
            auto kw = make(NodeKind::Keyword, tok);
            kw->name = tok.text;
            advance();
            advance();
            kw->children.push_back(parse_expression());
            owner.children.push_back(std::move(kw));
            seen_keyword = true;
        } else {
            if (seen_keyword) fail("positional argument follows keyword argument");
            auto arg = parse_named_expression();
            if (check_kw("for") || (check_kw("async") && peek(1).is_name("for"))) {
                auto gen = make_at(NodeKind::GeneratorExp, *arg);
                gen->children.push_back(std::move(arg));
                parse_comprehensions(*gen);
                arg = std::move(gen);
            }
            owner.children.push_back(std::move(arg));
        }
        if (!accept_op(",")) break;
    }
}

NodePtr Parser::parse_subscript(NodePtr value) {
    auto sub = make_at(NodeKind::Subscript, *value);
    sub->children.push_back(std::move(value));
    const Token& open = expect_op("[");

    auto first = parse_slice();
    if (check_op(",")) {
        auto tuple = make(NodeKind::Tuple, open);
        tuple->children.push_back(std::move(first));
        while (accept_op(",")) {
            if (check_op("]")) break;
            tuple->children.push_back(parse_slice());
        }
        first = std::move(tuple);
    }
    sub->children.push_back(std::move(first));
    expect_op("]");
    return sub;
}

NodePtr Parser::parse_slice() {
    const Token& start = peek();
    NodePtr lower;
    if (!check_op(":")) {
        if (check_op("*")) return parse_star_expression();
        lower = parse_named_expression();
        if (!check_op(":")) return lower;
    }

    auto slice = make(NodeKind::Slice, start);
    expect_op(":");
    auto bound_follows = [this]() {
        return !check_op(":") && !check_op("]") && !check_op(",");
    };
    NodePtr upper = bound_follows() ? parse_expression() : nullptr;
    NodePtr step;
    if (accept_op(":")) {
        if (bound_follows()) step = parse_expression();
    }
    slice->children.push_back(std::move(lower));
    slice->children.push_back(std::move(upper));
    slice->children.push_back(std::move(step));
    return slice;
}

NodePtr Parser::parse_lambda() {
    auto node = make(NodeKind::Lambda, advance());
    node->children.push_back(parse_parameters(":", false));
    expect_op(":");
    node->children.push_back(parse_expression());
    return node;
}

NodePtr Parser::parse_yield() {
    const Token& kw = advance();
    if (accept_kw("from")) {
        auto node = make(NodeKind::YieldFrom, kw);
        node->children.push_back(parse_expression());
        return node;
    }
    auto node = make(NodeKind::Yield, kw);
    if (starts_expression(peek())) node->children.push_back(parse_star_expressions());
    return node;
}

// ============================================================================
// String literals and f-strings
// ============================================================================

NodePtr Parser::parse_strings() {
    const Token first = peek();
    std::vector<Token> parts;
    while (peek().type == TokenType::STRING) parts.push_back(advance());

    bool any_bytes = false, any_text = false, any_fstring = false;
    for (const auto& p : parts) {
        (p.is_bytes ? any_bytes : any_text) = true;
        any_fstring = any_fstring || p.is_fstring;
    }
    if (any_bytes && any_text) {
        fail_at("cannot mix bytes and nonbytes literals", first);
    }

    auto decode = [](const Token& t) {
        return t.is_raw ? t.text : Lexer::decode_escapes(t.text, t.is_bytes, t.line);
    };

    if (!any_fstring) {
        std::string value;
        for (const auto& p : parts) value += decode(p);
        return make_constant(any_bytes ? ConstantKind::BYTES : ConstantKind::STR,
                             std::move(value), first.line, first.col);
    }

    auto joined = make(NodeKind::JoinedStr, first);
    auto append_literal = [&](std::string text, const Token& at) {
        if (text.empty()) return;
        if (!joined->children.empty() && joined->children.back()->kind == NodeKind::Constant) {
            joined->children.back()->value += text;
            return;
        }
        joined->children.push_back(make_constant(ConstantKind::STR, std::move(text), at.line, at.col));
    };

    for (const auto& p : parts) {
        if (!p.is_fstring) {
            append_literal(decode(p), p);
            continue;
        }
        auto piece = parse_fstring_body(p, p.text);
        for (auto& child : piece->children) {
            if (child->kind == NodeKind::Constant) {
                append_literal(std::move(child->value), p);
            } else {
                joined->children.push_back(std::move(child));
            }
        }
    }
    return joined;
}

NodePtr Parser::parse_fstring_body(const Token& tok, std::string_view body) {
    auto joined = make(NodeKind::JoinedStr, tok);
    std::string literal;

    auto flush = [&]() {
        if (literal.empty()) return;
        std::string text = tok.is_raw ? literal : Lexer::decode_escapes(literal, false, tok.line);
        joined->children.push_back(make_constant(ConstantKind::STR, std::move(text), tok.line, tok.col));
        literal.clear();
    };

    auto skip_quoted = [&](size_t j) {
        const char q = body[j];
        ++j;
        while (j < body.size() && body[j] != q) {
            if (body[j] == '\\') ++j;
            ++j;
        }
        return j;
    };

    size_t i = 0;
    while (i < body.size()) {
        const char c = body[i];

        if (c == '\\' && !tok.is_raw && i + 1 < body.size()) {
            literal += c;
            literal += body[i + 1];
            i += 2;
            continue;
        }
        if (c == '}') {
            if (i + 1 < body.size() && body[i + 1] == '}') {
                literal += '}';
                i += 2;
                continue;
            }
            throw SyntaxError("f-string: single '}' is not allowed", tok.line, tok.col);
        }
        if (c != '{') {
            literal += c;
            ++i;
            continue;
        }
        if (i + 1 < body.size() && body[i + 1] == '{') {
            literal += '{';
            i += 2;
            continue;
        }

        flush();

        // Locate the end of the replacement expression
        size_t j = i + 1;
        int depth = 0;
        bool self_documenting = false;
        for (; j < body.size(); ++j) {
            const char d = body[j];
            if (d == '\'' || d == '"') {
                j = skip_quoted(j);
                continue;
            }
            if (d == '(' || d == '[' || d == '{') { ++depth; continue; }
            if (d == ')' || d == ']') { --depth; continue; }
            if (d == '}') {
                if (depth == 0) break;
                --depth;
                continue;
            }
            if (depth != 0) continue;
            if (d == '!') {
                if (j + 1 < body.size() && body[j + 1] == '=') { ++j; continue; }
                break;
            }
            if (d == ':') break;
            if (d == '=') {
                const char prev = body[j - 1];
                const char next = j + 1 < body.size() ? body[j + 1] : '\0';
                if (next == '=' ) { ++j; continue; }
                if (prev == '=' || prev == '!' || prev == '<' || prev == '>') continue;
                size_t k = j + 1;
                while (k < body.size() && body[k] == ' ') ++k;
                if (k < body.size() && (body[k] == '}' || body[k] == '!' || body[k] == ':')) {
                    self_documenting = true;
                    break;
                }
            }
        }
        if (j >= body.size()) {
            throw SyntaxError("f-string: expecting '}'", tok.line, tok.col);
        }

        const std::string_view expr_text = body.substr(i + 1, j - i - 1);
        if (expr_text.find_first_not_of(" \t\n") == std::string_view::npos) {
            throw SyntaxError("f-string: valid expression required before '}'", tok.line, tok.col);
        }

        auto value = make(NodeKind::FormattedValue, tok);
        value->children.push_back(parse_expression_text(expr_text, tok.line));

        if (self_documenting) {
            joined->children.push_back(make_constant(ConstantKind::STR,
                std::string(expr_text) + "=", tok.line, tok.col));
            value->value = "r";
            ++j;
            while (j < body.size() && body[j] == ' ') ++j;
        }
        if (j < body.size() && body[j] == '!') {
            if (j + 1 >= body.size() ||
                (body[j + 1] != 'r' && body[j + 1] != 's' && body[j + 1] != 'a')) {
                throw SyntaxError("f-string: invalid conversion character", tok.line, tok.col);
            }
            value->value = std::string(1, body[j + 1]);
            j += 2;
        }

        NodePtr format_spec;
        if (j < body.size() && body[j] == ':') {
            const size_t spec_start = j + 1;
            int spec_depth = 0;
            for (j = spec_start; j < body.size(); ++j) {
                if (body[j] == '{') ++spec_depth;
                else if (body[j] == '}') {
                    if (spec_depth == 0) break;
                    --spec_depth;
                }
            }
            format_spec = parse_fstring_body(tok, body.substr(spec_start, j - spec_start));
        }
        if (j >= body.size() || body[j] != '}') {
            throw SyntaxError("f-string: expecting '}'", tok.line, tok.col);
        }
        value->children.push_back(std::move(format_spec));
        joined->children.push_back(std::move(value));
        i = j + 1;
    }
    flush();
    return joined;
}

} // namespace execbox::python

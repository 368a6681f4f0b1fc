#pragma once

#include "core/error.hpp"
#include "parser/python_ast.hpp"
#include "parser/python_lexer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace execbox::python {

/**
 * @brief Recursive-descent parser for Python 3 source.
 *
 * Covers the statement and expression grammar generated code uses, including
 * async constructs, decorators, f-strings, comprehensions and match statements.
 * Match patterns are parsed with the expression grammar.
 *
 * Thread-safety: instances are single-use; the static entry point is reentrant.
 */
class Parser {
public:
    /**
     * @brief Parse a complete module.
     * @return Module on success; SYNTAX_ERROR with "Syntax error: <msg> at line N"
     */
    [[nodiscard]] static Result<Module> parse(std::string_view source);

    /// Parse a single expression (used for f-string replacement fields)
    [[nodiscard]] static NodePtr parse_expression_text(std::string_view text, uint32_t line);

private:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    // ---- token stream ----
    [[nodiscard]] const Token& peek(size_t ahead = 0) const;
    const Token& advance();
    [[nodiscard]] bool check_op(std::string_view op) const { return peek().is_op(op); }
    [[nodiscard]] bool check_kw(std::string_view kw) const { return peek().is_name(kw); }
    bool accept_op(std::string_view op);
    bool accept_kw(std::string_view kw);
    const Token& expect_op(std::string_view op);
    const Token& expect_kw(std::string_view kw);
    std::string expect_identifier();
    [[noreturn]] void fail(const std::string& message) const;
    [[noreturn]] void fail_at(const std::string& message, const Token& tok) const;

    // ---- statements ----
    NodePtr parse_module();
    void parse_statement(std::vector<NodePtr>& out);
    void parse_simple_statements(std::vector<NodePtr>& out);
    NodePtr parse_simple_statement();
    NodePtr parse_expression_statement();
    NodePtr parse_import();
    NodePtr parse_from_import();
    std::vector<NodePtr> parse_block(std::string_view owner, uint32_t owner_line);
    NodePtr parse_if(const Token& kw);
    NodePtr parse_while();
    NodePtr parse_for(bool is_async, const Token& start);
    NodePtr parse_try();
    NodePtr parse_with(bool is_async, const Token& start);
    NodePtr parse_function(bool is_async, const Token& start, std::vector<NodePtr> decorators);
    NodePtr parse_class(std::vector<NodePtr> decorators);
    NodePtr parse_decorated();
    NodePtr try_parse_match();
    NodePtr parse_parameters(std::string_view closer, bool allow_annotations);

    // ---- expressions ----
    NodePtr parse_star_expressions();
    NodePtr parse_star_expression();
    NodePtr parse_named_expression();
    NodePtr parse_expression();
    NodePtr parse_disjunction();
    NodePtr parse_conjunction();
    NodePtr parse_inversion();
    NodePtr parse_comparison();
    NodePtr parse_bitwise_or();
    NodePtr parse_bitwise_xor();
    NodePtr parse_bitwise_and();
    NodePtr parse_shift();
    NodePtr parse_sum();
    NodePtr parse_term();
    NodePtr parse_factor();
    NodePtr parse_power();
    NodePtr parse_await_primary();
    NodePtr parse_primary();
    NodePtr parse_atom();
    NodePtr parse_lambda();
    NodePtr parse_yield();
    NodePtr parse_strings();
    NodePtr parse_paren_atom();
    NodePtr parse_list_atom();
    NodePtr parse_brace_atom();
    NodePtr parse_call(NodePtr func);
    NodePtr parse_subscript(NodePtr value);
    NodePtr parse_slice();
    NodePtr parse_star_target();
    NodePtr parse_target_list();
    NodePtr parse_pattern();
    void parse_call_arguments(Node& owner);
    void parse_comprehensions(Node& owner);

    // ---- f-strings ----
    NodePtr parse_fstring_body(const Token& tok, std::string_view body);

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    int depth_ = 0;
};

/// Raise SyntaxError when @p target cannot be assigned to
void validate_assign_target(const Node& target, bool augmented);

} // namespace execbox::python

#pragma once

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace execbox::python {

/**
 * @brief Raised by the lexer and parser for source that is not valid Python.
 */
struct SyntaxError : std::runtime_error {
    uint32_t line;
    uint32_t column;

    SyntaxError(const std::string& msg, uint32_t ln, uint32_t col)
        : std::runtime_error(msg), line(ln), column(col) {}
};

enum class TokenType : uint8_t {
    NAME,
    NUMBER,
    STRING,
    OP,
    NEWLINE,
    INDENT,
    DEDENT,
    END
};

struct Token {
    TokenType type = TokenType::END;
    std::string text;       // NAME/NUMBER/OP spelling; STRING body between the quotes
    uint32_t line = 0;
    uint32_t col = 0;

    // STRING only
    bool is_raw = false;
    bool is_bytes = false;
    bool is_fstring = false;

    [[nodiscard]] bool is_op(std::string_view op) const {
        return type == TokenType::OP && text == op;
    }

    [[nodiscard]] bool is_name(std::string_view word) const {
        return type == TokenType::NAME && text == word;
    }
};

/**
 * @brief Tokenizer for Python 3 source.
 *
 * Produces the logical-line token stream (NEWLINE/INDENT/DEDENT), joins
 * bracketed and backslash-continued lines, and keeps string bodies undecoded.
 */
class Lexer {
public:
    explicit Lexer(std::string_view source);

    /**
     * @brief Tokenize the whole source.
     * @throws SyntaxError on malformed input
     */
    [[nodiscard]] std::vector<Token> tokenize();

    /// Lines (1-based) that begin inside a multi-line string literal
    [[nodiscard]] const std::set<uint32_t>& string_continuation_lines() const {
        return string_lines_;
    }

    /**
     * @brief Decode backslash escapes of a non-raw literal body.
     * @throws SyntaxError on truncated \\x or \\u escapes
     */
    [[nodiscard]] static std::string decode_escapes(std::string_view body, bool is_bytes,
                                                    uint32_t line);

    [[nodiscard]] static bool is_keyword(std::string_view word);

private:
    void emit(TokenType type, std::string text, uint32_t line, uint32_t col);
    void handle_indentation();
    void scan_name_or_string();
    void scan_string(std::string_view prefix, uint32_t start_line, uint32_t start_col);
    void scan_number();
    void scan_operator();

    [[nodiscard]] uint32_t column() const {
        return static_cast<uint32_t>(pos_ - line_start_);
    }
    [[nodiscard]] char peek(size_t ahead = 0) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    std::string src_;
    size_t pos_ = 0;
    size_t line_start_ = 0;
    uint32_t line_ = 1;
    bool at_line_start_ = true;

    struct Bracket {
        char open;
        uint32_t line;
        uint32_t col;
    };
    std::vector<Bracket> brackets_;
    std::vector<uint32_t> indents_{0};
    std::vector<Token> tokens_;
    std::set<uint32_t> string_lines_;
};

} // namespace execbox::python

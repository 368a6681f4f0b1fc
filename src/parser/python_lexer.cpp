#include "parser/python_lexer.hpp"

#include <array>
#include <format>
#include <unordered_set>

namespace execbox::python {

// ============================================================================
// Character classification table (ASCII classes; bytes >= 0x80 are treated
// as identifier characters so UTF-8 identifiers pass through intact)
// ============================================================================
namespace {

enum CharClass : uint8_t {
    CC_OTHER = 0,
    CC_SPACE = 1,
    CC_DIGIT = 2,
    CC_ALPHA = 4,
    CC_IDENT = 8,
};

struct CharTable {
    uint8_t cls[256];

    constexpr CharTable() : cls{} {
        for (int i = 0; i < 256; ++i) cls[i] = CC_OTHER;
        cls[' '] = CC_SPACE; cls['\t'] = CC_SPACE; cls['\f'] = CC_SPACE;
        for (int i = '0'; i <= '9'; ++i) cls[i] = CC_DIGIT;
        for (int i = 'a'; i <= 'z'; ++i) cls[i] = CC_ALPHA;
        for (int i = 'A'; i <= 'Z'; ++i) cls[i] = CC_ALPHA;
        cls['_'] = CC_IDENT;
        for (int i = 0x80; i < 256; ++i) cls[i] = CC_IDENT;
    }
};

static constexpr CharTable CT{};

inline bool ct_space(unsigned char c)       { return CT.cls[c] == CC_SPACE; }
inline bool ct_digit(unsigned char c)       { return CT.cls[c] == CC_DIGIT; }
inline bool ct_ident_start(unsigned char c) { auto v = CT.cls[c]; return v == CC_ALPHA || v == CC_IDENT; }
inline bool ct_ident_cont(unsigned char c)  { auto v = CT.cls[c]; return v == CC_ALPHA || v == CC_DIGIT || v == CC_IDENT; }

inline bool is_hex(char c) {
    return ct_digit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

constexpr size_t kMaxBrackets = 200;
constexpr size_t kMaxIndentLevels = 100;

// Longest operators first
constexpr std::array<std::string_view, 48> kOperators = {
    "**=", "//=", ">>=", "<<=", "...", "!=",
    "->", ":=", "**", "//", "<<", ">>", "<=", ">=", "==",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=",
    "+", "-", "*", "/", "%", "@", "&", "|", "^", "~",
    "<", ">", "(", ")", "[", "]", "{", "}", ",", ":", ";", ".", "=", "!",
};

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool is_string_prefix(std::string_view ident) {
    if (ident.empty() || ident.size() > 2) return false;
    bool r = false, b = false, f = false, u = false;
    for (char c : ident) {
        switch (c) {
            case 'r': case 'R': if (r) return false; r = true; break;
            case 'b': case 'B': if (b) return false; b = true; break;
            case 'f': case 'F': if (f) return false; f = true; break;
            case 'u': case 'U': if (u) return false; u = true; break;
            default: return false;
        }
    }
    if (u && ident.size() > 1) return false;
    return !(b && f);
}

} // anonymous namespace

// ============================================================================
// Lexer
// ============================================================================

Lexer::Lexer(std::string_view source) {
    src_.reserve(source.size() + 1);
    for (size_t i = 0; i < source.size(); ++i) {
        if (source[i] == '\r') {
            src_ += '\n';
            if (i + 1 < source.size() && source[i + 1] == '\n') ++i;
        } else {
            src_ += source[i];
        }
    }
}

bool Lexer::is_keyword(std::string_view word) {
    static const std::unordered_set<std::string_view> keywords = {
        "False", "None", "True", "and", "as", "assert", "async", "await",
        "break", "class", "continue", "def", "del", "elif", "else", "except",
        "finally", "for", "from", "global", "if", "import", "in", "is",
        "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
        "while", "with", "yield",
    };
    return keywords.contains(word);
}

void Lexer::emit(TokenType type, std::string text, uint32_t line, uint32_t col) {
    Token tok;
    tok.type = type;
    tok.text = std::move(text);
    tok.line = line;
    tok.col = col;
    tokens_.emplace_back(std::move(tok));
}

std::vector<Token> Lexer::tokenize() {
    while (pos_ < src_.size()) {
        if (at_line_start_ && brackets_.empty()) {
            handle_indentation();
            continue;
        }

        const char c = src_[pos_];
        const auto uc = static_cast<unsigned char>(c);

        if (ct_space(uc)) {
            ++pos_;
        } else if (c == '#') {
            while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
        } else if (c == '\\') {
            if (peek(1) != '\n') {
                throw SyntaxError("unexpected character after line continuation character",
                                  line_, column());
            }
            pos_ += 2;
            ++line_;
            line_start_ = pos_;
        } else if (c == '\n') {
            if (brackets_.empty()) {
                emit(TokenType::NEWLINE, "", line_, column());
                at_line_start_ = true;
            }
            ++pos_;
            ++line_;
            line_start_ = pos_;
        } else if (ct_ident_start(uc)) {
            scan_name_or_string();
        } else if (ct_digit(uc) || (c == '.' && ct_digit(static_cast<unsigned char>(peek(1))))) {
            scan_number();
        } else if (c == '"' || c == '\'') {
            scan_string("", line_, column());
        } else {
            scan_operator();
        }
    }

    if (!brackets_.empty()) {
        const auto& open = brackets_.back();
        throw SyntaxError(std::format("'{}' was never closed", open.open), open.line, open.col);
    }

    if (!tokens_.empty() && tokens_.back().type != TokenType::NEWLINE &&
        tokens_.back().type != TokenType::DEDENT) {
        emit(TokenType::NEWLINE, "", line_, column());
    }
    while (indents_.size() > 1) {
        indents_.pop_back();
        emit(TokenType::DEDENT, "", line_, 0);
    }
    emit(TokenType::END, "", line_, 0);
    return std::move(tokens_);
}

void Lexer::handle_indentation() {
    uint32_t width = 0;
    while (pos_ < src_.size() && ct_space(static_cast<unsigned char>(src_[pos_]))) {
        width = (src_[pos_] == '\t') ? (width / 8 + 1) * 8 : width + 1;
        ++pos_;
    }

    // Blank and comment-only lines do not affect indentation
    if (pos_ >= src_.size()) {
        at_line_start_ = false;
        return;
    }
    if (src_[pos_] == '\n' || src_[pos_] == '#') {
        while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
        if (pos_ < src_.size()) {
            ++pos_;
            ++line_;
            line_start_ = pos_;
        }
        return;
    }

    at_line_start_ = false;
    if (width > indents_.back()) {
        if (tokens_.empty() || tokens_.back().type != TokenType::NEWLINE) {
            throw SyntaxError("unexpected indent", line_, width);
        }
        if (indents_.size() >= kMaxIndentLevels) {
            throw SyntaxError("too many levels of indentation", line_, width);
        }
        indents_.push_back(width);
        emit(TokenType::INDENT, "", line_, 0);
        return;
    }
    while (width < indents_.back()) {
        indents_.pop_back();
        emit(TokenType::DEDENT, "", line_, 0);
    }
    if (width != indents_.back()) {
        throw SyntaxError("unindent does not match any outer indentation level", line_, width);
    }
}

void Lexer::scan_name_or_string() {
    const size_t start = pos_;
    const uint32_t col = column();
    while (pos_ < src_.size() && ct_ident_cont(static_cast<unsigned char>(src_[pos_]))) ++pos_;
    std::string_view ident(src_.data() + start, pos_ - start);

    const char next = peek();
    if ((next == '"' || next == '\'') && is_string_prefix(ident)) {
        scan_string(ident, line_, col);
        return;
    }
    emit(TokenType::NAME, std::string(ident), line_, col);
}

void Lexer::scan_string(std::string_view prefix, uint32_t start_line, uint32_t start_col) {
    bool raw = false, bytes = false, fstr = false;
    for (char p : prefix) {
        switch (p) {
            case 'r': case 'R': raw = true; break;
            case 'b': case 'B': bytes = true; break;
            case 'f': case 'F': fstr = true; break;
            default: break;
        }
    }

    const char quote = src_[pos_];
    const bool triple = peek(1) == quote && peek(2) == quote;
    pos_ += triple ? 3 : 1;

    const size_t body_start = pos_;
    int brace_depth = 0;

    auto newline_in_string = [&]() {
        ++line_;
        line_start_ = pos_ + 1;
        string_lines_.insert(line_);
    };

    for (;;) {
        if (pos_ >= src_.size()) {
            if (triple) {
                throw SyntaxError(std::format(
                    "unterminated triple-quoted string literal (detected at line {})", line_),
                    start_line, start_col);
            }
            throw SyntaxError(std::format(
                "unterminated string literal (detected at line {})", start_line),
                start_line, start_col);
        }
        const char c = src_[pos_];
        if (c == '\\') {
            if (peek(1) == '\n') {
                ++pos_;
                newline_in_string();
            } else {
                ++pos_;
            }
            ++pos_;
            continue;
        }
        if (c == '\n') {
            if (!triple) {
                throw SyntaxError(std::format(
                    "unterminated string literal (detected at line {})", start_line),
                    start_line, start_col);
            }
            newline_in_string();
            ++pos_;
            continue;
        }
        if (fstr && c == '{') {
            if (brace_depth == 0 && peek(1) == '{') {
                pos_ += 2;
                continue;
            }
            ++brace_depth;
            ++pos_;
            continue;
        }
        if (fstr && c == '}') {
            if (brace_depth > 0) --brace_depth;
            ++pos_;
            continue;
        }
        if (fstr && brace_depth > 0 && (c == '"' || c == '\'') &&
            !(c == quote && triple && peek(1) == quote && peek(2) == quote)) {
            // Nested literal inside a replacement field
            const char inner = c;
            ++pos_;
            while (pos_ < src_.size() && src_[pos_] != inner && src_[pos_] != '\n') {
                if (src_[pos_] == '\\') ++pos_;
                ++pos_;
            }
            if (pos_ >= src_.size() || src_[pos_] == '\n') {
                throw SyntaxError("unterminated string in f-string replacement field",
                                  start_line, start_col);
            }
            ++pos_;
            continue;
        }
        if (c == quote) {
            if (!triple) break;
            if (peek(1) == quote && peek(2) == quote) break;
        }
        ++pos_;
    }

    Token tok;
    tok.type = TokenType::STRING;
    tok.text = src_.substr(body_start, pos_ - body_start);
    tok.line = start_line;
    tok.col = start_col;
    tok.is_raw = raw;
    tok.is_bytes = bytes;
    tok.is_fstring = fstr;
    tokens_.emplace_back(std::move(tok));

    pos_ += triple ? 3 : 1;
}

void Lexer::scan_number() {
    const size_t start = pos_;
    const uint32_t col = column();

    auto digits = [&](auto pred) {
        while (pos_ < src_.size() && (pred(src_[pos_]) || src_[pos_] == '_')) ++pos_;
    };
    auto dec = [](char c) { return ct_digit(static_cast<unsigned char>(c)); };

    if (src_[pos_] == '0' && (peek(1) == 'x' || peek(1) == 'X')) {
        pos_ += 2;
        digits(is_hex);
    } else if (src_[pos_] == '0' && (peek(1) == 'o' || peek(1) == 'O')) {
        pos_ += 2;
        digits([](char c) { return c >= '0' && c <= '7'; });
    } else if (src_[pos_] == '0' && (peek(1) == 'b' || peek(1) == 'B')) {
        pos_ += 2;
        digits([](char c) { return c == '0' || c == '1'; });
    } else {
        digits(dec);
        if (peek() == '.') {
            ++pos_;
            digits(dec);
        }
        if (peek() == 'e' || peek() == 'E') {
            const size_t save = pos_;
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (dec(peek())) {
                digits(dec);
            } else {
                pos_ = save;
            }
        }
        if (peek() == 'j' || peek() == 'J') ++pos_;
    }

    if (pos_ < src_.size() && ct_ident_cont(static_cast<unsigned char>(src_[pos_]))) {
        throw SyntaxError("invalid decimal literal", line_, column());
    }
    emit(TokenType::NUMBER, src_.substr(start, pos_ - start), line_, col);
}

void Lexer::scan_operator() {
    const uint32_t col = column();
    std::string_view rest(src_.data() + pos_, src_.size() - pos_);

    for (const auto op : kOperators) {
        if (!rest.starts_with(op)) continue;

        if (op == "!") {
            throw SyntaxError("invalid syntax", line_, col);
        }
        if (op == "(" || op == "[" || op == "{") {
            if (brackets_.size() >= kMaxBrackets) {
                throw SyntaxError("too many nested parentheses", line_, col);
            }
            brackets_.push_back({op[0], line_, col});
        } else if (op == ")" || op == "]" || op == "}") {
            if (brackets_.empty()) {
                throw SyntaxError(std::format("unmatched '{}'", op), line_, col);
            }
            const char open = brackets_.back().open;
            const char expected = open == '(' ? ')' : open == '[' ? ']' : '}';
            if (op[0] != expected) {
                throw SyntaxError(std::format(
                    "closing parenthesis '{}' does not match opening parenthesis '{}'",
                    op, open), line_, col);
            }
            brackets_.pop_back();
        }
        pos_ += op.size();
        emit(TokenType::OP, std::string(op), line_, col);
        return;
    }

    throw SyntaxError(std::format("invalid character '{}' (U+{:04X})",
                                  src_[pos_], static_cast<unsigned>(static_cast<unsigned char>(src_[pos_]))),
                      line_, col);
}

// ============================================================================
// Escape decoding
// ============================================================================

std::string Lexer::decode_escapes(std::string_view body, bool is_bytes, uint32_t line) {
    std::string out;
    out.reserve(body.size());

    auto hex_value = [&](size_t at, size_t count) -> uint32_t {
        if (at + count > body.size()) {
            throw SyntaxError("truncated escape sequence", line, 0);
        }
        uint32_t v = 0;
        for (size_t k = 0; k < count; ++k) {
            const char h = body[at + k];
            if (!is_hex(h)) throw SyntaxError("truncated escape sequence", line, 0);
            v = v * 16 + static_cast<uint32_t>(
                (h <= '9') ? h - '0' : (h | 0x20) - 'a' + 10);
        }
        return v;
    };

    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c != '\\' || i + 1 >= body.size()) {
            out += c;
            continue;
        }
        const char e = body[++i];
        switch (e) {
            case '\n': break;
            case '\\': out += '\\'; break;
            case '\'': out += '\''; break;
            case '"':  out += '"'; break;
            case 'a':  out += '\a'; break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'v':  out += '\v'; break;
            case 'x': {
                const uint32_t v = hex_value(i + 1, 2);
                if (is_bytes) out += static_cast<char>(v); else append_utf8(out, v);
                i += 2;
                break;
            }
            case 'u':
            case 'U': {
                if (is_bytes) {
                    out += '\\';
                    out += e;
                    break;
                }
                const size_t count = (e == 'u') ? 4 : 8;
                append_utf8(out, hex_value(i + 1, count));
                i += count;
                break;
            }
            case 'N': {
                // Named escapes are kept verbatim; no Unicode name database here
                const auto close = body.find('}', i);
                if (is_bytes || close == std::string_view::npos) {
                    out += '\\';
                    out += e;
                    break;
                }
                out.append(body.substr(i - 1, close - i + 2));
                i = close;
                break;
            }
            default:
                if (e >= '0' && e <= '7') {
                    uint32_t v = static_cast<uint32_t>(e - '0');
                    for (int k = 0; k < 2 && i + 1 < body.size() &&
                                    body[i + 1] >= '0' && body[i + 1] <= '7'; ++k) {
                        v = v * 8 + static_cast<uint32_t>(body[++i] - '0');
                    }
                    if (is_bytes) out += static_cast<char>(v & 0xFF); else append_utf8(out, v);
                } else {
                    out += '\\';
                    out += e;
                }
                break;
        }
    }
    return out;
}

} // namespace execbox::python

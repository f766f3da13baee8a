//! # Lexer Core
//!
//! Character access, layout handling and the token scanners.

#include "lexer/lexer.hpp"

#include <array>
#include <cctype>

namespace docforge::lexer {

namespace {

constexpr std::array<std::string_view, 5> THREE_CHAR_OPS = {"**=", "//=", ">>=", "<<=", "..."};

constexpr std::array<std::string_view, 19> TWO_CHAR_OPS = {
    "**", "//", ">>", "<<", "<=", ">=", "==", "!=", "->", "+=",
    "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=", ":="};

constexpr size_t MAX_INDENT_LEVELS = 100;

constexpr std::string_view ONE_CHAR_OPS = "+-*/%@&|^~<>()[]{},:;.=";

auto closing_for(char open) -> char {
    switch (open) {
    case '(':
        return ')';
    case '[':
        return ']';
    default:
        return '}';
    }
}

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

} // namespace

Lexer::Lexer(const Source& source) : source_(source) {}

// ============================================================================
// Character Access
// ============================================================================

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_n(size_t n) const -> char {
    return source_.at(pos_ + n);
}

auto Lexer::advance() -> char {
    char c = source_.at(pos_);
    if (pos_ < source_.length()) {
        ++pos_;
    }
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::is_identifier_start(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

auto Lexer::is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || is_digit(c);
}

// ============================================================================
// Token Creation
// ============================================================================

void Lexer::push_token(TokenKind kind) {
    tokens_.push_back(Token{.kind = kind,
                            .lexeme = source_.slice(token_start_, pos_),
                            .span = {source_.location(token_start_), source_.location(pos_)}});
}

void Lexer::push_layout(TokenKind kind, size_t offset) {
    auto loc = source_.location(offset);
    tokens_.push_back(Token{.kind = kind, .lexeme = {}, .span = {loc, loc}});
}

void Lexer::error(const std::string& message, size_t start, size_t end) {
    errors_.push_back(
        LexerError{.message = message, .span = {source_.location(start), source_.location(end)}});
}

// ============================================================================
// Main Loop
// ============================================================================

auto Lexer::tokenize() -> std::vector<Token> {
    while (errors_.empty()) {
        if (at_line_start_ && brackets_.empty()) {
            if (!lex_indentation()) {
                continue;
            }
        }

        if (is_at_end()) {
            lex_end_of_file();
            break;
        }

        char c = peek();
        token_start_ = pos_;

        if (c == ' ' || c == '\t' || c == '\f') {
            advance();
        } else if (c == '#') {
            while (!is_at_end() && peek() != '\n' && peek() != '\r') {
                advance();
            }
        } else if (c == '\\') {
            advance();
            if (peek() == '\r') {
                advance();
            }
            if (peek() == '\n') {
                advance();
            } else if (!is_at_end()) {
                error("unexpected character after line continuation character", token_start_, pos_);
            }
        } else if (c == '\n' || c == '\r') {
            advance();
            if (c == '\r' && peek() == '\n') {
                advance();
            }
            if (brackets_.empty()) {
                push_token(TokenKind::Newline);
                at_line_start_ = true;
            }
        } else if (is_identifier_start(c)) {
            lex_identifier_or_string();
        } else if (is_digit(c) || (c == '.' && is_digit(peek_n(1)))) {
            lex_number();
        } else if (c == '"' || c == '\'') {
            lex_string(0, StringFlags{});
        } else {
            lex_operator();
        }
    }

    if (!errors_.empty()) {
        push_layout(TokenKind::EndOfFile, pos_);
    }
    return std::move(tokens_);
}

// ============================================================================
// Layout
// ============================================================================

auto Lexer::lex_indentation() -> bool {
    size_t line_begin = pos_;
    uint32_t column = 0;
    while (!is_at_end()) {
        char c = peek();
        if (c == ' ') {
            ++column;
        } else if (c == '\t') {
            column = (column / 8 + 1) * 8;
        } else if (c == '\f') {
            column = 0;
        } else {
            break;
        }
        advance();
    }

    char c = peek();
    if (is_at_end()) {
        at_line_start_ = false;
        return true;
    }
    if (c == '#' || c == '\n' || c == '\r') {
        while (!is_at_end() && peek() != '\n' && peek() != '\r') {
            advance();
        }
        if (peek() == '\r') {
            advance();
        }
        if (peek() == '\n') {
            advance();
        }
        return false;
    }

    at_line_start_ = false;
    if (column > indent_stack_.back()) {
        if (indent_stack_.size() > MAX_INDENT_LEVELS) {
            error("too many levels of indentation", line_begin, pos_);
        }
        indent_stack_.push_back(column);
        push_layout(TokenKind::Indent, pos_);
        return true;
    }
    while (column < indent_stack_.back()) {
        indent_stack_.pop_back();
        push_layout(TokenKind::Dedent, pos_);
    }
    if (column != indent_stack_.back()) {
        error("unindent does not match any outer indentation level", line_begin, pos_);
    }
    return true;
}

void Lexer::lex_end_of_file() {
    if (!brackets_.empty()) {
        error(std::string("'") + brackets_.back() + "' was never closed", bracket_offsets_.back(),
              bracket_offsets_.back() + 1);
        return;
    }
    if (!tokens_.empty() && !tokens_.back().is(TokenKind::Newline)) {
        push_layout(TokenKind::Newline, pos_);
    }
    while (indent_stack_.size() > 1) {
        indent_stack_.pop_back();
        push_layout(TokenKind::Dedent, pos_);
    }
    push_layout(TokenKind::EndOfFile, pos_);
}

// ============================================================================
// Names, Numbers, Strings
// ============================================================================

void Lexer::lex_identifier_or_string() {
    while (is_identifier_continue(peek())) {
        advance();
    }
    std::string_view word = source_.slice(token_start_, pos_);

    if ((peek() == '"' || peek() == '\'') && word.size() <= 2) {
        StringFlags flags;
        bool valid = true;
        for (char ch : word) {
            switch (std::tolower(static_cast<unsigned char>(ch))) {
            case 'r':
                valid = valid && !flags.raw;
                flags.raw = true;
                break;
            case 'b':
                valid = valid && !flags.bytes;
                flags.bytes = true;
                break;
            case 'f':
                valid = valid && !flags.formatted;
                flags.formatted = true;
                break;
            case 'u':
                valid = valid && word.size() == 1;
                break;
            default:
                valid = false;
                break;
            }
        }
        if (valid && !(flags.bytes && flags.formatted)) {
            lex_string(word.size(), flags);
            return;
        }
    }

    push_token(is_hard_keyword(word) ? TokenKind::Keyword : TokenKind::Name);
}

void Lexer::lex_number() {
    char next = static_cast<char>(std::tolower(static_cast<unsigned char>(peek_n(1))));
    if (peek() == '0' && (next == 'x' || next == 'o' || next == 'b')) {
        advance();
        advance();
        while (std::isxdigit(static_cast<unsigned char>(peek())) || peek() == '_') {
            advance();
        }
    } else {
        while (is_digit(peek()) || peek() == '_') {
            advance();
        }
        if (peek() == '.') {
            advance();
            while (is_digit(peek()) || peek() == '_') {
                advance();
            }
        }
        if ((peek() == 'e' || peek() == 'E') &&
            (is_digit(peek_n(1)) ||
             ((peek_n(1) == '+' || peek_n(1) == '-') && is_digit(peek_n(2))))) {
            advance();
            if (peek() == '+' || peek() == '-') {
                advance();
            }
            while (is_digit(peek()) || peek() == '_') {
                advance();
            }
        }
        if (peek() == 'j' || peek() == 'J') {
            advance();
        }
    }
    push_token(TokenKind::Number);
}

void Lexer::lex_string(size_t prefix_len, StringFlags flags) {
    char quote = advance();
    flags.prefix_len = static_cast<uint8_t>(prefix_len);
    if (peek() == quote && peek_n(1) == quote) {
        advance();
        advance();
        flags.triple = true;
    }
    if (!scan_string_body(quote, flags.triple, flags.formatted)) {
        return;
    }
    push_token(TokenKind::String);
    tokens_.back().string = flags;
}

auto Lexer::scan_string_body(char quote, bool triple, bool formatted) -> bool {
    while (true) {
        if (is_at_end()) {
            error(triple ? "unterminated triple-quoted string literal"
                         : "unterminated string literal",
                  token_start_, pos_);
            return false;
        }
        char c = peek();
        if (c == '\\') {
            advance();
            if (peek() == '\r' && peek_n(1) == '\n') {
                advance();
            }
            advance();
            continue;
        }
        if (!triple && (c == '\n' || c == '\r')) {
            error("unterminated string literal", token_start_, pos_);
            return false;
        }
        if (c == quote) {
            if (!triple) {
                advance();
                return true;
            }
            if (peek_n(1) == quote && peek_n(2) == quote) {
                advance();
                advance();
                advance();
                return true;
            }
            advance();
            continue;
        }
        if (formatted && c == '{') {
            advance();
            if (peek() == '{') {
                advance();
                continue;
            }
            if (!scan_replacement_field(triple)) {
                return false;
            }
            continue;
        }
        advance();
    }
}

auto Lexer::scan_replacement_field(bool triple) -> bool {
    int depth = 1;
    while (depth > 0) {
        if (is_at_end() || (!triple && (peek() == '\n' || peek() == '\r'))) {
            error("unterminated f-string replacement field", token_start_, pos_);
            return false;
        }
        char c = advance();
        if (c == '{' || c == '[' || c == '(') {
            ++depth;
        } else if (c == '}' || c == ']' || c == ')') {
            --depth;
        } else if (c == '"' || c == '\'') {
            bool nested_triple = peek() == c && peek_n(1) == c;
            if (nested_triple) {
                advance();
                advance();
            }
            if (!scan_string_body(c, nested_triple, false)) {
                return false;
            }
        }
    }
    return true;
}

// ============================================================================
// Operators
// ============================================================================

void Lexer::lex_operator() {
    std::string_view rest = source_.slice(pos_, pos_ + 3);

    for (auto op : THREE_CHAR_OPS) {
        if (rest.starts_with(op)) {
            pos_ += 3;
            push_token(TokenKind::Operator);
            return;
        }
    }
    for (auto op : TWO_CHAR_OPS) {
        if (rest.starts_with(op)) {
            pos_ += 2;
            push_token(TokenKind::Operator);
            return;
        }
    }

    char c = peek();
    if (ONE_CHAR_OPS.find(c) == std::string_view::npos) {
        error(std::string("invalid character '") + c + "'", pos_, pos_ + 1);
        return;
    }

    if (c == '(' || c == '[' || c == '{') {
        brackets_.push_back(c);
        bracket_offsets_.push_back(pos_);
    } else if (c == ')' || c == ']' || c == '}') {
        if (brackets_.empty()) {
            error(std::string("unmatched '") + c + "'", pos_, pos_ + 1);
            return;
        }
        if (closing_for(brackets_.back()) != c) {
            error(std::string("closing parenthesis '") + c +
                      "' does not match opening parenthesis '" + brackets_.back() + "'",
                  pos_, pos_ + 1);
            return;
        }
        brackets_.pop_back();
        bracket_offsets_.pop_back();
    }

    advance();
    push_token(TokenKind::Operator);
}

} // namespace docforge::lexer

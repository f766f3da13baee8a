//! # Tokens
//!
//! Token kinds produced by the Python lexer. Operators and punctuation share
//! one kind and are told apart by their lexeme; hard keywords get their own
//! kind while soft keywords (`match`, `case`, `type`, `_`) stay names.

#ifndef DOCFORGE_LEXER_TOKEN_HPP
#define DOCFORGE_LEXER_TOKEN_HPP

#include "common.hpp"

#include <string_view>

namespace docforge::lexer {

enum class TokenKind : uint8_t {
    Name,
    Keyword,
    Number,
    String,
    Operator,
    Newline,
    Indent,
    Dedent,
    EndOfFile,
};

[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// Prefix flags of a string literal token.
struct StringFlags {
    bool raw = false;
    bool bytes = false;
    bool formatted = false;
    bool triple = false;
    uint8_t prefix_len = 0; ///< Bytes of prefix before the opening quote.
};

struct Token {
    TokenKind kind;
    std::string_view lexeme; ///< View into the Source content.
    SourceSpan span;
    StringFlags string{};

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_op(std::string_view op) const -> bool {
        return kind == TokenKind::Operator && lexeme == op;
    }

    [[nodiscard]] auto is_keyword(std::string_view kw) const -> bool {
        return kind == TokenKind::Keyword && lexeme == kw;
    }

    /// A name token with exactly this text (used for soft keywords).
    [[nodiscard]] auto is_name(std::string_view text) const -> bool {
        return kind == TokenKind::Name && lexeme == text;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::EndOfFile;
    }
};

/// True for Python's hard keywords (`def`, `class`, `True`, ...).
[[nodiscard]] auto is_hard_keyword(std::string_view word) -> bool;

/// Decoded contents of a single string literal lexeme: prefix and quotes
/// stripped, escape sequences resolved unless the literal is raw.
[[nodiscard]] auto string_literal_value(const Token& token) -> std::string;

} // namespace docforge::lexer

#endif // DOCFORGE_LEXER_TOKEN_HPP

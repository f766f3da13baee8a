//! # Python Lexer
//!
//! Converts Python source text into tokens, including the layout tokens
//! `Newline`, `Indent` and `Dedent`.
//!
//! ## Features
//!
//! - **Indentation**: tabs advance to the next multiple of 8; blank and
//!   comment-only lines never produce layout tokens
//! - **Line joining**: implicit inside `()`, `[]`, `{}` and explicit with a
//!   trailing backslash
//! - **Strings**: any combination of `r`, `b`, `f`, `u` prefixes, single or
//!   triple quoted, with nested replacement fields in f-strings
//! - **Numbers**: hex, octal, binary, underscores, exponents, imaginary `j`
//!
//! ## Errors
//!
//! Lexing stops at the first error (unterminated string, inconsistent
//! dedent, unbalanced bracket, stray character). The token list is then
//! truncated and closed with `EndOfFile`, and the error is available from
//! `errors()`.
//!
//! ```cpp
//! Source source = Source::from_string("def f(x):\n    return x\n");
//! Lexer lexer(source);
//! std::vector<Token> tokens = lexer.tokenize();
//! ```

#ifndef DOCFORGE_LEXER_LEXER_HPP
#define DOCFORGE_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <vector>

namespace docforge::lexer {

struct LexerError {
    std::string message;
    SourceSpan span;
};

class Lexer {
public:
    explicit Lexer(const Source& source);

    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    const Source& source_;
    size_t pos_ = 0;
    size_t token_start_ = 0;
    std::vector<Token> tokens_;
    std::vector<LexerError> errors_;

    std::vector<uint32_t> indent_stack_{0};
    std::vector<char> brackets_; ///< Open bracket characters, innermost last.
    std::vector<size_t> bracket_offsets_;
    bool at_line_start_ = true;

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_n(size_t n) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    void push_token(TokenKind kind);
    void push_layout(TokenKind kind, size_t offset);
    void error(const std::string& message, size_t start, size_t end);

    // ========================================================================
    // Scanners
    // ========================================================================

    /// Handles indentation at the start of a logical line. Returns false if
    /// the line was blank and consumed entirely.
    auto lex_indentation() -> bool;
    void lex_end_of_file();
    void lex_identifier_or_string();
    void lex_number();
    void lex_string(size_t prefix_len, StringFlags flags);
    auto scan_string_body(char quote, bool triple, bool formatted) -> bool;
    auto scan_replacement_field(bool triple) -> bool;
    void lex_operator();

    [[nodiscard]] static auto is_identifier_start(char c) -> bool;
    [[nodiscard]] static auto is_identifier_continue(char c) -> bool;
};

} // namespace docforge::lexer

#endif // DOCFORGE_LEXER_LEXER_HPP

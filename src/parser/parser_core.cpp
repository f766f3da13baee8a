//! # Parser Core
//!
//! Token navigation, error construction and the module entry points.

#include "parser/parser.hpp"

#include <algorithm>

namespace docforge::parser {

Parser::Parser(const lexer::Source& source, std::vector<lexer::Token> tokens)
    : source_(source), tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        auto end = source_.location(source_.length());
        tokens_.push_back(
            lexer::Token{.kind = lexer::TokenKind::EndOfFile, .lexeme = {}, .span = {end, end}});
    }
}

// ============================================================================
// Token Navigation
// ============================================================================

auto Parser::peek() const -> const lexer::Token& {
    return tokens_[std::min(pos_, tokens_.size() - 1)];
}

auto Parser::peek_next() const -> const lexer::Token& {
    return tokens_[std::min(pos_ + 1, tokens_.size() - 1)];
}

auto Parser::advance() -> const lexer::Token& {
    const auto& token = peek();
    if (!token.is_eof()) {
        ++pos_;
    }
    switch (token.kind) {
    case lexer::TokenKind::Newline:
    case lexer::TokenKind::Indent:
    case lexer::TokenKind::Dedent:
    case lexer::TokenKind::EndOfFile:
        break;
    default:
        last_end_ = token.span.end;
        break;
    }
    return token;
}

auto Parser::check(lexer::TokenKind kind) const -> bool {
    return peek().kind == kind;
}

auto Parser::check_op(std::string_view op) const -> bool {
    return peek().is_op(op);
}

auto Parser::check_keyword(std::string_view kw) const -> bool {
    return peek().is_keyword(kw);
}

auto Parser::match_op(std::string_view op) -> bool {
    if (check_op(op)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::match_keyword(std::string_view kw) -> bool {
    if (check_keyword(kw)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::expect_op(std::string_view op) -> Result<lexer::Token, ParseError> {
    if (check_op(op)) {
        return advance();
    }
    return error_here("expected '" + std::string(op) + "'");
}

auto Parser::expect_name() -> Result<lexer::Token, ParseError> {
    if (check(lexer::TokenKind::Name)) {
        return advance();
    }
    return error_here("expected identifier");
}

auto Parser::error_here(const std::string& message) const -> ParseError {
    const auto& token = peek();
    std::string text = message;
    if (token.is(lexer::TokenKind::Indent)) {
        text = "unexpected indent";
    } else if (!token.lexeme.empty() && message == "invalid syntax") {
        text = "invalid syntax near '" + std::string(token.lexeme) + "'";
    }
    return ParseError{.message = text, .span = token.span};
}

auto Parser::span_from(const SourceLocation& start) const -> SourceSpan {
    return SourceSpan{start, last_end_};
}

auto Parser::at_expression_start() const -> bool {
    const auto& token = peek();
    switch (token.kind) {
    case lexer::TokenKind::Name:
    case lexer::TokenKind::Number:
    case lexer::TokenKind::String:
        return true;
    case lexer::TokenKind::Keyword:
        return token.lexeme == "not" || token.lexeme == "lambda" || token.lexeme == "await" ||
               token.lexeme == "None" || token.lexeme == "True" || token.lexeme == "False";
    case lexer::TokenKind::Operator:
        return token.lexeme == "(" || token.lexeme == "[" || token.lexeme == "{" ||
               token.lexeme == "-" || token.lexeme == "+" || token.lexeme == "~" ||
               token.lexeme == "..." || token.lexeme == "*";
    default:
        return false;
    }
}

// ============================================================================
// Entry Points
// ============================================================================

auto Parser::parse_module() -> Result<Module, ParseError> {
    Module module;
    while (!check(lexer::TokenKind::EndOfFile)) {
        if (check(lexer::TokenKind::Newline)) {
            advance();
            continue;
        }
        if (check(lexer::TokenKind::Dedent)) {
            return error_here("unexpected unindent");
        }
        auto stmts = parse_statement();
        if (is_err(stmts)) {
            return unwrap_err(stmts);
        }
        for (auto& stmt : unwrap(stmts)) {
            module.body.push_back(std::move(stmt));
        }
    }
    return module;
}

auto parse_source(const lexer::Source& source) -> Result<Module, ParseError> {
    lexer::Lexer lex(source);
    auto tokens = lex.tokenize();
    if (lex.has_errors()) {
        const auto& err = lex.errors().front();
        return ParseError{.message = err.message, .span = err.span};
    }
    Parser parser(source, std::move(tokens));
    return parser.parse_module();
}

} // namespace docforge::parser

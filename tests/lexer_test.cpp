//! # Lexer Tests
//!
//! Token kinds, layout tokens, string prefixes and lexer errors.

#include "lexer/lexer.hpp"
#include "lexer/source.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <memory>

using namespace docforge;
using namespace docforge::lexer;

class LexerTest : public ::testing::Test {
protected:
    // Keep source alive so Token.lexeme (string_view) remains valid
    std::unique_ptr<Source> source_;
    std::vector<LexerError> errors_;

    auto lex(const std::string& code) -> std::vector<Token> {
        source_ = std::make_unique<Source>(Source::from_string(code));
        Lexer lexer(*source_);
        auto tokens = lexer.tokenize();
        errors_ = lexer.errors();
        return tokens;
    }

    auto lex_one(const std::string& code) -> Token {
        auto tokens = lex(code);
        EXPECT_GE(tokens.size(), 1u);
        return tokens[0];
    }

    auto kinds(const std::string& code) -> std::vector<TokenKind> {
        std::vector<TokenKind> result;
        for (const auto& token : lex(code)) {
            result.push_back(token.kind);
        }
        return result;
    }
};

// ============================================================================
// Names and Keywords
// ============================================================================

TEST_F(LexerTest, HardKeywords) {
    EXPECT_EQ(lex_one("def").kind, TokenKind::Keyword);
    EXPECT_EQ(lex_one("class").kind, TokenKind::Keyword);
    EXPECT_EQ(lex_one("return").kind, TokenKind::Keyword);
    EXPECT_EQ(lex_one("yield").kind, TokenKind::Keyword);
    EXPECT_EQ(lex_one("None").kind, TokenKind::Keyword);
    EXPECT_EQ(lex_one("async").kind, TokenKind::Keyword);
}

TEST_F(LexerTest, SoftKeywordsAreNames) {
    EXPECT_EQ(lex_one("match").kind, TokenKind::Name);
    EXPECT_EQ(lex_one("case").kind, TokenKind::Name);
    EXPECT_EQ(lex_one("type").kind, TokenKind::Name);
    EXPECT_EQ(lex_one("_").kind, TokenKind::Name);
}

TEST_F(LexerTest, IdentifierLexeme) {
    auto token = lex_one("compute_total2");
    EXPECT_EQ(token.kind, TokenKind::Name);
    EXPECT_EQ(token.lexeme, "compute_total2");
    EXPECT_EQ(token.span.start.offset, 0u);
    EXPECT_EQ(token.span.end.offset, 14u);
}

// ============================================================================
// Numbers and Operators
// ============================================================================

TEST_F(LexerTest, NumberForms) {
    for (const char* text : {"42", "0x1F", "0o17", "0b1010", "1_000", "3.14", ".5", "1e-3", "2j"}) {
        auto token = lex_one(text);
        EXPECT_EQ(token.kind, TokenKind::Number) << text;
        EXPECT_EQ(token.lexeme, text);
    }
}

TEST_F(LexerTest, LongestOperatorWins) {
    auto tokens = lex("a **= b -> c := d");
    ASSERT_GE(tokens.size(), 7u);
    EXPECT_TRUE(tokens[1].is_op("**="));
    EXPECT_TRUE(tokens[3].is_op("->"));
    EXPECT_TRUE(tokens[5].is_op(":="));
}

// ============================================================================
// Strings
// ============================================================================

TEST_F(LexerTest, StringPrefixes) {
    auto raw = lex_one(R"(r"\d+")");
    EXPECT_EQ(raw.kind, TokenKind::String);
    EXPECT_TRUE(raw.string.raw);
    EXPECT_EQ(string_literal_value(raw), "\\d+");

    auto fstr = lex_one("f'{x!r:>{width}}'");
    EXPECT_EQ(fstr.kind, TokenKind::String);
    EXPECT_TRUE(fstr.string.formatted);

    auto bytes = lex_one("Rb'abc'");
    EXPECT_TRUE(bytes.string.bytes);
    EXPECT_TRUE(bytes.string.raw);
    EXPECT_EQ(bytes.string.prefix_len, 2);
}

TEST_F(LexerTest, TripleQuotedSpansLines) {
    auto tokens = lex("x = \"\"\"first\nsecond\"\"\"\n");
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].kind, TokenKind::String);
    EXPECT_TRUE(tokens[2].string.triple);
    EXPECT_EQ(string_literal_value(tokens[2]), "first\nsecond");
    EXPECT_EQ(tokens[2].span.end.line, 2u);
}

TEST_F(LexerTest, EscapesDecoded) {
    EXPECT_EQ(string_literal_value(lex_one(R"('a\tb\'c')")), "a\tb'c");
}

// ============================================================================
// Layout
// ============================================================================

TEST_F(LexerTest, IndentAndDedent) {
    auto result = kinds("def f():\n    return 1\nx\n");
    std::vector<TokenKind> expected = {
        TokenKind::Keyword,  TokenKind::Name,    TokenKind::Operator, TokenKind::Operator,
        TokenKind::Operator, TokenKind::Newline, TokenKind::Indent,   TokenKind::Keyword,
        TokenKind::Number,   TokenKind::Newline, TokenKind::Dedent,   TokenKind::Name,
        TokenKind::Newline,  TokenKind::EndOfFile};
    EXPECT_EQ(result, expected);
}

TEST_F(LexerTest, BlankAndCommentLinesHaveNoLayout) {
    auto result = kinds("if a:\n\n    # note\n        \n    b\n");
    std::vector<TokenKind> expected = {
        TokenKind::Keyword, TokenKind::Name,    TokenKind::Operator, TokenKind::Newline,
        TokenKind::Indent,  TokenKind::Name,    TokenKind::Newline,  TokenKind::Dedent,
        TokenKind::EndOfFile};
    EXPECT_EQ(result, expected);
}

TEST_F(LexerTest, NewlinesInsideBracketsAreJoined) {
    auto result = kinds("f(a,\n  b)\n");
    EXPECT_EQ(std::count(result.begin(), result.end(), TokenKind::Newline), 1);
    EXPECT_EQ(std::count(result.begin(), result.end(), TokenKind::Indent), 0);
}

TEST_F(LexerTest, BackslashContinuation) {
    auto result = kinds("x = 1 + \\\n    2\n");
    EXPECT_EQ(std::count(result.begin(), result.end(), TokenKind::Newline), 1);
    EXPECT_EQ(std::count(result.begin(), result.end(), TokenKind::Indent), 0);
}

TEST_F(LexerTest, MissingFinalNewlineIsAdded) {
    auto result = kinds("def f():\n    pass");
    ASSERT_GE(result.size(), 3u);
    EXPECT_EQ(result[result.size() - 3], TokenKind::Newline);
    EXPECT_EQ(result[result.size() - 2], TokenKind::Dedent);
    EXPECT_EQ(result.back(), TokenKind::EndOfFile);
}

TEST_F(LexerTest, EmptyInput) {
    auto result = kinds("");
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], TokenKind::EndOfFile);
    EXPECT_TRUE(errors_.empty());
}

TEST_F(LexerTest, TabsAdvanceToMultipleOfEight) {
    // A tab and eight spaces are the same indentation level
    auto result = kinds("if a:\n\tb\n        c\n");
    EXPECT_TRUE(errors_.empty());
    EXPECT_EQ(std::count(result.begin(), result.end(), TokenKind::Indent), 1);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(LexerTest, UnterminatedString) {
    auto tokens = lex("x = 'abc\n");
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].message, "unterminated string literal");
    EXPECT_TRUE(tokens.back().is_eof());
}

TEST_F(LexerTest, InconsistentDedent) {
    (void)lex("if a:\n        b\n    c\n");
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].message, "unindent does not match any outer indentation level");
    EXPECT_EQ(errors_[0].span.start.line, 3u);
}

TEST_F(LexerTest, UnclosedBracket) {
    (void)lex("f(a, b\n");
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].message, "'(' was never closed");
    EXPECT_EQ(errors_[0].span.start.offset, 1u);
}

TEST_F(LexerTest, MismatchedBracket) {
    (void)lex("f(a]\n");
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].message,
              "closing parenthesis ']' does not match opening parenthesis '('");
}

TEST_F(LexerTest, StrayCharacter) {
    (void)lex("x = 1 $ 2\n");
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].message, "invalid character '$'");
}

// ============================================================================
// Source
// ============================================================================

TEST(SourceTest, LocationAndLines) {
    auto source = Source::from_string("def f():\n    pass\n");
    auto loc = source.location(13);
    EXPECT_EQ(loc.line, 2u);
    EXPECT_EQ(loc.column, 5u);
    EXPECT_EQ(source.line(2), "    pass");
    EXPECT_EQ(source.newline(), "\n");
}

TEST(SourceTest, DetectsCrlf) {
    auto source = Source::from_string("a = 1\r\nb = 2\r\n");
    EXPECT_EQ(source.newline(), "\r\n");
    EXPECT_EQ(source.line(1), "a = 1");
}

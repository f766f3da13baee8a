//! # Python Parser
//!
//! Recursive descent parser over the token stream from `lexer::Lexer`.
//! Binary arithmetic and bitwise operators are parsed by precedence
//! climbing; the boolean, comparison and conditional layers follow the
//! grammar's own nesting.
//!
//! ## Error Handling
//!
//! Parsing stops at the first syntax error. `parse_source` also folds lexer
//! errors into the same `ParseError` shape, so callers see one error type.
//!
//! ```cpp
//! auto source = lexer::Source::from_string(text, "mod.py");
//! auto result = parser::parse_source(source);
//! if (is_err(result)) {
//!     const auto& err = unwrap_err(result);
//!     std::cerr << err.span.start.line << ": " << err.message << "\n";
//! }
//! ```

#ifndef DOCFORGE_PARSER_PARSER_HPP
#define DOCFORGE_PARSER_PARSER_HPP

#include "common.hpp"
#include "lexer/lexer.hpp"
#include "parser/ast.hpp"

#include <vector>

namespace docforge::parser {

struct ParseError {
    std::string message;
    SourceSpan span;
};

// ============================================================================
// Operator Precedence
// ============================================================================

/// Binding power of binary operators between `|` and `**`.
namespace precedence {
constexpr int NONE = 0;
constexpr int BIT_OR = 1;
constexpr int BIT_XOR = 2;
constexpr int BIT_AND = 3;
constexpr int SHIFT = 4;
constexpr int TERM = 5;   // + -
constexpr int FACTOR = 6; // * / // % @
} // namespace precedence

/// Recursion bound shared by expressions and blocks.
constexpr int MAX_NESTING = 200;

/// Longest left-leaning chain of binary operators or trailers in one
/// expression, e.g. `a + b + ...` or `f()()...`.
constexpr size_t MAX_CHAIN_LENGTH = 1000;

/// Bounds recursion for pathological inputs.
class NestingGuard {
public:
    explicit NestingGuard(int& depth) : depth_(depth) {
        ++depth_;
    }
    ~NestingGuard() {
        --depth_;
    }
    NestingGuard(const NestingGuard&) = delete;
    auto operator=(const NestingGuard&) -> NestingGuard& = delete;

    [[nodiscard]] auto exceeded() const -> bool {
        return depth_ > MAX_NESTING;
    }

private:
    int& depth_;
};

class Parser {
public:
    /// `tokens` must end with EndOfFile and view into `source`.
    Parser(const lexer::Source& source, std::vector<lexer::Token> tokens);

    [[nodiscard]] auto parse_module() -> Result<Module, ParseError>;

private:
    const lexer::Source& source_;
    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;
    SourceLocation last_end_; ///< End of the last non-layout token consumed.
    int depth_ = 0;

    // ========================================================================
    // Token Navigation
    // ========================================================================

    [[nodiscard]] auto peek() const -> const lexer::Token&;
    [[nodiscard]] auto peek_next() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;
    [[nodiscard]] auto check_op(std::string_view op) const -> bool;
    [[nodiscard]] auto check_keyword(std::string_view kw) const -> bool;
    auto match_op(std::string_view op) -> bool;
    auto match_keyword(std::string_view kw) -> bool;
    auto expect_op(std::string_view op) -> Result<lexer::Token, ParseError>;
    auto expect_name() -> Result<lexer::Token, ParseError>;
    [[nodiscard]] auto error_here(const std::string& message) const -> ParseError;
    [[nodiscard]] auto span_from(const SourceLocation& start) const -> SourceSpan;

    /// True when the current token can begin an expression.
    [[nodiscard]] auto at_expression_start() const -> bool;

    // ========================================================================
    // Statements
    // ========================================================================

    auto parse_statement() -> Result<Suite, ParseError>;
    auto parse_simple_line() -> Result<Suite, ParseError>;
    auto parse_simple_statement() -> Result<StmtPtr, ParseError>;
    auto parse_expression_statement() -> Result<StmtPtr, ParseError>;
    auto parse_import() -> Result<StmtPtr, ParseError>;
    auto parse_block(BlockLayout* layout, std::string_view context, uint32_t header_line)
        -> Result<Suite, ParseError>;

    auto parse_decorated() -> Result<StmtPtr, ParseError>;
    auto parse_function(std::vector<ExprPtr> decorators,
                        std::optional<SourceLocation> decorator_start)
        -> Result<StmtPtr, ParseError>;
    auto parse_class(std::vector<ExprPtr> decorators,
                     std::optional<SourceLocation> decorator_start)
        -> Result<StmtPtr, ParseError>;
    auto parse_parameters(std::string_view closer, bool annotations)
        -> Result<std::vector<Parameter>, ParseError>;
    auto skip_type_params() -> Result<std::string, ParseError>;

    auto parse_if() -> Result<StmtPtr, ParseError>;
    auto parse_while() -> Result<StmtPtr, ParseError>;
    auto parse_for(const SourceLocation& start, bool is_async) -> Result<StmtPtr, ParseError>;
    auto parse_try() -> Result<StmtPtr, ParseError>;
    auto parse_with(const SourceLocation& start, bool is_async) -> Result<StmtPtr, ParseError>;
    auto parse_with_items(bool parenthesized) -> Result<std::vector<WithItem>, ParseError>;
    auto try_parse_match() -> Result<StmtPtr, ParseError>;
    auto parse_type_alias() -> Result<StmtPtr, ParseError>;

    // ========================================================================
    // Expressions
    // ========================================================================

    /// `a, *b, c` as a tuple, or a single expression without a comma.
    auto parse_testlist(bool allow_star) -> Result<ExprPtr, ParseError>;
    /// Target list of `for`: bitwise-level expressions separated by commas.
    auto parse_exprlist() -> Result<ExprPtr, ParseError>;
    auto parse_star_or_test() -> Result<ExprPtr, ParseError>;
    auto parse_named_expr() -> Result<ExprPtr, ParseError>;
    auto parse_test() -> Result<ExprPtr, ParseError>;
    auto parse_lambda() -> Result<ExprPtr, ParseError>;
    auto parse_or_test() -> Result<ExprPtr, ParseError>;
    auto parse_and_test() -> Result<ExprPtr, ParseError>;
    auto parse_not_test() -> Result<ExprPtr, ParseError>;
    auto parse_comparison() -> Result<ExprPtr, ParseError>;
    auto parse_binary(int min_precedence) -> Result<ExprPtr, ParseError>;
    auto parse_factor() -> Result<ExprPtr, ParseError>;
    auto parse_power() -> Result<ExprPtr, ParseError>;
    auto parse_primary() -> Result<ExprPtr, ParseError>;
    auto parse_atom() -> Result<ExprPtr, ParseError>;
    auto parse_strings() -> Result<ExprPtr, ParseError>;
    auto parse_paren_atom() -> Result<ExprPtr, ParseError>;
    auto parse_list_atom() -> Result<ExprPtr, ParseError>;
    auto parse_brace_atom() -> Result<ExprPtr, ParseError>;
    auto parse_call_args() -> Result<std::vector<Argument>, ParseError>;
    auto parse_subscript() -> Result<ExprPtr, ParseError>;
    auto parse_slice_item() -> Result<ExprPtr, ParseError>;
    auto parse_yield() -> Result<ExprPtr, ParseError>;
    auto parse_comprehension_clauses() -> Result<std::vector<Comprehension>, ParseError>;

    [[nodiscard]] auto binary_precedence(const lexer::Token& token) const -> int;
};

/// Lexes and parses a whole file.
[[nodiscard]] auto parse_source(const lexer::Source& source) -> Result<Module, ParseError>;

} // namespace docforge::parser

#endif // DOCFORGE_PARSER_PARSER_HPP

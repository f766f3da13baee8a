//! # Parser Tests
//!
//! Statement and expression shapes, definition layouts and syntax errors.

#include "parser/parser.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string_view>

using namespace docforge;
using namespace docforge::parser;

namespace {

auto repeat(std::string_view text, size_t count) -> std::string {
    std::string out;
    out.reserve(text.size() * count);
    for (size_t i = 0; i < count; ++i) {
        out += text;
    }
    return out;
}

/// `depth` nested `if` blocks, one space of indentation per level.
auto nested_ifs(size_t depth) -> std::string {
    std::string out;
    for (size_t i = 0; i < depth; ++i) {
        out += std::string(i, ' ') + "if x:\n";
    }
    out += std::string(depth, ' ') + "pass\n";
    return out;
}

} // namespace

class ParserTest : public ::testing::Test {
protected:
    std::unique_ptr<lexer::Source> source_;

    auto parse(const std::string& code) -> Result<Module, ParseError> {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code, "test.py"));
        return parse_source(*source_);
    }

    auto parse_ok(const std::string& code) -> Module {
        auto result = parse(code);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).message : "");
        if (is_err(result)) {
            return Module{};
        }
        return std::move(unwrap(result));
    }

    auto parse_error(const std::string& code) -> ParseError {
        auto result = parse(code);
        EXPECT_TRUE(is_err(result));
        if (is_ok(result)) {
            return ParseError{};
        }
        return unwrap_err(result);
    }

    /// The value of a single expression statement.
    auto parse_expr(const std::string& code) -> ExprPtr {
        auto module = parse_ok(code + "\n");
        EXPECT_EQ(module.body.size(), 1u);
        if (module.body.empty() || !module.body[0]->is<ExprStmt>()) {
            return nullptr;
        }
        return std::move(module.body[0]->as<ExprStmt>().expr);
    }
};

// ============================================================================
// Definitions
// ============================================================================

TEST_F(ParserTest, FunctionSignature) {
    auto module = parse_ok("def f(a, b: int = 1, /, c=None, *args, d, **kwargs) -> str:\n"
                           "    return a\n");
    ASSERT_EQ(module.body.size(), 1u);
    ASSERT_TRUE(module.body[0]->is<FunctionDef>());

    const auto& func = module.body[0]->as<FunctionDef>();
    EXPECT_EQ(func.name, "f");
    ASSERT_EQ(func.params.size(), 6u);
    EXPECT_EQ(func.params[0].kind, ParamKind::PositionalOnly);
    EXPECT_EQ(func.params[1].kind, ParamKind::PositionalOnly);
    ASSERT_NE(func.params[1].annotation, nullptr);
    ASSERT_NE(func.params[1].default_value, nullptr);
    EXPECT_EQ(func.params[2].kind, ParamKind::Positional);
    EXPECT_EQ(func.params[3].kind, ParamKind::VarPositional);
    EXPECT_EQ(func.params[3].name, "args");
    EXPECT_EQ(func.params[4].kind, ParamKind::KeywordOnly);
    EXPECT_EQ(func.params[5].kind, ParamKind::VarKeyword);
    ASSERT_NE(func.returns, nullptr);
    EXPECT_EQ(func.returns->as<NameExpr>().name, "str");
}

TEST_F(ParserTest, BareStarMakesKeywordOnly) {
    auto module = parse_ok("def f(a, *, b):\n    pass\n");
    const auto& func = module.body[0]->as<FunctionDef>();
    ASSERT_EQ(func.params.size(), 2u);
    EXPECT_EQ(func.params[1].kind, ParamKind::KeywordOnly);
}

TEST_F(ParserTest, DecoratedAsyncFunction) {
    auto module = parse_ok("@cache\n@retry(times=3)\nasync def fetch(url):\n    pass\n");
    const auto& func = module.body[0]->as<FunctionDef>();
    EXPECT_TRUE(func.is_async);
    EXPECT_EQ(func.decorators.size(), 2u);
    ASSERT_TRUE(func.decorator_start.has_value());
    EXPECT_EQ(func.decorator_start->line, 1u);
    // The statement span starts at `async`, not at the decorators
    EXPECT_EQ(module.body[0]->span.start.line, 3u);
}

TEST_F(ParserTest, BlockLayout) {
    auto module = parse_ok("def f(x):\n    return x\n");
    const auto& layout = module.body[0]->as<FunctionDef>().layout;
    EXPECT_FALSE(layout.inline_body);
    EXPECT_EQ(layout.colon_end, 9u);
    EXPECT_EQ(layout.header_line, 1u);
}

TEST_F(ParserTest, InlineBody) {
    auto module = parse_ok("def f(): return 1\n");
    const auto& func = module.body[0]->as<FunctionDef>();
    EXPECT_TRUE(func.layout.inline_body);
    ASSERT_EQ(func.body.size(), 1u);
    EXPECT_TRUE(func.body[0]->is<ReturnStmt>());
}

TEST_F(ParserTest, ClassWithBasesAndMethods) {
    auto module = parse_ok("class Stack(Base, metaclass=Meta):\n"
                           "    size: int = 0\n"
                           "\n"
                           "    def push(self, item):\n"
                           "        self.items.append(item)\n");
    const auto& cls = module.body[0]->as<ClassDef>();
    EXPECT_EQ(cls.name, "Stack");
    ASSERT_EQ(cls.bases.size(), 2u);
    EXPECT_EQ(cls.bases[1].keyword, "metaclass");
    ASSERT_EQ(cls.body.size(), 2u);
    EXPECT_TRUE(cls.body[0]->is<AssignStmt>());
    EXPECT_TRUE(cls.body[1]->is<FunctionDef>());
}

TEST_F(ParserTest, GenericTypeParameters) {
    auto module = parse_ok("def first[T](items: list[T]) -> T:\n    return items[0]\n");
    EXPECT_EQ(module.body[0]->as<FunctionDef>().type_params, "[T]");
}

// ============================================================================
// Statements
// ============================================================================

TEST_F(ParserTest, IfElifElse) {
    auto module = parse_ok("if a:\n    x = 1\nelif b:\n    x = 2\nelse:\n    x = 3\n");
    const auto& stmt = module.body[0]->as<IfStmt>();
    ASSERT_EQ(stmt.orelse.size(), 1u);
    ASSERT_TRUE(stmt.orelse[0]->is<IfStmt>());
    EXPECT_EQ(stmt.orelse[0]->as<IfStmt>().orelse.size(), 1u);
}

TEST_F(ParserTest, TryHandlers) {
    auto module = parse_ok("try:\n    f()\n"
                           "except (ValueError, TypeError) as exc:\n    raise\n"
                           "except:\n    pass\n"
                           "finally:\n    g()\n");
    const auto& stmt = module.body[0]->as<TryStmt>();
    ASSERT_EQ(stmt.handlers.size(), 2u);
    EXPECT_EQ(stmt.handlers[0].name, "exc");
    EXPECT_EQ(stmt.handlers[1].type, nullptr);
    EXPECT_EQ(stmt.finalbody.size(), 1u);
}

TEST_F(ParserTest, RaiseFrom) {
    auto module = parse_ok("raise KeyError(key) from exc\n");
    const auto& stmt = module.body[0]->as<RaiseStmt>();
    ASSERT_NE(stmt.exception, nullptr);
    EXPECT_TRUE(stmt.exception->is<CallExpr>());
    EXPECT_NE(stmt.cause, nullptr);
}

TEST_F(ParserTest, SemicolonSeparatedStatements) {
    auto module = parse_ok("a = 1; b = 2; pass\n");
    EXPECT_EQ(module.body.size(), 3u);
}

TEST_F(ParserTest, MatchStatement) {
    auto module = parse_ok("match command:\n"
                           "    case [x, y] if x > 0:\n"
                           "        pass\n"
                           "    case _:\n"
                           "        pass\n");
    ASSERT_TRUE(module.body[0]->is<MatchStmt>());
    const auto& stmt = module.body[0]->as<MatchStmt>();
    ASSERT_EQ(stmt.cases.size(), 2u);
    EXPECT_NE(stmt.cases[0].guard, nullptr);
}

TEST_F(ParserTest, MatchAsPlainName) {
    auto module = parse_ok("match = 1\nmatch.group(0)\n");
    ASSERT_EQ(module.body.size(), 2u);
    EXPECT_TRUE(module.body[0]->is<AssignStmt>());
}

TEST_F(ParserTest, WithItems) {
    auto module = parse_ok("with open(p) as f, lock:\n    pass\n");
    const auto& stmt = module.body[0]->as<WithStmt>();
    ASSERT_EQ(stmt.items.size(), 2u);
    EXPECT_NE(stmt.items[0].target, nullptr);
    EXPECT_EQ(stmt.items[1].target, nullptr);
}

// ============================================================================
// Expressions
// ============================================================================

TEST_F(ParserTest, BinaryPrecedence) {
    auto expr = parse_expr("a + b * c");
    ASSERT_NE(expr, nullptr);
    const auto& add = expr->as<BinaryExpr>();
    EXPECT_EQ(add.op, "+");
    EXPECT_EQ(add.right->as<BinaryExpr>().op, "*");
}

TEST_F(ParserTest, PowerBindsTighterThanUnaryMinus) {
    auto expr = parse_expr("-x ** 2");
    ASSERT_NE(expr, nullptr);
    const auto& neg = expr->as<UnaryExpr>();
    EXPECT_EQ(neg.op, "-");
    EXPECT_EQ(neg.operand->as<BinaryExpr>().op, "**");
}

TEST_F(ParserTest, ChainedComparison) {
    auto expr = parse_expr("0 <= i < n and x is not None");
    ASSERT_NE(expr, nullptr);
    const auto& bool_op = expr->as<BoolOpExpr>();
    ASSERT_EQ(bool_op.values.size(), 2u);
    const auto& chain = bool_op.values[0]->as<CompareExpr>();
    EXPECT_EQ(chain.ops, (std::vector<std::string>{"<=", "<"}));
    EXPECT_EQ(bool_op.values[1]->as<CompareExpr>().ops[0], "is not");
}

TEST_F(ParserTest, ImplicitStringConcatenation) {
    auto expr = parse_expr("'abc' \"def\"");
    ASSERT_NE(expr, nullptr);
    const auto& constant = expr->as<ConstantExpr>();
    EXPECT_EQ(constant.kind, ConstantKind::Str);
    EXPECT_EQ(constant.value, "abcdef");
}

TEST_F(ParserTest, Comprehensions) {
    auto expr = parse_expr("{k: v for k, v in items if v}");
    ASSERT_NE(expr, nullptr);
    const auto& comp = expr->as<ComprehensionExpr>();
    EXPECT_EQ(comp.kind, ComprehensionKind::Dict);
    ASSERT_EQ(comp.generators.size(), 1u);
    EXPECT_EQ(comp.generators[0].ifs.size(), 1u);
}

TEST_F(ParserTest, LambdaAndConditional) {
    auto expr = parse_expr("lambda x, y=2: x if x else y");
    ASSERT_NE(expr, nullptr);
    const auto& lambda = expr->as<LambdaExpr>();
    EXPECT_EQ(lambda.params.size(), 2u);
    EXPECT_TRUE(lambda.body->is<IfExpr>());
}

TEST_F(ParserTest, SubscriptSlice) {
    auto expr = parse_expr("items[1:-1:2]");
    ASSERT_NE(expr, nullptr);
    const auto& sub = expr->as<SubscriptExpr>();
    ASSERT_TRUE(sub.index->is<SliceExpr>());
    EXPECT_NE(sub.index->as<SliceExpr>().step, nullptr);
}

TEST_F(ParserTest, YieldFrom) {
    auto module = parse_ok("def g():\n    yield from range(3)\n");
    const auto& body = module.body[0]->as<FunctionDef>().body;
    const auto& expr = body[0]->as<ExprStmt>().expr;
    ASSERT_TRUE(expr->is<YieldExpr>());
    EXPECT_TRUE(expr->as<YieldExpr>().is_from);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ParserTest, EmptyModule) {
    EXPECT_TRUE(parse_ok("").body.empty());
    EXPECT_TRUE(parse_ok("# only a comment\n\n").body.empty());
}

TEST_F(ParserTest, MissingIndentedBlock) {
    auto err = parse_error("def f():\nreturn 1\n");
    EXPECT_EQ(err.message, "expected an indented block after function definition on line 1");
    EXPECT_EQ(err.span.start.line, 2u);
}

TEST_F(ParserTest, MissingColon) {
    auto err = parse_error("def f()\n    pass\n");
    EXPECT_EQ(err.message, "expected ':'");
    EXPECT_EQ(err.span.start.line, 1u);
}

TEST_F(ParserTest, UnexpectedIndent) {
    auto err = parse_error("x = 1\n    y = 2\n");
    EXPECT_EQ(err.message, "unexpected indent");
}

TEST_F(ParserTest, LexerErrorsSurfaceAsParseErrors) {
    auto err = parse_error("def f(:\n");
    EXPECT_FALSE(err.message.empty());

    auto unterminated = parse_error("s = 'abc\n");
    EXPECT_EQ(unterminated.message, "unterminated string literal");
    EXPECT_EQ(unterminated.span.start.line, 1u);
}

// ============================================================================
// Nesting Limits
// ============================================================================

TEST_F(ParserTest, DeepUnaryChainsAreRejected) {
    EXPECT_EQ(parse_error("x = " + repeat("-", 20000) + "1\n").message,
              "too many nested expressions");
    EXPECT_EQ(parse_error("x = " + repeat("~", 20000) + "1\n").message,
              "too many nested expressions");
    EXPECT_EQ(parse_error("x = " + repeat("not ", 20000) + "1\n").message,
              "too many nested expressions");
}

TEST_F(ParserTest, DeepPowerAndAwaitChainsAreRejected) {
    EXPECT_EQ(parse_error("x = " + repeat("2 ** ", 20000) + "2\n").message,
              "too many nested expressions");
    EXPECT_EQ(
        parse_error("async def f():\n    x = " + repeat("await ", 20000) + "y\n").message,
        "too many nested expressions");
}

TEST_F(ParserTest, ModerateNestingIsAccepted) {
    EXPECT_NE(parse_expr(repeat("-", 50) + "1"), nullptr);
    EXPECT_NE(parse_expr(repeat("not ", 50) + "x"), nullptr);
    EXPECT_NE(parse_expr(repeat("(", 40) + "x" + repeat(")", 40)), nullptr);
    EXPECT_EQ(parse_ok(nested_ifs(60)).body.size(), 1u);
}

TEST_F(ParserTest, DeepIndentationIsRejected) {
    auto err = parse_error(nested_ifs(5000));
    EXPECT_EQ(err.message, "too many levels of indentation");
    EXPECT_EQ(err.span.start.line, 102u);
}

TEST_F(ParserTest, LongChainsAreRejected) {
    EXPECT_NE(parse_expr(repeat("a + ", 500) + "a"), nullptr);
    EXPECT_EQ(parse_error("x = " + repeat("a + ", 1500) + "a\n").message,
              "expression is too long");
    EXPECT_EQ(parse_error("x = a" + repeat(".b", 1500) + "\n").message,
              "expression is too long");
    EXPECT_EQ(parse_error("x = f" + repeat("()", 1500) + "\n").message,
              "expression is too long");
}

//! # Statement Parsing
//!
//! Simple and compound statements, blocks, and the `def`/`class` headers
//! whose layout the extractor and injector rely on.

#include "parser/parser.hpp"

#include <array>

namespace docforge::parser {

namespace {

auto single(StmtPtr stmt) -> Suite {
    Suite suite;
    suite.push_back(std::move(stmt));
    return suite;
}

constexpr std::array<std::string_view, 13> AUGMENTED_OPS = {
    "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**="};

} // namespace

// ============================================================================
// Dispatch
// ============================================================================

auto Parser::parse_statement() -> Result<Suite, ParseError> {
    const auto& token = peek();
    if (token.is(lexer::TokenKind::Indent)) {
        return error_here("unexpected indent");
    }

    if (check_op("@")) {
        auto stmt = parse_decorated();
        if (is_err(stmt))
            return unwrap_err(stmt);
        return single(std::move(unwrap(stmt)));
    }

    Result<StmtPtr, ParseError> compound = StmtPtr{};
    auto start = token.span.start;
    if (token.is_keyword("def")) {
        compound = parse_function({}, std::nullopt);
    } else if (token.is_keyword("class")) {
        compound = parse_class({}, std::nullopt);
    } else if (token.is_keyword("if")) {
        compound = parse_if();
    } else if (token.is_keyword("while")) {
        compound = parse_while();
    } else if (token.is_keyword("for")) {
        compound = parse_for(start, false);
    } else if (token.is_keyword("try")) {
        compound = parse_try();
    } else if (token.is_keyword("with")) {
        compound = parse_with(start, false);
    } else if (token.is_keyword("async")) {
        const auto& next = peek_next();
        if (next.is_keyword("def")) {
            compound = parse_function({}, std::nullopt);
        } else if (next.is_keyword("for")) {
            advance();
            compound = parse_for(start, true);
        } else if (next.is_keyword("with")) {
            advance();
            compound = parse_with(start, true);
        } else {
            advance();
            return error_here("expected 'def', 'for' or 'with' after 'async'");
        }
    } else if (token.is_name("match")) {
        compound = try_parse_match();
    }

    if (is_err(compound)) {
        return unwrap_err(compound);
    }
    if (unwrap(compound)) {
        return single(std::move(unwrap(compound)));
    }
    return parse_simple_line();
}

auto Parser::parse_simple_line() -> Result<Suite, ParseError> {
    Suite out;
    while (true) {
        auto stmt = parse_simple_statement();
        if (is_err(stmt))
            return unwrap_err(stmt);
        out.push_back(std::move(unwrap(stmt)));
        if (match_op(";")) {
            if (check(lexer::TokenKind::Newline)) {
                break;
            }
            continue;
        }
        break;
    }
    if (!check(lexer::TokenKind::Newline)) {
        return error_here("invalid syntax");
    }
    advance();
    return out;
}

// ============================================================================
// Simple Statements
// ============================================================================

auto Parser::parse_simple_statement() -> Result<StmtPtr, ParseError> {
    const auto& token = peek();
    auto start = token.span.start;

    if (token.is_keyword("pass") || token.is_keyword("break") || token.is_keyword("continue")) {
        std::string keyword(advance().lexeme);
        return make_stmt(KeywordStmt{.keyword = keyword, .names = {}}, span_from(start));
    }

    if (token.is_keyword("return")) {
        advance();
        ExprPtr value;
        if (at_expression_start()) {
            auto expr = parse_testlist(true);
            if (is_err(expr))
                return unwrap_err(expr);
            value = std::move(unwrap(expr));
        }
        return make_stmt(ReturnStmt{.value = std::move(value)}, span_from(start));
    }

    if (token.is_keyword("raise")) {
        advance();
        RaiseStmt raise;
        if (at_expression_start()) {
            auto exc = parse_test();
            if (is_err(exc))
                return unwrap_err(exc);
            raise.exception = std::move(unwrap(exc));
            if (match_keyword("from")) {
                auto cause = parse_test();
                if (is_err(cause))
                    return unwrap_err(cause);
                raise.cause = std::move(unwrap(cause));
            }
        }
        return make_stmt(std::move(raise), span_from(start));
    }

    if (token.is_keyword("global") || token.is_keyword("nonlocal")) {
        KeywordStmt stmt{.keyword = std::string(advance().lexeme), .names = {}};
        do {
            auto name = expect_name();
            if (is_err(name))
                return unwrap_err(name);
            stmt.names.emplace_back(unwrap(name).lexeme);
        } while (match_op(","));
        return make_stmt(std::move(stmt), span_from(start));
    }

    if (token.is_keyword("del")) {
        advance();
        auto targets = parse_exprlist();
        if (is_err(targets))
            return unwrap_err(targets);
        DelStmt del;
        del.targets.push_back(std::move(unwrap(targets)));
        return make_stmt(std::move(del), span_from(start));
    }

    if (token.is_keyword("assert")) {
        advance();
        auto test = parse_test();
        if (is_err(test))
            return unwrap_err(test);
        AssertStmt stmt{.test = std::move(unwrap(test)), .message = nullptr};
        if (match_op(",")) {
            auto message = parse_test();
            if (is_err(message))
                return unwrap_err(message);
            stmt.message = std::move(unwrap(message));
        }
        return make_stmt(std::move(stmt), span_from(start));
    }

    if (token.is_keyword("import") || token.is_keyword("from")) {
        return parse_import();
    }

    if (token.is_name("type") && peek_next().is(lexer::TokenKind::Name) &&
        pos_ + 2 < tokens_.size() &&
        (tokens_[pos_ + 2].is_op("=") || tokens_[pos_ + 2].is_op("["))) {
        return parse_type_alias();
    }

    return parse_expression_statement();
}

auto Parser::parse_expression_statement() -> Result<StmtPtr, ParseError> {
    auto start = peek().span.start;

    auto parse_rhs = [this]() -> Result<ExprPtr, ParseError> {
        if (check_keyword("yield")) {
            return parse_yield();
        }
        return parse_testlist(true);
    };

    auto first = parse_rhs();
    if (is_err(first))
        return unwrap_err(first);

    // Annotated assignment: `x: int = 0`
    if (match_op(":")) {
        auto annotation = parse_test();
        if (is_err(annotation))
            return unwrap_err(annotation);
        AssignStmt assign;
        assign.targets.push_back(std::move(unwrap(first)));
        assign.annotation = std::move(unwrap(annotation));
        if (match_op("=")) {
            auto value = parse_rhs();
            if (is_err(value))
                return unwrap_err(value);
            assign.value = std::move(unwrap(value));
        }
        return make_stmt(std::move(assign), span_from(start));
    }

    for (auto op : AUGMENTED_OPS) {
        if (check_op(op)) {
            advance();
            auto value = parse_rhs();
            if (is_err(value))
                return unwrap_err(value);
            return make_stmt(AugAssignStmt{.target = std::move(unwrap(first)),
                                           .op = std::string(op.substr(0, op.size() - 1)),
                                           .value = std::move(unwrap(value))},
                             span_from(start));
        }
    }

    if (check_op("=")) {
        AssignStmt assign;
        ExprPtr last = std::move(unwrap(first));
        while (match_op("=")) {
            auto next = parse_rhs();
            if (is_err(next))
                return unwrap_err(next);
            assign.targets.push_back(std::move(last));
            last = std::move(unwrap(next));
        }
        assign.value = std::move(last);
        return make_stmt(std::move(assign), span_from(start));
    }

    return make_stmt(ExprStmt{.expr = std::move(unwrap(first))}, span_from(start));
}

auto Parser::parse_import() -> Result<StmtPtr, ParseError> {
    auto start = peek().span.start;
    ImportStmt stmt;

    auto dotted_name = [this]() -> Result<std::string, ParseError> {
        auto first = expect_name();
        if (is_err(first))
            return unwrap_err(first);
        std::string name(unwrap(first).lexeme);
        while (match_op(".")) {
            auto part = expect_name();
            if (is_err(part))
                return unwrap_err(part);
            name += ".";
            name += unwrap(part).lexeme;
        }
        return name;
    };

    if (match_keyword("import")) {
        do {
            auto name = dotted_name();
            if (is_err(name))
                return unwrap_err(name);
            std::string bound = unwrap(name);
            if (match_keyword("as")) {
                auto alias = expect_name();
                if (is_err(alias))
                    return unwrap_err(alias);
                bound = std::string(unwrap(alias).lexeme);
            }
            stmt.names.push_back(std::move(bound));
        } while (match_op(","));
        return make_stmt(std::move(stmt), span_from(start));
    }

    advance(); // 'from'
    while (check_op(".") || check_op("...")) {
        stmt.module += advance().lexeme;
    }
    if (check(lexer::TokenKind::Name)) {
        auto module = dotted_name();
        if (is_err(module))
            return unwrap_err(module);
        stmt.module += unwrap(module);
    }
    if (stmt.module.empty()) {
        return error_here("expected module name");
    }
    if (!match_keyword("import")) {
        return error_here("expected 'import'");
    }
    if (match_op("*")) {
        stmt.names.emplace_back("*");
        return make_stmt(std::move(stmt), span_from(start));
    }
    bool parenthesized = match_op("(");
    do {
        if (parenthesized && check_op(")")) {
            break;
        }
        auto name = expect_name();
        if (is_err(name))
            return unwrap_err(name);
        std::string bound(unwrap(name).lexeme);
        if (match_keyword("as")) {
            auto alias = expect_name();
            if (is_err(alias))
                return unwrap_err(alias);
            bound = std::string(unwrap(alias).lexeme);
        }
        stmt.names.push_back(std::move(bound));
    } while (match_op(","));
    if (parenthesized) {
        auto close = expect_op(")");
        if (is_err(close))
            return unwrap_err(close);
    }
    return make_stmt(std::move(stmt), span_from(start));
}

auto Parser::parse_type_alias() -> Result<StmtPtr, ParseError> {
    auto start = peek().span.start;
    advance(); // 'type'
    auto name = expect_name();
    if (is_err(name))
        return unwrap_err(name);
    if (check_op("[")) {
        auto params = skip_type_params();
        if (is_err(params))
            return unwrap_err(params);
    }
    auto eq = expect_op("=");
    if (is_err(eq))
        return unwrap_err(eq);
    auto value = parse_test();
    if (is_err(value))
        return unwrap_err(value);
    return make_stmt(TypeAliasStmt{.name = std::string(unwrap(name).lexeme),
                                   .value = std::move(unwrap(value))},
                     span_from(start));
}

// ============================================================================
// Blocks
// ============================================================================

auto Parser::parse_block(BlockLayout* layout, std::string_view context, uint32_t header_line)
    -> Result<Suite, ParseError> {
    NestingGuard guard(depth_);
    if (guard.exceeded()) {
        return error_here("too many nested blocks");
    }
    if (!check_op(":")) {
        return error_here("expected ':'");
    }
    const auto& colon = advance();
    if (layout) {
        layout->colon_end = colon.span.end.offset;
        layout->header_line = colon.span.end.line;
    }

    if (!check(lexer::TokenKind::Newline)) {
        if (layout) {
            layout->inline_body = true;
        }
        return parse_simple_line();
    }
    advance();

    if (!check(lexer::TokenKind::Indent)) {
        return ParseError{.message = "expected an indented block after " + std::string(context) +
                                     " on line " + std::to_string(header_line),
                          .span = peek().span};
    }
    advance();

    Suite body;
    while (!check(lexer::TokenKind::Dedent) && !check(lexer::TokenKind::EndOfFile)) {
        auto stmts = parse_statement();
        if (is_err(stmts))
            return unwrap_err(stmts);
        for (auto& stmt : unwrap(stmts)) {
            body.push_back(std::move(stmt));
        }
    }
    if (check(lexer::TokenKind::Dedent)) {
        advance();
    }
    return body;
}

// ============================================================================
// Definitions
// ============================================================================

auto Parser::parse_decorated() -> Result<StmtPtr, ParseError> {
    auto start = peek().span.start;
    std::vector<ExprPtr> decorators;
    while (match_op("@")) {
        auto expr = parse_named_expr();
        if (is_err(expr))
            return unwrap_err(expr);
        decorators.push_back(std::move(unwrap(expr)));
        if (!check(lexer::TokenKind::Newline)) {
            return error_here("invalid syntax");
        }
        advance();
    }

    if (check_keyword("def") || (check_keyword("async") && peek_next().is_keyword("def"))) {
        return parse_function(std::move(decorators), start);
    }
    if (check_keyword("class")) {
        return parse_class(std::move(decorators), start);
    }
    return error_here("expected function or class definition after decorator");
}

auto Parser::parse_function(std::vector<ExprPtr> decorators,
                            std::optional<SourceLocation> decorator_start)
    -> Result<StmtPtr, ParseError> {
    auto start = peek().span.start;
    FunctionDef func;
    func.decorators = std::move(decorators);
    func.decorator_start = decorator_start;
    func.is_async = match_keyword("async");
    if (!match_keyword("def")) {
        return error_here("expected 'def'");
    }

    auto name = expect_name();
    if (is_err(name))
        return unwrap_err(name);
    func.name = std::string(unwrap(name).lexeme);

    if (check_op("[")) {
        auto params = skip_type_params();
        if (is_err(params))
            return unwrap_err(params);
        func.type_params = std::move(unwrap(params));
    }

    auto open = expect_op("(");
    if (is_err(open))
        return unwrap_err(open);
    auto params = parse_parameters(")", true);
    if (is_err(params))
        return unwrap_err(params);
    func.params = std::move(unwrap(params));
    auto close = expect_op(")");
    if (is_err(close))
        return unwrap_err(close);

    if (match_op("->")) {
        auto returns = parse_test();
        if (is_err(returns))
            return unwrap_err(returns);
        func.returns = std::move(unwrap(returns));
    }

    auto body = parse_block(&func.layout, "function definition", start.line);
    if (is_err(body))
        return unwrap_err(body);
    func.body = std::move(unwrap(body));
    return make_stmt(std::move(func), span_from(start));
}

auto Parser::parse_class(std::vector<ExprPtr> decorators,
                         std::optional<SourceLocation> decorator_start)
    -> Result<StmtPtr, ParseError> {
    auto start = peek().span.start;
    advance(); // 'class'
    ClassDef cls;
    cls.decorators = std::move(decorators);
    cls.decorator_start = decorator_start;

    auto name = expect_name();
    if (is_err(name))
        return unwrap_err(name);
    cls.name = std::string(unwrap(name).lexeme);

    if (check_op("[")) {
        auto params = skip_type_params();
        if (is_err(params))
            return unwrap_err(params);
        cls.type_params = std::move(unwrap(params));
    }

    if (match_op("(")) {
        auto bases = parse_call_args();
        if (is_err(bases))
            return unwrap_err(bases);
        cls.bases = std::move(unwrap(bases));
    }

    auto body = parse_block(&cls.layout, "class definition", start.line);
    if (is_err(body))
        return unwrap_err(body);
    cls.body = std::move(unwrap(body));
    return make_stmt(std::move(cls), span_from(start));
}

auto Parser::parse_parameters(std::string_view closer, bool annotations)
    -> Result<std::vector<Parameter>, ParseError> {
    std::vector<Parameter> params;
    bool seen_star = false;

    while (!check_op(closer)) {
        auto start = peek().span.start;
        if (match_op("/")) {
            for (auto& param : params) {
                if (param.kind == ParamKind::Positional) {
                    param.kind = ParamKind::PositionalOnly;
                }
            }
        } else {
            Parameter param;
            if (match_op("*")) {
                seen_star = true;
                if (!check(lexer::TokenKind::Name)) {
                    if (!match_op(",")) {
                        break;
                    }
                    continue;
                }
                param.kind = ParamKind::VarPositional;
            } else if (match_op("**")) {
                param.kind = ParamKind::VarKeyword;
            } else {
                param.kind = seen_star ? ParamKind::KeywordOnly : ParamKind::Positional;
            }

            auto name = expect_name();
            if (is_err(name))
                return unwrap_err(name);
            param.name = std::string(unwrap(name).lexeme);

            if (annotations && match_op(":")) {
                auto annotation = param.kind == ParamKind::VarPositional ? parse_star_or_test()
                                                                          : parse_test();
                if (is_err(annotation))
                    return unwrap_err(annotation);
                param.annotation = std::move(unwrap(annotation));
            }
            if (match_op("=")) {
                auto value = parse_test();
                if (is_err(value))
                    return unwrap_err(value);
                param.default_value = std::move(unwrap(value));
            }
            param.span = span_from(start);
            params.push_back(std::move(param));
        }

        if (!match_op(",")) {
            break;
        }
    }
    return params;
}

auto Parser::skip_type_params() -> Result<std::string, ParseError> {
    auto start = peek().span.start;
    int depth = 0;
    do {
        if (check(lexer::TokenKind::EndOfFile)) {
            return error_here("'[' was never closed");
        }
        const auto& token = advance();
        if (token.is_op("[") || token.is_op("(")) {
            ++depth;
        } else if (token.is_op("]") || token.is_op(")")) {
            --depth;
        }
    } while (depth > 0);
    return std::string(source_.slice(start.offset, last_end_.offset));
}

// ============================================================================
// Control Flow
// ============================================================================

auto Parser::parse_if() -> Result<StmtPtr, ParseError> {
    auto start = peek().span.start;
    advance(); // 'if' or 'elif'
    auto test = parse_named_expr();
    if (is_err(test))
        return unwrap_err(test);
    auto body = parse_block(nullptr, "'if' statement", start.line);
    if (is_err(body))
        return unwrap_err(body);

    IfStmt stmt{.test = std::move(unwrap(test)), .body = std::move(unwrap(body)), .orelse = {}};
    if (check_keyword("elif")) {
        auto nested = parse_if();
        if (is_err(nested))
            return unwrap_err(nested);
        stmt.orelse.push_back(std::move(unwrap(nested)));
    } else if (check_keyword("else")) {
        uint32_t line = advance().span.start.line;
        auto orelse = parse_block(nullptr, "'else' statement", line);
        if (is_err(orelse))
            return unwrap_err(orelse);
        stmt.orelse = std::move(unwrap(orelse));
    }
    return make_stmt(std::move(stmt), span_from(start));
}

auto Parser::parse_while() -> Result<StmtPtr, ParseError> {
    auto start = peek().span.start;
    advance(); // 'while'
    auto test = parse_named_expr();
    if (is_err(test))
        return unwrap_err(test);
    auto body = parse_block(nullptr, "'while' statement", start.line);
    if (is_err(body))
        return unwrap_err(body);

    WhileStmt stmt{.test = std::move(unwrap(test)), .body = std::move(unwrap(body)), .orelse = {}};
    if (check_keyword("else")) {
        uint32_t line = advance().span.start.line;
        auto orelse = parse_block(nullptr, "'else' statement", line);
        if (is_err(orelse))
            return unwrap_err(orelse);
        stmt.orelse = std::move(unwrap(orelse));
    }
    return make_stmt(std::move(stmt), span_from(start));
}

auto Parser::parse_for(const SourceLocation& start, bool is_async) -> Result<StmtPtr, ParseError> {
    advance(); // 'for'
    auto target = parse_exprlist();
    if (is_err(target))
        return unwrap_err(target);
    if (!match_keyword("in")) {
        return error_here("expected 'in'");
    }
    auto iter = parse_testlist(true);
    if (is_err(iter))
        return unwrap_err(iter);
    auto body = parse_block(nullptr, "'for' statement", start.line);
    if (is_err(body))
        return unwrap_err(body);

    ForStmt stmt{.target = std::move(unwrap(target)),
                 .iter = std::move(unwrap(iter)),
                 .body = std::move(unwrap(body)),
                 .orelse = {},
                 .is_async = is_async};
    if (check_keyword("else")) {
        uint32_t line = advance().span.start.line;
        auto orelse = parse_block(nullptr, "'else' statement", line);
        if (is_err(orelse))
            return unwrap_err(orelse);
        stmt.orelse = std::move(unwrap(orelse));
    }
    return make_stmt(std::move(stmt), span_from(start));
}

auto Parser::parse_try() -> Result<StmtPtr, ParseError> {
    auto start = peek().span.start;
    advance(); // 'try'
    auto body = parse_block(nullptr, "'try' statement", start.line);
    if (is_err(body))
        return unwrap_err(body);

    TryStmt stmt;
    stmt.body = std::move(unwrap(body));

    while (check_keyword("except")) {
        auto handler_start = peek().span.start;
        advance();
        ExceptHandler handler;
        if (match_op("*")) {
            stmt.is_star = true;
        }
        if (at_expression_start()) {
            auto type = parse_test();
            if (is_err(type))
                return unwrap_err(type);
            handler.type = std::move(unwrap(type));
            if (match_keyword("as")) {
                auto name = expect_name();
                if (is_err(name))
                    return unwrap_err(name);
                handler.name = std::string(unwrap(name).lexeme);
            }
        }
        auto handler_body = parse_block(nullptr, "'except' statement", handler_start.line);
        if (is_err(handler_body))
            return unwrap_err(handler_body);
        handler.body = std::move(unwrap(handler_body));
        handler.span = span_from(handler_start);
        stmt.handlers.push_back(std::move(handler));
    }

    if (check_keyword("else")) {
        uint32_t line = advance().span.start.line;
        auto orelse = parse_block(nullptr, "'else' statement", line);
        if (is_err(orelse))
            return unwrap_err(orelse);
        stmt.orelse = std::move(unwrap(orelse));
    }
    if (check_keyword("finally")) {
        uint32_t line = advance().span.start.line;
        auto finalbody = parse_block(nullptr, "'finally' statement", line);
        if (is_err(finalbody))
            return unwrap_err(finalbody);
        stmt.finalbody = std::move(unwrap(finalbody));
    }
    if (stmt.handlers.empty() && stmt.finalbody.empty()) {
        return error_here("expected 'except' or 'finally' block");
    }
    return make_stmt(std::move(stmt), span_from(start));
}

auto Parser::parse_with(const SourceLocation& start, bool is_async)
    -> Result<StmtPtr, ParseError> {
    advance(); // 'with'

    std::vector<WithItem> items;
    bool parsed = false;
    if (check_op("(")) {
        size_t saved_pos = pos_;
        auto saved_end = last_end_;
        auto attempt = parse_with_items(true);
        if (is_ok(attempt) && check_op(":")) {
            items = std::move(unwrap(attempt));
            parsed = true;
        } else {
            pos_ = saved_pos;
            last_end_ = saved_end;
        }
    }
    if (!parsed) {
        auto plain = parse_with_items(false);
        if (is_err(plain))
            return unwrap_err(plain);
        items = std::move(unwrap(plain));
    }

    auto body = parse_block(nullptr, "'with' statement", start.line);
    if (is_err(body))
        return unwrap_err(body);
    return make_stmt(
        WithStmt{.items = std::move(items), .body = std::move(unwrap(body)), .is_async = is_async},
        span_from(start));
}

auto Parser::parse_with_items(bool parenthesized) -> Result<std::vector<WithItem>, ParseError> {
    if (parenthesized) {
        advance(); // '('
    }
    std::vector<WithItem> items;
    while (true) {
        auto context = parse_test();
        if (is_err(context))
            return unwrap_err(context);
        WithItem item{.context = std::move(unwrap(context)), .target = nullptr};
        if (match_keyword("as")) {
            auto target = parse_binary(precedence::NONE);
            if (is_err(target))
                return unwrap_err(target);
            item.target = std::move(unwrap(target));
        }
        items.push_back(std::move(item));
        if (!match_op(",")) {
            break;
        }
        if (parenthesized && check_op(")")) {
            break;
        }
    }
    if (parenthesized) {
        auto close = expect_op(")");
        if (is_err(close))
            return unwrap_err(close);
    }
    return items;
}

auto Parser::try_parse_match() -> Result<StmtPtr, ParseError> {
    size_t saved_pos = pos_;
    auto saved_end = last_end_;
    auto restore = [&]() -> Result<StmtPtr, ParseError> {
        pos_ = saved_pos;
        last_end_ = saved_end;
        return StmtPtr{};
    };

    auto start = peek().span.start;
    advance(); // 'match'
    if (!at_expression_start() || check_op("*")) {
        return restore();
    }
    auto subject = parse_testlist(true);
    if (is_err(subject) || !check_op(":")) {
        return restore();
    }
    advance(); // ':'
    if (!check(lexer::TokenKind::Newline)) {
        return restore();
    }
    advance();
    if (!check(lexer::TokenKind::Indent)) {
        return ParseError{.message = "expected an indented block after 'match' statement on line " +
                                     std::to_string(start.line),
                          .span = peek().span};
    }
    advance();

    MatchStmt stmt{.subject = std::move(unwrap(subject)), .cases = {}};
    while (peek().is_name("case")) {
        auto case_start = peek().span.start;
        advance();
        auto pattern_start = peek().span.start;
        int depth = 0;
        while (!check(lexer::TokenKind::Newline) && !check(lexer::TokenKind::EndOfFile)) {
            const auto& token = peek();
            if (depth == 0 && (token.is_op(":") || token.is_keyword("if"))) {
                break;
            }
            if (token.is_op("(") || token.is_op("[") || token.is_op("{")) {
                ++depth;
            } else if (token.is_op(")") || token.is_op("]") || token.is_op("}")) {
                --depth;
            }
            advance();
        }
        if (last_end_.offset <= pattern_start.offset) {
            return error_here("expected pattern");
        }

        MatchCase match_case;
        match_case.pattern_span = span_from(pattern_start);
        if (match_keyword("if")) {
            auto guard = parse_named_expr();
            if (is_err(guard))
                return unwrap_err(guard);
            match_case.guard = std::move(unwrap(guard));
        }
        auto body = parse_block(nullptr, "'case' statement", case_start.line);
        if (is_err(body))
            return unwrap_err(body);
        match_case.body = std::move(unwrap(body));
        stmt.cases.push_back(std::move(match_case));
    }

    if (stmt.cases.empty() || !check(lexer::TokenKind::Dedent)) {
        return error_here("expected 'case' block");
    }
    advance();
    return make_stmt(std::move(stmt), span_from(start));
}

} // namespace docforge::parser

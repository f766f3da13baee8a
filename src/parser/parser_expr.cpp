//! # Expression Parsing
//!
//! Grammar layers from the loosest binding to the tightest:
//!
//! | Layer             | Forms                                  |
//! |-------------------|----------------------------------------|
//! | `parse_testlist`  | `a, *b`                                 |
//! | `parse_test`      | `x if c else y`, `lambda`               |
//! | `parse_or_test`   | `or`, `and`, `not`                      |
//! | `parse_comparison`| `<`, `in`, `not in`, `is not`, ...      |
//! | `parse_binary`    | `|` through `*` by precedence climbing  |
//! | `parse_factor`    | unary `-`, `+`, `~` and `**`            |
//! | `parse_primary`   | `await`, calls, subscripts, attributes  |

#include "parser/parser.hpp"

namespace docforge::parser {

namespace {

auto is_comprehension_start(const lexer::Token& token, const lexer::Token& next) -> bool {
    return token.is_keyword("for") || (token.is_keyword("async") && next.is_keyword("for"));
}

} // namespace

// ============================================================================
// Lists and Named Expressions
// ============================================================================

auto Parser::parse_testlist(bool allow_star) -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    auto first = allow_star ? parse_star_or_test() : parse_test();
    if (is_err(first) || !check_op(",")) {
        return first;
    }

    CollectionExpr tuple{.kind = CollectionKind::Tuple, .elements = {}};
    tuple.elements.push_back(std::move(unwrap(first)));
    while (match_op(",")) {
        if (!at_expression_start()) {
            break;
        }
        auto next = allow_star ? parse_star_or_test() : parse_test();
        if (is_err(next))
            return next;
        tuple.elements.push_back(std::move(unwrap(next)));
    }
    return make_expr(std::move(tuple), span_from(start));
}

auto Parser::parse_exprlist() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    auto parse_item = [this]() -> Result<ExprPtr, ParseError> {
        auto item_start = peek().span.start;
        if (match_op("*")) {
            auto value = parse_binary(precedence::NONE);
            if (is_err(value))
                return value;
            return make_expr(StarredExpr{.value = std::move(unwrap(value))},
                             span_from(item_start));
        }
        return parse_binary(precedence::NONE);
    };

    auto first = parse_item();
    if (is_err(first) || !check_op(",")) {
        return first;
    }
    CollectionExpr tuple{.kind = CollectionKind::Tuple, .elements = {}};
    tuple.elements.push_back(std::move(unwrap(first)));
    while (match_op(",")) {
        if (!at_expression_start()) {
            break;
        }
        auto next = parse_item();
        if (is_err(next))
            return next;
        tuple.elements.push_back(std::move(unwrap(next)));
    }
    return make_expr(std::move(tuple), span_from(start));
}

auto Parser::parse_star_or_test() -> Result<ExprPtr, ParseError> {
    if (check_op("*")) {
        auto start = peek().span.start;
        advance();
        auto value = parse_binary(precedence::NONE);
        if (is_err(value))
            return value;
        return make_expr(StarredExpr{.value = std::move(unwrap(value))}, span_from(start));
    }
    return parse_named_expr();
}

auto Parser::parse_named_expr() -> Result<ExprPtr, ParseError> {
    if (check(lexer::TokenKind::Name) && peek_next().is_op(":=")) {
        auto start = peek().span.start;
        const auto& name = advance();
        auto target = make_expr(NameExpr{.name = std::string(name.lexeme)}, name.span);
        advance(); // ':='
        auto value = parse_test();
        if (is_err(value))
            return value;
        return make_expr(NamedExpr{.target = std::move(target), .value = std::move(unwrap(value))},
                         span_from(start));
    }
    return parse_test();
}

// ============================================================================
// Conditional, Lambda, Boolean
// ============================================================================

auto Parser::parse_test() -> Result<ExprPtr, ParseError> {
    NestingGuard guard(depth_);
    if (guard.exceeded()) {
        return error_here("too many nested expressions");
    }
    if (check_keyword("lambda")) {
        return parse_lambda();
    }

    auto start = peek().span.start;
    auto body = parse_or_test();
    if (is_err(body) || !check_keyword("if")) {
        return body;
    }
    advance(); // 'if'
    auto test = parse_or_test();
    if (is_err(test))
        return test;
    if (!match_keyword("else")) {
        return error_here("expected 'else' after 'if' expression");
    }
    auto orelse = parse_test();
    if (is_err(orelse))
        return orelse;
    return make_expr(IfExpr{.test = std::move(unwrap(test)),
                            .body = std::move(unwrap(body)),
                            .orelse = std::move(unwrap(orelse))},
                     span_from(start));
}

auto Parser::parse_lambda() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    advance(); // 'lambda'
    auto params = parse_parameters(":", false);
    if (is_err(params))
        return unwrap_err(params);
    auto colon = expect_op(":");
    if (is_err(colon))
        return unwrap_err(colon);
    auto body = parse_test();
    if (is_err(body))
        return body;
    return make_expr(
        LambdaExpr{.params = std::move(unwrap(params)), .body = std::move(unwrap(body))},
        span_from(start));
}

auto Parser::parse_or_test() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    auto first = parse_and_test();
    if (is_err(first) || !check_keyword("or")) {
        return first;
    }
    BoolOpExpr op{.op = "or", .values = {}};
    op.values.push_back(std::move(unwrap(first)));
    while (match_keyword("or")) {
        auto next = parse_and_test();
        if (is_err(next))
            return next;
        op.values.push_back(std::move(unwrap(next)));
    }
    return make_expr(std::move(op), span_from(start));
}

auto Parser::parse_and_test() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    auto first = parse_not_test();
    if (is_err(first) || !check_keyword("and")) {
        return first;
    }
    BoolOpExpr op{.op = "and", .values = {}};
    op.values.push_back(std::move(unwrap(first)));
    while (match_keyword("and")) {
        auto next = parse_not_test();
        if (is_err(next))
            return next;
        op.values.push_back(std::move(unwrap(next)));
    }
    return make_expr(std::move(op), span_from(start));
}

auto Parser::parse_not_test() -> Result<ExprPtr, ParseError> {
    if (check_keyword("not")) {
        NestingGuard guard(depth_);
        if (guard.exceeded()) {
            return error_here("too many nested expressions");
        }
        auto start = peek().span.start;
        advance();
        auto operand = parse_not_test();
        if (is_err(operand))
            return operand;
        return make_expr(UnaryExpr{.op = "not", .operand = std::move(unwrap(operand))},
                         span_from(start));
    }
    return parse_comparison();
}

auto Parser::parse_comparison() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    auto left = parse_binary(precedence::NONE);
    if (is_err(left))
        return left;

    CompareExpr compare{.left = std::move(unwrap(left)), .ops = {}, .comparators = {}};
    while (true) {
        const auto& token = peek();
        std::string op;
        if (token.is_op("<") || token.is_op(">") || token.is_op("==") || token.is_op(">=") ||
            token.is_op("<=") || token.is_op("!=")) {
            op = std::string(advance().lexeme);
        } else if (token.is_keyword("in")) {
            advance();
            op = "in";
        } else if (token.is_keyword("not") && peek_next().is_keyword("in")) {
            advance();
            advance();
            op = "not in";
        } else if (token.is_keyword("is")) {
            advance();
            op = match_keyword("not") ? "is not" : "is";
        } else {
            break;
        }
        auto right = parse_binary(precedence::NONE);
        if (is_err(right))
            return right;
        compare.ops.push_back(std::move(op));
        compare.comparators.push_back(std::move(unwrap(right)));
    }

    if (compare.ops.empty()) {
        return std::move(compare.left);
    }
    return make_expr(std::move(compare), span_from(start));
}

// ============================================================================
// Binary Operators (Precedence Climbing)
// ============================================================================

auto Parser::binary_precedence(const lexer::Token& token) const -> int {
    if (!token.is(lexer::TokenKind::Operator)) {
        return precedence::NONE;
    }
    auto op = token.lexeme;
    if (op == "|")
        return precedence::BIT_OR;
    if (op == "^")
        return precedence::BIT_XOR;
    if (op == "&")
        return precedence::BIT_AND;
    if (op == "<<" || op == ">>")
        return precedence::SHIFT;
    if (op == "+" || op == "-")
        return precedence::TERM;
    if (op == "*" || op == "/" || op == "//" || op == "%" || op == "@")
        return precedence::FACTOR;
    return precedence::NONE;
}

auto Parser::parse_binary(int min_precedence) -> Result<ExprPtr, ParseError> {
    auto left = parse_factor();
    if (is_err(left))
        return left;

    size_t links = 0;
    while (true) {
        int prec = binary_precedence(peek());
        if (prec == precedence::NONE || prec <= min_precedence) {
            break;
        }
        if (++links > MAX_CHAIN_LENGTH) {
            return error_here("expression is too long");
        }
        std::string op(advance().lexeme);
        auto right = parse_binary(prec);
        if (is_err(right))
            return right;
        auto span = SourceSpan::merge(unwrap(left)->span, unwrap(right)->span);
        left = make_expr(BinaryExpr{.op = std::move(op),
                                    .left = std::move(unwrap(left)),
                                    .right = std::move(unwrap(right))},
                         span);
    }
    return left;
}

auto Parser::parse_factor() -> Result<ExprPtr, ParseError> {
    if (check_op("-") || check_op("+") || check_op("~")) {
        NestingGuard guard(depth_);
        if (guard.exceeded()) {
            return error_here("too many nested expressions");
        }
        auto start = peek().span.start;
        std::string op(advance().lexeme);
        auto operand = parse_factor();
        if (is_err(operand))
            return operand;
        return make_expr(UnaryExpr{.op = std::move(op), .operand = std::move(unwrap(operand))},
                         span_from(start));
    }
    return parse_power();
}

auto Parser::parse_power() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    auto base = parse_primary();
    if (is_err(base) || !check_op("**")) {
        return base;
    }
    advance();
    NestingGuard guard(depth_);
    if (guard.exceeded()) {
        return error_here("too many nested expressions");
    }
    auto exponent = parse_factor();
    if (is_err(exponent))
        return exponent;
    return make_expr(BinaryExpr{.op = "**",
                                .left = std::move(unwrap(base)),
                                .right = std::move(unwrap(exponent))},
                     span_from(start));
}

// ============================================================================
// Primary and Trailers
// ============================================================================

auto Parser::parse_primary() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    if (check_keyword("await")) {
        NestingGuard guard(depth_);
        if (guard.exceeded()) {
            return error_here("too many nested expressions");
        }
        advance();
        auto value = parse_primary();
        if (is_err(value))
            return value;
        return make_expr(AwaitExpr{.value = std::move(unwrap(value))}, span_from(start));
    }

    auto expr = parse_atom();
    if (is_err(expr))
        return expr;

    size_t links = 0;
    while (check_op("(") || check_op("[") || check_op(".")) {
        if (++links > MAX_CHAIN_LENGTH) {
            return error_here("expression is too long");
        }
        if (match_op("(")) {
            auto args = parse_call_args();
            if (is_err(args))
                return unwrap_err(args);
            expr = make_expr(
                CallExpr{.func = std::move(unwrap(expr)), .args = std::move(unwrap(args))},
                span_from(start));
        } else if (match_op("[")) {
            auto index = parse_subscript();
            if (is_err(index))
                return index;
            auto close = expect_op("]");
            if (is_err(close))
                return unwrap_err(close);
            expr = make_expr(
                SubscriptExpr{.value = std::move(unwrap(expr)), .index = std::move(unwrap(index))},
                span_from(start));
        } else {
            advance(); // '.'
            auto name = expect_name();
            if (is_err(name))
                return unwrap_err(name);
            expr = make_expr(AttributeExpr{.value = std::move(unwrap(expr)),
                                           .attr = std::string(unwrap(name).lexeme)},
                             span_from(start));
        }
    }
    return expr;
}

auto Parser::parse_call_args() -> Result<std::vector<Argument>, ParseError> {
    std::vector<Argument> args;
    while (!check_op(")")) {
        Argument arg;
        if (match_op("*")) {
            arg.star = 1;
        } else if (match_op("**")) {
            arg.star = 2;
        } else if (check(lexer::TokenKind::Name) && peek_next().is_op("=")) {
            arg.keyword = std::string(advance().lexeme);
            advance(); // '='
        }

        auto value_start = peek().span.start;
        auto value = (arg.star == 0 && !arg.keyword) ? parse_named_expr() : parse_test();
        if (is_err(value))
            return unwrap_err(value);
        arg.value = std::move(unwrap(value));

        if (arg.star == 0 && !arg.keyword && is_comprehension_start(peek(), peek_next())) {
            auto generators = parse_comprehension_clauses();
            if (is_err(generators))
                return unwrap_err(generators);
            arg.value = make_expr(ComprehensionExpr{.kind = ComprehensionKind::Generator,
                                                    .element = std::move(arg.value),
                                                    .value = nullptr,
                                                    .generators = std::move(unwrap(generators))},
                                  span_from(value_start));
        }
        args.push_back(std::move(arg));
        if (!match_op(",")) {
            break;
        }
    }
    auto close = expect_op(")");
    if (is_err(close))
        return unwrap_err(close);
    return args;
}

auto Parser::parse_subscript() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    auto first = parse_slice_item();
    if (is_err(first) || !check_op(",")) {
        return first;
    }
    CollectionExpr tuple{.kind = CollectionKind::Tuple, .elements = {}};
    tuple.elements.push_back(std::move(unwrap(first)));
    while (match_op(",")) {
        if (check_op("]")) {
            break;
        }
        auto next = parse_slice_item();
        if (is_err(next))
            return next;
        tuple.elements.push_back(std::move(unwrap(next)));
    }
    return make_expr(std::move(tuple), span_from(start));
}

auto Parser::parse_slice_item() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    SliceExpr slice;
    if (!check_op(":")) {
        auto lower = parse_star_or_test();
        if (is_err(lower) || !check_op(":")) {
            return lower;
        }
        slice.lower = std::move(unwrap(lower));
    }
    advance(); // ':'

    auto at_slice_end = [this]() { return check_op(":") || check_op("]") || check_op(","); };
    if (!at_slice_end()) {
        auto upper = parse_test();
        if (is_err(upper))
            return upper;
        slice.upper = std::move(unwrap(upper));
    }
    if (match_op(":") && !at_slice_end()) {
        auto step = parse_test();
        if (is_err(step))
            return step;
        slice.step = std::move(unwrap(step));
    }
    return make_expr(std::move(slice), span_from(start));
}

auto Parser::parse_yield() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    advance(); // 'yield'
    YieldExpr yield;
    if (match_keyword("from")) {
        yield.is_from = true;
        auto value = parse_test();
        if (is_err(value))
            return value;
        yield.value = std::move(unwrap(value));
    } else if (at_expression_start()) {
        auto value = parse_testlist(true);
        if (is_err(value))
            return value;
        yield.value = std::move(unwrap(value));
    }
    return make_expr(std::move(yield), span_from(start));
}

auto Parser::parse_comprehension_clauses() -> Result<std::vector<Comprehension>, ParseError> {
    std::vector<Comprehension> generators;
    while (is_comprehension_start(peek(), peek_next())) {
        Comprehension clause;
        clause.is_async = match_keyword("async");
        advance(); // 'for'
        auto target = parse_exprlist();
        if (is_err(target))
            return unwrap_err(target);
        clause.target = std::move(unwrap(target));
        if (!match_keyword("in")) {
            return error_here("expected 'in'");
        }
        auto iter = parse_or_test();
        if (is_err(iter))
            return unwrap_err(iter);
        clause.iter = std::move(unwrap(iter));
        while (match_keyword("if")) {
            auto cond = parse_or_test();
            if (is_err(cond))
                return unwrap_err(cond);
            clause.ifs.push_back(std::move(unwrap(cond)));
        }
        generators.push_back(std::move(clause));
    }
    return generators;
}

// ============================================================================
// Atoms
// ============================================================================

auto Parser::parse_atom() -> Result<ExprPtr, ParseError> {
    const auto& token = peek();
    switch (token.kind) {
    case lexer::TokenKind::Name: {
        advance();
        return make_expr(NameExpr{.name = std::string(token.lexeme)}, token.span);
    }
    case lexer::TokenKind::Number: {
        advance();
        auto text = token.lexeme;
        bool hex = text.size() > 1 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
        ConstantKind kind = ConstantKind::Int;
        if (text.back() == 'j' || text.back() == 'J') {
            kind = ConstantKind::Complex;
        } else if (!hex && text.find_first_of(".eE") != std::string_view::npos) {
            kind = ConstantKind::Float;
        }
        return make_expr(ConstantExpr{.kind = kind, .value = std::string(text)}, token.span);
    }
    case lexer::TokenKind::String:
        return parse_strings();
    case lexer::TokenKind::Keyword: {
        ConstantKind kind;
        if (token.lexeme == "None") {
            kind = ConstantKind::None;
        } else if (token.lexeme == "True") {
            kind = ConstantKind::True;
        } else if (token.lexeme == "False") {
            kind = ConstantKind::False;
        } else {
            return error_here("invalid syntax");
        }
        advance();
        return make_expr(ConstantExpr{.kind = kind, .value = std::string(token.lexeme)},
                         token.span);
    }
    case lexer::TokenKind::Operator:
        if (token.lexeme == "(") {
            return parse_paren_atom();
        }
        if (token.lexeme == "[") {
            return parse_list_atom();
        }
        if (token.lexeme == "{") {
            return parse_brace_atom();
        }
        if (token.lexeme == "...") {
            advance();
            return make_expr(ConstantExpr{.kind = ConstantKind::Ellipsis, .value = "..."},
                             token.span);
        }
        return error_here("invalid syntax");
    default:
        return error_here("invalid syntax");
    }
}

auto Parser::parse_strings() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    ConstantExpr constant{.kind = ConstantKind::Str, .value = {}};
    bool seen_bytes = false;
    bool seen_text = false;

    while (check(lexer::TokenKind::String)) {
        const auto& token = advance();
        if (token.string.bytes) {
            seen_bytes = true;
        } else {
            seen_text = true;
        }
        if (seen_bytes && seen_text) {
            return ParseError{.message = "cannot mix bytes and nonbytes literals",
                              .span = token.span};
        }
        if (token.string.formatted) {
            constant.kind = ConstantKind::FString;
            constant.value += token.lexeme;
        } else {
            constant.value += lexer::string_literal_value(token);
        }
    }
    if (seen_bytes) {
        constant.kind = ConstantKind::Bytes;
    }
    return make_expr(std::move(constant), span_from(start));
}

auto Parser::parse_paren_atom() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    advance(); // '('

    if (match_op(")")) {
        return make_expr(CollectionExpr{.kind = CollectionKind::Tuple, .elements = {}},
                         span_from(start));
    }
    if (check_keyword("yield")) {
        auto yield = parse_yield();
        if (is_err(yield))
            return yield;
        auto close = expect_op(")");
        if (is_err(close))
            return unwrap_err(close);
        return yield;
    }

    auto first = parse_star_or_test();
    if (is_err(first))
        return first;

    if (is_comprehension_start(peek(), peek_next())) {
        auto generators = parse_comprehension_clauses();
        if (is_err(generators))
            return unwrap_err(generators);
        auto close = expect_op(")");
        if (is_err(close))
            return unwrap_err(close);
        return make_expr(ComprehensionExpr{.kind = ComprehensionKind::Generator,
                                           .element = std::move(unwrap(first)),
                                           .value = nullptr,
                                           .generators = std::move(unwrap(generators))},
                         span_from(start));
    }

    if (match_op(")")) {
        return first;
    }

    CollectionExpr tuple{.kind = CollectionKind::Tuple, .elements = {}};
    tuple.elements.push_back(std::move(unwrap(first)));
    while (match_op(",")) {
        if (check_op(")")) {
            break;
        }
        auto next = parse_star_or_test();
        if (is_err(next))
            return next;
        tuple.elements.push_back(std::move(unwrap(next)));
    }
    auto close = expect_op(")");
    if (is_err(close))
        return unwrap_err(close);
    return make_expr(std::move(tuple), span_from(start));
}

auto Parser::parse_list_atom() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    advance(); // '['

    CollectionExpr list{.kind = CollectionKind::List, .elements = {}};
    if (match_op("]")) {
        return make_expr(std::move(list), span_from(start));
    }

    auto first = parse_star_or_test();
    if (is_err(first))
        return first;

    if (is_comprehension_start(peek(), peek_next())) {
        auto generators = parse_comprehension_clauses();
        if (is_err(generators))
            return unwrap_err(generators);
        auto close = expect_op("]");
        if (is_err(close))
            return unwrap_err(close);
        return make_expr(ComprehensionExpr{.kind = ComprehensionKind::List,
                                           .element = std::move(unwrap(first)),
                                           .value = nullptr,
                                           .generators = std::move(unwrap(generators))},
                         span_from(start));
    }

    list.elements.push_back(std::move(unwrap(first)));
    while (match_op(",")) {
        if (check_op("]")) {
            break;
        }
        auto next = parse_star_or_test();
        if (is_err(next))
            return next;
        list.elements.push_back(std::move(unwrap(next)));
    }
    auto close = expect_op("]");
    if (is_err(close))
        return unwrap_err(close);
    return make_expr(std::move(list), span_from(start));
}

auto Parser::parse_brace_atom() -> Result<ExprPtr, ParseError> {
    auto start = peek().span.start;
    advance(); // '{'

    if (match_op("}")) {
        return make_expr(DictExpr{}, span_from(start));
    }

    // Parses one `key: value` or `**mapping` entry into the dict.
    auto parse_entry = [this](DictExpr& dict) -> std::optional<ParseError> {
        if (match_op("**")) {
            auto mapping = parse_binary(precedence::NONE);
            if (is_err(mapping))
                return unwrap_err(mapping);
            dict.keys.push_back(nullptr);
            dict.values.push_back(std::move(unwrap(mapping)));
            return std::nullopt;
        }
        auto key = parse_test();
        if (is_err(key))
            return unwrap_err(key);
        auto colon = expect_op(":");
        if (is_err(colon))
            return unwrap_err(colon);
        auto value = parse_test();
        if (is_err(value))
            return unwrap_err(value);
        dict.keys.push_back(std::move(unwrap(key)));
        dict.values.push_back(std::move(unwrap(value)));
        return std::nullopt;
    };

    auto finish_dict = [&](DictExpr dict) -> Result<ExprPtr, ParseError> {
        while (match_op(",")) {
            if (check_op("}")) {
                break;
            }
            if (auto err = parse_entry(dict)) {
                return *err;
            }
        }
        auto close = expect_op("}");
        if (is_err(close))
            return unwrap_err(close);
        return make_expr(std::move(dict), span_from(start));
    };

    if (check_op("**")) {
        DictExpr dict;
        if (auto err = parse_entry(dict)) {
            return *err;
        }
        return finish_dict(std::move(dict));
    }

    auto first = parse_star_or_test();
    if (is_err(first))
        return first;

    if (match_op(":")) {
        auto value = parse_test();
        if (is_err(value))
            return value;
        if (is_comprehension_start(peek(), peek_next())) {
            auto generators = parse_comprehension_clauses();
            if (is_err(generators))
                return unwrap_err(generators);
            auto close = expect_op("}");
            if (is_err(close))
                return unwrap_err(close);
            return make_expr(ComprehensionExpr{.kind = ComprehensionKind::Dict,
                                               .element = std::move(unwrap(first)),
                                               .value = std::move(unwrap(value)),
                                               .generators = std::move(unwrap(generators))},
                             span_from(start));
        }
        DictExpr dict;
        dict.keys.push_back(std::move(unwrap(first)));
        dict.values.push_back(std::move(unwrap(value)));
        return finish_dict(std::move(dict));
    }

    if (is_comprehension_start(peek(), peek_next())) {
        auto generators = parse_comprehension_clauses();
        if (is_err(generators))
            return unwrap_err(generators);
        auto close = expect_op("}");
        if (is_err(close))
            return unwrap_err(close);
        return make_expr(ComprehensionExpr{.kind = ComprehensionKind::Set,
                                           .element = std::move(unwrap(first)),
                                           .value = nullptr,
                                           .generators = std::move(unwrap(generators))},
                         span_from(start));
    }

    CollectionExpr set{.kind = CollectionKind::Set, .elements = {}};
    set.elements.push_back(std::move(unwrap(first)));
    while (match_op(",")) {
        if (check_op("}")) {
            break;
        }
        auto next = parse_star_or_test();
        if (is_err(next))
            return next;
        set.elements.push_back(std::move(unwrap(next)));
    }
    auto close = expect_op("}");
    if (is_err(close))
        return unwrap_err(close);
    return make_expr(std::move(set), span_from(start));
}

} // namespace docforge::parser

#include "analysis/walker.hpp"

#include <type_traits>

namespace docforge::analysis {

void ScopeWalker::walk_suite(const parser::Suite& suite) {
    for (const auto& stmt : suite) {
        walk_stmt(*stmt);
    }
}

void ScopeWalker::walk_optional(const parser::ExprPtr& expr) {
    if (expr) {
        walk_expr(*expr);
    }
}

void ScopeWalker::walk_stmt(const parser::Stmt& stmt) {
    on_stmt(stmt);
    std::visit(
        [this](const auto& s) {
            using T = std::decay_t<decltype(s)>;
            using namespace parser;

            if constexpr (std::is_same_v<T, ExprStmt>) {
                walk_expr(*s.expr);
            } else if constexpr (std::is_same_v<T, AssignStmt>) {
                for (const auto& target : s.targets) {
                    walk_expr(*target);
                }
                walk_optional(s.annotation);
                walk_optional(s.value);
            } else if constexpr (std::is_same_v<T, AugAssignStmt>) {
                walk_expr(*s.target);
                walk_expr(*s.value);
            } else if constexpr (std::is_same_v<T, ReturnStmt>) {
                walk_optional(s.value);
            } else if constexpr (std::is_same_v<T, RaiseStmt>) {
                walk_optional(s.exception);
                walk_optional(s.cause);
            } else if constexpr (std::is_same_v<T, AssertStmt>) {
                walk_expr(*s.test);
                walk_optional(s.message);
            } else if constexpr (std::is_same_v<T, DelStmt>) {
                for (const auto& target : s.targets) {
                    walk_expr(*target);
                }
            } else if constexpr (std::is_same_v<T, IfStmt> || std::is_same_v<T, WhileStmt>) {
                walk_expr(*s.test);
                walk_suite(s.body);
                walk_suite(s.orelse);
            } else if constexpr (std::is_same_v<T, ForStmt>) {
                walk_expr(*s.target);
                walk_expr(*s.iter);
                walk_suite(s.body);
                walk_suite(s.orelse);
            } else if constexpr (std::is_same_v<T, TryStmt>) {
                walk_suite(s.body);
                for (const auto& handler : s.handlers) {
                    on_handler(handler);
                    walk_optional(handler.type);
                    walk_suite(handler.body);
                }
                walk_suite(s.orelse);
                walk_suite(s.finalbody);
            } else if constexpr (std::is_same_v<T, WithStmt>) {
                for (const auto& item : s.items) {
                    walk_expr(*item.context);
                    walk_optional(item.target);
                }
                walk_suite(s.body);
            } else if constexpr (std::is_same_v<T, MatchStmt>) {
                walk_expr(*s.subject);
                for (const auto& match_case : s.cases) {
                    walk_optional(match_case.guard);
                    walk_suite(match_case.body);
                }
            } else if constexpr (std::is_same_v<T, TypeAliasStmt>) {
                walk_expr(*s.value);
            }
            // FunctionDef and ClassDef open a new scope; KeywordStmt and
            // ImportStmt have no expressions.
        },
        stmt.kind);
}

void ScopeWalker::walk_expr(const parser::Expr& expr) {
    on_expr(expr);
    std::visit(
        [this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            using namespace parser;

            if constexpr (std::is_same_v<T, UnaryExpr>) {
                walk_expr(*e.operand);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                walk_expr(*e.left);
                walk_expr(*e.right);
            } else if constexpr (std::is_same_v<T, BoolOpExpr>) {
                for (const auto& value : e.values) {
                    walk_expr(*value);
                }
            } else if constexpr (std::is_same_v<T, CompareExpr>) {
                walk_expr(*e.left);
                for (const auto& comparator : e.comparators) {
                    walk_expr(*comparator);
                }
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                walk_expr(*e.func);
                for (const auto& arg : e.args) {
                    walk_expr(*arg.value);
                }
            } else if constexpr (std::is_same_v<T, AttributeExpr>) {
                walk_expr(*e.value);
            } else if constexpr (std::is_same_v<T, SubscriptExpr>) {
                walk_expr(*e.value);
                walk_expr(*e.index);
            } else if constexpr (std::is_same_v<T, SliceExpr>) {
                walk_optional(e.lower);
                walk_optional(e.upper);
                walk_optional(e.step);
            } else if constexpr (std::is_same_v<T, CollectionExpr>) {
                for (const auto& element : e.elements) {
                    walk_expr(*element);
                }
            } else if constexpr (std::is_same_v<T, DictExpr>) {
                for (size_t i = 0; i < e.values.size(); ++i) {
                    walk_optional(e.keys[i]);
                    walk_expr(*e.values[i]);
                }
            } else if constexpr (std::is_same_v<T, ComprehensionExpr>) {
                for (const auto& clause : e.generators) {
                    on_comprehension(clause);
                    walk_expr(*clause.target);
                    walk_expr(*clause.iter);
                    for (const auto& cond : clause.ifs) {
                        walk_expr(*cond);
                    }
                }
                walk_expr(*e.element);
                walk_optional(e.value);
            } else if constexpr (std::is_same_v<T, IfExpr>) {
                walk_expr(*e.test);
                walk_expr(*e.body);
                walk_expr(*e.orelse);
            } else if constexpr (std::is_same_v<T, NamedExpr>) {
                walk_expr(*e.target);
                walk_expr(*e.value);
            } else if constexpr (std::is_same_v<T, StarredExpr> || std::is_same_v<T, AwaitExpr>) {
                walk_expr(*e.value);
            } else if constexpr (std::is_same_v<T, YieldExpr>) {
                walk_optional(e.value);
            }
            // LambdaExpr bodies belong to their own scope.
        },
        expr.kind);
}

} // namespace docforge::analysis

//! # Scope Walker
//!
//! Depth-first traversal of one function or class body that stays inside
//! that scope: nested `def`, `class` and `lambda` bodies are reported to the
//! hooks but never entered. Every analysis that is defined over "the
//! element's own body" (raise sites, returns, yields, evidence collection,
//! complexity) derives from this class.
//!
//! Comprehensions are entered; their clauses count toward the enclosing
//! function.

#ifndef DOCFORGE_ANALYSIS_WALKER_HPP
#define DOCFORGE_ANALYSIS_WALKER_HPP

#include "parser/ast.hpp"

namespace docforge::analysis {

class ScopeWalker {
public:
    virtual ~ScopeWalker() = default;

    void walk_suite(const parser::Suite& suite);
    void walk_stmt(const parser::Stmt& stmt);
    void walk_expr(const parser::Expr& expr);

protected:
    /// Called before the children of `stmt` are walked.
    virtual void on_stmt(const parser::Stmt& /*stmt*/) {}
    /// Called before the children of `expr` are walked.
    virtual void on_expr(const parser::Expr& /*expr*/) {}
    /// Called once per `except` clause.
    virtual void on_handler(const parser::ExceptHandler& /*handler*/) {}
    /// Called once per comprehension `for` clause.
    virtual void on_comprehension(const parser::Comprehension& /*clause*/) {}

private:
    void walk_optional(const parser::ExprPtr& expr);
};

} // namespace docforge::analysis

#endif // DOCFORGE_ANALYSIS_WALKER_HPP

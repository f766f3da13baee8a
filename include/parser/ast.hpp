//! # Python AST
//!
//! Statement and expression nodes produced by the parser. Each node stores
//! its payload in a `std::variant` named `kind` and the byte span it covers.
//! Annotations, defaults and decorators stay ordinary expressions; callers
//! that need their text slice the source with the node's span.
//!
//! ```cpp
//! if (stmt.is<FunctionDef>()) {
//!     const auto& func = stmt.as<FunctionDef>();
//!     for (const auto& param : func.params) { ... }
//! }
//! ```

#ifndef DOCFORGE_PARSER_AST_HPP
#define DOCFORGE_PARSER_AST_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docforge::parser {

struct Expr;
struct Stmt;

using ExprPtr = Box<Expr>;
using StmtPtr = Box<Stmt>;
using Suite = std::vector<StmtPtr>;

// ============================================================================
// Parameters
// ============================================================================

enum class ParamKind : uint8_t {
    Positional,
    PositionalOnly,
    KeywordOnly,
    VarPositional, ///< `*args`
    VarKeyword,    ///< `**kwargs`
};

struct Parameter {
    std::string name;
    ParamKind kind = ParamKind::Positional;
    ExprPtr annotation; ///< May be null.
    ExprPtr default_value; ///< May be null.
    SourceSpan span;
};

// ============================================================================
// Expressions
// ============================================================================

enum class ConstantKind : uint8_t {
    Int,
    Float,
    Complex,
    Str,
    Bytes,
    FString,
    True,
    False,
    None,
    Ellipsis,
};

struct NameExpr {
    std::string name;
};

/// Literal. For strings `value` holds the decoded, concatenated contents
/// (raw text for f-strings); for numbers the literal text.
struct ConstantExpr {
    ConstantKind kind;
    std::string value;
};

/// `-x`, `+x`, `~x`, `not x`
struct UnaryExpr {
    std::string op;
    ExprPtr operand;
};

/// Arithmetic, bitwise and matrix operators.
struct BinaryExpr {
    std::string op;
    ExprPtr left;
    ExprPtr right;
};

/// `a and b and c` is one node with three values.
struct BoolOpExpr {
    std::string op;
    std::vector<ExprPtr> values;
};

/// Chained comparison: `a < b <= c`. Operators are "not in" and "is not"
/// for the two-word forms.
struct CompareExpr {
    ExprPtr left;
    std::vector<std::string> ops;
    std::vector<ExprPtr> comparators;
};

struct Argument {
    std::optional<std::string> keyword;
    int star = 0; ///< 1 for `*value`, 2 for `**value`
    ExprPtr value;
};

struct CallExpr {
    ExprPtr func;
    std::vector<Argument> args;
};

struct AttributeExpr {
    ExprPtr value;
    std::string attr;
};

struct SubscriptExpr {
    ExprPtr value;
    ExprPtr index;
};

/// `lower:upper:step`, any part may be null.
struct SliceExpr {
    ExprPtr lower;
    ExprPtr upper;
    ExprPtr step;
};

enum class CollectionKind : uint8_t { Tuple, List, Set };

struct CollectionExpr {
    CollectionKind kind;
    std::vector<ExprPtr> elements;
};

/// A null key marks a `**mapping` unpacking entry.
struct DictExpr {
    std::vector<ExprPtr> keys;
    std::vector<ExprPtr> values;
};

struct Comprehension {
    ExprPtr target;
    ExprPtr iter;
    std::vector<ExprPtr> ifs;
    bool is_async = false;
};

enum class ComprehensionKind : uint8_t { List, Set, Dict, Generator };

struct ComprehensionExpr {
    ComprehensionKind kind;
    ExprPtr element; ///< Key for dict comprehensions.
    ExprPtr value;   ///< Value for dict comprehensions, null otherwise.
    std::vector<Comprehension> generators;
};

struct LambdaExpr {
    std::vector<Parameter> params;
    ExprPtr body;
};

/// `body if test else orelse`
struct IfExpr {
    ExprPtr test;
    ExprPtr body;
    ExprPtr orelse;
};

/// `target := value`
struct NamedExpr {
    ExprPtr target;
    ExprPtr value;
};

struct StarredExpr {
    ExprPtr value;
};

struct AwaitExpr {
    ExprPtr value;
};

struct YieldExpr {
    ExprPtr value; ///< May be null.
    bool is_from = false;
};

struct Expr {
    std::variant<NameExpr, ConstantExpr, UnaryExpr, BinaryExpr, BoolOpExpr, CompareExpr, CallExpr,
                 AttributeExpr, SubscriptExpr, SliceExpr, CollectionExpr, DictExpr,
                 ComprehensionExpr, LambdaExpr, IfExpr, NamedExpr, StarredExpr, AwaitExpr,
                 YieldExpr>
        kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// ============================================================================
// Statements
// ============================================================================

struct ExprStmt {
    ExprPtr expr;
};

/// `a = b = value`, or an annotated assignment `a: T = value` where `value`
/// may be null.
struct AssignStmt {
    std::vector<ExprPtr> targets;
    ExprPtr value;
    ExprPtr annotation;
};

struct AugAssignStmt {
    ExprPtr target;
    std::string op; ///< Operator without the `=`, e.g. "+"
    ExprPtr value;
};

struct ReturnStmt {
    ExprPtr value; ///< May be null.
};

struct RaiseStmt {
    ExprPtr exception; ///< Null for a bare re-raise.
    ExprPtr cause;
};

struct AssertStmt {
    ExprPtr test;
    ExprPtr message;
};

struct DelStmt {
    std::vector<ExprPtr> targets;
};

/// `pass`, `break`, `continue`, `global a, b`, `nonlocal a`
struct KeywordStmt {
    std::string keyword;
    std::vector<std::string> names;
};

struct ImportStmt {
    std::string module; ///< Empty for plain `import a, b`.
    std::vector<std::string> names;
};

struct IfStmt {
    ExprPtr test;
    Suite body;
    Suite orelse; ///< An `elif` is a nested IfStmt here.
};

struct WhileStmt {
    ExprPtr test;
    Suite body;
    Suite orelse;
};

struct ForStmt {
    ExprPtr target;
    ExprPtr iter;
    Suite body;
    Suite orelse;
    bool is_async = false;
};

struct ExceptHandler {
    ExprPtr type; ///< Null for a bare `except:`.
    std::optional<std::string> name;
    Suite body;
    SourceSpan span;
};

struct TryStmt {
    Suite body;
    std::vector<ExceptHandler> handlers;
    Suite orelse;
    Suite finalbody;
    bool is_star = false; ///< `except*`
};

struct WithItem {
    ExprPtr context;
    ExprPtr target;
};

struct WithStmt {
    std::vector<WithItem> items;
    Suite body;
    bool is_async = false;
};

/// One `case`. Patterns are kept as source spans only.
struct MatchCase {
    SourceSpan pattern_span;
    ExprPtr guard;
    Suite body;
};

struct MatchStmt {
    ExprPtr subject;
    std::vector<MatchCase> cases;
};

/// `type Alias[T] = value`
struct TypeAliasStmt {
    std::string name;
    ExprPtr value;
};

/// Where the body of a `def` or `class` begins relative to its header.
struct BlockLayout {
    uint32_t colon_end = 0;     ///< Offset just past the header's `:`.
    bool inline_body = false;   ///< Body on the header line (`def f(): pass`).
    uint32_t header_line = 0;   ///< Line of the `:` token.
};

struct FunctionDef {
    std::string name;
    std::vector<Parameter> params;
    ExprPtr returns; ///< Return annotation, may be null.
    Suite body;
    std::vector<ExprPtr> decorators;
    std::optional<SourceLocation> decorator_start; ///< Location of the first `@`.
    std::string type_params;                       ///< `[T, *Ts]` text, empty if none.
    BlockLayout layout;
    bool is_async = false;
};

struct ClassDef {
    std::string name;
    std::vector<Argument> bases;
    Suite body;
    std::vector<ExprPtr> decorators;
    std::optional<SourceLocation> decorator_start;
    std::string type_params;
    BlockLayout layout;
};

struct Stmt {
    std::variant<ExprStmt, AssignStmt, AugAssignStmt, ReturnStmt, RaiseStmt, AssertStmt, DelStmt,
                 KeywordStmt, ImportStmt, IfStmt, WhileStmt, ForStmt, TryStmt, WithStmt, MatchStmt,
                 TypeAliasStmt, FunctionDef, ClassDef>
        kind;
    SourceSpan span; ///< Excludes decorators for definitions.

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

struct Module {
    Suite body;
};

// ============================================================================
// Node Construction
// ============================================================================

template <typename T> [[nodiscard]] auto make_expr(T kind, SourceSpan span) -> ExprPtr {
    return make_box<Expr>(Expr{.kind = std::move(kind), .span = span});
}

template <typename T> [[nodiscard]] auto make_stmt(T kind, SourceSpan span) -> StmtPtr {
    return make_box<Stmt>(Stmt{.kind = std::move(kind), .span = span});
}

} // namespace docforge::parser

#endif // DOCFORGE_PARSER_AST_HPP

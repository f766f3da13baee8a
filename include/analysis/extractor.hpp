//! # Element Extractor
//!
//! Walks a parsed module and builds one `CodeElement` per function, method,
//! constructor and class, in source (pre-order) order.
//!
//! ## Scoping
//!
//! | Context of the `def`          | Kind        | Qualified name          |
//! |-------------------------------|-------------|-------------------------|
//! | module level                  | Function    | `name`                  |
//! | class body                    | Method      | `Class.name`            |
//! | class body, `__init__`        | Constructor | `Class.__init__`        |
//! | function body                 | Function    | `outer.<locals>.name`   |
//!
//! Definitions inside compound statements (`if`, `try`, `with`, ...) keep
//! the scope of the statement that contains them.
//!
//! ```cpp
//! auto source = lexer::Source::from_string(text);
//! auto result = analysis::analyze(source);
//! if (is_ok(result)) {
//!     for (const auto& element : unwrap(result)) { ... }
//! }
//! ```

#ifndef DOCFORGE_ANALYSIS_EXTRACTOR_HPP
#define DOCFORGE_ANALYSIS_EXTRACTOR_HPP

#include "analysis/code_element.hpp"
#include "lexer/source.hpp"
#include "parser/parser.hpp"

#include <functional>
#include <string>
#include <vector>

namespace docforge::analysis {

/// Called for each element right after it is built, with its AST node.
using ElementHook = std::function<void(CodeElement&, const parser::Stmt&)>;

class Extractor {
public:
    explicit Extractor(const lexer::Source& source, ElementHook hook = nullptr);

    [[nodiscard]] auto extract(const parser::Module& module) -> std::vector<CodeElement>;

private:
    enum class Scope : uint8_t { Module, Class, Function };

    const lexer::Source& source_;
    ElementHook hook_;
    std::string indent_unit_;
    std::vector<CodeElement> elements_;

    void visit_suite(const parser::Suite& suite, Scope scope, const std::string& prefix);
    void visit_function(const parser::Stmt& stmt, Scope scope, const std::string& prefix);
    void visit_class(const parser::Stmt& stmt, Scope scope, const std::string& prefix);

    // ========================================================================
    // Fact Collection
    // ========================================================================

    [[nodiscard]] auto text_of(const parser::Expr& expr) const -> std::string;
    [[nodiscard]] auto text_of(const parser::ExprPtr& expr) const -> std::optional<std::string>;
    void collect_decorators(const std::vector<parser::ExprPtr>& decorators,
                            CodeElement& element) const;
    [[nodiscard]] auto find_docstring(const parser::Suite& body) const -> std::optional<DocBlock>;
    [[nodiscard]] auto insertion_point(const parser::BlockLayout& layout,
                                       const parser::Suite& body,
                                       const SourceSpan& span) const -> InsertionPoint;
    [[nodiscard]] auto digest(const parser::Suite& body) const -> std::string;
    [[nodiscard]] auto indentation_of(uint32_t line) const -> std::string;
};

/// Parses `source` and extracts its elements without type inference.
[[nodiscard]] auto extract(const lexer::Source& source)
    -> Result<std::vector<CodeElement>, parser::ParseError>;

/// Parses, extracts and augments every element with inferred facts.
[[nodiscard]] auto analyze(const lexer::Source& source)
    -> Result<std::vector<CodeElement>, parser::ParseError>;

/// Leading whitespace of the first indented code line, or four spaces.
[[nodiscard]] auto detect_indent_unit(const lexer::Source& source) -> std::string;

} // namespace docforge::analysis

#endif // DOCFORGE_ANALYSIS_EXTRACTOR_HPP

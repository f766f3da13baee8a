//! # Code Element Model
//!
//! Structured description of one documentable unit of a Python file:
//! a function, method, constructor or class. Elements are produced by the
//! extractor in source order and consumed by the generator, critic, scorer
//! and injector; none of those stages look at the AST again.
//!
//! ## Lifecycle
//!
//! - `Extractor` fills every field except the inferred ones
//! - `augment()` fills `inferred_type`, `complexity_score` and `warnings`
//! - afterwards elements are read-only
//!
//! `source_span` and `existing_doc` are never touched after extraction.

#ifndef DOCFORGE_ANALYSIS_CODE_ELEMENT_HPP
#define DOCFORGE_ANALYSIS_CODE_ELEMENT_HPP

#include "common.hpp"
#include "parser/ast.hpp"

#include <optional>
#include <string>
#include <vector>

namespace docforge::analysis {

// ============================================================================
// Element Kinds and Modifiers
// ============================================================================

enum class ElementKind : uint8_t {
    Function,
    Method,
    Constructor,
    Class,
};

[[nodiscard]] auto element_kind_to_string(ElementKind kind) -> std::string_view;

enum class Modifier : uint8_t {
    Async = 1 << 0,
    Decorated = 1 << 1,
    StaticMethod = 1 << 2,
    ClassMethod = 1 << 3,
    Property = 1 << 4,
    Abstract = 1 << 5,
};

[[nodiscard]] auto modifier_to_string(Modifier modifier) -> std::string_view;

/// Small bit set of `Modifier` flags.
struct Modifiers {
    uint8_t bits = 0;

    void set(Modifier m) {
        bits |= static_cast<uint8_t>(m);
    }

    [[nodiscard]] auto has(Modifier m) const -> bool {
        return (bits & static_cast<uint8_t>(m)) != 0;
    }

    [[nodiscard]] auto empty() const -> bool {
        return bits == 0;
    }

    /// Names of the set flags in declaration order.
    [[nodiscard]] auto names() const -> std::vector<std::string>;
};

// ============================================================================
// Element Facts
// ============================================================================

using parser::ParamKind;

[[nodiscard]] auto param_kind_to_string(ParamKind kind) -> std::string_view;

struct Parameter {
    std::string name;
    std::optional<std::string> declared_type; ///< Annotation source text.
    std::optional<std::string> default_value; ///< Default expression source text.
    std::optional<std::string> inferred_type; ///< Filled by `augment()`.
    ParamKind kind = ParamKind::Positional;

    /// Declared type if present, otherwise the inferred one unless unknown.
    [[nodiscard]] auto display_type() const -> std::optional<std::string>;
};

struct ReturnInfo {
    std::optional<std::string> declared_type;
    std::optional<std::string> inferred_type;
    bool is_generator = false;
    bool is_multi_value = false;

    [[nodiscard]] auto display_type() const -> std::optional<std::string>;
};

struct ExceptionInfo {
    std::string kind; ///< Dotted name as written, e.g. "ValueError" or "errors.Timeout".
    std::optional<std::string> description;
};

/// A docstring already present in the source.
struct DocBlock {
    std::string raw;   ///< Literal text including prefix and quotes.
    std::string value; ///< Decoded string contents.
    SourceSpan span;   ///< Exact span of the string literal.
};

/// Where a new docstring goes when the element has none.
///
/// For a regular body the block is inserted at `offset`, the start of the
/// line after the header, with every line prefixed by `indent`. For an
/// inline body (`def f(): return 1`) the text between `offset` (just past
/// the colon) and `body_offset` is replaced so the block and the old body
/// each get their own line.
struct InsertionPoint {
    uint32_t offset = 0;
    uint32_t body_offset = 0;
    std::string indent;
    bool inline_body = false;
};

/// Marker stored in `inferred_type` when no type could be determined.
constexpr const char* UNKNOWN_TYPE = "unknown";

struct CodeElement {
    ElementKind kind = ElementKind::Function;
    std::string name;
    std::string qualified_name;
    std::vector<Parameter> parameters;
    std::optional<std::string> receiver; ///< `self` or `cls` when bound.
    std::optional<ReturnInfo> returns;
    std::vector<ExceptionInfo> raises;
    std::optional<DocBlock> existing_doc;
    SourceSpan source_span;
    std::optional<SourceSpan> decorator_span;
    InsertionPoint insertion;
    int complexity_score = 1;
    Modifiers modifiers;
    std::vector<std::string> decorators;
    std::string body_digest;
    std::vector<std::string> attributes; ///< Class only.
    std::vector<std::string> warnings;

    [[nodiscard]] auto is_class() const -> bool {
        return kind == ElementKind::Class;
    }

    [[nodiscard]] auto has_existing_doc() const -> bool {
        return existing_doc.has_value() && !existing_doc->value.empty();
    }

    /// Key used to match results back to elements.
    [[nodiscard]] auto offset() const -> uint32_t {
        return source_span.start.offset;
    }
};

} // namespace docforge::analysis

#endif // DOCFORGE_ANALYSIS_CODE_ELEMENT_HPP

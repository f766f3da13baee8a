//! # Type and Complexity Inference
//!
//! Fills the inferred facts of a `CodeElement` from its AST node:
//! parameter types from usage evidence, the return type from `return` and
//! `yield` expressions, and the cyclomatic complexity.
//!
//! ## Evidence Resolution
//!
//! Each use of an unannotated parameter in the element's own body adds an
//! `Evidence` tag to that parameter's bit set. Every tag maps to a set of
//! candidate types; the candidates of all tags are intersected and the
//! result is named by the first entry of a fixed priority table whose type
//! set contains it. An empty intersection or a parameter with no evidence
//! resolves to `UNKNOWN_TYPE` and adds a warning to the element.
//!
//! `AttributeAccess` is weak evidence: it only decides the type (`object`)
//! when no other tag was collected.

#ifndef DOCFORGE_ANALYSIS_INFERENCE_HPP
#define DOCFORGE_ANALYSIS_INFERENCE_HPP

#include "analysis/code_element.hpp"
#include "parser/ast.hpp"

#include <bitset>
#include <optional>
#include <string>

namespace docforge::analysis {

// ============================================================================
// Evidence Tags
// ============================================================================

enum class Evidence : uint8_t {
    Arithmetic,
    Bitwise,
    StringOperand,
    Indexed,
    KeyAccess,
    Subscripted,
    Iterated,
    Membership,
    Sized,
    ListMethod,
    SetMethod,
    Called,
    AttributeAccess,
    NumericBuiltin,
    RangeArgument,
    DefaultInt,
    DefaultFloat,
    DefaultStr,
    DefaultBool,
    DefaultList,
    DefaultTuple,
    DefaultDict,
    DefaultSet,
    Count,
};

constexpr size_t EVIDENCE_COUNT = static_cast<size_t>(Evidence::Count);

using EvidenceSet = std::bitset<EVIDENCE_COUNT>;

[[nodiscard]] auto evidence_to_string(Evidence evidence) -> std::string_view;

// ============================================================================
// Type Sets
// ============================================================================

/// Bit flags over the base types the inferencer can name.
namespace types {
constexpr uint16_t INT = 1 << 0;
constexpr uint16_t FLOAT = 1 << 1;
constexpr uint16_t STR = 1 << 2;
constexpr uint16_t BOOL = 1 << 3;
constexpr uint16_t LIST = 1 << 4;
constexpr uint16_t TUPLE = 1 << 5;
constexpr uint16_t DICT = 1 << 6;
constexpr uint16_t SET = 1 << 7;
constexpr uint16_t CALLABLE = 1 << 8;
constexpr uint16_t OBJECT = 1 << 9;
constexpr uint16_t ALL = (1 << 10) - 1;
} // namespace types

using TypeSet = uint16_t;

/// Candidate types of one evidence tag.
[[nodiscard]] auto candidates(Evidence evidence) -> TypeSet;

/// Resolves collected evidence to a type name, or nullopt when there is
/// no evidence or the evidence conflicts.
[[nodiscard]] auto resolve(const EvidenceSet& evidence) -> std::optional<std::string>;

/// Names a type set: a priority table entry when one matches exactly,
/// otherwise the member names joined with " | ".
[[nodiscard]] auto render_types(TypeSet set) -> std::string;

/// Maps a simple annotation (`int`, `list[str]`, `Dict[str, int]`, ...)
/// to its base type set, or 0 when it names something else.
[[nodiscard]] auto annotation_types(std::string_view annotation) -> TypeSet;

// ============================================================================
// Analyses
// ============================================================================

/// Evidence for `name` collected from the function's own body.
[[nodiscard]] auto collect_evidence(const parser::FunctionDef& func, std::string_view name)
    -> EvidenceSet;

/// 1 + decision points of the body, nested scopes excluded.
[[nodiscard]] auto compute_complexity(const parser::Suite& body) -> int;

/// Fills `inferred_type`, `complexity_score` and `warnings` of `element`.
/// `node` must be the FunctionDef or ClassDef the element was built from.
void augment(CodeElement& element, const parser::Stmt& node);

} // namespace docforge::analysis

#endif // DOCFORGE_ANALYSIS_INFERENCE_HPP

//! # Confidence Scorer
//!
//! Blends the critic score with objective coverage and clarity checks:
//!
//! | Component          | Weight |
//! |--------------------|--------|
//! | critic score       | 0.40   |
//! | parameter coverage | 0.20   |
//! | return coverage    | 0.15   |
//! | exception coverage | 0.10   |
//! | clarity            | 0.15   |
//!
//! The result is pure: the same inputs always give the same confidence.

#ifndef DOCFORGE_DOC_SCORER_HPP
#define DOCFORGE_DOC_SCORER_HPP

#include "analysis/code_element.hpp"
#include "doc/critic.hpp"
#include "doc/style.hpp"

#include <string_view>

namespace docforge::doc {

constexpr double WEIGHT_CRITIC = 0.40;
constexpr double WEIGHT_PARAMETERS = 0.20;
constexpr double WEIGHT_RETURNS = 0.15;
constexpr double WEIGHT_EXCEPTIONS = 0.10;
constexpr double WEIGHT_CLARITY = 0.15;

/// Individual components, kept for reports and diagnostics.
struct ScoreBreakdown {
    double critic = 0.0;
    double parameters = 0.0;
    double returns = 0.0;
    double exceptions = 0.0;
    double clarity = 0.0;

    [[nodiscard]] auto total() const -> double;
};

[[nodiscard]] auto breakdown(const analysis::CodeElement& element, std::string_view candidate,
                             const CriticReview& review, DocStyle style) -> ScoreBreakdown;

/// Weighted confidence in [0, 1].
[[nodiscard]] auto score(const analysis::CodeElement& element, std::string_view candidate,
                         const CriticReview& review, DocStyle style) -> double;

/// Fraction of parameters named in the block; 1.0 without parameters.
[[nodiscard]] auto parameter_coverage(const analysis::CodeElement& element,
                                      std::string_view candidate) -> double;

[[nodiscard]] auto exception_coverage(const analysis::CodeElement& element,
                                      std::string_view candidate) -> double;

/// 1.0 when a returns section is present exactly when the element returns.
[[nodiscard]] auto return_coverage(const analysis::CodeElement& element,
                                   std::string_view candidate, DocStyle style) -> double;

/// Thirds for the word band, the required section headers and the delimiters.
[[nodiscard]] auto clarity(const analysis::CodeElement& element, std::string_view candidate,
                           DocStyle style) -> double;

} // namespace docforge::doc

#endif // DOCFORGE_DOC_SCORER_HPP

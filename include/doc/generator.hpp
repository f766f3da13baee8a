//! # Docstring Generator
//!
//! Produces a candidate block for an element. With a completion backend
//! the generator sends the element facts, the style template and the
//! previous review, then validates the reply; an invalid reply or a
//! backend failure falls back to the rule-based rendering for that
//! iteration. Without a backend only the rule-based rendering is used.
//!
//! The rule-based rendering is deterministic and never fails:
//!
//! ```text
//! compute_total(a, b=0) -> int   =>   """Compute total.
//!
//!                                     Args:
//!                                         a (int): Description of a.
//!                                         b (int): Description of b. Defaults to 0.
//!
//!                                     Returns:
//!                                         int: Description of return value.
//!                                     """
//! ```

#ifndef DOCFORGE_DOC_GENERATOR_HPP
#define DOCFORGE_DOC_GENERATOR_HPP

#include "analysis/code_element.hpp"
#include "backend/backend.hpp"
#include "doc/critic.hpp"
#include "doc/style.hpp"

#include <string>

namespace docforge::doc {

class Generator {
public:
    explicit Generator(Rc<backend::CompletionBackend> completion = nullptr);

    /// Candidate block for `element`. `prior` is the review of the previous
    /// iteration, if any.
    [[nodiscard]] auto generate(const analysis::CodeElement& element, DocStyle style,
                                const CriticReview* prior = nullptr) const -> std::string;

    [[nodiscard]] auto has_backend() const -> bool {
        return completion_ != nullptr;
    }

private:
    Rc<backend::CompletionBackend> completion_;

    [[nodiscard]] auto complete(const analysis::CodeElement& element, DocStyle style,
                                const CriticReview* prior) const -> std::optional<std::string>;
};

/// Deterministic block built from the element facts alone.
[[nodiscard]] auto render_rule_based(const analysis::CodeElement& element, DocStyle style)
    -> std::string;

/// One-line summary derived from the element name, e.g. "Compute total.".
[[nodiscard]] auto summarize_name(const analysis::CodeElement& element) -> std::string;

/// Checks that a normalized block names every parameter and exception.
/// Returns the first missing name, or nullopt when complete.
[[nodiscard]] auto find_missing_fact(const analysis::CodeElement& element, std::string_view block)
    -> std::optional<std::string>;

} // namespace docforge::doc

#endif // DOCFORGE_DOC_GENERATOR_HPP

//! # Critic
//!
//! Reviews a candidate block against the element facts. Four objective
//! checks each contribute an equal share of the score:
//!
//! 1. format: non-empty, `"""`-delimited, word count within the clarity
//!    band, at most `MAX_LINES` lines
//! 2. every parameter is named
//! 3. a returns (or yields) section is present exactly when the element
//!    returns a value
//! 4. every raised exception kind is named
//!
//! With an evaluation backend the objective score is averaged with the
//! backend's score. When the element has nothing to cover (no parameters,
//! no returns, no exceptions) the objective format check decides alone.

#ifndef DOCFORGE_DOC_CRITIC_HPP
#define DOCFORGE_DOC_CRITIC_HPP

#include "analysis/code_element.hpp"
#include "backend/backend.hpp"
#include "doc/style.hpp"

#include <string>
#include <vector>

namespace docforge::doc {

struct CriticReview {
    double score = 0.0;
    std::vector<std::string> issues;
    std::vector<std::string> suggestions;
};

class Critic {
public:
    explicit Critic(Rc<backend::EvaluationBackend> evaluation = nullptr);

    [[nodiscard]] auto review(const analysis::CodeElement& element, std::string_view candidate,
                              DocStyle style) const -> CriticReview;

private:
    Rc<backend::EvaluationBackend> evaluation_;
};

/// The four objective checks without any backend.
[[nodiscard]] auto objective_review(const analysis::CodeElement& element,
                                    std::string_view candidate, DocStyle style) -> CriticReview;

/// True when the element has no parameters, exceptions or return value.
[[nodiscard]] auto has_nothing_to_cover(const analysis::CodeElement& element) -> bool;

} // namespace docforge::doc

#endif // DOCFORGE_DOC_CRITIC_HPP

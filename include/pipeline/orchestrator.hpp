//! # Refinement Orchestrator
//!
//! Drives the generate / review / score loop for one element as an explicit
//! bounded state machine:
//!
//! ```text
//! Init ──generate──▶ Generated ──review+score──▶ Reviewed
//!                        ▲                          │
//!                        └──── below threshold, ────┤
//!                              iteration < max      ├── confidence >= threshold ──▶ Accepted
//!                                                   └── iteration == max ─────────▶ Exhausted
//! ```
//!
//! The generator runs at most `max_iterations` times per element. An
//! exhausted loop returns the highest-scoring candidate of all iterations
//! (the earliest one on ties) with a "threshold not reached" warning.

#ifndef DOCFORGE_PIPELINE_ORCHESTRATOR_HPP
#define DOCFORGE_PIPELINE_ORCHESTRATOR_HPP

#include "analysis/code_element.hpp"
#include "doc/critic.hpp"
#include "doc/generator.hpp"
#include "doc/style.hpp"
#include "json/json_value.hpp"

#include <string>
#include <vector>

namespace docforge::pipeline {

constexpr uint32_t DEFAULT_MAX_ITERATIONS = 3;
constexpr double DEFAULT_THRESHOLD = 0.8;
constexpr std::string_view THRESHOLD_NOT_REACHED = "threshold not reached";

enum class RefinementPhase : uint8_t {
    Init,
    Generated,
    Reviewed,
    Accepted,
    Exhausted,
};

enum class Outcome : uint8_t {
    Accepted,
    Exhausted,
};

[[nodiscard]] auto phase_name(RefinementPhase phase) -> std::string_view;
[[nodiscard]] auto outcome_name(Outcome outcome) -> std::string_view;

/// One pass through the loop. Kept for diagnostics only.
struct Attempt {
    std::string candidate;
    doc::CriticReview review;
    double confidence = 0.0;
};

struct RefinementState {
    RefinementPhase phase = RefinementPhase::Init;
    uint32_t iteration = 0;
    std::string best_candidate;
    double best_score = 0.0;
    uint32_t best_iteration = 0;
    std::vector<Attempt> history;
};

/// Terminal output for one element.
struct DocstringResult {
    std::string element_name;
    uint32_t element_offset = 0;
    std::string text;
    double confidence_score = 0.0;
    doc::DocStyle style = doc::DocStyle::Google;
    uint32_t iterations_used = 0;
    std::vector<std::string> warnings;
    Outcome outcome = Outcome::Accepted;

    [[nodiscard]] auto to_json() const -> json::JsonValue;
};

struct RefinementOptions {
    doc::DocStyle style = doc::DocStyle::Google;
    uint32_t max_iterations = DEFAULT_MAX_ITERATIONS;
    double threshold = DEFAULT_THRESHOLD;
};

class Orchestrator {
public:
    Orchestrator(const doc::Generator& generator, const doc::Critic& critic,
                 RefinementOptions options);

    [[nodiscard]] auto refine(const analysis::CodeElement& element) const -> DocstringResult;

    /// Same as `refine`, leaving the final loop state in `state`.
    [[nodiscard]] auto refine(const analysis::CodeElement& element, RefinementState& state) const
        -> DocstringResult;

    /// Refines every element on up to `jobs` workers; results keep the
    /// order of `elements`.
    [[nodiscard]] auto refine_all(const std::vector<const analysis::CodeElement*>& elements,
                                  size_t jobs) const -> std::vector<DocstringResult>;

    [[nodiscard]] auto options() const -> const RefinementOptions& {
        return options_;
    }

private:
    const doc::Generator& generator_;
    const doc::Critic& critic_;
    RefinementOptions options_;

    void step(const analysis::CodeElement& element, RefinementState& state,
              std::string& candidate) const;
};

} // namespace docforge::pipeline

#endif // DOCFORGE_PIPELINE_ORCHESTRATOR_HPP

#include "pipeline/orchestrator.hpp"

#include "doc/scorer.hpp"
#include "log/log.hpp"
#include "pipeline/work_queue.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace docforge::pipeline {

auto phase_name(RefinementPhase phase) -> std::string_view {
    switch (phase) {
    case RefinementPhase::Init:
        return "init";
    case RefinementPhase::Generated:
        return "generated";
    case RefinementPhase::Reviewed:
        return "reviewed";
    case RefinementPhase::Accepted:
        return "accepted";
    case RefinementPhase::Exhausted:
        return "exhausted";
    }
    return "unknown";
}

auto outcome_name(Outcome outcome) -> std::string_view {
    switch (outcome) {
    case Outcome::Accepted:
        return "accepted";
    case Outcome::Exhausted:
        return "exhausted";
    }
    return "unknown";
}

auto DocstringResult::to_json() const -> json::JsonValue {
    auto obj = json::json_object();
    obj.set("element", json::JsonValue(element_name));
    obj.set("offset", json::JsonValue(static_cast<int64_t>(element_offset)));
    obj.set("style", json::JsonValue(doc::style_name(style)));
    obj.set("confidence", json::JsonValue(confidence_score));
    obj.set("iterations", json::JsonValue(static_cast<int64_t>(iterations_used)));
    obj.set("outcome", json::JsonValue(outcome_name(outcome)));
    obj.set("warnings", json::json_string_array(warnings));
    obj.set("text", json::JsonValue(text));
    return obj;
}

Orchestrator::Orchestrator(const doc::Generator& generator, const doc::Critic& critic,
                           RefinementOptions options)
    : generator_(generator), critic_(critic), options_(options) {
    options_.max_iterations = std::max<uint32_t>(options_.max_iterations, 1);
}

// ============================================================================
// State Machine
// ============================================================================

void Orchestrator::step(const analysis::CodeElement& element, RefinementState& state,
                        std::string& candidate) const {
    switch (state.phase) {
    case RefinementPhase::Init:
        candidate = generator_.generate(element, options_.style);
        state.iteration = 1;
        state.phase = RefinementPhase::Generated;
        break;

    case RefinementPhase::Generated: {
        auto review = critic_.review(element, candidate, options_.style);
        double confidence = doc::score(element, candidate, review, options_.style);
        DOCFORGE_LOG_DEBUG("refine", element.qualified_name << " iteration " << state.iteration
                                                            << ": critic " << review.score
                                                            << ", confidence " << confidence);
        if (state.history.empty() || confidence > state.best_score) {
            state.best_candidate = candidate;
            state.best_score = confidence;
            state.best_iteration = state.iteration;
        }
        state.history.push_back(Attempt{
            .candidate = candidate,
            .review = std::move(review),
            .confidence = confidence,
        });
        state.phase = RefinementPhase::Reviewed;
        break;
    }

    case RefinementPhase::Reviewed: {
        const auto& last = state.history.back();
        if (last.confidence >= options_.threshold) {
            state.phase = RefinementPhase::Accepted;
        } else if (state.iteration < options_.max_iterations) {
            candidate = generator_.generate(element, options_.style, &last.review);
            ++state.iteration;
            state.phase = RefinementPhase::Generated;
        } else {
            state.phase = RefinementPhase::Exhausted;
        }
        break;
    }

    case RefinementPhase::Accepted:
    case RefinementPhase::Exhausted:
        break;
    }
}

auto Orchestrator::refine(const analysis::CodeElement& element) const -> DocstringResult {
    RefinementState state;
    return refine(element, state);
}

auto Orchestrator::refine(const analysis::CodeElement& element, RefinementState& state) const
    -> DocstringResult {
    state = RefinementState{};
    std::string candidate;
    while (state.phase != RefinementPhase::Accepted &&
           state.phase != RefinementPhase::Exhausted) {
        step(element, state, candidate);
    }

    DocstringResult result{
        .element_name = element.qualified_name,
        .element_offset = element.offset(),
        .style = options_.style,
        .iterations_used = state.iteration,
        .warnings = element.warnings,
    };

    if (state.phase == RefinementPhase::Accepted) {
        result.text = candidate;
        result.confidence_score = state.history.back().confidence;
        result.outcome = Outcome::Accepted;
        DOCFORGE_LOG_INFO("refine", element.qualified_name << " accepted at iteration "
                                                           << state.iteration);
    } else {
        result.text = state.best_candidate;
        result.confidence_score = state.best_score;
        result.outcome = Outcome::Exhausted;

        std::ostringstream warning;
        warning << THRESHOLD_NOT_REACHED << ": best confidence " << std::fixed
                << std::setprecision(2) << state.best_score << " < " << options_.threshold
                << " after " << state.iteration << " iteration"
                << (state.iteration == 1 ? "" : "s");
        result.warnings.push_back(warning.str());
        DOCFORGE_LOG_WARN("refine", element.qualified_name << ": " << warning.str());
    }
    return result;
}

auto Orchestrator::refine_all(const std::vector<const analysis::CodeElement*>& elements,
                              size_t jobs) const -> std::vector<DocstringResult> {
    std::vector<DocstringResult> results(elements.size());
    run_workers(elements.size(), jobs,
                [&](size_t index) { results[index] = refine(*elements[index]); });
    return results;
}

} // namespace docforge::pipeline

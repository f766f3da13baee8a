#include "doc/critic.hpp"

#include "analysis/element_json.hpp"
#include "doc/docstring.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace docforge::doc {

namespace {

constexpr double CHECK_SHARE = 0.25;

/// Format problems of a candidate; empty when the format check passes.
auto format_issues(std::string_view candidate) -> std::vector<std::string> {
    std::vector<std::string> issues;
    if (candidate.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        issues.emplace_back("docstring is empty");
        return issues;
    }
    if (!is_delimited(candidate)) {
        issues.emplace_back("docstring is not delimited by triple quotes");
    }
    auto words = word_count(candidate);
    if (words < MIN_WORDS) {
        issues.push_back("docstring has " + std::to_string(words) + " words, at least " +
                         std::to_string(MIN_WORDS) + " expected");
    } else if (words > MAX_WORDS) {
        issues.push_back("docstring has " + std::to_string(words) + " words, at most " +
                         std::to_string(MAX_WORDS) + " expected");
    }
    if (line_count(candidate) > MAX_LINES) {
        issues.push_back("docstring exceeds " + std::to_string(MAX_LINES) + " lines");
    }
    return issues;
}

void append(std::vector<std::string>& into, const std::vector<std::string>& from) {
    into.insert(into.end(), from.begin(), from.end());
}

} // namespace

auto has_nothing_to_cover(const analysis::CodeElement& element) -> bool {
    return element.parameters.empty() && !element.returns && element.raises.empty();
}

auto objective_review(const analysis::CodeElement& element, std::string_view candidate,
                      DocStyle style) -> CriticReview {
    CriticReview review;

    auto format = format_issues(candidate);
    bool format_ok = format.empty();
    append(review.issues, format);
    if (!format_ok) {
        review.suggestions.emplace_back("write a one-line summary inside a single \"\"\" block");
    }

    if (has_nothing_to_cover(element)) {
        review.score = format_ok ? 1.0 : 0.0;
        return review;
    }

    int passed = format_ok ? 1 : 0;
    auto body = block_body(candidate);

    bool params_ok = true;
    for (const auto& param : element.parameters) {
        if (!mentions(body, param.name)) {
            params_ok = false;
            review.issues.push_back("parameter '" + param.name + "' is not documented");
        }
    }
    if (!params_ok) {
        review.suggestions.push_back(std::string("describe every parameter in the ") +
                                     std::string(section_name(Section::Parameters)) +
                                     " section");
    }
    passed += params_ok ? 1 : 0;

    bool has_returns = has_return_section(style, candidate);
    if (element.returns && !has_returns) {
        review.issues.emplace_back(element.returns->is_generator ? "missing yields section"
                                                                 : "missing returns section");
        review.suggestions.emplace_back("document the returned value and its type");
    } else if (!element.returns && has_returns) {
        review.issues.emplace_back("returns section documents a value that is never returned");
        review.suggestions.emplace_back("remove the returns section");
    } else {
        ++passed;
    }

    bool raises_ok = true;
    for (const auto& exc : element.raises) {
        if (!mentions(body, exc.kind)) {
            raises_ok = false;
            review.issues.push_back("exception '" + exc.kind + "' is not documented");
        }
    }
    if (!raises_ok) {
        review.suggestions.emplace_back("list each raised exception with its condition");
    }
    passed += raises_ok ? 1 : 0;

    review.score = CHECK_SHARE * passed;
    return review;
}

Critic::Critic(Rc<backend::EvaluationBackend> evaluation) : evaluation_(std::move(evaluation)) {}

auto Critic::review(const analysis::CodeElement& element, std::string_view candidate,
                    DocStyle style) const -> CriticReview {
    auto review = objective_review(element, candidate, style);
    if (!evaluation_ || has_nothing_to_cover(element)) {
        return review;
    }

    backend::EvaluationRequest request{
        .element = analysis::to_prompt_json(element),
        .style = std::string(style_template_id(style)),
        .candidate = std::string(candidate),
    };
    auto reply = evaluation_->evaluate(request);
    if (is_err(reply)) {
        DOCFORGE_LOG_WARN("critic", element.qualified_name
                                        << ": evaluation failed (" << unwrap_err(reply).message
                                        << "), keeping objective score");
        return review;
    }

    const auto& evaluation = unwrap(reply);
    double external = std::clamp(evaluation.score, 0.0, 1.0);
    DOCFORGE_LOG_DEBUG("critic", element.qualified_name << ": objective " << review.score
                                                        << ", backend " << external);
    review.score = 0.5 * review.score + 0.5 * external;
    append(review.issues, evaluation.issues);
    append(review.suggestions, evaluation.suggestions);
    return review;
}

} // namespace docforge::doc

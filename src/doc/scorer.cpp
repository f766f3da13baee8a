#include "doc/scorer.hpp"

#include "doc/docstring.hpp"

#include <algorithm>

namespace docforge::doc {

auto ScoreBreakdown::total() const -> double {
    double sum = critic * WEIGHT_CRITIC + parameters * WEIGHT_PARAMETERS +
                 returns * WEIGHT_RETURNS + exceptions * WEIGHT_EXCEPTIONS +
                 clarity * WEIGHT_CLARITY;
    return std::clamp(sum, 0.0, 1.0);
}

auto parameter_coverage(const analysis::CodeElement& element, std::string_view candidate)
    -> double {
    if (element.parameters.empty()) {
        return 1.0;
    }
    auto body = block_body(candidate);
    auto named = std::count_if(element.parameters.begin(), element.parameters.end(),
                               [&](const auto& param) { return mentions(body, param.name); });
    return static_cast<double>(named) / static_cast<double>(element.parameters.size());
}

auto exception_coverage(const analysis::CodeElement& element, std::string_view candidate)
    -> double {
    if (element.raises.empty()) {
        return 1.0;
    }
    auto body = block_body(candidate);
    auto named = std::count_if(element.raises.begin(), element.raises.end(),
                               [&](const auto& exc) { return mentions(body, exc.kind); });
    return static_cast<double>(named) / static_cast<double>(element.raises.size());
}

auto return_coverage(const analysis::CodeElement& element, std::string_view candidate,
                     DocStyle style) -> double {
    return has_return_section(style, candidate) == element.returns.has_value() ? 1.0 : 0.0;
}

auto clarity(const analysis::CodeElement& element, std::string_view candidate, DocStyle style)
    -> double {
    int passed = 0;

    auto words = word_count(candidate);
    if (words >= MIN_WORDS && words <= MAX_WORDS) {
        ++passed;
    }

    auto sections = required_sections(element);
    if (std::all_of(sections.begin(), sections.end(),
                    [&](Section section) { return has_section(style, candidate, section); })) {
        ++passed;
    }

    if (is_delimited(candidate)) {
        ++passed;
    }
    return passed / 3.0;
}

auto breakdown(const analysis::CodeElement& element, std::string_view candidate,
               const CriticReview& review, DocStyle style) -> ScoreBreakdown {
    return ScoreBreakdown{
        .critic = std::clamp(review.score, 0.0, 1.0),
        .parameters = parameter_coverage(element, candidate),
        .returns = return_coverage(element, candidate, style),
        .exceptions = exception_coverage(element, candidate),
        .clarity = clarity(element, candidate, style),
    };
}

auto score(const analysis::CodeElement& element, std::string_view candidate,
           const CriticReview& review, DocStyle style) -> double {
    return breakdown(element, candidate, review, style).total();
}

} // namespace docforge::doc

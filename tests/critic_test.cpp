//! # Critic Tests
//!
//! Style section detection, the four objective checks and blending with an
//! evaluation backend.

#include "analysis/extractor.hpp"
#include "doc/critic.hpp"
#include "doc/docstring.hpp"
#include "doc/generator.hpp"
#include "doc/style.hpp"
#include "stub_backend.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <memory>

using namespace docforge;
using namespace docforge::doc;
using analysis::CodeElement;

class CriticTest : public ::testing::Test {
protected:
    std::unique_ptr<lexer::Source> source_;

    auto analyze_one(const std::string& code) -> CodeElement {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code, "test.py"));
        auto result = analysis::analyze(*source_);
        EXPECT_TRUE(is_ok(result));
        if (is_err(result) || unwrap(result).empty()) {
            return CodeElement{};
        }
        return std::move(unwrap(result).front());
    }

    static auto has_issue(const CriticReview& review, const std::string& issue) -> bool {
        return std::find(review.issues.begin(), review.issues.end(), issue) != review.issues.end();
    }
};

// ============================================================================
// Styles
// ============================================================================

TEST(StyleTest, ParseNames) {
    EXPECT_EQ(parse_style("google"), DocStyle::Google);
    EXPECT_EQ(parse_style("NumPy"), DocStyle::Numpy);
    EXPECT_EQ(parse_style("rst"), DocStyle::Rest);
    EXPECT_EQ(parse_style("reStructuredText"), DocStyle::Rest);
    EXPECT_FALSE(parse_style("epytext"));
    EXPECT_EQ(style_name(DocStyle::Rest), "rst");
    EXPECT_EQ(style_template_id(DocStyle::Numpy), "numpy/1");
}

TEST(StyleTest, GoogleHeaders) {
    std::string block = "\"\"\"Load.\n\nArguments:\n    path: File.\n\nReturn:\n    Data.\n\"\"\"";
    EXPECT_TRUE(has_section(DocStyle::Google, block, Section::Parameters));
    EXPECT_TRUE(has_return_section(DocStyle::Google, block));
    EXPECT_FALSE(has_section(DocStyle::Google, block, Section::Raises));
}

TEST(StyleTest, NumpyHeadersNeedRule) {
    std::string ruled = "\"\"\"Load.\n\nReturns\n-------\ndict\n    Data.\n\"\"\"";
    std::string bare = "\"\"\"Load.\n\nReturns\ndict\n\"\"\"";
    EXPECT_TRUE(has_section(DocStyle::Numpy, ruled, Section::Returns));
    EXPECT_FALSE(has_section(DocStyle::Numpy, bare, Section::Returns));
    EXPECT_FALSE(has_section(DocStyle::Google, ruled, Section::Returns));
}

TEST(StyleTest, RestFields) {
    std::string block = "\"\"\"Load.\n\n:param path: File.\n:raises OSError: Missing.\n:rtype: dict\n\"\"\"";
    EXPECT_TRUE(has_section(DocStyle::Rest, block, Section::Parameters));
    EXPECT_TRUE(has_section(DocStyle::Rest, block, Section::Raises));
    EXPECT_TRUE(has_section(DocStyle::Rest, block, Section::Returns));
    EXPECT_FALSE(has_section(DocStyle::Rest, block, Section::Yields));
}

TEST_F(CriticTest, RequiredSections) {
    auto element = analyze_one("def gen(n):\n"
                               "    if n < 0:\n"
                               "        raise ValueError\n"
                               "    yield n\n");
    auto sections = required_sections(element);
    EXPECT_EQ(sections, (std::vector<Section>{Section::Parameters, Section::Yields,
                                              Section::Raises}));
}

// ============================================================================
// Objective Checks
// ============================================================================

TEST_F(CriticTest, RuleBasedCandidatePassesEverything) {
    auto element = analyze_one("def add(a, b):\n    return a + b\n");
    for (auto style : {DocStyle::Google, DocStyle::Numpy, DocStyle::Rest}) {
        auto review = objective_review(element, render_rule_based(element, style), style);
        EXPECT_DOUBLE_EQ(review.score, 1.0) << style_name(style);
        EXPECT_TRUE(review.issues.empty()) << style_name(style);
    }
}

TEST_F(CriticTest, UndocumentedParameter) {
    auto element = analyze_one("def add(a, b):\n    return a + b\n");
    auto review = objective_review(
        element, "\"\"\"Add numbers.\n\nArgs:\n    a: First.\n\nReturns:\n    Sum.\n\"\"\"",
        DocStyle::Google);
    EXPECT_DOUBLE_EQ(review.score, 0.75);
    EXPECT_TRUE(has_issue(review, "parameter 'b' is not documented"));
    EXPECT_FALSE(review.suggestions.empty());
}

TEST_F(CriticTest, ReturnsSectionWithoutValue) {
    auto element = analyze_one("def show(message):\n    print(message)\n");
    auto review = objective_review(
        element, "\"\"\"Show message.\n\nReturns:\n    Nothing useful.\n\"\"\"", DocStyle::Google);
    EXPECT_DOUBLE_EQ(review.score, 0.75);
    EXPECT_TRUE(has_issue(review, "returns section documents a value that is never returned"));
}

TEST_F(CriticTest, MissingYieldsSection) {
    auto element = analyze_one("def count():\n    yield 1\n");
    auto review = objective_review(element, R"("""Count upwards.""")", DocStyle::Google);
    EXPECT_DOUBLE_EQ(review.score, 0.75);
    EXPECT_TRUE(has_issue(review, "missing yields section"));
}

TEST_F(CriticTest, UndocumentedException) {
    auto element = analyze_one("def check():\n    raise KeyError('x')\n");
    auto review = objective_review(element, R"("""Check the state.""")", DocStyle::Google);
    EXPECT_DOUBLE_EQ(review.score, 0.75);
    EXPECT_TRUE(has_issue(review, "exception 'KeyError' is not documented"));
}

TEST_F(CriticTest, FormatProblems) {
    auto element = analyze_one("def add(a, b):\n    return a + b\n");

    auto empty = objective_review(element, "", DocStyle::Google);
    EXPECT_TRUE(has_issue(empty, "docstring is empty"));
    EXPECT_DOUBLE_EQ(empty.score, 0.25);

    auto bare = objective_review(element, "Add a and b.\n\nReturns:\n    Sum.", DocStyle::Google);
    EXPECT_TRUE(has_issue(bare, "docstring is not delimited by triple quotes"));
    EXPECT_DOUBLE_EQ(bare.score, 0.75);
}

TEST_F(CriticTest, NothingToCoverUsesFormatAlone) {
    auto element = analyze_one("def reset():\n    pass\n");
    EXPECT_TRUE(has_nothing_to_cover(element));

    EXPECT_DOUBLE_EQ(objective_review(element, R"("""Reset the state.""")", DocStyle::Google).score,
                     1.0);

    auto short_review = objective_review(element, R"("""Reset""")", DocStyle::Google);
    EXPECT_DOUBLE_EQ(short_review.score, 0.0);
    EXPECT_TRUE(has_issue(short_review, "docstring has 1 words, at least 2 expected"));
}

TEST_F(CriticTest, TooManyLines) {
    auto element = analyze_one("def reset():\n    pass\n");
    std::vector<std::string> lines(90, "More text here.");
    auto review = objective_review(element, make_block(lines), DocStyle::Google);
    EXPECT_TRUE(has_issue(review, "docstring exceeds 80 lines"));
}

// ============================================================================
// Evaluation Backend
// ============================================================================

TEST_F(CriticTest, BackendScoreIsAveraged) {
    auto element = analyze_one("def add(a, b):\n    return a + b\n");
    auto evaluation = std::make_shared<stubs::StubEvaluation>(backend::Evaluation{
        .score = 0.5, .issues = {"summary is vague"}, .suggestions = {"say what is added"}});
    Critic critic(evaluation);

    auto review = critic.review(element, render_rule_based(element, DocStyle::Google),
                                DocStyle::Google);
    EXPECT_DOUBLE_EQ(review.score, 0.75);
    EXPECT_TRUE(has_issue(review, "summary is vague"));
    EXPECT_EQ(review.suggestions.back(), "say what is added");
    EXPECT_EQ(evaluation->calls(), 1u);
}

TEST_F(CriticTest, BackendScoreIsClamped) {
    auto element = analyze_one("def add(a, b):\n    return a + b\n");
    auto evaluation =
        std::make_shared<stubs::StubEvaluation>(backend::Evaluation{.score = 3.0});
    Critic critic(evaluation);
    auto review = critic.review(element, render_rule_based(element, DocStyle::Google),
                                DocStyle::Google);
    EXPECT_DOUBLE_EQ(review.score, 1.0);
}

TEST_F(CriticTest, BackendFailureKeepsObjectiveScore) {
    auto element = analyze_one("def add(a, b):\n    return a + b\n");
    auto evaluation = std::make_shared<stubs::StubEvaluation>(backend::Evaluation{.score = 0.0});
    evaluation->set_failing(true);
    Critic critic(evaluation);

    auto review = critic.review(element, render_rule_based(element, DocStyle::Google),
                                DocStyle::Google);
    EXPECT_DOUBLE_EQ(review.score, 1.0);
}

TEST_F(CriticTest, NothingToCoverSkipsBackend) {
    auto element = analyze_one("def reset():\n    pass\n");
    auto evaluation = std::make_shared<stubs::StubEvaluation>(backend::Evaluation{.score = 0.0});
    Critic critic(evaluation);

    auto review = critic.review(element, R"("""Reset the state.""")", DocStyle::Google);
    EXPECT_DOUBLE_EQ(review.score, 1.0);
    EXPECT_EQ(evaluation->calls(), 0u);
}

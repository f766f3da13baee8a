//! # Extractor Tests
//!
//! Element kinds, qualified names, parameters, raises, existing docstrings
//! and insertion points.

#include "analysis/element_json.hpp"
#include "analysis/extractor.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace docforge;
using namespace docforge::analysis;

class ExtractorTest : public ::testing::Test {
protected:
    std::unique_ptr<lexer::Source> source_;

    auto extract_all(const std::string& code) -> std::vector<CodeElement> {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code, "test.py"));
        auto result = extract(*source_);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).message : "");
        if (is_err(result)) {
            return {};
        }
        return std::move(unwrap(result));
    }

    auto extract_one(const std::string& code) -> CodeElement {
        auto elements = extract_all(code);
        EXPECT_EQ(elements.size(), 1u);
        return elements.empty() ? CodeElement{} : std::move(elements.front());
    }
};

// ============================================================================
// Kinds and Names
// ============================================================================

TEST_F(ExtractorTest, SourceOrderAndQualifiedNames) {
    auto elements = extract_all("class Stack:\n"
                                "    def __init__(self):\n"
                                "        self.items = []\n"
                                "\n"
                                "    def push(self, item):\n"
                                "        def check(x):\n"
                                "            return x\n"
                                "        self.items.append(item)\n"
                                "\n"
                                "def helper():\n"
                                "    pass\n");
    ASSERT_EQ(elements.size(), 5u);

    EXPECT_EQ(elements[0].kind, ElementKind::Class);
    EXPECT_EQ(elements[0].qualified_name, "Stack");
    EXPECT_EQ(elements[1].kind, ElementKind::Constructor);
    EXPECT_EQ(elements[1].qualified_name, "Stack.__init__");
    EXPECT_EQ(elements[2].kind, ElementKind::Method);
    EXPECT_EQ(elements[2].qualified_name, "Stack.push");
    EXPECT_EQ(elements[3].kind, ElementKind::Function);
    EXPECT_EQ(elements[3].qualified_name, "Stack.push.<locals>.check");
    EXPECT_EQ(elements[4].qualified_name, "helper");

    for (size_t i = 1; i < elements.size(); ++i) {
        EXPECT_LT(elements[i - 1].offset(), elements[i].offset());
    }
}

TEST_F(ExtractorTest, ConditionalDefinitionsKeepScope) {
    auto elements = extract_all("if TYPE_CHECKING:\n"
                                "    def typed():\n"
                                "        pass\n"
                                "else:\n"
                                "    try:\n"
                                "        def fallback():\n"
                                "            pass\n"
                                "    except ImportError:\n"
                                "        pass\n");
    ASSERT_EQ(elements.size(), 2u);
    EXPECT_EQ(elements[0].qualified_name, "typed");
    EXPECT_EQ(elements[1].qualified_name, "fallback");
}

TEST_F(ExtractorTest, EmptyFileHasNoElements) {
    EXPECT_TRUE(extract_all("").empty());
    EXPECT_TRUE(extract_all("import os\nX = 1\n").empty());
}

// ============================================================================
// Parameters and Receivers
// ============================================================================

TEST_F(ExtractorTest, ReceiverIsRemovedFromParameters) {
    auto elements = extract_all("class A:\n"
                                "    def run(self, x, *args, key=None, **kwargs):\n"
                                "        pass\n"
                                "    @classmethod\n"
                                "    def make(cls, y):\n"
                                "        pass\n"
                                "    @staticmethod\n"
                                "    def util(z):\n"
                                "        pass\n");
    ASSERT_EQ(elements.size(), 4u);

    const auto& run = elements[1];
    EXPECT_EQ(run.receiver, "self");
    ASSERT_EQ(run.parameters.size(), 4u);
    EXPECT_EQ(run.parameters[0].name, "x");
    EXPECT_EQ(run.parameters[1].kind, ParamKind::VarPositional);
    EXPECT_EQ(run.parameters[2].default_value, "None");
    EXPECT_EQ(run.parameters[3].kind, ParamKind::VarKeyword);

    EXPECT_EQ(elements[2].receiver, "cls");
    EXPECT_TRUE(elements[2].modifiers.has(Modifier::ClassMethod));

    EXPECT_FALSE(elements[3].receiver.has_value());
    EXPECT_TRUE(elements[3].modifiers.has(Modifier::StaticMethod));
    ASSERT_EQ(elements[3].parameters.size(), 1u);
    EXPECT_EQ(elements[3].parameters[0].name, "z");
}

TEST_F(ExtractorTest, AnnotationsAreSourceText) {
    auto element = extract_one("def f(items: list[int], *, limit: int = 10) -> dict[str, int]:\n"
                               "    return {}\n");
    ASSERT_EQ(element.parameters.size(), 2u);
    EXPECT_EQ(element.parameters[0].declared_type, "list[int]");
    EXPECT_EQ(element.parameters[1].kind, ParamKind::KeywordOnly);
    EXPECT_EQ(element.parameters[1].default_value, "10");
    ASSERT_TRUE(element.returns.has_value());
    EXPECT_EQ(element.returns->declared_type, "dict[str, int]");
}

TEST_F(ExtractorTest, DecoratorsAndModifiers) {
    auto element = extract_one("@functools.lru_cache(maxsize=None)\n"
                               "async def load(path):\n"
                               "    return await read(path)\n");
    EXPECT_TRUE(element.modifiers.has(Modifier::Async));
    EXPECT_TRUE(element.modifiers.has(Modifier::Decorated));
    ASSERT_EQ(element.decorators.size(), 1u);
    EXPECT_EQ(element.decorators[0], "functools.lru_cache(maxsize=None)");
    ASSERT_TRUE(element.decorator_span.has_value());
    EXPECT_EQ(element.decorator_span->start.line, 1u);
    EXPECT_EQ(element.source_span.start.line, 2u);
}

// ============================================================================
// Returns and Raises
// ============================================================================

TEST_F(ExtractorTest, ReturnFacts) {
    auto elements = extract_all("def none():\n    return None\n"
                                "def pair():\n    return 1, 2\n"
                                "def gen():\n    yield 1\n"
                                "def declared() -> None:\n    print()\n");
    ASSERT_EQ(elements.size(), 4u);
    EXPECT_FALSE(elements[0].returns.has_value());
    ASSERT_TRUE(elements[1].returns.has_value());
    EXPECT_TRUE(elements[1].returns->is_multi_value);
    ASSERT_TRUE(elements[2].returns.has_value());
    EXPECT_TRUE(elements[2].returns->is_generator);
    EXPECT_FALSE(elements[3].returns.has_value());
}

TEST_F(ExtractorTest, NestedReturnsDoNotLeak) {
    auto element = extract_all("def outer():\n"
                               "    def inner():\n"
                               "        return 1\n"
                               "    inner()\n")
                       .front();
    EXPECT_FALSE(element.returns.has_value());
}

TEST_F(ExtractorTest, RaisesAreDeduplicatedInOrder) {
    auto element = extract_one("def check(x):\n"
                               "    if x < 0:\n"
                               "        raise ValueError('negative')\n"
                               "    if x > 10:\n"
                               "        raise TypeError\n"
                               "    if x == 5:\n"
                               "        raise ValueError('five')\n"
                               "    try:\n"
                               "        pass\n"
                               "    except KeyError as exc:\n"
                               "        raise exc\n"
                               "    raise\n");
    ASSERT_EQ(element.raises.size(), 2u);
    EXPECT_EQ(element.raises[0].kind, "ValueError");
    EXPECT_EQ(element.raises[0].description, "negative");
    EXPECT_EQ(element.raises[1].kind, "TypeError");
    EXPECT_FALSE(element.raises[1].description.has_value());
}

TEST_F(ExtractorTest, ClassAttributesFromConstructor) {
    auto element = extract_all("class Point:\n"
                               "    def __init__(self, x, y):\n"
                               "        self.x = x\n"
                               "        self.y, self.z = y, 0\n"
                               "        self.x = 2\n"
                               "        other.w = 1\n")
                       .front();
    EXPECT_EQ(element.attributes, (std::vector<std::string>{"x", "y", "z"}));
}

TEST_F(ExtractorTest, AbstractBase) {
    auto element = extract_all("class Shape(ABC):\n    pass\n").front();
    EXPECT_TRUE(element.modifiers.has(Modifier::Abstract));
}

// ============================================================================
// Existing Docstrings and Insertion Points
// ============================================================================

TEST_F(ExtractorTest, ExistingDocstring) {
    auto element = extract_one("def f():\n"
                               "    \"\"\"Do things.\"\"\"\n"
                               "    return 1\n");
    ASSERT_TRUE(element.has_existing_doc());
    EXPECT_EQ(element.existing_doc->raw, "\"\"\"Do things.\"\"\"");
    EXPECT_EQ(element.existing_doc->value, "Do things.");
    EXPECT_EQ(element.existing_doc->span.start.line, 2u);
    EXPECT_EQ(element.body_digest, "return 1");
}

TEST_F(ExtractorTest, EmptyDocstringIsNotExistingDoc) {
    auto element = extract_one("def f():\n    ''\n");
    EXPECT_TRUE(element.existing_doc.has_value());
    EXPECT_FALSE(element.has_existing_doc());
}

TEST_F(ExtractorTest, InsertionPointAfterHeader) {
    std::string code = "def f(a,\n      b):\n  return a\n";
    auto element = extract_one(code);
    EXPECT_FALSE(element.insertion.inline_body);
    EXPECT_EQ(element.insertion.offset, code.find("  return"));
    EXPECT_EQ(element.insertion.indent, "  ");
}

TEST_F(ExtractorTest, InlineBodyInsertionPoint) {
    std::string code = "class A:\n    def f(self): return 1\n";
    auto elements = extract_all(code);
    ASSERT_EQ(elements.size(), 2u);
    const auto& point = elements[1].insertion;
    EXPECT_TRUE(point.inline_body);
    EXPECT_EQ(point.offset, code.find(':', code.find("def")) + 1);
    EXPECT_EQ(point.body_offset, code.find("return"));
    EXPECT_EQ(point.indent, "        ");
}

TEST_F(ExtractorTest, DetectsTabIndentUnit) {
    source_ = std::make_unique<lexer::Source>(
        lexer::Source::from_string("def f():\n\treturn 1\n"));
    EXPECT_EQ(detect_indent_unit(*source_), "\t");

    source_ = std::make_unique<lexer::Source>(lexer::Source::from_string("x = 1\n"));
    EXPECT_EQ(detect_indent_unit(*source_), "    ");
}

TEST_F(ExtractorTest, SyntaxErrorIsReported) {
    source_ = std::make_unique<lexer::Source>(lexer::Source::from_string("def f(:\n    pass\n"));
    auto result = extract(*source_);
    EXPECT_TRUE(is_err(result));
}

// ============================================================================
// Serialization
// ============================================================================

TEST_F(ExtractorTest, PromptJsonOmitsSpans) {
    auto element = extract_one("def area(w, h):\n    return w * h\n");
    auto full = to_json(element);
    auto prompt = to_prompt_json(element);

    EXPECT_TRUE(full.contains("source_span"));
    EXPECT_FALSE(prompt.contains("source_span"));
    EXPECT_FALSE(prompt.contains("insertion"));
    EXPECT_EQ(prompt.get_string("qualified_name"), "area");
    EXPECT_EQ(prompt.get("parameters")->size(), 2u);
}

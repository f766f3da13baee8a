//! # JSON Tests
//!
//! Value construction, the parser (primitives, strings, nesting, errors)
//! and the serializer (compact, pretty, escapes).

#include "json/json_value.hpp"

#include <gtest/gtest.h>

using namespace docforge;
using namespace docforge::json;

static auto parse_ok(std::string_view text) -> JsonValue {
    auto result = parse_json(text);
    EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
    if (is_err(result)) {
        return json_null();
    }
    return std::move(unwrap(result));
}

// ============================================================================
// Construction
// ============================================================================

TEST(JsonValueTest, IntegersStayIntegers) {
    JsonValue count(static_cast<size_t>(3));
    EXPECT_TRUE(count.is_integer());
    EXPECT_EQ(count.to_string(), "3");

    JsonValue ratio(0.5);
    EXPECT_TRUE(ratio.is_float());
    EXPECT_EQ(ratio.to_string(), "0.5");
}

TEST(JsonValueTest, WholeFloatKeepsDecimalPoint) {
    EXPECT_EQ(JsonValue(1.0).to_string(), "1.0");
}

TEST(JsonValueTest, ObjectKeysAreSorted) {
    auto obj = json_object();
    obj.set("style", JsonValue("google"));
    obj.set("confidence", JsonValue(0.9));
    obj.set("name", JsonValue("add"));

    EXPECT_EQ(obj.to_string(), R"({"confidence":0.9,"name":"add","style":"google"})");
}

TEST(JsonValueTest, CloneIsDeep) {
    auto obj = json_object();
    obj.set("issues", json_string_array({"a", "b"}));

    auto copy = obj.clone();
    obj.as_object_mut()["issues"].push(JsonValue("c"));

    EXPECT_EQ(copy.get_string_array("issues").size(), 2u);
    EXPECT_EQ(obj.get_string_array("issues").size(), 3u);
}

TEST(JsonValueTest, TypedMemberAccess) {
    auto obj = parse_ok(R"({"score": 1, "text": "x", "issues": ["a", 2, "b"]})");

    EXPECT_EQ(obj.get_number("score"), 1.0);
    EXPECT_EQ(obj.get_string("text"), "x");
    EXPECT_FALSE(obj.get_string("score").has_value());
    EXPECT_FALSE(obj.get_number("missing").has_value());

    auto issues = obj.get_string_array("issues");
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[1], "b");
}

// ============================================================================
// Parser
// ============================================================================

TEST(JsonParserTest, Primitives) {
    EXPECT_TRUE(parse_ok("null").is_null());
    EXPECT_TRUE(parse_ok("true").as_bool());
    EXPECT_EQ(parse_ok("-42").as_i64(), -42);
    EXPECT_DOUBLE_EQ(parse_ok("2.5e1").as_f64(), 25.0);
}

TEST(JsonParserTest, StringEscapes) {
    auto value = parse_ok(R"("line\n\"q\" \u00e9 \ud83d\ude00")");
    EXPECT_EQ(value.as_string(), "line\n\"q\" \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JsonParserTest, NestedStructures) {
    auto value = parse_ok(R"({"a": [1, {"b": [true, null]}], "c": {}})");

    ASSERT_TRUE(value.is_object());
    const auto* a = value.get("a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->size(), 2u);
    EXPECT_TRUE((*a)[1].get("b")->is_array());
    EXPECT_EQ(value.get("c")->size(), 0u);
}

TEST(JsonParserTest, RejectsTrailingCharacters) {
    auto result = parse_json("{} x");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "Unexpected trailing characters");
}

TEST(JsonParserTest, ReportsPosition) {
    auto result = parse_json("{\n  \"a\": tru\n}");
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.line, 2u);
    EXPECT_NE(err.to_string().find("line 2"), std::string::npos);
}

TEST(JsonParserTest, RejectsMalformedInput) {
    EXPECT_TRUE(is_err(parse_json("")));
    EXPECT_TRUE(is_err(parse_json("[1, 2")));
    EXPECT_TRUE(is_err(parse_json("{\"a\" 1}")));
    EXPECT_TRUE(is_err(parse_json("\"unterminated")));
    EXPECT_TRUE(is_err(parse_json("01.")));
    EXPECT_TRUE(is_err(parse_json("\"bad \\q escape\"")));
}

TEST(JsonParserTest, RejectsExcessiveNesting) {
    std::string deep(1000, '[');
    deep += std::string(1000, ']');
    EXPECT_TRUE(is_err(parse_json(deep)));
}

// ============================================================================
// Serializer
// ============================================================================

TEST(JsonSerializerTest, EscapesControlCharacters) {
    EXPECT_EQ(escape_string("a\"b\\c\nd\te"), "a\\\"b\\\\c\\nd\\te");
}

TEST(JsonSerializerTest, PrettyPrint) {
    auto obj = json_object();
    obj.set("files", json_string_array({"a.py"}));
    obj.set("failed", JsonValue(0));

    EXPECT_EQ(obj.to_string_pretty(), "{\n  \"failed\": 0,\n  \"files\": [\n    \"a.py\"\n  ]\n}");
}

TEST(JsonSerializerTest, ReparsesToEqualValue) {
    auto original = parse_ok(R"({"name": "f", "params": [{"name": "x", "type": null}], "n": 2})");
    auto reparsed = parse_ok(original.to_string());
    EXPECT_TRUE(original == reparsed);
}

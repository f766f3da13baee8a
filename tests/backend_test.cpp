//! # Backend Tests
//!
//! Reply parsing, subprocess execution and the JSON-lines command backend,
//! using `sh` scripts as stand-in capability commands.

#include "backend/command_backend.hpp"
#include "backend/subprocess.hpp"

#include <gtest/gtest.h>

using namespace docforge;
using namespace docforge::backend;

namespace {

auto parse_ok(const std::string& text) -> json::JsonValue {
    auto result = json::parse_json(text);
    EXPECT_TRUE(is_ok(result));
    return is_ok(result) ? std::move(unwrap(result)) : json::json_object();
}

auto shell_backend(const std::string& script, int timeout_seconds = 10) -> CommandBackend {
    return CommandBackend(CommandConfig{
        .command = "sh",
        .args = {"-c", "cat > /dev/null; " + script},
        .timeout_seconds = timeout_seconds,
    });
}

auto sample_completion() -> CompletionRequest {
    return CompletionRequest{
        .element = parse_ok(R"({"name": "add", "parameters": []})"),
        .style = "google/1",
        .skeleton = R"("""Add operation.""")",
        .issues = {"missing returns section"},
        .suggestions = {},
    };
}

} // namespace

// ============================================================================
// Evaluation Replies
// ============================================================================

TEST(ParseEvaluationTest, ScoreIssuesAndSuggestions) {
    auto result = parse_evaluation(
        parse_ok(R"({"score": 0.7, "issues": ["vague", 3], "suggestions": ["be concrete"]})"));
    ASSERT_TRUE(is_ok(result));
    const auto& evaluation = unwrap(result);
    EXPECT_DOUBLE_EQ(evaluation.score, 0.7);
    EXPECT_EQ(evaluation.issues, std::vector<std::string>{"vague"});
    EXPECT_EQ(evaluation.suggestions, std::vector<std::string>{"be concrete"});
}

TEST(ParseEvaluationTest, ScoreIsClamped) {
    auto high = parse_evaluation(parse_ok(R"({"score": 7})"));
    ASSERT_TRUE(is_ok(high));
    EXPECT_DOUBLE_EQ(unwrap(high).score, 1.0);

    auto low = parse_evaluation(parse_ok(R"({"score": -0.5})"));
    ASSERT_TRUE(is_ok(low));
    EXPECT_DOUBLE_EQ(unwrap(low).score, 0.0);
}

TEST(ParseEvaluationTest, RejectsMalformedReplies) {
    auto not_object = parse_evaluation(parse_ok("[1, 2]"));
    ASSERT_TRUE(is_err(not_object));
    EXPECT_EQ(unwrap_err(not_object).message, "evaluation reply is not a JSON object");

    auto no_score = parse_evaluation(parse_ok(R"({"score": "high"})"));
    ASSERT_TRUE(is_err(no_score));
    EXPECT_EQ(unwrap_err(no_score).message, "evaluation reply has no numeric 'score'");
}

TEST(RequestJsonTest, CompletionRequestFields) {
    auto json = sample_completion().to_json();
    EXPECT_EQ(json.get_string("op"), "complete");
    EXPECT_EQ(json.get_string("style"), "google/1");
    EXPECT_EQ(json.get_string_array("issues"),
              std::vector<std::string>{"missing returns section"});
    ASSERT_NE(json.get("element"), nullptr);
    EXPECT_EQ(json.get("element")->get_string("name"), "add");
}

TEST(RequestJsonTest, EvaluationRequestFields) {
    EvaluationRequest request{
        .element = json::json_object(), .style = "rst/1", .candidate = R"("""Add.""")"};
    auto json = request.to_json();
    EXPECT_EQ(json.get_string("op"), "evaluate");
    EXPECT_EQ(json.get_string("candidate"), R"("""Add.""")");
}

// ============================================================================
// Subprocess
// ============================================================================

TEST(SubprocessTest, EchoesStdin) {
    auto result = run_subprocess("cat", {}, "hello\n", 5);
    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "hello\n");
}

TEST(SubprocessTest, CapturesStderrAndExitCode) {
    auto result = run_subprocess("sh", {"-c", "echo oops >&2; exit 3"}, "", 5);
    EXPECT_TRUE(result.launched);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stderr_output, "oops\n");
    EXPECT_TRUE(result.stdout_output.empty());
}

TEST(SubprocessTest, LargeInputDoesNotDeadlock) {
    std::string input(256 * 1024, 'x');
    auto result = run_subprocess("cat", {}, input, 10);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.stdout_output.size(), input.size());
}

TEST(SubprocessTest, TimeoutKillsChild) {
    auto result = run_subprocess("sleep", {"30"}, "", 1);
    EXPECT_TRUE(result.launched);
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.duration_us, 10'000'000);
}

TEST(SubprocessTest, TimeoutAppliesAfterOutputCloses) {
    auto result = run_subprocess("sh", {"-c", "exec >&- 2>&-; sleep 6"}, "", 1);
    EXPECT_TRUE(result.launched);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_LT(result.duration_us, 4'000'000);
}

// ============================================================================
// Command Backend
// ============================================================================

TEST(CommandBackendTest, CompletionText) {
    auto backend = shell_backend(R"(echo '{"text": "Add a and b."}')");
    auto reply = backend.complete(sample_completion());
    ASSERT_TRUE(is_ok(reply)) << unwrap_err(reply).message;
    EXPECT_EQ(unwrap(reply), "Add a and b.");
    EXPECT_EQ(backend.name(), "command:sh");
}

TEST(CommandBackendTest, EvaluationReply) {
    auto backend = shell_backend(R"(echo '{"score": 0.9, "issues": ["vague"]}')");
    EvaluationRequest request{
        .element = json::json_object(), .style = "google/1", .candidate = R"("""Add.""")"};
    auto reply = backend.evaluate(request);
    ASSERT_TRUE(is_ok(reply));
    EXPECT_DOUBLE_EQ(unwrap(reply).score, 0.9);
    EXPECT_EQ(unwrap(reply).issues, std::vector<std::string>{"vague"});
}

TEST(CommandBackendTest, ReceivesRequestOnStdin) {
    CommandBackend backend(CommandConfig{
        .command = "sh",
        .args = {"-c", R"(grep -q '"op":"complete"' && echo '{"text": "seen"}')"},
    });
    auto reply = backend.complete(sample_completion());
    ASSERT_TRUE(is_ok(reply));
    EXPECT_EQ(unwrap(reply), "seen");
}

TEST(CommandBackendTest, Failures) {
    auto malformed = shell_backend("echo 'not json'").complete(sample_completion());
    ASSERT_TRUE(is_err(malformed));
    EXPECT_NE(unwrap_err(malformed).message.find("malformed reply"), std::string::npos);

    auto no_text = shell_backend("echo '{}'").complete(sample_completion());
    ASSERT_TRUE(is_err(no_text));
    EXPECT_EQ(unwrap_err(no_text).message, "completion reply has no string 'text'");

    auto exit_code = shell_backend("echo broken >&2; exit 2").complete(sample_completion());
    ASSERT_TRUE(is_err(exit_code));
    EXPECT_EQ(unwrap_err(exit_code).message, "'sh' exited with status 2: broken\n");

    auto slow = shell_backend("sleep 30", 1).complete(sample_completion());
    ASSERT_TRUE(is_err(slow));
    EXPECT_EQ(unwrap_err(slow).message, "'sh' timed out after 1s");
}

TEST(CommandBackendTest, MissingCommand) {
    CommandBackend backend(CommandConfig{.command = "docforge-no-such-command-xyz"});
    auto reply = backend.complete(sample_completion());
    ASSERT_TRUE(is_err(reply));
    EXPECT_NE(unwrap_err(reply).message.find("127"), std::string::npos);
}

TEST(CapabilitiesTest, SelectedFromConfig) {
    auto none = make_capabilities(CommandConfig{}, true);
    EXPECT_EQ(none.completion, nullptr);
    EXPECT_EQ(none.evaluation, nullptr);

    auto completion_only = make_capabilities(CommandConfig{.command = "cat"}, false);
    EXPECT_NE(completion_only.completion, nullptr);
    EXPECT_EQ(completion_only.evaluation, nullptr);

    auto both = make_capabilities(CommandConfig{.command = "cat"}, true);
    EXPECT_NE(both.completion, nullptr);
    EXPECT_NE(both.evaluation, nullptr);
}

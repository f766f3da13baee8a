//! # Configuration Tests
//!
//! The `.docgenrc` reader, typed settings and the layering of rc file,
//! environment and command-line overrides.

#include "config/config.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <map>

using namespace docforge;
using namespace docforge::config;
namespace fs = std::filesystem;

namespace {

auto parse_ok(const std::string& text) -> RcDocument {
    auto result = parse_rc(text, "test.docgenrc");
    EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
    return is_ok(result) ? unwrap(result) : RcDocument{};
}

auto parse_error(const std::string& text) -> ConfigError {
    auto result = parse_rc(text, "test.docgenrc");
    EXPECT_TRUE(is_err(result));
    return is_err(result) ? unwrap_err(result) : ConfigError{};
}

auto env_from(std::map<std::string, std::string> values) -> EnvLookup {
    return [values = std::move(values)](const char* name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

// ============================================================================
// Rc Parsing
// ============================================================================

TEST(RcParserTest, SectionsAndValues) {
    auto document = parse_ok("# docforge settings\n"
                             "style = \"numpy\"\n"
                             "threshold = 0.75\n"
                             "overwrite = true\n"
                             "\n"
                             "[backend]\n"
                             "command = 'docgen-llm'  # trailing comment\n"
                             "args = [\"--model\", \"small # not a comment\"]\n"
                             "timeout_seconds = 1_000\n");
    ASSERT_EQ(document.entries.size(), 6u);

    EXPECT_EQ(document.entries[0].key, "style");
    EXPECT_EQ(std::get<std::string>(document.entries[0].value), "numpy");
    EXPECT_EQ(document.entries[0].line, 2u);
    EXPECT_DOUBLE_EQ(std::get<double>(document.entries[1].value), 0.75);
    EXPECT_TRUE(std::get<bool>(document.entries[2].value));

    EXPECT_EQ(document.entries[3].key, "backend.command");
    EXPECT_EQ(std::get<std::string>(document.entries[3].value), "docgen-llm");
    EXPECT_EQ(std::get<std::vector<std::string>>(document.entries[4].value),
              (std::vector<std::string>{"--model", "small # not a comment"}));
    EXPECT_DOUBLE_EQ(std::get<double>(document.entries[5].value), 1000.0);
    EXPECT_EQ(document.entries[5].line, 9u);
}

TEST(RcParserTest, StringEscapes) {
    auto document = parse_ok("a = \"tab\\there \\\"quoted\\\"\"\nb = 'C:\\path'\n");
    ASSERT_EQ(document.entries.size(), 2u);
    EXPECT_EQ(std::get<std::string>(document.entries[0].value), "tab\there \"quoted\"");
    EXPECT_EQ(std::get<std::string>(document.entries[1].value), "C:\\path");
}

TEST(RcParserTest, Errors) {
    auto missing_eq = parse_error("style = \"google\"\njust words\n");
    EXPECT_EQ(missing_eq.message, "expected 'key = value'");
    EXPECT_EQ(missing_eq.line, 2u);
    EXPECT_EQ(missing_eq.to_string(), "test.docgenrc:2: expected 'key = value'");

    EXPECT_EQ(parse_error("style = \"google\n").message, "unterminated string");
    EXPECT_EQ(parse_error("jobs = many\n").message, "invalid value 'many'");
    EXPECT_EQ(parse_error("[backend\n").message, "unterminated section header");
    EXPECT_EQ(parse_error("args = [1, 2]\n").message, "arrays may only contain strings");
    EXPECT_EQ(parse_error("args = [\"a\" \"b\"]\n").message, "expected ',' or ']' in array");
    EXPECT_EQ(parse_error("style = \"a\" \"b\"\n").message, "unexpected text after value: '\"b\"'");
    EXPECT_EQ(parse_error("bad key = 1\n").message, "invalid key 'bad key'");
    EXPECT_EQ(parse_error("style =\n").message, "missing value");
}

// ============================================================================
// Settings
// ============================================================================

TEST(ApplyRcTest, SetsTypedFields) {
    auto document = parse_ok("style = \"rst\"\n"
                             "max_iterations = 5\n"
                             "skip_existing = false\n"
                             "[backend]\n"
                             "command = \"docgen-llm\"\n"
                             "args = [\"--fast\"]\n"
                             "evaluate = false\n"
                             "[batch]\n"
                             "jobs = 2\n"
                             "extensions = [\".py\", \".pyi\"]\n"
                             "[report]\n"
                             "json_path = \"report.json\"\n");
    auto result = apply_rc(Config{}, document);
    ASSERT_TRUE(is_ok(result));
    const auto& config = unwrap(result);

    EXPECT_EQ(config.style, doc::DocStyle::Rest);
    EXPECT_EQ(config.max_iterations, 5u);
    EXPECT_FALSE(config.skip_existing);
    EXPECT_EQ(config.backend.command, "docgen-llm");
    EXPECT_EQ(config.backend.args, std::vector<std::string>{"--fast"});
    EXPECT_FALSE(config.backend.evaluate);
    EXPECT_EQ(config.batch.jobs, 2u);
    EXPECT_EQ(config.batch.extensions, (std::vector<std::string>{".py", ".pyi"}));
    EXPECT_EQ(config.report.json_path, "report.json");
}

TEST(ApplyRcTest, UnknownKeysAreIgnored) {
    auto result = apply_rc(Config{}, parse_ok("colour = \"blue\"\nthreshold = 0.5\n"));
    ASSERT_TRUE(is_ok(result));
    EXPECT_DOUBLE_EQ(unwrap(result).threshold, 0.5);
}

TEST(ApplyRcTest, TypeAndRangeErrorsCarryLine) {
    auto mismatch = apply_rc(Config{}, parse_ok("\nmax_iterations = \"three\"\n"));
    ASSERT_TRUE(is_err(mismatch));
    EXPECT_EQ(unwrap_err(mismatch).to_string(),
              "test.docgenrc:2: 'max_iterations' must be an integer");

    auto fraction = apply_rc(Config{}, parse_ok("max_iterations = 2.5\n"));
    ASSERT_TRUE(is_err(fraction));

    auto range = apply_rc(Config{}, parse_ok("threshold = 3\n"));
    ASSERT_TRUE(is_err(range));
    EXPECT_EQ(unwrap_err(range).message, "threshold must be between 0 and 2");

    auto style = apply_rc(Config{}, parse_ok("style = \"epytext\"\n"));
    ASSERT_TRUE(is_err(style));
    EXPECT_EQ(unwrap_err(style).message, "unknown style 'epytext' (expected google, numpy or rst)");
}

TEST(ApplySettingTextTest, ConvertsText) {
    Config config;
    EXPECT_FALSE(apply_setting_text(config, "overwrite", "yes"));
    EXPECT_TRUE(config.overwrite);
    EXPECT_FALSE(apply_setting_text(config, "batch.extensions", ".py, .pyw ,"));
    EXPECT_EQ(config.batch.extensions, (std::vector<std::string>{".py", ".pyw"}));
    EXPECT_FALSE(apply_setting_text(config, "threshold", "0.95"));
    EXPECT_DOUBLE_EQ(config.threshold, 0.95);

    EXPECT_EQ(apply_setting_text(config, "overwrite", "maybe"),
              "'overwrite' must be a boolean, got 'maybe'");
    EXPECT_EQ(apply_setting_text(config, "batch.jobs", "four"),
              "'batch.jobs' must be an integer, got 'four'");
    EXPECT_EQ(apply_setting_text(config, "colour", "blue"), "unknown key 'colour'");
}

TEST(ValidateTest, CrossFieldChecks) {
    Config config;
    EXPECT_FALSE(validate(config));
    config.batch.extensions.clear();
    auto error = validate(config);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->message, "batch.extensions must not be empty");
}

TEST(ConfigJsonTest, EffectiveSettings) {
    Config config;
    config.style = doc::DocStyle::Numpy;
    auto json = config.to_json();
    EXPECT_EQ(json.get_string("style"), "numpy");
    EXPECT_EQ(json.get_number("max_iterations"), 3.0);
    ASSERT_NE(json.get("batch"), nullptr);
    EXPECT_EQ(json.get("batch")->get_string_array("extensions"), std::vector<std::string>{".py"});
}

// ============================================================================
// Layering
// ============================================================================

TEST(ApplyEnvTest, ReadsBoundVariables) {
    auto result = apply_env(Config{}, env_from({{"DOCFORGE_STYLE", "numpy"},
                                                {"DOCFORGE_JOBS", "4"},
                                                {"UNRELATED", "x"}}));
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).style, doc::DocStyle::Numpy);
    EXPECT_EQ(unwrap(result).batch.jobs, 4u);
}

TEST(ApplyEnvTest, BadValueNamesVariable) {
    auto result = apply_env(Config{}, env_from({{"DOCFORGE_THRESHOLD", "9"}}));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).origin, "environment");
    EXPECT_EQ(unwrap_err(result).message,
              "DOCFORGE_THRESHOLD: threshold must be between 0 and 2");
}

class LoadConfigTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() / "docforge_config_test";
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write_rc(const std::string& content) {
        std::ofstream out(dir_ / RC_FILENAME);
        out << content;
    }
};

TEST_F(LoadConfigTest, DefaultsWithoutRcFile) {
    auto result = load_config(LoadOptions{.working_dir = dir_.string()});
    ASSERT_TRUE(is_ok(result));
    const auto& config = unwrap(result);
    EXPECT_EQ(config.style, doc::DocStyle::Google);
    EXPECT_EQ(config.max_iterations, 3u);
    EXPECT_DOUBLE_EQ(config.threshold, 0.8);
    EXPECT_FALSE(config.overwrite);
    EXPECT_TRUE(config.skip_existing);
}

TEST_F(LoadConfigTest, LayersInOrder) {
    write_rc("style = \"numpy\"\nthreshold = 0.5\nmax_iterations = 4\n");
    auto result = load_config(LoadOptions{
        .working_dir = dir_.string(),
        .env = env_from({{"DOCFORGE_THRESHOLD", "0.6"}, {"DOCFORGE_MAX_ITERATIONS", "6"}}),
        .overrides = {{"max_iterations", "2"}},
    });
    ASSERT_TRUE(is_ok(result));
    const auto& config = unwrap(result);
    EXPECT_EQ(config.style, doc::DocStyle::Numpy);
    EXPECT_DOUBLE_EQ(config.threshold, 0.6);
    EXPECT_EQ(config.max_iterations, 2u);
}

TEST_F(LoadConfigTest, ExplicitPathMustExist) {
    auto result = load_config(LoadOptions{.config_path = (dir_ / "missing.toml").string()});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "cannot open configuration file");
}

TEST_F(LoadConfigTest, OverrideErrorsAreFromCommandLine) {
    auto result = load_config(
        LoadOptions{.working_dir = dir_.string(), .overrides = {{"threshold", "high"}}});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).origin, "command line");
}

//! # Logger Unit Tests
//!
//! Tests for LogFilter parsing, record formatting, the file sink, CLI
//! option extraction and routing through the Logger singleton.

#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace docforge::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("refine=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "refine"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "refine"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "refine"));

    EXPECT_TRUE(filter.should_log(LogLevel::Info, "batch"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "batch"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("critic=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "critic"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "generate"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // Bare module name enables everything for that module
    filter.parse("extract");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "extract"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "inject"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("inject=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilter) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

TEST(LogLevelTest, ParseLevelNames) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    // Unknown names fall back to Info
    EXPECT_EQ(parse_level("loud"), LogLevel::Info);
}

// ============================================================================
// Record Formatting
// ============================================================================

static LogRecord make_record(LogLevel level, std::string_view module, std::string message) {
    return LogRecord{.level = level,
                     .module = module,
                     .message = std::move(message),
                     .file = __FILE__,
                     .line = __LINE__,
                     .timestamp_ms = 1700000000000};
}

TEST(FormatRecordTest, TextContainsLevelModuleAndMessage) {
    auto line = format_record(make_record(LogLevel::Warn, "generate", "fallback used"),
                              LogFormat::Text);

    EXPECT_NE(line.find("WARN"), std::string::npos);
    EXPECT_NE(line.find("[generate]"), std::string::npos);
    EXPECT_NE(line.find("fallback used"), std::string::npos);
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find("\033["), std::string::npos);
}

TEST(FormatRecordTest, JsonEscapesMessage) {
    auto line = format_record(make_record(LogLevel::Error, "batch", "bad \"path\"\n"),
                              LogFormat::JSON);

    EXPECT_EQ(line, "{\"ts\":1700000000000,\"level\":\"ERROR\",\"module\":\"batch\","
                    "\"msg\":\"bad \\\"path\\\"\\n\"}\n");
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path path;

    void SetUp() override {
        path = fs::temp_directory_path() / "docforge_log_test.log";
        fs::remove(path);
    }

    void TearDown() override {
        fs::remove(path);
    }

    auto contents() const -> std::string {
        std::ifstream in(path);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }
};

TEST_F(FileSinkTest, WritesRecords) {
    {
        FileSink sink(path.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "batch", "processed 3 files"));
        sink.write(make_record(LogLevel::Warn, "critic", "evaluation failed"));
    }

    auto text = contents();
    EXPECT_NE(text.find("processed 3 files"), std::string::npos);
    EXPECT_NE(text.find("[critic] evaluation failed"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormatOneObjectPerLine) {
    {
        FileSink sink(path.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Info, "refine", "one"));
        sink.write(make_record(LogLevel::Info, "refine", "two"));
    }

    std::ifstream in(path);
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        EXPECT_EQ(line.front(), '{');
        EXPECT_EQ(line.back(), '}');
        ++count;
    }
    EXPECT_EQ(count, 2);
}

// ============================================================================
// CLI Options
// ============================================================================

TEST(LogOptionsTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("--log-filter=refine=trace"));
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_FALSE(is_log_option("-i"));
    EXPECT_FALSE(is_log_option("--style=google"));
}

TEST(LogOptionsTest, VerbosityCountSetsLevel) {
    std::vector<std::string> args = {"docforge", "generate", "-vv", "x.py"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    auto config = parse_log_options(static_cast<int>(argv.size()), argv.data());
    EXPECT_EQ(config.level, LogLevel::Debug);
}

TEST(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    std::vector<std::string> args = {"docforge", "-vvv", "--log-level=error", "--log-format=json"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    auto config = parse_log_options(static_cast<int>(argv.size()), argv.data());
    EXPECT_EQ(config.level, LogLevel::Error);
    EXPECT_EQ(config.format, LogFormat::JSON);
}

// ============================================================================
// Logger Routing
// ============================================================================

class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::vector<Entry>& out) : out_(out) {}

    void write(const LogRecord& record) override {
        out_.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

private:
    std::vector<Entry>& out_;
};

class LoggerTest : public ::testing::Test {
protected:
    std::vector<CaptureSink::Entry> records;

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.add_sink(std::make_unique<CaptureSink>(records));
        logger.set_level(LogLevel::Info);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_filter("*=warn");
    }
};

TEST_F(LoggerTest, MacroFormatsStreamExpression) {
    DOCFORGE_LOG_INFO("batch", "processed " << 3 << " files");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].module, "batch");
    EXPECT_EQ(records[0].message, "processed 3 files");
}

TEST_F(LoggerTest, DropsBelowLevel) {
    DOCFORGE_LOG_DEBUG("batch", "hidden");
    DOCFORGE_LOG_WARN("batch", "shown");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Warn);
}

TEST_F(LoggerTest, FilterEnablesSingleModule) {
    Logger::instance().set_filter("refine=trace,*=error");

    DOCFORGE_LOG_TRACE("refine", "step");
    DOCFORGE_LOG_WARN("inject", "dropped");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].module, "refine");
}

//! # docforge Logging
//!
//! Module-tagged structured logging shared by every pipeline stage:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - per-module filtering (`refine=debug,*=warn`)
//! - console, file, null and fan-out sinks
//! - text or JSON-lines output
//! - compile-time level elision via DOCFORGE_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! DOCFORGE_LOG_INFO("batch", "Processing " << path);
//! DOCFORGE_LOG_DEBUG("refine", element.qualified_name << " iteration " << n);
//! ```

#ifndef DOCFORGE_LOG_HPP
#define DOCFORGE_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace docforge::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a level name in lower or upper case. Unknown names give Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g. "extract", "refine")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

/// Renders a record as one line (newline included) in the given format.
std::string format_record(const LogRecord& record, LogFormat format, bool colors = false);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends to a file. Flushes on Error and Fatal.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans records out to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter parsed from "module=level,*=default".
/// A bare module name enables Trace for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }
    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level across the default and all module overrides.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty = no file sink
    bool console = true;
    bool colors = true;
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger. Usable before `init()` with Info level and no
/// sinks.
class Logger {
public:
    static void init(const LogConfig& config);
    static Logger& instance();

    /// Fast-path check used by the macros before formatting the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Messages are dropped until a sink is added.
    void clear_sinks();

    void set_level(LogLevel level);
    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);
    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_c, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv
/// and -q from argv. Falls back to the DOCFORGE_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true for arguments consumed by `parse_log_options`.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef DOCFORGE_MIN_LOG_LEVEL
#define DOCFORGE_MIN_LOG_LEVEL 0
#endif

#define DOCFORGE_LOG_IMPL(level, module_str, msg)                                                  \
    do {                                                                                           \
        if (static_cast<int>(level) >= DOCFORGE_MIN_LOG_LEVEL) {                                   \
            auto& logger_ = ::docforge::log::Logger::instance();                                   \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define DOCFORGE_LOG_TRACE(module, msg)                                                            \
    DOCFORGE_LOG_IMPL(::docforge::log::LogLevel::Trace, module, msg)
#define DOCFORGE_LOG_DEBUG(module, msg)                                                            \
    DOCFORGE_LOG_IMPL(::docforge::log::LogLevel::Debug, module, msg)
#define DOCFORGE_LOG_INFO(module, msg)                                                             \
    DOCFORGE_LOG_IMPL(::docforge::log::LogLevel::Info, module, msg)
#define DOCFORGE_LOG_WARN(module, msg)                                                             \
    DOCFORGE_LOG_IMPL(::docforge::log::LogLevel::Warn, module, msg)
#define DOCFORGE_LOG_ERROR(module, msg)                                                            \
    DOCFORGE_LOG_IMPL(::docforge::log::LogLevel::Error, module, msg)
#define DOCFORGE_LOG_FATAL(module, msg)                                                            \
    DOCFORGE_LOG_IMPL(::docforge::log::LogLevel::Fatal, module, msg)

} // namespace docforge::log

#endif // DOCFORGE_LOG_HPP

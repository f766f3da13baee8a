//! # Configuration
//!
//! One immutable `Config` value per run, assembled from (later wins):
//!
//! 1. built-in defaults
//! 2. `.docgenrc` in the working directory, or the file given by `--config=`
//! 3. `DOCFORGE_*` environment variables
//! 4. command-line flags
//!
//! ## `.docgenrc`
//!
//! ```toml
//! style = "numpy"
//! max_iterations = 4
//! threshold = 0.85
//!
//! [backend]
//! command = "docforge-llm"
//! args = ["--model", "small"]
//! timeout_seconds = 20
//!
//! [batch]
//! jobs = 4
//! extensions = [".py", ".pyi"]
//! ```
//!
//! Supported values: strings, numbers, booleans and single-line string
//! arrays. `#` starts a comment outside of strings.

#ifndef DOCFORGE_CONFIG_CONFIG_HPP
#define DOCFORGE_CONFIG_CONFIG_HPP

#include "common.hpp"
#include "doc/style.hpp"
#include "json/json_value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace docforge::config {

constexpr const char* RC_FILENAME = ".docgenrc";
constexpr double MAX_THRESHOLD = 2.0;

struct BackendConfig {
    std::string command; ///< Empty means no capability backend.
    std::vector<std::string> args;
    int timeout_seconds = 30;
    bool evaluate = true;
};

struct BatchConfig {
    size_t jobs = 0; ///< 0 = hardware concurrency capped at 8.
    size_t element_jobs = 1;
    bool recursive = true;
    std::vector<std::string> extensions = {".py"};
    bool dry_run = false;
};

struct ReportConfig {
    std::string json_path;
};

struct Config {
    doc::DocStyle style = doc::DocStyle::Google;
    uint32_t max_iterations = 3;
    double threshold = 0.8;
    bool overwrite = false;
    bool skip_existing = true;
    BackendConfig backend;
    BatchConfig batch;
    ReportConfig report;

    [[nodiscard]] auto to_json() const -> json::JsonValue;
};

struct ConfigError {
    std::string message;
    std::string origin; ///< File path, "environment" or "command line".
    uint32_t line = 0;

    [[nodiscard]] auto to_string() const -> std::string;
};

// ============================================================================
// Rc Files
// ============================================================================

using RcValue = std::variant<std::string, double, bool, std::vector<std::string>>;

struct RcEntry {
    std::string key; ///< "section.key", or "key" before any section.
    RcValue value;
    uint32_t line = 0;
};

struct RcDocument {
    std::string path;
    std::vector<RcEntry> entries;
};

[[nodiscard]] auto parse_rc(std::string_view text, const std::string& path = RC_FILENAME)
    -> Result<RcDocument, ConfigError>;

[[nodiscard]] auto load_rc_file(const std::string& path) -> Result<RcDocument, ConfigError>;

// ============================================================================
// Layering
// ============================================================================

/// Looks up an environment variable.
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

/// Reads the process environment.
[[nodiscard]] auto process_env() -> EnvLookup;

/// Sets one key from a typed value. Returns an error message on failure.
[[nodiscard]] auto apply_setting(Config& config, const std::string& key, const RcValue& value)
    -> std::optional<std::string>;

/// Sets one key from text, converting it to the key's type.
[[nodiscard]] auto apply_setting_text(Config& config, const std::string& key,
                                      std::string_view text) -> std::optional<std::string>;

[[nodiscard]] auto apply_rc(Config config, const RcDocument& document)
    -> Result<Config, ConfigError>;

[[nodiscard]] auto apply_env(Config config, const EnvLookup& env) -> Result<Config, ConfigError>;

/// Checks cross-field constraints on a fully assembled config.
[[nodiscard]] auto validate(const Config& config) -> std::optional<ConfigError>;

struct LoadOptions {
    std::optional<std::string> config_path; ///< From `--config=`.
    std::string working_dir = ".";
    EnvLookup env;
    std::vector<std::pair<std::string, std::string>> overrides; ///< key, text
};

/// Defaults, then the rc file, then the environment, then `overrides`.
[[nodiscard]] auto load_config(const LoadOptions& options) -> Result<Config, ConfigError>;

} // namespace docforge::config

#endif // DOCFORGE_CONFIG_CONFIG_HPP

//! # CLI Driver Interface
//!
//! | Command            | Description                                      |
//! |--------------------|--------------------------------------------------|
//! | `generate <file>`  | Document one file, print or write the result     |
//! | `batch <dir>`      | Document every matching file on the worker pool  |
//! | `analyze <file>`   | Print the extracted elements as JSON             |
//!
//! ## Exit Codes
//!
//! | Code | Meaning                              |
//! |------|--------------------------------------|
//! | 0    | Success                              |
//! | 1    | At least one file failed             |
//! | 2    | Usage or configuration error         |

#ifndef DOCFORGE_CLI_DRIVER_HPP
#define DOCFORGE_CLI_DRIVER_HPP

#include "common.hpp"
#include "config/config.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docforge::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURES = 1;
constexpr int EXIT_USAGE = 2;

struct CliArgs {
    std::string command;
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> overrides; ///< config key, text
    std::optional<std::string> config_path;
    std::optional<std::string> output;
    bool in_place = false;
    bool diff = false;
    bool help = false;
    bool version = false;
};

/// Parses everything but the logging flags.
[[nodiscard]] auto parse_args(const std::vector<std::string>& args)
    -> Result<CliArgs, std::string>;

/// Builds the run configuration for parsed arguments.
[[nodiscard]] auto build_config(const CliArgs& args, const config::EnvLookup& env)
    -> Result<config::Config, config::ConfigError>;

/// Minimal unified diff between two texts, one hunk around the change.
[[nodiscard]] auto unified_diff(std::string_view before, std::string_view after,
                                const std::string& path) -> std::string;

void print_usage();
void print_version();

int docforge_main(int argc, char* argv[]);

} // namespace docforge::cli

#endif // DOCFORGE_CLI_DRIVER_HPP

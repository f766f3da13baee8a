//! # Run Reports
//!
//! Text summary table for the terminal and the JSON report file.
//!
//! ```text
//! src/shapes.py  [ok]  fingerprint 5c1f03a200000412
//!   Element                 Confidence  Iter  Outcome    Warnings
//!   Shape.area                    0.93     1  accepted
//!   Shape.scale                   0.71     3  exhausted  threshold not reached: ...
//! ```

#ifndef DOCFORGE_CLI_REPORT_HPP
#define DOCFORGE_CLI_REPORT_HPP

#include "config/config.hpp"
#include "json/json_value.hpp"
#include "pipeline/batch.hpp"

#include <string>
#include <vector>

namespace docforge::cli {

/// Report entry for a single processed (or failed) file.
[[nodiscard]] auto make_report(const std::string& path,
                               const Result<pipeline::FileOutcome, pipeline::FileError>& outcome)
    -> pipeline::FileReport;

[[nodiscard]] auto render_summary(const std::vector<pipeline::FileReport>& reports)
    -> std::string;

/// Mean confidence over all element results; 0 when there are none.
[[nodiscard]] auto average_confidence(const std::vector<pipeline::FileReport>& reports) -> double;

[[nodiscard]] auto report_to_json(const std::vector<pipeline::FileReport>& reports,
                                  const config::Config& config) -> json::JsonValue;

[[nodiscard]] auto write_report(const std::string& path,
                                const std::vector<pipeline::FileReport>& reports,
                                const config::Config& config) -> Result<size_t, std::string>;

} // namespace docforge::cli

#endif // DOCFORGE_CLI_REPORT_HPP

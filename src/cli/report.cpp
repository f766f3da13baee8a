#include "cli/report.hpp"

#include "common.hpp"

#include <iomanip>
#include <sstream>

namespace docforge::cli {

namespace {

constexpr size_t NAME_WIDTH = 32;

auto join(const std::vector<std::string>& items, std::string_view separator) -> std::string {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += separator;
        }
        out += item;
    }
    return out;
}

auto error_to_json(const pipeline::FileError& error) -> json::JsonValue {
    auto obj = json::json_object();
    obj.set("kind", json::JsonValue(error.kind == pipeline::FileErrorKind::Parse ? "parse" : "io"));
    obj.set("message", json::JsonValue(error.message));
    obj.set("line", json::JsonValue(static_cast<int64_t>(error.line)));
    obj.set("column", json::JsonValue(static_cast<int64_t>(error.column)));
    return obj;
}

} // namespace

auto make_report(const std::string& path,
                 const Result<pipeline::FileOutcome, pipeline::FileError>& outcome)
    -> pipeline::FileReport {
    pipeline::FileReport report;
    report.path = path;
    if (is_err(outcome)) {
        report.error = unwrap_err(outcome);
        return report;
    }
    const auto& value = unwrap(outcome);
    report.fingerprint = value.fingerprint;
    report.results = value.results;
    report.skipped = value.skipped;
    return report;
}

auto average_confidence(const std::vector<pipeline::FileReport>& reports) -> double {
    double sum = 0.0;
    size_t count = 0;
    for (const auto& report : reports) {
        for (const auto& result : report.results) {
            sum += result.confidence_score;
            ++count;
        }
    }
    return count == 0 ? 0.0 : sum / static_cast<double>(count);
}

auto render_summary(const std::vector<pipeline::FileReport>& reports) -> std::string {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);

    size_t elements = 0;
    size_t failed = 0;
    size_t skipped = 0;
    for (const auto& report : reports) {
        out << report.path << "  [" << (report.ok() ? "ok" : "failed") << "]";
        if (!report.fingerprint.empty()) {
            out << "  fingerprint " << report.fingerprint;
        }
        out << "\n";

        if (!report.ok()) {
            ++failed;
            out << "  error: " << report.error->to_string() << "\n";
            continue;
        }

        if (!report.results.empty()) {
            out << "  " << std::left << std::setw(NAME_WIDTH) << "Element" << std::right
                << std::setw(11) << "Confidence" << std::setw(6) << "Iter" << "  " << std::left
                << std::setw(11) << "Outcome" << "Warnings\n";
        }
        for (const auto& result : report.results) {
            out << "  " << std::left << std::setw(NAME_WIDTH) << result.element_name << std::right
                << std::setw(11) << result.confidence_score << std::setw(6)
                << result.iterations_used << "  " << std::left << std::setw(11)
                << pipeline::outcome_name(result.outcome) << join(result.warnings, "; ") << "\n";
        }
        if (!report.skipped.empty()) {
            out << "  skipped (existing docstring): " << join(report.skipped, ", ") << "\n";
        }
        elements += report.results.size();
        skipped += report.skipped.size();
    }

    out << "\n"
        << reports.size() << " files, " << failed << " failed, " << elements << " documented, "
        << skipped << " skipped, average confidence " << average_confidence(reports) << "\n";
    return out.str();
}

auto report_to_json(const std::vector<pipeline::FileReport>& reports,
                    const config::Config& config) -> json::JsonValue {
    auto files = json::json_array();
    for (const auto& report : reports) {
        auto obj = json::json_object();
        obj.set("path", json::JsonValue(report.path));
        obj.set("fingerprint", json::JsonValue(report.fingerprint));
        obj.set("status", json::JsonValue(report.ok() ? "ok" : "failed"));
        obj.set("error", report.error ? error_to_json(*report.error) : json::json_null());
        obj.set("written", json::JsonValue(report.written));

        auto results = json::json_array();
        for (const auto& result : report.results) {
            results.push(result.to_json());
        }
        obj.set("elements", std::move(results));
        obj.set("skipped", json::json_string_array(report.skipped));
        files.push(std::move(obj));
    }

    auto root = json::json_object();
    root.set("version", json::JsonValue(VERSION));
    root.set("config", config.to_json());
    root.set("files", std::move(files));
    root.set("average_confidence", json::JsonValue(average_confidence(reports)));
    root.set("failed", json::JsonValue(pipeline::any_failed(reports)));
    return root;
}

auto write_report(const std::string& path, const std::vector<pipeline::FileReport>& reports,
                  const config::Config& config) -> Result<size_t, std::string> {
    return pipeline::write_atomic(path, report_to_json(reports, config).to_string_pretty() + "\n");
}

} // namespace docforge::cli

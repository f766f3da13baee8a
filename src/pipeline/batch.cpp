//! # Batch Processing
//!
//! ```text
//! BatchRunner::run()
//!   ├─ sort input paths
//!   ├─ run_workers()          # bounded pool over the file indices
//!   │    └─ process_one()     # FilePipeline::process_file + write_atomic
//!   └─ reports in path order
//! ```
//!
//! | Component   | Synchronization                 |
//! |-------------|---------------------------------|
//! | WorkQueue   | Mutex + condition variable      |
//! | BatchStats  | Atomic counters                 |
//! | reports     | One slot per input index        |

#include "pipeline/batch.hpp"

#include "common/fingerprint.hpp"
#include "log/log.hpp"
#include "pipeline/work_queue.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>

namespace docforge::pipeline {

BatchRunner::BatchRunner(const FilePipeline& pipeline, BatchOptions options)
    : pipeline_(pipeline), options_(options) {}

auto BatchRunner::run(std::vector<fs::path> files) -> std::vector<FileReport> {
    std::sort(files.begin(), files.end());

    stats_.reset();
    stats_.total_files = static_cast<int>(files.size());

    size_t jobs = resolve_jobs(options_.jobs);
    DOCFORGE_LOG_INFO("batch", "Processing " << files.size() << " files with "
                                             << std::min(jobs, std::max<size_t>(files.size(), 1))
                                             << " workers");

    std::vector<FileReport> reports(files.size());
    run_workers(files.size(), jobs,
                [&](size_t index) { reports[index] = process_one(files[index]); });

    DOCFORGE_LOG_INFO("batch", "Done in " << stats_.elapsed_ms() << " ms: " << stats_.succeeded
                                          << " ok, " << stats_.failed << " failed, "
                                          << stats_.written << " written");
    return reports;
}

auto BatchRunner::process_one(const fs::path& path) -> FileReport {
    FileReport report;
    report.path = path.string();

    DOCFORGE_LOG_DEBUG("batch", "[" << (stats_.succeeded + stats_.failed + 1) << "/"
                                    << stats_.total_files << "] " << report.path);

    auto processed = pipeline_.process_file(report.path);
    if (is_err(processed)) {
        report.error = unwrap_err(processed);
        report.fingerprint = fingerprint_file(report.path);
        stats_.failed++;
        DOCFORGE_LOG_ERROR("batch", report.path << ": " << report.error->to_string());
        return report;
    }

    auto& outcome = unwrap(processed);
    report.fingerprint = outcome.fingerprint;
    report.results = std::move(outcome.results);
    report.skipped = std::move(outcome.skipped);

    if (outcome.changed && !options_.dry_run) {
        auto written = write_atomic(path, outcome.rewritten);
        if (is_err(written)) {
            report.error = FileError{.kind = FileErrorKind::Io, .message = unwrap_err(written)};
            stats_.failed++;
            DOCFORGE_LOG_ERROR("batch", report.path << ": " << unwrap_err(written));
            return report;
        }
        report.written = true;
        stats_.written++;
    }
    stats_.succeeded++;
    return report;
}

// ============================================================================
// File Helpers
// ============================================================================

auto discover_files(const fs::path& root, bool recursive,
                    const std::vector<std::string>& extensions) -> std::vector<fs::path> {
    std::vector<fs::path> files;
    std::error_code ec;

    if (fs::is_regular_file(root, ec)) {
        files.push_back(root);
        return files;
    }
    if (!fs::is_directory(root, ec)) {
        DOCFORGE_LOG_WARN("batch", root.string() << " is not a directory");
        return files;
    }

    auto matches = [&](const fs::path& path) {
        auto ext = path.extension().string();
        return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
    };

    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(
                 root, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code entry_ec;
            const auto& name = it->path().filename().string();
            if (it->is_directory(entry_ec) && !name.empty() && name.front() == '.') {
                it.disable_recursion_pending();
                continue;
            }
            if (it->is_regular_file(entry_ec) && matches(it->path())) {
                files.push_back(it->path());
            }
        }
        if (ec) {
            DOCFORGE_LOG_WARN("batch", "cannot list " << root.string() << ": " << ec.message());
        }
    } else {
        for (const auto& entry : fs::directory_iterator(root, ec)) {
            std::error_code entry_ec;
            if (entry.is_regular_file(entry_ec) && matches(entry.path())) {
                files.push_back(entry.path());
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

auto write_atomic(const fs::path& target, std::string_view content)
    -> Result<size_t, std::string> {
    std::ostringstream suffix;
    suffix << ".docforge-" << std::this_thread::get_id() << ".tmp";
    fs::path temp = target;
    temp += suffix.str();

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return "cannot create " + temp.string();
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return "cannot write " + temp.string();
        }
    }

    std::error_code ec;
    auto perms = fs::status(target, ec).permissions();
    if (!ec) {
        fs::permissions(temp, perms, ec);
    }
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return "cannot replace " + target.string() + ": " + ec.message();
    }
    return content.size();
}

auto any_failed(const std::vector<FileReport>& reports) -> bool {
    return std::any_of(reports.begin(), reports.end(),
                       [](const FileReport& report) { return !report.ok(); });
}

} // namespace docforge::pipeline

//! # Batch Processing
//!
//! Processes many files on a bounded worker pool.
//!
//! ## Components
//!
//! | Item             | Description                                  |
//! |------------------|----------------------------------------------|
//! | `discover_files` | Sorted list of matching files under a root   |
//! | `BatchStats`     | Atomic counters for progress and the summary |
//! | `BatchRunner`    | Runs the file pipeline over the pool         |
//! | `write_atomic`   | Temporary sibling file renamed over a target |
//!
//! Files are independent. A failed file is reported and never partially
//! rewritten; the report list is ordered by input path whatever the pool
//! size.

#ifndef DOCFORGE_PIPELINE_BATCH_HPP
#define DOCFORGE_PIPELINE_BATCH_HPP

#include "pipeline/file_pipeline.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace docforge::pipeline {

struct FileReport {
    std::string path;
    std::string fingerprint;
    std::optional<FileError> error;
    std::vector<DocstringResult> results;
    std::vector<std::string> skipped;
    bool written = false;

    [[nodiscard]] auto ok() const -> bool {
        return !error.has_value();
    }
};

struct BatchStats {
    std::atomic<int> total_files{0};
    std::atomic<int> succeeded{0};
    std::atomic<int> failed{0};
    std::atomic<int> written{0};
    std::chrono::steady_clock::time_point start_time;

    void reset() {
        total_files = 0;
        succeeded = 0;
        failed = 0;
        written = 0;
        start_time = std::chrono::steady_clock::now();
    }

    [[nodiscard]] auto elapsed_ms() const -> int64_t {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time).count();
    }
};

struct BatchOptions {
    size_t jobs = 0;     ///< 0 = hardware concurrency capped at 8.
    bool dry_run = false; ///< Process but never write.
};

class BatchRunner {
public:
    BatchRunner(const FilePipeline& pipeline, BatchOptions options);

    /// Processes `files` and returns one report per file, sorted by path.
    [[nodiscard]] auto run(std::vector<fs::path> files) -> std::vector<FileReport>;

    [[nodiscard]] auto stats() const -> const BatchStats& {
        return stats_;
    }

private:
    const FilePipeline& pipeline_;
    BatchOptions options_;
    BatchStats stats_;

    [[nodiscard]] auto process_one(const fs::path& path) -> FileReport;
};

/// Regular files under `root` whose extension is in `extensions`, sorted.
/// A `root` that is a file is returned as the only entry.
[[nodiscard]] auto discover_files(const fs::path& root, bool recursive,
                                  const std::vector<std::string>& extensions)
    -> std::vector<fs::path>;

/// Writes `content` to a temporary sibling of `target` and renames it over
/// the target. Returns the number of bytes written.
[[nodiscard]] auto write_atomic(const fs::path& target, std::string_view content)
    -> Result<size_t, std::string>;

/// True when any report failed.
[[nodiscard]] auto any_failed(const std::vector<FileReport>& reports) -> bool;

} // namespace docforge::pipeline

#endif // DOCFORGE_PIPELINE_BATCH_HPP

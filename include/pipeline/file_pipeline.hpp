//! # File Pipeline
//!
//! Runs the synchronous per-file stages:
//!
//! ```text
//! Source → analyze (parse, extract, infer) → refine each element → inject
//! ```
//!
//! Only parse and I/O failures surface as `FileError`; backend failures
//! are recovered inside the generator and the critic.

#ifndef DOCFORGE_PIPELINE_FILE_PIPELINE_HPP
#define DOCFORGE_PIPELINE_FILE_PIPELINE_HPP

#include "backend/backend.hpp"
#include "config/config.hpp"
#include "doc/critic.hpp"
#include "doc/generator.hpp"
#include "lexer/source.hpp"
#include "pipeline/orchestrator.hpp"

#include <string>
#include <vector>

namespace docforge::pipeline {

enum class FileErrorKind : uint8_t {
    Parse,
    Io,
};

struct FileError {
    FileErrorKind kind = FileErrorKind::Io;
    std::string message;
    uint32_t line = 0;
    uint32_t column = 0;

    /// "parse error at 3:7: expected ':'" or "I/O error: ...".
    [[nodiscard]] auto to_string() const -> std::string;
};

struct FileOutcome {
    std::string path;
    std::string fingerprint; ///< Of the input text.
    std::string rewritten;
    std::vector<DocstringResult> results;
    std::vector<std::string> skipped; ///< Qualified names left as they were.
    bool changed = false;
};

class FilePipeline {
public:
    FilePipeline(const config::Config& config, backend::Capabilities capabilities);

    FilePipeline(const FilePipeline&) = delete;
    auto operator=(const FilePipeline&) -> FilePipeline& = delete;

    [[nodiscard]] auto process_source(const lexer::Source& source) const
        -> Result<FileOutcome, FileError>;

    [[nodiscard]] auto process_file(const std::string& path) const
        -> Result<FileOutcome, FileError>;

    [[nodiscard]] auto config() const -> const config::Config& {
        return config_;
    }

private:
    const config::Config& config_;
    doc::Generator generator_;
    doc::Critic critic_;
    Orchestrator orchestrator_;
};

/// Refinement options taken from a run configuration.
[[nodiscard]] auto refinement_options(const config::Config& config) -> RefinementOptions;

} // namespace docforge::pipeline

#endif // DOCFORGE_PIPELINE_FILE_PIPELINE_HPP

#include "pipeline/file_pipeline.hpp"

#include "analysis/extractor.hpp"
#include "common/fingerprint.hpp"
#include "log/log.hpp"
#include "pipeline/injector.hpp"

namespace docforge::pipeline {

auto FileError::to_string() const -> std::string {
    if (kind == FileErrorKind::Parse) {
        return "parse error at " + std::to_string(line) + ":" + std::to_string(column) + ": " +
               message;
    }
    return "I/O error: " + message;
}

auto refinement_options(const config::Config& config) -> RefinementOptions {
    return RefinementOptions{
        .style = config.style,
        .max_iterations = config.max_iterations,
        .threshold = config.threshold,
    };
}

FilePipeline::FilePipeline(const config::Config& config, backend::Capabilities capabilities)
    : config_(config), generator_(std::move(capabilities.completion)),
      critic_(std::move(capabilities.evaluation)),
      orchestrator_(generator_, critic_, refinement_options(config)) {}

auto FilePipeline::process_source(const lexer::Source& source) const
    -> Result<FileOutcome, FileError> {
    FileOutcome outcome;
    outcome.path = std::string(source.filename());
    outcome.fingerprint = fingerprint(source.content());

    auto analyzed = analysis::analyze(source);
    if (is_err(analyzed)) {
        const auto& error = unwrap_err(analyzed);
        DOCFORGE_LOG_ERROR("extract", outcome.path << ":" << error.span.start.line << ":"
                                                   << error.span.start.column << ": "
                                                   << error.message);
        return FileError{
            .kind = FileErrorKind::Parse,
            .message = error.message,
            .line = error.span.start.line,
            .column = error.span.start.column,
        };
    }
    const auto& elements = unwrap(analyzed);
    DOCFORGE_LOG_INFO("extract", outcome.path << ": " << elements.size() << " elements");

    std::vector<const analysis::CodeElement*> pending;
    for (const auto& element : elements) {
        if (element.has_existing_doc() && !config_.overwrite && config_.skip_existing) {
            outcome.skipped.push_back(element.qualified_name);
            continue;
        }
        pending.push_back(&element);
    }

    outcome.results = orchestrator_.refine_all(pending, config_.batch.element_jobs);
    outcome.rewritten = inject(source, elements, outcome.results,
                               InjectOptions{.overwrite = config_.overwrite});
    outcome.changed = outcome.rewritten != source.content();
    return outcome;
}

auto FilePipeline::process_file(const std::string& path) const -> Result<FileOutcome, FileError> {
    auto source = lexer::Source::from_file(path);
    if (is_err(source)) {
        DOCFORGE_LOG_ERROR("batch", path << ": " << unwrap_err(source));
        return FileError{.kind = FileErrorKind::Io, .message = unwrap_err(source)};
    }
    return process_source(unwrap(source));
}

} // namespace docforge::pipeline

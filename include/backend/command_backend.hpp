//! # Command Backend
//!
//! Implements both capabilities by running an external command once per
//! request. The request is written to the command's stdin as one JSON
//! object and the reply is read from its stdout:
//!
//! ```text
//! stdin:  {"op": "complete", "style": "google/1", "element": {...}, ...}
//! stdout: {"text": "\"\"\"Compute the total.\"\"\""}
//!
//! stdin:  {"op": "evaluate", "candidate": "...", "element": {...}, ...}
//! stdout: {"score": 0.8, "issues": [...], "suggestions": [...]}
//! ```
//!
//! A non-zero exit status, a timeout or a reply that is not the expected
//! JSON object is a `BackendError`.

#ifndef DOCFORGE_BACKEND_COMMAND_BACKEND_HPP
#define DOCFORGE_BACKEND_COMMAND_BACKEND_HPP

#include "backend/backend.hpp"

#include <string>
#include <vector>

namespace docforge::backend {

struct CommandConfig {
    std::string command;
    std::vector<std::string> args;
    int timeout_seconds = 30;
};

class CommandBackend : public CompletionBackend, public EvaluationBackend {
public:
    explicit CommandBackend(CommandConfig config);

    [[nodiscard]] auto complete(const CompletionRequest& request)
        -> Result<std::string, BackendError> override;

    [[nodiscard]] auto evaluate(const EvaluationRequest& request)
        -> Result<Evaluation, BackendError> override;

    [[nodiscard]] auto name() const -> std::string override;

private:
    CommandConfig config_;

    [[nodiscard]] auto exchange(const json::JsonValue& request) const
        -> Result<json::JsonValue, BackendError>;
};

/// Capabilities for a run: none when `config.command` is empty, otherwise
/// one shared `CommandBackend` (evaluation only when `evaluate` is set).
[[nodiscard]] auto make_capabilities(const CommandConfig& config, bool evaluate) -> Capabilities;

} // namespace docforge::backend

#endif // DOCFORGE_BACKEND_COMMAND_BACKEND_HPP

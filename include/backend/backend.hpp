//! # Capability Backends
//!
//! Abstract natural-language capabilities used by the generator and the
//! critic. The pipeline never depends on a concrete model: a run either has
//! a backend (selected once from configuration) or falls back to the
//! rule-based generator and the objective critic.
//!
//! | Interface           | Used by   | Failure handling               |
//! |---------------------|-----------|--------------------------------|
//! | `CompletionBackend` | Generator | rule-based candidate instead   |
//! | `EvaluationBackend` | Critic    | objective score stands         |
//!
//! Implementations must be safe to call from several worker threads.

#ifndef DOCFORGE_BACKEND_BACKEND_HPP
#define DOCFORGE_BACKEND_BACKEND_HPP

#include "common.hpp"
#include "json/json_value.hpp"

#include <string>
#include <vector>

namespace docforge::backend {

struct BackendError {
    std::string message;
};

// ============================================================================
// Requests and Replies
// ============================================================================

struct CompletionRequest {
    json::JsonValue element; ///< `analysis::to_prompt_json()` of the element.
    std::string style;       ///< Template id, e.g. "google/1".
    std::string skeleton;    ///< Section layout the reply must follow.
    std::vector<std::string> issues;
    std::vector<std::string> suggestions;

    [[nodiscard]] auto to_json() const -> json::JsonValue;
};

struct EvaluationRequest {
    json::JsonValue element;
    std::string style;
    std::string candidate;

    [[nodiscard]] auto to_json() const -> json::JsonValue;
};

struct Evaluation {
    double score = 0.0; ///< Clamped to [0, 1].
    std::vector<std::string> issues;
    std::vector<std::string> suggestions;
};

// ============================================================================
// Interfaces
// ============================================================================

class CompletionBackend {
public:
    virtual ~CompletionBackend() = default;

    [[nodiscard]] virtual auto complete(const CompletionRequest& request)
        -> Result<std::string, BackendError> = 0;

    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

class EvaluationBackend {
public:
    virtual ~EvaluationBackend() = default;

    [[nodiscard]] virtual auto evaluate(const EvaluationRequest& request)
        -> Result<Evaluation, BackendError> = 0;

    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

/// The capabilities of one run. Either pointer may be null.
struct Capabilities {
    Rc<CompletionBackend> completion;
    Rc<EvaluationBackend> evaluation;
};

/// Parses an evaluation reply object (`score`, `issues`, `suggestions`).
[[nodiscard]] auto parse_evaluation(const json::JsonValue& reply)
    -> Result<Evaluation, BackendError>;

} // namespace docforge::backend

#endif // DOCFORGE_BACKEND_BACKEND_HPP

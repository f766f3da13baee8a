#include "backend/command_backend.hpp"

#include "backend/subprocess.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace docforge::backend {

// ============================================================================
// Request Serialization
// ============================================================================

auto CompletionRequest::to_json() const -> json::JsonValue {
    auto obj = json::json_object();
    obj.set("op", json::JsonValue("complete"));
    obj.set("element", element.clone());
    obj.set("style", json::JsonValue(style));
    obj.set("skeleton", json::JsonValue(skeleton));
    obj.set("issues", json::json_string_array(issues));
    obj.set("suggestions", json::json_string_array(suggestions));
    return obj;
}

auto EvaluationRequest::to_json() const -> json::JsonValue {
    auto obj = json::json_object();
    obj.set("op", json::JsonValue("evaluate"));
    obj.set("element", element.clone());
    obj.set("style", json::JsonValue(style));
    obj.set("candidate", json::JsonValue(candidate));
    return obj;
}

auto parse_evaluation(const json::JsonValue& reply) -> Result<Evaluation, BackendError> {
    if (!reply.is_object()) {
        return BackendError{"evaluation reply is not a JSON object"};
    }
    auto score = reply.get_number("score");
    if (!score) {
        return BackendError{"evaluation reply has no numeric 'score'"};
    }
    return Evaluation{
        .score = std::clamp(*score, 0.0, 1.0),
        .issues = reply.get_string_array("issues"),
        .suggestions = reply.get_string_array("suggestions"),
    };
}

// ============================================================================
// CommandBackend
// ============================================================================

CommandBackend::CommandBackend(CommandConfig config) : config_(std::move(config)) {}

auto CommandBackend::name() const -> std::string {
    return "command:" + config_.command;
}

auto CommandBackend::exchange(const json::JsonValue& request) const
    -> Result<json::JsonValue, BackendError> {
    auto raw = run_subprocess(config_.command, config_.args, request.to_string() + "\n",
                              config_.timeout_seconds);
    if (!raw.launched) {
        return BackendError{"cannot run '" + config_.command + "': " + raw.stderr_output};
    }
    if (raw.timed_out) {
        return BackendError{"'" + config_.command + "' timed out after " +
                            std::to_string(config_.timeout_seconds) + "s"};
    }
    if (raw.exit_code != 0) {
        std::string detail = raw.stderr_output.substr(0, 200);
        return BackendError{"'" + config_.command + "' exited with status " +
                            std::to_string(raw.exit_code) +
                            (detail.empty() ? "" : ": " + detail)};
    }
    DOCFORGE_LOG_TRACE("backend", config_.command << " replied in " << raw.duration_us / 1000
                                                  << "ms");

    auto reply = json::parse_json(raw.stdout_output);
    if (is_err(reply)) {
        return BackendError{"malformed reply from '" + config_.command +
                            "': " + unwrap_err(reply).to_string()};
    }
    return std::move(unwrap(reply));
}

auto CommandBackend::complete(const CompletionRequest& request)
    -> Result<std::string, BackendError> {
    auto reply = exchange(request.to_json());
    if (is_err(reply)) {
        return unwrap_err(reply);
    }
    auto text = unwrap(reply).get_string("text");
    if (!text) {
        return BackendError{"completion reply has no string 'text'"};
    }
    return *text;
}

auto CommandBackend::evaluate(const EvaluationRequest& request)
    -> Result<Evaluation, BackendError> {
    auto reply = exchange(request.to_json());
    if (is_err(reply)) {
        return unwrap_err(reply);
    }
    return parse_evaluation(unwrap(reply));
}

auto make_capabilities(const CommandConfig& config, bool evaluate) -> Capabilities {
    Capabilities caps;
    if (config.command.empty()) {
        return caps;
    }
    auto backend = make_rc<CommandBackend>(config);
    caps.completion = backend;
    if (evaluate) {
        caps.evaluation = backend;
    }
    DOCFORGE_LOG_INFO("backend", "using " << backend->name()
                                          << (evaluate ? " for completion and evaluation"
                                                       : " for completion"));
    return caps;
}

} // namespace docforge::backend

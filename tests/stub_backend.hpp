//! # Stub Backends
//!
//! Scripted capability backends for tests. Replies are served in order;
//! the last one repeats once the script runs out. Every call is recorded.

#ifndef DOCFORGE_TESTS_STUB_BACKEND_HPP
#define DOCFORGE_TESTS_STUB_BACKEND_HPP

#include "backend/backend.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

namespace docforge::stubs {

/// The parts of a completion request the tests look at.
struct RecordedRequest {
    std::string element_name;
    std::string style;
    std::string skeleton;
    std::vector<std::string> issues;
    std::vector<std::string> suggestions;
};

class StubCompletion : public backend::CompletionBackend {
public:
    explicit StubCompletion(std::vector<std::string> replies = {}) : replies_(std::move(replies)) {}

    [[nodiscard]] auto complete(const backend::CompletionRequest& request)
        -> Result<std::string, backend::BackendError> override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(RecordedRequest{
            .element_name = request.element.get_string("name").value_or(""),
            .style = request.style,
            .skeleton = request.skeleton,
            .issues = request.issues,
            .suggestions = request.suggestions,
        });
        if (fail_ || replies_.empty()) {
            return backend::BackendError{"stub completion failed"};
        }
        auto index = std::min(next_, replies_.size() - 1);
        ++next_;
        return replies_[index];
    }

    [[nodiscard]] auto name() const -> std::string override {
        return "stub-completion";
    }

    void set_failing(bool fail) {
        fail_ = fail;
    }

    [[nodiscard]] auto calls() -> size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    [[nodiscard]] auto requests() -> std::vector<RecordedRequest> {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    std::vector<std::string> replies_;
    size_t next_ = 0;
    bool fail_ = false;
    std::vector<RecordedRequest> requests_;
    std::mutex mutex_;
};

class StubEvaluation : public backend::EvaluationBackend {
public:
    explicit StubEvaluation(backend::Evaluation reply) : reply_(std::move(reply)) {}

    [[nodiscard]] auto evaluate(const backend::EvaluationRequest& request)
        -> Result<backend::Evaluation, backend::BackendError> override {
        std::lock_guard<std::mutex> lock(mutex_);
        candidates_.push_back(request.candidate);
        if (fail_) {
            return backend::BackendError{"stub evaluation failed"};
        }
        return reply_;
    }

    [[nodiscard]] auto name() const -> std::string override {
        return "stub-evaluation";
    }

    void set_failing(bool fail) {
        fail_ = fail;
    }

    [[nodiscard]] auto calls() -> size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return candidates_.size();
    }

private:
    backend::Evaluation reply_;
    bool fail_ = false;
    std::vector<std::string> candidates_;
    std::mutex mutex_;
};

} // namespace docforge::stubs

#endif // DOCFORGE_TESTS_STUB_BACKEND_HPP

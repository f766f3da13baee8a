//! # Work Queue
//!
//! Thread-safe index queue and a bounded worker pool. Both the per-file
//! element loops and the batch file loop run through `run_workers`.
//!
//! ```text
//! run_workers(count, jobs, task)
//!   ├─ WorkQueue      # indices 0..count, mutex + condition variable
//!   └─ jobs threads   # each pops an index and calls task(index)
//! ```
//!
//! Results are written by index, so the output order never depends on the
//! number of workers.

#ifndef DOCFORGE_PIPELINE_WORK_QUEUE_HPP
#define DOCFORGE_PIPELINE_WORK_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace docforge::pipeline {

/// Upper bound for automatically chosen worker counts.
constexpr size_t MAX_AUTO_JOBS = 8;

class WorkQueue {
public:
    WorkQueue() = default;

    void push(size_t index);

    /// Pops an index, waiting up to `timeout_ms`. Returns nullopt once the
    /// queue is empty and stopped, or on timeout.
    auto pop(int timeout_ms = 100) -> std::optional<size_t>;

    void stop();
    auto is_empty() -> bool;
    auto size() -> size_t;

private:
    std::queue<size_t> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_flag_ = false;
};

/// 0 means hardware concurrency capped at `MAX_AUTO_JOBS`; never below 1.
[[nodiscard]] auto resolve_jobs(size_t requested) -> size_t;

/// Calls `task(i)` for every i in [0, count) on at most `jobs` threads.
/// With one job (or one item) the tasks run on the calling thread.
void run_workers(size_t count, size_t jobs, const std::function<void(size_t)>& task);

} // namespace docforge::pipeline

#endif // DOCFORGE_PIPELINE_WORK_QUEUE_HPP

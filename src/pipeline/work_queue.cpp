#include "pipeline/work_queue.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

namespace docforge::pipeline {

void WorkQueue::push(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(index);
    cv_.notify_one();
}

auto WorkQueue::pop(int timeout_ms) -> std::optional<size_t> {
    std::unique_lock<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return !queue_.empty() || stop_flag_; });
    }

    if (queue_.empty()) {
        return std::nullopt;
    }

    auto index = queue_.front();
    queue_.pop();
    return index;
}

void WorkQueue::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_flag_ = true;
    cv_.notify_all();
}

auto WorkQueue::is_empty() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

auto WorkQueue::size() -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

auto resolve_jobs(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    size_t hardware = std::thread::hardware_concurrency();
    return std::clamp<size_t>(hardware, 1, MAX_AUTO_JOBS);
}

void run_workers(size_t count, size_t jobs, const std::function<void(size_t)>& task) {
    if (count == 0) {
        return;
    }
    size_t threads = std::min(count, std::max<size_t>(jobs, 1));
    if (threads == 1) {
        for (size_t i = 0; i < count; ++i) {
            task(i);
        }
        return;
    }

    // Every index is queued before the workers start, so an empty pop means
    // the work is done.
    WorkQueue queue;
    for (size_t i = 0; i < count; ++i) {
        queue.push(i);
    }
    queue.stop();

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (size_t t = 0; t < threads; ++t) {
        workers.emplace_back([&queue, &task] {
            while (auto index = queue.pop()) {
                task(*index);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
}

} // namespace docforge::pipeline

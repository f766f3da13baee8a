//! # Subprocess Runner
//!
//! Runs an external command with a piped stdin, collects stdout and
//! stderr, and kills the child when it exceeds its time limit. The pipes
//! are serviced with `poll()` while waiting so a chatty child can never
//! block on a full pipe.

#ifndef DOCFORGE_BACKEND_SUBPROCESS_HPP
#define DOCFORGE_BACKEND_SUBPROCESS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace docforge::backend {

struct SubprocessResult {
    bool launched = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;
    int64_t duration_us = 0;
};

/// Runs `command args...` (PATH lookup as in `execvp`), writing `input` to
/// its stdin. A `timeout_seconds` of 0 or less means 60 seconds.
[[nodiscard]] auto run_subprocess(const std::string& command, const std::vector<std::string>& args,
                                  const std::string& input, int timeout_seconds)
    -> SubprocessResult;

} // namespace docforge::backend

#endif // DOCFORGE_BACKEND_SUBPROCESS_HPP

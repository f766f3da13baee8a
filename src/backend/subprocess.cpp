#include "backend/subprocess.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace docforge::backend {

namespace {

using Clock = std::chrono::steady_clock;

void ignore_sigpipe() {
    static std::once_flag once;
    // A child that exits before reading its input must not kill us.
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/// Reads what is available; returns false at end of stream.
auto drain(int fd, std::string& out) -> bool {
    std::array<char, 4096> buf{};
    while (true) {
        ssize_t n = read(fd, buf.data(), buf.size());
        if (n > 0) {
            out.append(buf.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
    }
}

} // namespace

auto run_subprocess(const std::string& command, const std::vector<std::string>& args,
                    const std::string& input, int timeout_seconds) -> SubprocessResult {
    ignore_sigpipe();
    auto start = Clock::now();
    SubprocessResult result;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        result.stderr_output = "failed to create pipes";
        for (int* fd : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0], &stdout_pipe[1],
                        &stderr_pipe[0], &stderr_pipe[1]}) {
            close_fd(*fd);
        }
        return result;
    }

    // Built before fork: the child may only call async-signal-safe functions.
    std::vector<char*> c_args;
    c_args.push_back(const_cast<char*>(command.c_str()));
    for (const auto& a : args) {
        c_args.push_back(const_cast<char*>(a.c_str()));
    }
    c_args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_output = "failed to fork";
        for (int* fd : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0], &stdout_pipe[1],
                        &stderr_pipe[0], &stderr_pipe[1]}) {
            close_fd(*fd);
        }
        return result;
    }

    if (pid == 0) {
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        execvp(command.c_str(), c_args.data());
        _exit(127);
    }

    result.launched = true;
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);

    int in_fd = stdin_pipe[1];
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];
    fcntl(in_fd, F_SETFL, O_NONBLOCK);
    fcntl(out_fd, F_SETFL, O_NONBLOCK);
    fcntl(err_fd, F_SETFL, O_NONBLOCK);

    size_t written = 0;
    if (input.empty()) {
        close_fd(in_fd);
    }

    int limit = timeout_seconds > 0 ? timeout_seconds : 60;
    auto deadline = start + std::chrono::seconds(limit);

    while (out_fd >= 0 || err_fd >= 0) {
        auto now = Clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        if (in_fd >= 0) {
            fds[count++] = pollfd{in_fd, POLLOUT, 0};
        }
        if (out_fd >= 0) {
            fds[count++] = pollfd{out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            fds[count++] = pollfd{err_fd, POLLIN, 0};
        }

        int ready = poll(fds.data(), count, static_cast<int>(std::min<int64_t>(remaining, 100)));
        if (ready < 0 && errno != EINTR) {
            result.stderr_output += "poll failed";
            break;
        }
        if (ready <= 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == in_fd) {
                ssize_t n = write(in_fd, input.data() + written, input.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                }
                if ((n < 0 && errno != EAGAIN && errno != EINTR) || written == input.size()) {
                    close_fd(in_fd);
                }
            } else if (fds[i].fd == out_fd) {
                if (!drain(out_fd, result.stdout_output)) {
                    close_fd(out_fd);
                }
            } else if (fds[i].fd == err_fd) {
                if (!drain(err_fd, result.stderr_output)) {
                    close_fd(err_fd);
                }
            }
        }
    }

    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    // The child may close its output and keep running, so the wait is
    // bounded by the same deadline.
    int status = 0;
    bool reaped = false;
    while (!result.timed_out) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid || (waited < 0 && errno != EINTR)) {
            reaped = waited == pid;
            break;
        }
        if (Clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (result.timed_out) {
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        result.exit_code = -1;
        result.stderr_output += "timed out after " + std::to_string(limit) + "s";
        DOCFORGE_LOG_WARN("backend", command << " killed after " << limit << "s");
    } else {
        result.exit_code = reaped && WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }

    result.duration_us =
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
    return result;
}

} // namespace docforge::backend

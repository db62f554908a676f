#include "session/turn_runner.hpp"

#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace taskwarden::session {

using core::errors::ErrorCategory;
using core::errors::TaskError;

namespace {

constexpr std::size_t kMaxStderrBytes = 16 * 1024;

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        close_fd(fd);
        return;
    }
}

// Hands every complete line to the sink and keeps the unfinished tail.
void flush_lines(std::string& pending, const LineSink& on_line) {
    std::size_t start = 0;
    while (true) {
        const auto newline = pending.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        std::string line = pending.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty() && on_line) {
            on_line(line);
        }
        start = newline + 1;
    }
    pending.erase(0, start);
}

}  // namespace

CliTurnRunner::CliTurnRunner(core::config::CliCommand cli, std::filesystem::path cwd,
                             process::Environment env, const std::uint32_t timeout_ms,
                             std::shared_ptr<std::atomic_bool> cancel_token)
    : cli_(std::move(cli)),
      cwd_(std::move(cwd)),
      env_(std::move(env)),
      timeout_ms_(timeout_ms),
      cancel_token_(std::move(cancel_token)) {}

std::vector<std::string> CliTurnRunner::build_arguments(const core::config::CliCommand& cli,
                                                        const TurnRequest& request) {
    std::vector<std::string> args = cli.args;
    args.insert(args.end(), {"run", "--format", "json"});
    if (request.attach_url.has_value()) {
        args.push_back("--attach");
        args.push_back(request.attach_url.value());
    }
    if (request.session_id.has_value() && !request.session_id->empty()) {
        args.push_back("--session");
        args.push_back(request.session_id.value());
    }
    args.push_back(request.prompt);
    return args;
}

core::errors::Result<TurnResult> CliTurnRunner::run_turn(const TurnRequest& request,
                                                         const LineSink& on_line) {
    TurnResult result;
    if (cancel_token_ && cancel_token_->load()) {
        result.cancelled = true;
        result.stderr_text = "Turn cancelled before start.";
        return result;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        return TaskError{ErrorCategory::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        return TaskError{ErrorCategory::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }

    process::LaunchSpec spec;
    spec.command = cli_.command;
    spec.args = build_arguments(cli_, request);
    spec.cwd = cwd_;
    spec.env = env_;

    LOG_DEBUG("Starting agent turn" +
              (request.attach_url ? " attached to " + request.attach_url.value()
                                  : std::string(" standalone")));

    auto spawned = process::spawn_child(spec, {stdout_pipe[1], stderr_pipe[1]});
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    if (core::errors::is_error(spawned)) {
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return core::errors::get_error(spawned);
    }
    const pid_t pid = core::errors::get_value(spawned);

    int stdout_fd = stdout_pipe[0];
    int stderr_fd = stderr_pipe[0];
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);

    const auto started = std::chrono::steady_clock::now();
    std::string pending;
    std::string stderr_text;
    bool child_exited = false;
    int status = 0;

    while (stdout_fd >= 0 || stderr_fd >= 0 || !child_exited) {
        if (cancel_token_ && cancel_token_->load() && !child_exited && !result.cancelled) {
            result.cancelled = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        const bool past_deadline =
            timeout_ms_ > 0 && elapsed > static_cast<std::int64_t>(timeout_ms_);
        if (!result.timed_out && past_deadline && !child_exited) {
            result.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        // A descendant that outlived the agent can hold the pipes open.
        const bool cancel_requested = cancel_token_ && cancel_token_->load();
        if (child_exited && (past_deadline || cancel_requested) &&
            (stdout_fd >= 0 || stderr_fd >= 0)) {
            if (past_deadline) {
                result.timed_out = true;
            } else {
                result.cancelled = true;
            }
            static_cast<void>(kill(-pid, SIGKILL));
            close_fd(stdout_fd);
            close_fd(stderr_fd);
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_fd >= 0) {
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_fd >= 0) {
            fds[nfds].fd = stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            usleep(10 * 1000);
        }

        drain_pipe(stdout_fd, pending);
        flush_lines(pending, on_line);
        drain_pipe(stderr_fd, stderr_text);
        if (stderr_text.size() > kMaxStderrBytes) {
            stderr_text.erase(0, stderr_text.size() - kMaxStderrBytes);
        }

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (!pending.empty()) {
        pending.push_back('\n');
        flush_lines(pending, on_line);
    }

    result.exit_code = process::decode_wait_status(status);
    result.stderr_text = std::move(stderr_text);
    return result;
}

}  // namespace taskwarden::session

#include "process/child_spawn.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace taskwarden::process {

using core::errors::ErrorCategory;
using core::errors::TaskError;

Environment merged_environment(const Environment& overrides) {
    Environment env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string kv(*entry);
        const auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        env[key] = value;
    }
    return env;
}

int decode_wait_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

core::errors::Result<pid_t> spawn_child(const LaunchSpec& spec,
                                        const ChildStdio& stdio) {
    if (spec.command.empty()) {
        return TaskError{ErrorCategory::Input, "Command cannot be empty.",
                         "empty_command"};
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.command);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    env_storage.reserve(spec.env.size());
    for (const auto& [key, value] : spec.env) {
        env_storage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const std::string cwd = spec.cwd.string();

    int status_pipe[2] = {-1, -1};
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        return TaskError{ErrorCategory::Internal, "Failed to create status pipe.",
                         "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        static_cast<void>(close(status_pipe[0]));
        static_cast<void>(close(status_pipe[1]));
        return TaskError{ErrorCategory::Internal, "Failed to fork process.",
                         "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(close(status_pipe[0]));
        static_cast<void>(setsid());
        const int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
        }
        static_cast<void>(dup2(stdio.stdout_fd >= 0 ? stdio.stdout_fd : devnull, STDOUT_FILENO));
        static_cast<void>(dup2(stdio.stderr_fd >= 0 ? stdio.stderr_fd : devnull, STDERR_FILENO));
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            const int err = errno;
            static_cast<void>(write(status_pipe[1], &err, sizeof(err)));
            _exit(126);
        }
        execvpe(argv[0], argv.data(), envp.data());
        const int err = errno;
        static_cast<void>(write(status_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    static_cast<void>(close(status_pipe[1]));
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    static_cast<void>(close(status_pipe[0]));

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        return TaskError{ErrorCategory::Startup,
                         "Failed to start " + spec.command + ": " +
                             std::strerror(child_errno),
                         "spawn_failed"};
    }
    return pid;
}

}  // namespace taskwarden::process

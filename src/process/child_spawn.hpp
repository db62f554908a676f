#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/task_errors.hpp"

namespace taskwarden::process {

using Environment = std::map<std::string, std::string>;

struct LaunchSpec {
    std::string command;
    std::vector<std::string> args;
    std::filesystem::path cwd = ".";
    Environment env;  // complete environment of the child
};

struct ChildStdio {
    int stdout_fd = -1;  // -1 sends stdout to /dev/null
    int stderr_fd = -1;  // -1 sends stderr to /dev/null
};

// Host environment overlaid with overrides.
Environment merged_environment(const Environment& overrides);

// fork + execvpe in a new session (own process group) so the child does
// not share the host's terminal or signals. Exec failures are reported
// synchronously through a close-on-exec pipe.
core::errors::Result<pid_t> spawn_child(const LaunchSpec& spec,
                                        const ChildStdio& stdio = {});

// Decodes a waitpid status into an exit code; signals map to 128 + signo.
int decode_wait_status(int status);

}  // namespace taskwarden::process

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include "core/errors/task_errors.hpp"
#include "process/child_spawn.hpp"

namespace taskwarden::process {

// What the supervision layer reports when a launched process goes away.
// error is set when the process failed rather than exited.
struct ProcessExit {
    int exit_code = -1;
    std::optional<std::string> error;
};

using ExitSink = std::function<void(const ProcessExit&)>;

class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;
    virtual pid_t pid() const = 0;
    // Idempotent. The exit is still reported through the sink.
    virtual void kill() = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // The sink is invoked exactly once, from a supervision thread, when the
    // process exits. It must not block on locks held around kill().
    virtual core::errors::Result<std::unique_ptr<ProcessHandle>> launch(
        const LaunchSpec& spec, ExitSink on_exit) = 0;
};

class PosixProcessLauncher : public ProcessLauncher {
public:
    core::errors::Result<std::unique_ptr<ProcessHandle>> launch(
        const LaunchSpec& spec, ExitSink on_exit) override;
};

}  // namespace taskwarden::process

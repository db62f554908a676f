#include "process/process_launcher.hpp"

#include <cerrno>
#include <mutex>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <utility>

namespace taskwarden::process {

namespace {

class PosixProcessHandle : public ProcessHandle {
public:
    PosixProcessHandle(const pid_t pid, ExitSink on_exit) : pid_(pid) {
        watcher_ = std::thread([this, sink = std::move(on_exit)]() { watch(sink); });
    }

    ~PosixProcessHandle() override {
        kill();
        if (watcher_.joinable()) {
            watcher_.join();
        }
    }

    PosixProcessHandle(const PosixProcessHandle&) = delete;
    PosixProcessHandle& operator=(const PosixProcessHandle&) = delete;

    pid_t pid() const override { return pid_; }

    void kill() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (exited_) {
            return;
        }
        // The child leads its own process group; take grandchildren with it.
        if (::kill(-pid_, SIGKILL) != 0) {
            static_cast<void>(::kill(pid_, SIGKILL));
        }
    }

private:
    void watch(const ExitSink& sink) {
        // Wait without reaping so kill() can never target a recycled pid.
        siginfo_t info{};
        int rc = 0;
        do {
            rc = waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
        } while (rc != 0 && errno == EINTR);

        int status = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            exited_ = true;
            static_cast<void>(waitpid(pid_, &status, 0));
        }

        ProcessExit report;
        if (rc != 0) {
            report.error = "Lost track of process " + std::to_string(pid_);
        } else {
            report.exit_code = decode_wait_status(status);
        }
        if (sink) {
            sink(report);
        }
    }

    const pid_t pid_;
    std::mutex mutex_;
    bool exited_ = false;
    std::thread watcher_;
};

}  // namespace

core::errors::Result<std::unique_ptr<ProcessHandle>> PosixProcessLauncher::launch(
    const LaunchSpec& spec, ExitSink on_exit) {
    auto spawned = spawn_child(spec);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    std::unique_ptr<ProcessHandle> handle = std::make_unique<PosixProcessHandle>(
        core::errors::get_value(spawned), std::move(on_exit));
    return handle;
}

}  // namespace taskwarden::process

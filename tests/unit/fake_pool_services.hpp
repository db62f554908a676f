#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "net/health_probe.hpp"
#include "net/port_allocator.hpp"
#include "process/process_launcher.hpp"

// In-memory stand-ins for the pool's OS seams.
namespace taskwarden::fakes {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::TaskError;
using process::ExitSink;
using process::LaunchSpec;
using process::ProcessExit;
using process::ProcessHandle;

struct FakeProcess {
    LaunchSpec spec;
    ExitSink sink;
    std::atomic_bool exited{false};
    std::atomic_bool killed{false};

    void exit(const int code) {
        if (exited.exchange(true)) {
            return;
        }
        if (sink) {
            sink(ProcessExit{code, std::nullopt});
        }
    }
};

class FakeHandle : public ProcessHandle {
public:
    FakeHandle(std::shared_ptr<FakeProcess> process, const pid_t pid)
        : process_(std::move(process)), pid_(pid) {}

    pid_t pid() const override { return pid_; }

    void kill() override {
        process_->killed = true;
        process_->exit(137);
    }

private:
    std::shared_ptr<FakeProcess> process_;
    pid_t pid_;
};

class FakeLauncher : public process::ProcessLauncher {
public:
    Result<std::unique_ptr<ProcessHandle>> launch(const LaunchSpec& spec,
                                                  ExitSink on_exit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++attempts_;
        if (fail_) {
            return TaskError{ErrorCategory::Startup, "Failed to start " + spec.command,
                             "spawn_failed"};
        }
        auto process = std::make_shared<FakeProcess>();
        process->spec = spec;
        process->sink = std::move(on_exit);
        processes_.push_back(process);
        if (exit_on_launch_) {
            process->exit(1);
        }
        std::unique_ptr<ProcessHandle> handle = std::make_unique<FakeHandle>(
            process, static_cast<pid_t>(1000 + processes_.size()));
        return handle;
    }

    void set_fail(const bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

    void set_exit_on_launch(const bool exit_on_launch) {
        std::lock_guard<std::mutex> lock(mutex_);
        exit_on_launch_ = exit_on_launch;
    }

    std::size_t launched() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return processes_.size();
    }

    std::size_t attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

    std::shared_ptr<FakeProcess> process(const std::size_t index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return processes_.at(index);
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<FakeProcess>> processes_;
    std::size_t attempts_ = 0;
    bool fail_ = false;
    bool exit_on_launch_ = false;
};

class FakePorts : public net::PortAllocator {
public:
    Result<std::uint16_t> allocate() override { return next_++; }

private:
    std::atomic<std::uint16_t> next_{40000};
};

class FakeProbe : public net::HealthProbe {
public:
    bool ping(const std::string& url, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return ready_ ? ready_(url) : false;
    }

    void set_ready(std::function<bool(const std::string&)> ready) {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_ = std::move(ready);
    }

private:
    std::mutex mutex_;
    std::function<bool(const std::string&)> ready_;
};

inline bool wait_until(const std::function<bool()>& predicate,
                const std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

}  // namespace taskwarden::fakes

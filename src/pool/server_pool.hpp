#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <deque>
#include <variant>
#include <vector>
#include "core/config/runtime_config.hpp"
#include "core/errors/task_errors.hpp"
#include "core/sync/channel.hpp"
#include "net/health_probe.hpp"
#include "net/port_allocator.hpp"
#include "process/process_launcher.hpp"

namespace taskwarden::pool {

enum class WorkerState {
    Starting,
    Idle,
    InUse
};

enum class LeaseSource {
    Warm,  // popped from the idle queue
    Cold   // spawned on demand
};

std::string to_string(WorkerState state);
std::string to_string(LeaseSource source);

// How the pool launches the agent CLI. Supplied by whoever owns task
// execution and replaceable through update_config().
struct PoolRuntime {
    std::function<core::config::CliCommand()> get_cli_command;
    std::filesystem::path cwd = ".";
    std::function<core::errors::Result<process::Environment>()> build_environment;
    std::function<core::errors::Status()> on_before_start;  // optional
};

// OS-facing seams, swapped for fakes in tests.
struct PoolServices {
    std::shared_ptr<process::ProcessLauncher> launcher;
    std::shared_ptr<net::PortAllocator> ports;
    std::shared_ptr<net::HealthProbe> probe;
};

PoolServices default_pool_services();

struct PoolTimings {
    std::chrono::milliseconds readiness_poll_interval{250};
    std::chrono::milliseconds ping_timeout{1000};
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_cap{30000};
};

struct PoolSnapshot {
    std::size_t total = 0;
    std::size_t idle = 0;
    std::size_t in_use = 0;
    std::size_t starting = 0;
    std::size_t warming = 0;
    std::uint32_t warmup_failure_streak = 0;
};

class ServerPool;

// Single-use right to one worker. Copies share the same one-shot flag, so
// only the first release() or retire() across all copies takes effect.
// The pool must outlive its leases.
class Lease {
public:
    const std::string& attach_url() const { return attach_url_; }
    LeaseSource source() const { return source_; }
    int worker_id() const { return worker_id_; }
    bool closed() const { return closed_->load(); }

    void release();
    void retire();

private:
    friend class ServerPool;
    Lease(ServerPool* pool, int worker_id, std::string attach_url, LeaseSource source);

    ServerPool* pool_;
    int worker_id_;
    std::string attach_url_;
    LeaseSource source_;
    std::shared_ptr<std::atomic_bool> closed_;
};

// Keeps min_idle agent servers warm, never more than max_total alive.
// Thread-safe; background warmups and process exits are serialized through
// an internal event loop.
class ServerPool {
public:
    ServerPool(std::string name, PoolRuntime runtime,
               const core::config::PoolOptions& options = {},
               PoolServices services = default_pool_services(),
               PoolTimings timings = {});
    ~ServerPool();

    ServerPool(const ServerPool&) = delete;
    ServerPool& operator=(const ServerPool&) = delete;

    // nullopt means "start the CLI directly": the pool is disabled, or it
    // could not provide a server and cold-start fallback is allowed.
    core::errors::Result<std::optional<Lease>> acquire();

    void update_config(PoolRuntime runtime, const core::config::PoolOptions& options = {});

    void dispose();

    bool disposed() const;
    const std::string& name() const { return name_; }
    core::config::PoolConfig config() const;
    PoolSnapshot snapshot() const;

private:
    friend class Lease;

    struct PooledServer {
        int id = 0;
        std::string attach_url;
        std::unique_ptr<process::ProcessHandle> process;
        WorkerState state = WorkerState::Starting;
        bool alive = true;
        bool ready = false;
    };

    struct SpawnedServer {
        int id = 0;
        std::string attach_url;
    };

    struct WorkerExited {
        int id = 0;
        process::ProcessExit exit;
    };
    struct ReplenishRequested {};
    using PoolEvent = std::variant<ReplenishRequested, WorkerExited>;

    using Doomed = std::vector<std::unique_ptr<process::ProcessHandle>>;

    void release_server(int server_id);
    void retire_server(int server_id);

    void ensure_min_idle();
    void replenish_locked();
    bool should_warm_another_locked(std::chrono::steady_clock::time_point now) const;
    void run_warmup();
    void run_events();
    void handle_server_exit(int server_id, const process::ProcessExit& exit, Doomed& doomed);

    core::errors::Result<SpawnedServer> spawn_server(WorkerState target);
    core::errors::Status wait_for_server_ready(int server_id, const std::string& attach_url,
                                               std::chrono::milliseconds timeout);

    void prune_idle_locked();
    void kill_server_locked(int server_id, Doomed& doomed);
    void remove_from_idle_locked(int server_id);
    core::errors::TaskError pool_error(core::errors::ErrorCategory category,
                                       const std::string& message,
                                       const std::string& code) const;

    const std::string name_;
    PoolServices services_;
    const PoolTimings timings_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    PoolRuntime runtime_;
    core::config::PoolConfig config_;
    std::unordered_map<int, PooledServer> servers_;
    std::unordered_map<int, std::string> startup_errors_;
    // Launched but not yet registered; exits seen in that window wait here.
    std::unordered_set<int> launching_;
    std::unordered_map<int, process::ProcessExit> early_exits_;
    std::deque<int> idle_queue_;
    std::size_t warming_count_ = 0;
    std::size_t pending_spawns_ = 0;
    int next_server_id_ = 1;
    bool disposed_ = false;
    std::uint32_t warmup_failure_streak_ = 0;
    bool warmup_alarm_raised_ = false;
    std::optional<std::chrono::steady_clock::time_point> warmup_backoff_until_;
    std::vector<std::future<void>> warmups_;

    std::shared_ptr<core::sync::Channel<PoolEvent>> events_;
    std::thread event_loop_;
};

}  // namespace taskwarden::pool

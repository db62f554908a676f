#include "pool/server_pool.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace taskwarden::pool {

using core::errors::ErrorCategory;
using core::errors::TaskError;
using std::chrono::steady_clock;

namespace {

constexpr std::uint32_t kMaxWarmupFailureStreak = 8;
constexpr const char* kServerHost = "127.0.0.1";

std::chrono::milliseconds warmup_backoff(const std::uint32_t streak,
                                         const PoolTimings& timings) {
    // min(2^(streak-1) * base, cap); streak is capped at 8 so no overflow.
    const auto factor = static_cast<std::int64_t>(1) << (streak - 1);
    return std::min(timings.backoff_base * factor, timings.backoff_cap);
}

}  // namespace

std::string to_string(const WorkerState state) {
    switch (state) {
        case WorkerState::Starting:
            return "starting";
        case WorkerState::Idle:
            return "idle";
        case WorkerState::InUse:
            return "in_use";
        default:
            return "unknown";
    }
}

std::string to_string(const LeaseSource source) {
    switch (source) {
        case LeaseSource::Warm:
            return "warm";
        case LeaseSource::Cold:
            return "cold";
        default:
            return "unknown";
    }
}

PoolServices default_pool_services() {
    PoolServices services;
    services.launcher = std::make_shared<process::PosixProcessLauncher>();
    services.ports = std::make_shared<net::LoopbackPortAllocator>(kServerHost);
    services.probe = std::make_shared<net::CurlHealthProbe>();
    return services;
}

Lease::Lease(ServerPool* pool, const int worker_id, std::string attach_url,
             const LeaseSource source)
    : pool_(pool),
      worker_id_(worker_id),
      attach_url_(std::move(attach_url)),
      source_(source),
      closed_(std::make_shared<std::atomic_bool>(false)) {}

void Lease::release() {
    if (closed_->exchange(true)) {
        return;
    }
    pool_->release_server(worker_id_);
}

void Lease::retire() {
    if (closed_->exchange(true)) {
        return;
    }
    pool_->retire_server(worker_id_);
}

ServerPool::ServerPool(std::string name, PoolRuntime runtime,
                       const core::config::PoolOptions& options,
                       PoolServices services, const PoolTimings timings)
    : name_(std::move(name)),
      services_(std::move(services)),
      timings_(timings),
      runtime_(std::move(runtime)),
      config_(core::config::resolve_pool_options(options)),
      events_(std::make_shared<core::sync::Channel<PoolEvent>>()) {
    event_loop_ = std::thread([this]() { run_events(); });
    ensure_min_idle();
}

ServerPool::~ServerPool() {
    dispose();
}

TaskError ServerPool::pool_error(const ErrorCategory category,
                                 const std::string& message,
                                 const std::string& code) const {
    return TaskError{category, name_ + " " + message, code};
}

void ServerPool::update_config(PoolRuntime runtime,
                               const core::config::PoolOptions& options) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        runtime_ = std::move(runtime);
        config_ = core::config::resolve_pool_options(options);
        LOG_INFO(name_ + ": config updated (min_idle=" + std::to_string(config_.min_idle) +
                 ", max_total=" + std::to_string(config_.max_total) + ")");
    }
    ensure_min_idle();
}

core::errors::Result<std::optional<Lease>> ServerPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return pool_error(ErrorCategory::Input, "is disposed", "pool_disposed");
        }
        if (!config_.enabled) {
            return std::optional<Lease>{};
        }

        prune_idle_locked();
        while (!idle_queue_.empty()) {
            const int id = idle_queue_.front();
            idle_queue_.pop_front();
            auto it = servers_.find(id);
            // Re-check right before committing; an exit may have raced the prune.
            if (it == servers_.end() || !it->second.alive ||
                it->second.state != WorkerState::Idle) {
                continue;
            }
            it->second.state = WorkerState::InUse;
            Lease lease(this, id, it->second.attach_url, LeaseSource::Warm);
            LOG_DEBUG(name_ + ": warm lease on server " + std::to_string(id));
            ensure_min_idle();
            return std::optional<Lease>(std::move(lease));
        }
    }

    auto spawned = spawn_server(WorkerState::InUse);
    if (core::errors::is_error(spawned)) {
        const auto err = core::errors::get_error(spawned);
        bool fallback = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fallback = config_.cold_start_fallback;
        }
        ensure_min_idle();
        if (!fallback) {
            return err;
        }
        if (err.code != "pool_at_capacity") {
            LOG_WARN(name_ + ": falling back to direct CLI startup: " + err.message);
        }
        return std::optional<Lease>{};
    }

    const auto& server = core::errors::get_value(spawned);
    LOG_DEBUG(name_ + ": cold lease on server " + std::to_string(server.id));
    ensure_min_idle();
    return std::optional<Lease>(Lease(this, server.id, server.attach_url, LeaseSource::Cold));
}

void ServerPool::dispose() {
    Doomed doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
        warmup_backoff_until_.reset();
        for (auto& [id, server] : servers_) {
            server.alive = false;
            if (server.process) {
                server.process->kill();
                doomed.push_back(std::move(server.process));
            }
        }
        servers_.clear();
        startup_errors_.clear();
        early_exits_.clear();
        idle_queue_.clear();
    }
    cv_.notify_all();
    events_->close();
    if (event_loop_.joinable() && event_loop_.get_id() != std::this_thread::get_id()) {
        event_loop_.join();
    }

    std::vector<std::future<void>> warmups;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        warmups.swap(warmups_);
    }
    for (auto& warmup : warmups) {
        warmup.wait();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        warming_count_ = 0;
    }
    LOG_INFO(name_ + ": disposed, killed " + std::to_string(doomed.size()) + " server(s)");
}

bool ServerPool::disposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

core::config::PoolConfig ServerPool::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

PoolSnapshot ServerPool::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolSnapshot snap;
    snap.total = servers_.size();
    snap.idle = idle_queue_.size();
    snap.warming = warming_count_;
    snap.warmup_failure_streak = warmup_failure_streak_;
    for (const auto& [id, server] : servers_) {
        if (server.state == WorkerState::InUse) {
            ++snap.in_use;
        } else if (server.state == WorkerState::Starting) {
            ++snap.starting;
        }
    }
    return snap;
}

void ServerPool::release_server(const int server_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(server_id);
        if (it == servers_.end() || !it->second.alive) {
            return;
        }
        if (it->second.state == WorkerState::Idle) {
            return;
        }
        it->second.state = WorkerState::Idle;
        idle_queue_.push_back(server_id);
        LOG_DEBUG(name_ + ": server " + std::to_string(server_id) + " returned to idle");
    }
    ensure_min_idle();
}

void ServerPool::retire_server(const int server_id) {
    Doomed doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (servers_.find(server_id) == servers_.end()) {
            return;
        }
        LOG_INFO(name_ + ": retiring server " + std::to_string(server_id));
        kill_server_locked(server_id, doomed);
    }
    cv_.notify_all();
    ensure_min_idle();
}

void ServerPool::prune_idle_locked() {
    idle_queue_.erase(
        std::remove_if(idle_queue_.begin(), idle_queue_.end(),
                       [this](const int id) {
                           auto it = servers_.find(id);
                           return it == servers_.end() || !it->second.alive ||
                                  it->second.state != WorkerState::Idle;
                       }),
        idle_queue_.end());
}

void ServerPool::remove_from_idle_locked(const int server_id) {
    idle_queue_.erase(std::remove(idle_queue_.begin(), idle_queue_.end(), server_id),
                      idle_queue_.end());
}

void ServerPool::kill_server_locked(const int server_id, Doomed& doomed) {
    auto it = servers_.find(server_id);
    if (it == servers_.end()) {
        return;
    }
    it->second.alive = false;
    if (it->second.process) {
        it->second.process->kill();
        doomed.push_back(std::move(it->second.process));
    }
    servers_.erase(it);
    startup_errors_.erase(server_id);
    remove_from_idle_locked(server_id);
}

void ServerPool::ensure_min_idle() {
    events_->push(ReplenishRequested{});
}

bool ServerPool::should_warm_another_locked(const steady_clock::time_point now) const {
    if (warmup_backoff_until_.has_value() && warmup_backoff_until_.value() > now) {
        return false;
    }

    const std::size_t idle_count = idle_queue_.size() + warming_count_;
    if (idle_count >= config_.min_idle) {
        return false;
    }

    const std::size_t total_count = servers_.size() + pending_spawns_ + warming_count_;
    return total_count < config_.max_total;
}

void ServerPool::replenish_locked() {
    if (disposed_ || !config_.enabled) {
        return;
    }
    const auto now = steady_clock::now();
    if (warmup_backoff_until_.has_value() && warmup_backoff_until_.value() <= now) {
        warmup_backoff_until_.reset();
    }

    warmups_.erase(std::remove_if(warmups_.begin(), warmups_.end(),
                                  [](const std::future<void>& f) {
                                      return f.wait_for(std::chrono::seconds(0)) ==
                                             std::future_status::ready;
                                  }),
                   warmups_.end());

    while (should_warm_another_locked(now)) {
        ++warming_count_;
        warmups_.push_back(std::async(std::launch::async, [this]() { run_warmup(); }));
    }
}

void ServerPool::run_warmup() {
    auto spawned = spawn_server(WorkerState::Idle);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        warming_count_ = warming_count_ > 0 ? warming_count_ - 1 : 0;
        if (disposed_) {
            return;
        }

        if (!core::errors::is_error(spawned)) {
            warmup_failure_streak_ = 0;
            warmup_backoff_until_.reset();
            warmup_alarm_raised_ = false;
            LOG_INFO(name_ + ": warm server " +
                     std::to_string(core::errors::get_value(spawned).id) + " ready");
        } else {
            const auto& err = core::errors::get_error(spawned);
            if (err.category == ErrorCategory::Capacity) {
                // Lost a race with a cold start; not a health problem.
                LOG_DEBUG(name_ + ": warmup skipped: " + err.message);
            } else {
                warmup_failure_streak_ =
                    std::min(warmup_failure_streak_ + 1, kMaxWarmupFailureStreak);
                const auto backoff = warmup_backoff(warmup_failure_streak_, timings_);
                warmup_backoff_until_ = steady_clock::now() + backoff;
                LOG_WARN(name_ + ": warm server startup failed. Retrying in " +
                         std::to_string(backoff.count()) + "ms: " + err.message);
                if (warmup_failure_streak_ == kMaxWarmupFailureStreak &&
                    !warmup_alarm_raised_) {
                    warmup_alarm_raised_ = true;
                    LOG_ERROR(name_ + ": warm servers keep failing to start (" +
                              std::to_string(warmup_failure_streak_) +
                              " consecutive failures); retrying at the backoff ceiling");
                }
            }
        }
    }
    ensure_min_idle();
}

void ServerPool::run_events() {
    for (;;) {
        auto deadline = steady_clock::now() + std::chrono::hours(1);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (disposed_) {
                return;
            }
            if (warmup_backoff_until_.has_value()) {
                deadline = warmup_backoff_until_.value();
            }
        }

        auto event = events_->pop_until(deadline);
        if (events_->closed()) {
            return;
        }

        Doomed doomed;
        if (event.has_value()) {
            if (const auto* exited = std::get_if<WorkerExited>(&event.value())) {
                handle_server_exit(exited->id, exited->exit, doomed);
            }
        }

        // Every wakeup (request, exit, backoff expiry) re-evaluates capacity.
        std::lock_guard<std::mutex> lock(mutex_);
        replenish_locked();
    }
}

void ServerPool::handle_server_exit(const int server_id,
                                    const process::ProcessExit& exit,
                                    Doomed& doomed) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(server_id);
        if (it == servers_.end()) {
            if (launching_.count(server_id) != 0) {
                early_exits_[server_id] = exit;
            }
            return;
        }

        auto& server = it->second;
        if (exit.error.has_value()) {
            LOG_WARN(name_ + ": server " + std::to_string(server_id) +
                     " failed: " + exit.error.value());
            if (!server.ready) {
                startup_errors_[server_id] = exit.error.value();
            }
        } else {
            LOG_INFO(name_ + ": server " + std::to_string(server_id) + " exited with code " +
                     std::to_string(exit.exit_code) + " while " + to_string(server.state));
        }

        server.alive = false;
        if (server.process) {
            doomed.push_back(std::move(server.process));
        }
        servers_.erase(it);
        remove_from_idle_locked(server_id);
    }
    cv_.notify_all();
}

core::errors::Result<ServerPool::SpawnedServer> ServerPool::spawn_server(
    const WorkerState target) {
    PoolRuntime runtime;
    std::chrono::milliseconds startup_timeout{0};
    int server_id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return pool_error(ErrorCategory::Input, "is disposed", "pool_disposed");
        }
        if (servers_.size() + pending_spawns_ >= config_.max_total) {
            return pool_error(ErrorCategory::Capacity,
                              "at capacity (" + std::to_string(config_.max_total) + ")",
                              "pool_at_capacity");
        }
        ++pending_spawns_;
        server_id = next_server_id_++;
        launching_.insert(server_id);
        runtime = runtime_;
        startup_timeout = std::chrono::milliseconds(config_.startup_timeout_ms);
    }

    auto abandon = [this, server_id](TaskError err) -> core::errors::Result<SpawnedServer> {
        std::lock_guard<std::mutex> lock(mutex_);
        --pending_spawns_;
        launching_.erase(server_id);
        return err;
    };

    if (runtime.on_before_start) {
        auto prepared = runtime.on_before_start();
        if (core::errors::is_error(prepared)) {
            auto err = core::errors::get_error(prepared);
            err.message = name_ + " before-start hook failed: " + err.message;
            err.code = "before_start_failed";
            return abandon(err);
        }
    }

    const core::config::CliCommand cli =
        runtime.get_cli_command ? runtime.get_cli_command() : core::config::CliCommand{};
    process::Environment env_overrides;
    if (runtime.build_environment) {
        auto built = runtime.build_environment();
        if (core::errors::is_error(built)) {
            auto err = core::errors::get_error(built);
            err.message = name_ + " failed to build environment: " + err.message;
            err.code = "environment_failed";
            return abandon(err);
        }
        env_overrides = core::errors::get_value(built);
    }

    auto port = services_.ports->allocate();
    if (core::errors::is_error(port)) {
        return abandon(core::errors::get_error(port));
    }
    const std::string port_text = std::to_string(core::errors::get_value(port));

    process::LaunchSpec spec;
    spec.command = cli.command;
    spec.args = cli.args;
    spec.args.insert(spec.args.end(),
                     {"serve", "--hostname", kServerHost, "--port", port_text});
    spec.cwd = runtime.cwd;
    spec.env = process::merged_environment(env_overrides);
    const std::string attach_url = std::string("http://") + kServerHost + ":" + port_text;

    auto launched = services_.launcher->launch(
        spec, [events = events_, server_id](const process::ProcessExit& exit) {
            events->push(WorkerExited{server_id, exit});
        });
    if (core::errors::is_error(launched)) {
        auto err = core::errors::get_error(launched);
        err.message = name_ + " server failed to spawn: " + err.message;
        return abandon(err);
    }

    {
        Doomed doomed;
        std::lock_guard<std::mutex> lock(mutex_);
        --pending_spawns_;
        launching_.erase(server_id);
        auto handle = std::move(core::errors::get_value(launched));
        if (disposed_) {
            handle->kill();
            doomed.push_back(std::move(handle));
            return pool_error(ErrorCategory::Startup, "disposed while starting a server",
                              "pool_disposed_during_startup");
        }

        auto early = early_exits_.find(server_id);
        if (early != early_exits_.end()) {
            const process::ProcessExit exit = early->second;
            early_exits_.erase(early);
            doomed.push_back(std::move(handle));
            if (exit.error.has_value()) {
                return pool_error(ErrorCategory::Startup,
                                  "server failed during startup: " + exit.error.value(),
                                  "spawn_failed");
            }
            return pool_error(ErrorCategory::Startup,
                              "server exited during startup with code " +
                                  std::to_string(exit.exit_code),
                              "server_exited_during_startup");
        }

        // Registered before readiness so an early exit is observable.
        PooledServer server;
        server.id = server_id;
        server.attach_url = attach_url;
        server.process = std::move(handle);
        server.state = target == WorkerState::Idle ? WorkerState::Starting : target;
        servers_.emplace(server_id, std::move(server));
        LOG_INFO(name_ + ": spawned server " + std::to_string(server_id) + " at " +
                 attach_url);
    }

    auto ready = wait_for_server_ready(server_id, attach_url, startup_timeout);
    Doomed doomed;
    std::lock_guard<std::mutex> lock(mutex_);
    if (core::errors::is_error(ready)) {
        kill_server_locked(server_id, doomed);
        return core::errors::get_error(ready);
    }

    auto it = servers_.find(server_id);
    if (it == servers_.end() || !it->second.alive) {
        return pool_error(ErrorCategory::Startup, "server exited during startup",
                          "server_exited_during_startup");
    }
    it->second.ready = true;
    if (target == WorkerState::Idle) {
        it->second.state = WorkerState::Idle;
        idle_queue_.push_back(server_id);
    }
    return SpawnedServer{server_id, attach_url};
}

core::errors::Status ServerPool::wait_for_server_ready(
    const int server_id, const std::string& attach_url,
    const std::chrono::milliseconds timeout) {
    const auto timeout_at = steady_clock::now() + timeout;
    while (steady_clock::now() < timeout_at) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (disposed_) {
                return pool_error(ErrorCategory::Startup,
                                  "disposed while waiting for server readiness",
                                  "pool_disposed_during_startup");
            }
            auto startup_error = startup_errors_.find(server_id);
            if (startup_error != startup_errors_.end()) {
                const std::string message = startup_error->second;
                startup_errors_.erase(startup_error);
                return pool_error(ErrorCategory::Startup,
                                  "server failed during startup: " + message,
                                  "spawn_failed");
            }
            auto it = servers_.find(server_id);
            if (it == servers_.end() || !it->second.alive) {
                return pool_error(ErrorCategory::Startup, "server exited during startup",
                                  "server_exited_during_startup");
            }
        }

        if (services_.probe->ping(attach_url, timings_.ping_timeout)) {
            return core::errors::ok();
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timings_.readiness_poll_interval, [this, server_id]() {
            return disposed_ || servers_.find(server_id) == servers_.end();
        });
    }

    return pool_error(ErrorCategory::Startup, "server startup timed out",
                      "server_startup_timeout");
}

}  // namespace taskwarden::pool

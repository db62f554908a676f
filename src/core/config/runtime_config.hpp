#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/task_errors.hpp"
#include "core/logging/logger.hpp"

namespace taskwarden::core::config {

// Caller-supplied pool settings; unset fields take the defaults below.
struct PoolOptions {
    std::optional<std::int64_t> min_idle;
    std::optional<std::int64_t> max_total;
    std::optional<bool> cold_start_fallback;
    std::optional<std::int64_t> startup_timeout_ms;
    std::optional<bool> enabled;
};

struct PoolConfig {
    std::uint32_t min_idle = 1;
    std::uint32_t max_total = 2;
    bool cold_start_fallback = true;
    std::uint32_t startup_timeout_ms = 60000;
    bool enabled = true;
};

// Non-positive numbers fall back to defaults; max_total is clamped to
// at least min_idle.
PoolConfig resolve_pool_options(const PoolOptions& options = {});

struct CliCommand {
    std::string command = "opencode";
    std::vector<std::string> args;
};

struct RuntimeConfig {
    CliCommand cli;
    std::filesystem::path cwd = std::filesystem::current_path();
    std::map<std::string, std::string> env;
    PoolOptions pool;
    std::uint32_t max_continuation_attempts = 10;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

errors::Result<RuntimeConfig> parse_runtime_config(const std::string& json_text);

errors::Result<RuntimeConfig> load_runtime_config(const std::filesystem::path& path);

}  // namespace taskwarden::core::config

#include <filesystem>
#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/runtime_config.hpp"
#include "core/config/task_id.hpp"
#include "core/errors/task_errors.hpp"
#include "core/logging/logger.hpp"
#include "pool/server_pool.hpp"
#include "process/child_spawn.hpp"
#include "session/task_session.hpp"
#include "session/turn_runner.hpp"

int main(int argc, char* argv[]) {
    namespace errors = taskwarden::core::errors;
    using taskwarden::core::logging::Logger;
    using taskwarden::core::logging::LogLevel;

    // 1. Generate a Task ID and register it with the Global Logger
    const std::string task_id = taskwarden::core::config::generate_task_id();
    Logger::get().set_task_id(task_id);

    // 2. Parse CLI input and return normalized input errors
    LOG_INFO("Taskwarden: Bootstrapping...");
    auto parsed = taskwarden::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = errors::get_value(parsed);

    // 3. Resolve runtime configuration; CLI flags win over the file
    taskwarden::core::config::RuntimeConfig config;
    if (req.config_file.has_value()) {
        auto loaded = taskwarden::core::config::load_runtime_config(req.config_file.value());
        if (errors::is_error(loaded)) {
            const auto& err = errors::get_error(loaded);
            LOG_ERROR("Config error [" + err.code + "]: " + err.message);
            if (!err.hint.empty()) {
                LOG_INFO("Hint: " + err.hint);
            }
            return 2;
        }
        config = errors::get_value(loaded);
    }
    if (req.working_directory.has_value()) {
        config.cwd = req.working_directory.value();
    }
    if (req.max_continuations.has_value()) {
        config.max_continuation_attempts = req.max_continuations.value();
    }
    Logger::get().set_min_level(req.verbose ? LogLevel::DEBUG : config.log_level);

    // 4. Wire the warm server pool
    taskwarden::pool::PoolRuntime runtime;
    runtime.get_cli_command = [config]() { return config.cli; };
    runtime.cwd = config.cwd;
    runtime.build_environment =
        [config]() -> errors::Result<taskwarden::process::Environment> { return config.env; };

    taskwarden::pool::ServerPool pool("LocalServerPool", runtime, config.pool);

    // 5. Run the task until the agent is done
    taskwarden::session::CliTurnRunner runner(
        config.cli, config.cwd, taskwarden::process::merged_environment(config.env));
    taskwarden::session::TaskSession session(&pool, runner, config.max_continuation_attempts);

    auto outcome_result = session.run(req.task);
    pool.dispose();
    if (errors::is_error(outcome_result)) {
        const auto& err = errors::get_error(outcome_result);
        LOG_ERROR("Task failed to run [" + err.code + "] (" +
                  errors::to_string(err.category) + "): " + err.message);
        return 3;
    }

    const auto& outcome = errors::get_value(outcome_result);
    LOG_INFO("Final task state: " + taskwarden::completion::to_string(outcome.final_state) +
             " (" + std::to_string(outcome.continuation_attempts) + " continuation(s))");
    if (!outcome.session_id.empty()) {
        LOG_INFO("Agent session: " + outcome.session_id);
    }
    if (!outcome.summary.empty()) {
        std::cout << outcome.summary << std::endl;
    }

    switch (outcome.status) {
        case taskwarden::session::TaskStatus::Completed:
            return 0;
        case taskwarden::session::TaskStatus::Blocked:
            LOG_WARN("Task blocked: " + outcome.error.value_or("no blocker given"));
            return 4;
        case taskwarden::session::TaskStatus::Incomplete:
            LOG_WARN("Task incomplete: continuation attempts exhausted");
            return 5;
        case taskwarden::session::TaskStatus::Failed:
        default:
            LOG_ERROR("Task failed: " + outcome.error.value_or("unknown error"));
            return 1;
    }
}

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "core/config/runtime_config.hpp"
#include "core/errors/task_errors.hpp"
#include "process/child_spawn.hpp"

namespace taskwarden::session {

struct TurnRequest {
    std::string prompt;
    std::optional<std::string> attach_url;  // unset runs the CLI standalone
    std::optional<std::string> session_id;  // resume an earlier agent session
};

struct TurnResult {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stderr_text;
};

using LineSink = std::function<void(const std::string& line)>;

// Runs one agent turn and streams its stdout, line by line, to the sink.
class TurnRunner {
public:
    virtual ~TurnRunner() = default;
    virtual core::errors::Result<TurnResult> run_turn(const TurnRequest& request,
                                                      const LineSink& on_line) = 0;
};

// Launches "<command> <args> run --format json [--attach URL]
// [--session ID] <prompt>".
class CliTurnRunner : public TurnRunner {
public:
    CliTurnRunner(core::config::CliCommand cli, std::filesystem::path cwd,
                  process::Environment env, std::uint32_t timeout_ms = 0,
                  std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

    core::errors::Result<TurnResult> run_turn(const TurnRequest& request,
                                              const LineSink& on_line) override;

    static std::vector<std::string> build_arguments(const core::config::CliCommand& cli,
                                                    const TurnRequest& request);

private:
    core::config::CliCommand cli_;
    std::filesystem::path cwd_;
    process::Environment env_;
    std::uint32_t timeout_ms_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
};

}  // namespace taskwarden::session

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "completion/completion_enforcer.hpp"
#include "core/errors/task_errors.hpp"
#include "pool/server_pool.hpp"
#include "protocol/event_contract.hpp"
#include "session/turn_runner.hpp"

namespace taskwarden::session {

enum class TaskStatus {
    Completed,   // success declared, or a conversational answer
    Blocked,     // agent declared it cannot proceed
    Incomplete,  // continuation budget exhausted
    Failed       // agent process or stream reported an error
};

std::string to_string(TaskStatus status);

struct TaskOutcome {
    TaskStatus status = TaskStatus::Failed;
    int exit_code = -1;
    completion::CompletionFlowState final_state = completion::CompletionFlowState::Idle;
    std::uint32_t continuation_attempts = 0;
    std::uint32_t turns = 0;
    std::string summary;
    std::string session_id;
    std::optional<std::string> error;
};

// Drives one task: leases a warm server when the pool has one, runs turns
// until the completion enforcer stops asking for continuations.
class TaskSession {
public:
    // pool may be null to always start the CLI directly.
    TaskSession(pool::ServerPool* pool, TurnRunner& runner,
                std::uint32_t max_continuation_attempts = 10);

    core::errors::Result<TaskOutcome> run(const std::string& prompt);

    const completion::CompletionEnforcer& enforcer() const { return enforcer_; }

private:
    void handle_line(const std::string& line);
    void handle_event(const protocol::AgentEvent& event);
    void handle_tool_call(const protocol::ToolCall& call);
    void remember_session(const std::string& session_id);
    TaskOutcome build_outcome(int exit_code) const;

    pool::ServerPool* pool_;
    TurnRunner& runner_;
    completion::CompletionEnforcer enforcer_;

    std::optional<std::string> next_prompt_;
    bool completed_ = false;
    std::string session_id_;
    std::string last_text_;
    std::optional<std::string> stream_error_;
    std::uint32_t turns_ = 0;
};

}  // namespace taskwarden::session

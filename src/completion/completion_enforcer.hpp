#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "completion/completion_state.hpp"
#include "protocol/completion_contract.hpp"
#include "protocol/todo_contract.hpp"

namespace taskwarden::completion {

enum class StepFinishAction {
    Continue,   // turn still running, no intervention
    Pending,    // a continuation prompt is owed
    Complete    // finalize the task
};

std::string to_string(StepFinishAction action);

struct CompletionCallbacks {
    std::function<void(const std::string& prompt)> on_start_continuation;
    std::function<void()> on_complete;
    // Observability only; never consulted for control flow.
    std::function<void(const std::string& type, const std::string& message,
                       const nlohmann::json& data)> on_debug;
};

// Tool-usage flags of one task. Only their combination matters, so the
// conversational-turn decision lives here and nowhere else.
struct ToolUsage {
    bool task_tools_this_turn = false;
    bool helper_tools_this_turn = false;
    bool task_tools_ever = false;       // sticky
    bool requires_completion = false;   // sticky

    void mark(bool counts_for_continuation);
    void start_turn();

    bool any_tools_this_turn() const { return task_tools_this_turn || helper_tools_this_turn; }

    // A plain question/answer turn that needs no completion declaration.
    bool is_conversational() const {
        return !task_tools_this_turn && !task_tools_ever && !requires_completion;
    }
};

// Per-task state machine deciding whether the agent is really done.
// Not thread-safe: one instance per task driver.
class CompletionEnforcer {
public:
    explicit CompletionEnforcer(CompletionCallbacks callbacks,
                                std::uint32_t max_continuation_attempts = 10);

    void update_todos(protocol::TodoList todos);
    void mark_tools_used(bool counts_for_continuation = true);
    void mark_task_requires_completion();

    // True only for the first declaration of the current window.
    bool handle_complete_task_detection(const protocol::CompletionDeclaration& declaration);
    bool handle_complete_task_detection(const nlohmann::json& tool_input);

    StepFinishAction handle_step_finish(const std::string& reason);

    // May invoke on_start_continuation or on_complete.
    void handle_process_exit(int exit_code);

    bool should_complete() const;
    bool is_in_continuation() const { return in_continuation_; }
    void reset();

    CompletionFlowState state() const { return state_.state(); }
    std::uint32_t continuation_attempts() const { return state_.continuation_attempts(); }
    std::uint32_t max_continuation_attempts() const {
        return state_.max_continuation_attempts();
    }
    const std::optional<protocol::CompletionDeclaration>& declaration() const {
        return state_.declaration();
    }
    const protocol::TodoList& todos() const { return todos_; }
    const ToolUsage& tool_usage() const { return usage_; }

private:
    bool has_unresolved_todos() const;
    std::string unresolved_todos_summary() const;
    void dispatch_continuation(const std::string& prompt);
    void finish();
    void debug(const std::string& type, const std::string& message,
               const nlohmann::json& data = nlohmann::json::object()) const;

    CompletionCallbacks callbacks_;
    CompletionState state_;
    protocol::TodoList todos_;
    ToolUsage usage_;
    bool in_continuation_ = false;
};

}  // namespace taskwarden::completion

#include "session/task_session.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/completion_contract.hpp"
#include "protocol/todo_contract.hpp"
#include "tools/tool_classification.hpp"

namespace taskwarden::session {

using completion::CompletionFlowState;
using core::errors::get_error;
using core::errors::get_value;
using core::errors::is_error;

namespace {

// start_task steps become the initial todo list; the first is in progress.
protocol::TodoList todos_from_steps(const nlohmann::json& steps) {
    protocol::TodoList todos;
    if (!steps.is_array()) {
        return todos;
    }
    for (const auto& step : steps) {
        if (!step.is_string() || step.get<std::string>().empty()) {
            continue;
        }
        protocol::TodoItem item;
        item.id = std::to_string(todos.size() + 1);
        item.content = step.get<std::string>();
        item.status = todos.empty() ? protocol::TodoStatus::InProgress
                                    : protocol::TodoStatus::Pending;
        todos.push_back(std::move(item));
    }
    return todos;
}

// Only a real boolean true turns planning on; anything else is ignored.
bool wants_planning(const nlohmann::json& input) {
    if (!input.is_object()) {
        return false;
    }
    auto it = input.find("needs_planning");
    return it != input.end() && it->is_boolean() && it->get<bool>();
}

}  // namespace

std::string to_string(const TaskStatus status) {
    switch (status) {
        case TaskStatus::Completed:
            return "completed";
        case TaskStatus::Blocked:
            return "blocked";
        case TaskStatus::Incomplete:
            return "incomplete";
        case TaskStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

TaskSession::TaskSession(pool::ServerPool* pool, TurnRunner& runner,
                         const std::uint32_t max_continuation_attempts)
    : pool_(pool),
      runner_(runner),
      enforcer_(
          completion::CompletionCallbacks{
              [this](const std::string& prompt) { next_prompt_ = prompt; },
              [this]() { completed_ = true; },
              nullptr},
          max_continuation_attempts) {}

core::errors::Result<TaskOutcome> TaskSession::run(const std::string& prompt) {
    if (prompt.empty()) {
        return core::errors::TaskError{core::errors::ErrorCategory::Input,
                                       "Task prompt cannot be empty.", "empty_prompt"};
    }

    std::optional<pool::Lease> lease;
    if (pool_ != nullptr) {
        auto acquired = pool_->acquire();
        if (is_error(acquired)) {
            return get_error(acquired);
        }
        lease = std::move(get_value(acquired));
    }
    if (lease.has_value()) {
        LOG_INFO("Running task on " + pool::to_string(lease->source()) + " server " +
                 lease->attach_url());
    } else {
        LOG_INFO("Running task with a directly started CLI");
    }

    enforcer_.reset();
    next_prompt_ = prompt;
    completed_ = false;
    session_id_.clear();
    last_text_.clear();
    turns_ = 0;

    int exit_code = 0;
    while (next_prompt_.has_value()) {
        TurnRequest request;
        request.prompt = std::move(next_prompt_.value());
        next_prompt_.reset();
        if (lease.has_value()) {
            request.attach_url = lease->attach_url();
        }
        if (!session_id_.empty()) {
            request.session_id = session_id_;
        }
        stream_error_.reset();
        ++turns_;

        auto turn = runner_.run_turn(
            request, [this](const std::string& line) { handle_line(line); });
        if (is_error(turn)) {
            if (lease.has_value()) {
                lease->retire();
            }
            return get_error(turn);
        }

        const TurnResult& result = get_value(turn);
        exit_code = result.exit_code;
        if (exit_code == 0 && stream_error_.has_value()) {
            exit_code = 1;
        }
        if (exit_code != 0 && !stream_error_.has_value()) {
            if (result.timed_out) {
                stream_error_ = "Agent turn timed out";
            } else if (result.cancelled) {
                stream_error_ = "Agent turn cancelled";
            } else {
                stream_error_ = "Agent exited with code " + std::to_string(exit_code) +
                                (result.stderr_text.empty() ? "" : ": " + result.stderr_text);
            }
        }

        enforcer_.handle_process_exit(exit_code);
        if (exit_code != 0) {
            break;
        }
    }

    if (lease.has_value()) {
        if (exit_code == 0) {
            lease->release();
        } else {
            lease->retire();
        }
    }

    if (!completed_) {
        LOG_WARN("Task loop ended without a completion signal");
    }

    TaskOutcome outcome = build_outcome(exit_code);
    LOG_INFO("Task " + to_string(outcome.status) + " after " + std::to_string(outcome.turns) +
             " turn(s), state " + completion::to_string(outcome.final_state));
    return outcome;
}

void TaskSession::handle_line(const std::string& line) {
    auto parsed = protocol::parse_event_line(line);
    if (is_error(parsed)) {
        LOG_DEBUG("Skipping agent output line [" + get_error(parsed).code +
                  "]: " + get_error(parsed).message);
        return;
    }
    handle_event(get_value(parsed));
}

void TaskSession::remember_session(const std::string& session_id) {
    if (session_id_.empty() && !session_id.empty()) {
        session_id_ = session_id;
    }
}

void TaskSession::handle_event(const protocol::AgentEvent& event) {
    if (const auto* start = std::get_if<protocol::StepStartEvent>(&event)) {
        remember_session(start->session_id);
    } else if (const auto* text = std::get_if<protocol::TextEvent>(&event)) {
        remember_session(text->session_id);
        if (!text->text.empty()) {
            last_text_ = text->text;
        }
    } else if (const auto* tool = std::get_if<protocol::ToolCallEvent>(&event)) {
        remember_session(tool->session_id);
        handle_tool_call(tool->call);
    } else if (const auto* finish = std::get_if<protocol::StepFinishEvent>(&event)) {
        remember_session(finish->session_id);
        if (finish->reason == "error") {
            stream_error_ = "Task failed";
            return;
        }
        const auto action = enforcer_.handle_step_finish(finish->reason);
        LOG_DEBUG("step_finish action: " + completion::to_string(action));
    } else if (const auto* error = std::get_if<protocol::ErrorEvent>(&event)) {
        stream_error_ = error->message.empty() ? "Agent reported an error" : error->message;
    } else if (const auto* unknown = std::get_if<protocol::UnknownEvent>(&event)) {
        LOG_DEBUG("Unknown agent event type: " + unknown->type);
    }
}

void TaskSession::handle_tool_call(const protocol::ToolCall& call) {
    LOG_DEBUG("Tool call: " + call.name);

    if (tools::is_start_task_tool(call.name) && wants_planning(call.input)) {
        enforcer_.mark_task_requires_completion();
        if (call.input.contains("goal") && call.input.contains("steps")) {
            auto todos = todos_from_steps(call.input["steps"]);
            if (!todos.empty()) {
                enforcer_.update_todos(std::move(todos));
            }
        }
    }

    enforcer_.mark_tools_used(!tools::is_non_task_continuation_tool(call.name));

    if (tools::is_complete_task_tool(call.name)) {
        static_cast<void>(enforcer_.handle_complete_task_detection(call.input));
    }

    if (tools::is_todo_write_tool(call.name)) {
        auto todos = protocol::parse_todo_list(call.input);
        if (!todos.empty()) {
            enforcer_.update_todos(std::move(todos));
        }
    }
}

TaskOutcome TaskSession::build_outcome(const int exit_code) const {
    TaskOutcome outcome;
    outcome.exit_code = exit_code;
    outcome.final_state = enforcer_.state();
    outcome.continuation_attempts = enforcer_.continuation_attempts();
    outcome.turns = turns_;
    outcome.session_id = session_id_;

    const auto& declaration = enforcer_.declaration();
    outcome.summary = declaration.has_value() && !declaration->summary.empty()
                          ? declaration->summary
                          : last_text_;

    if (exit_code != 0) {
        outcome.status = TaskStatus::Failed;
        outcome.error = stream_error_;
        return outcome;
    }

    switch (outcome.final_state) {
        case CompletionFlowState::Blocked:
            outcome.status = TaskStatus::Blocked;
            if (declaration.has_value() && declaration->blocker.has_value()) {
                outcome.error = declaration->blocker;
            }
            break;
        case CompletionFlowState::MaxRetriesReached:
            outcome.status = TaskStatus::Incomplete;
            break;
        default:
            outcome.status = TaskStatus::Completed;
            break;
    }
    return outcome;
}

}  // namespace taskwarden::session

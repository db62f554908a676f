#include "completion/completion_enforcer.hpp"

#include <utility>
#include "completion/completion_prompts.hpp"
#include "core/logging/logger.hpp"
#include "protocol/event_contract.hpp"

namespace taskwarden::completion {

using nlohmann::json;
using protocol::CompletionDeclaration;
using protocol::CompletionStatus;

namespace {

json declaration_to_json(const CompletionDeclaration& declaration) {
    json payload;
    payload["status"] = protocol::to_string(declaration.status);
    payload["summary"] = declaration.summary;
    payload["original_request_summary"] = declaration.original_request_summary;
    payload["remaining_work"] =
        declaration.remaining_work.has_value() ? json(declaration.remaining_work.value())
                                               : json();
    payload["blocker"] =
        declaration.blocker.has_value() ? json(declaration.blocker.value()) : json();
    return payload;
}

json todos_to_json(const protocol::TodoList& todos) {
    json items = json::array();
    for (const auto& todo : todos) {
        items.push_back({{"id", todo.id},
                         {"content", todo.content},
                         {"status", protocol::to_string(todo.status)},
                         {"priority", todo.priority}});
    }
    return items;
}

}  // namespace

std::string to_string(const StepFinishAction action) {
    switch (action) {
        case StepFinishAction::Continue:
            return "continue";
        case StepFinishAction::Pending:
            return "pending";
        case StepFinishAction::Complete:
            return "complete";
        default:
            return "unknown";
    }
}

void ToolUsage::mark(const bool counts_for_continuation) {
    if (counts_for_continuation) {
        task_tools_this_turn = true;
        task_tools_ever = true;
    } else {
        helper_tools_this_turn = true;
    }
}

void ToolUsage::start_turn() {
    task_tools_this_turn = false;
    helper_tools_this_turn = false;
}

CompletionEnforcer::CompletionEnforcer(CompletionCallbacks callbacks,
                                       const std::uint32_t max_continuation_attempts)
    : callbacks_(std::move(callbacks)), state_(max_continuation_attempts) {}

void CompletionEnforcer::debug(const std::string& type, const std::string& message,
                               const json& data) const {
    LOG_DEBUG("CompletionEnforcer [" + type + "]: " + message);
    if (callbacks_.on_debug) {
        callbacks_.on_debug(type, message, data);
    }
}

void CompletionEnforcer::update_todos(protocol::TodoList todos) {
    todos_ = std::move(todos);
    if (!todos_.empty()) {
        usage_.requires_completion = true;
    }
    debug("todo_update", "Todo list updated: " + std::to_string(todos_.size()) + " items",
          {{"todos", todos_to_json(todos_)}});
}

void CompletionEnforcer::mark_tools_used(const bool counts_for_continuation) {
    usage_.mark(counts_for_continuation);
}

void CompletionEnforcer::mark_task_requires_completion() {
    usage_.requires_completion = true;
}

bool CompletionEnforcer::has_unresolved_todos() const {
    for (const auto& todo : todos_) {
        if (protocol::is_unresolved(todo)) {
            return true;
        }
    }
    return false;
}

std::string CompletionEnforcer::unresolved_todos_summary() const {
    std::string summary;
    for (const auto& todo : todos_) {
        if (!protocol::is_unresolved(todo)) {
            continue;
        }
        if (!summary.empty()) {
            summary += "\n";
        }
        summary += "- " + todo.content;
    }
    return summary;
}

bool CompletionEnforcer::handle_complete_task_detection(const json& tool_input) {
    return handle_complete_task_detection(protocol::parse_completion_declaration(tool_input));
}

bool CompletionEnforcer::handle_complete_task_detection(
    const CompletionDeclaration& declaration) {
    if (!state_.accepts_declaration()) {
        debug("complete_task_duplicate", "Ignoring repeated complete_task call",
              {{"args", declaration_to_json(declaration)}});
        return false;
    }

    CompletionDeclaration effective = declaration;
    bool downgraded = false;
    if (effective.status == CompletionStatus::Success && has_unresolved_todos()) {
        const std::string unresolved = unresolved_todos_summary();
        debug("incomplete_todos",
              "Agent claimed success but has incomplete todos - downgrading to partial",
              {{"incompleteTodos", unresolved}});
        effective.status = CompletionStatus::Partial;
        effective.remaining_work = unresolved;
        downgraded = true;
    }

    state_.record_declaration(effective, downgraded);
    if (state_.state() == CompletionFlowState::Done ||
        state_.state() == CompletionFlowState::Blocked) {
        in_continuation_ = false;
    }

    debug("complete_task",
          "complete_task detected with status: " + protocol::to_string(effective.status),
          {{"args", declaration_to_json(effective)}, {"state", to_string(state_.state())}});
    return true;
}

StepFinishAction CompletionEnforcer::handle_step_finish(const std::string& reason) {
    if (!protocol::is_turn_ending_reason(reason)) {
        return StepFinishAction::Continue;
    }

    if (state_.is_pending_partial_continuation()) {
        const auto& declaration = state_.declaration();
        debug("partial_continuation", "Scheduling continuation for partial completion",
              {{"remainingWork", declaration.has_value() && declaration->remaining_work
                                     ? json(declaration->remaining_work.value())
                                     : json()}});
        return StepFinishAction::Pending;
    }

    if (state_.is_terminal()) {
        return StepFinishAction::Complete;
    }

    if (usage_.is_conversational()) {
        debug("skip_continuation",
              "No tools used and no complete_task called — treating as "
              "conversational response");
        return StepFinishAction::Complete;
    }

    if (state_.schedule_continuation()) {
        debug("continuation", "Scheduled continuation prompt (attempt " +
                                  std::to_string(state_.continuation_attempts()) + ")");
        return StepFinishAction::Pending;
    }

    LOG_WARN("CompletionEnforcer: agent stopped without complete_task. State: " +
             to_string(state_.state()) + ", attempts: " +
             std::to_string(state_.continuation_attempts()) + "/" +
             std::to_string(state_.max_continuation_attempts()));
    debug("max_retries", "Continuation attempts exhausted",
          {{"attempts", state_.continuation_attempts()}});
    return StepFinishAction::Complete;
}

void CompletionEnforcer::handle_process_exit(const int exit_code) {
    if (exit_code != 0) {
        debug("process_exit", "Agent process exited with code " + std::to_string(exit_code) +
                                  "; finalizing without continuation");
        finish();
        return;
    }

    if (state_.is_pending_partial_continuation()) {
        const CompletionDeclaration declaration =
            state_.declaration().value_or(CompletionDeclaration{});
        std::optional<std::string> unresolved;
        if (state_.downgraded_by_todos()) {
            unresolved = has_unresolved_todos()
                             ? unresolved_todos_summary()
                             : declaration.remaining_work.value_or("");
        }
        const std::string remaining =
            declaration.remaining_work.value_or("No remaining work specified");
        const std::string prompt = partial_continuation_prompt(
            remaining,
            declaration.original_request_summary.empty()
                ? "Unknown request"
                : declaration.original_request_summary,
            declaration.summary.empty() ? "No summary provided" : declaration.summary,
            unresolved);

        if (!state_.start_partial_continuation()) {
            LOG_WARN("CompletionEnforcer: max partial continuation attempts reached");
            debug("max_retries", "Partial continuation attempts exhausted",
                  {{"attempts", state_.continuation_attempts()}});
            finish();
            return;
        }

        debug("partial_continuation",
              "Starting partial continuation (attempt " +
                  std::to_string(state_.continuation_attempts()) + ")",
              {{"remainingWork", remaining},
               {"summary", declaration.summary},
               {"continuationPrompt", prompt}});
        dispatch_continuation(prompt);
        return;
    }

    if (state_.is_pending_continuation()) {
        const std::string prompt = continuation_prompt();
        state_.start_continuation();
        debug("continuation", "Starting continuation task (attempt " +
                                  std::to_string(state_.continuation_attempts()) + ")",
              {{"continuationPrompt", prompt}});
        dispatch_continuation(prompt);
        return;
    }

    finish();
}

void CompletionEnforcer::dispatch_continuation(const std::string& prompt) {
    usage_.start_turn();
    in_continuation_ = true;
    if (callbacks_.on_start_continuation) {
        callbacks_.on_start_continuation(prompt);
    }
}

void CompletionEnforcer::finish() {
    if (callbacks_.on_complete) {
        callbacks_.on_complete();
    }
}

bool CompletionEnforcer::should_complete() const {
    return state_.is_terminal();
}

void CompletionEnforcer::reset() {
    state_.reset();
    todos_.clear();
    usage_ = ToolUsage{};
    in_continuation_ = false;
}

}  // namespace taskwarden::completion

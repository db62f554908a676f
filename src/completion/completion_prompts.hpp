#pragma once

#include <optional>
#include <string>

namespace taskwarden::completion {

// Reminder sent when the agent used tools but stopped without calling
// complete_task.
std::string continuation_prompt();

// Sent after a partial completion. With incomplete_todos set the prompt is
// the focused "your todo list is still open" variant; otherwise it asks the
// agent for a continuation plan.
std::string partial_continuation_prompt(
    const std::string& remaining_work, const std::string& original_request,
    const std::string& completed_summary,
    const std::optional<std::string>& incomplete_todos = std::nullopt);

}  // namespace taskwarden::completion

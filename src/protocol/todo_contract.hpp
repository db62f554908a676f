#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace taskwarden::protocol {

    enum class TodoStatus {
        Pending,
        InProgress,
        Completed,
        Cancelled
    };

    // One entry of the agent's self-declared todo list. Read-only to us.
    struct TodoItem {
        std::string id;
        std::string content;
        TodoStatus status = TodoStatus::Pending;
        std::string priority = "medium";
    };

    using TodoList = std::vector<TodoItem>;

    // Anything not completed or cancelled still needs work.
    inline bool is_unresolved(const TodoItem& item) {
        return item.status != TodoStatus::Completed &&
               item.status != TodoStatus::Cancelled;
    }

    inline std::string to_string(const TodoStatus status) {
        switch (status) {
            case TodoStatus::Pending:
                return "pending";
            case TodoStatus::InProgress:
                return "in_progress";
            case TodoStatus::Completed:
                return "completed";
            case TodoStatus::Cancelled:
                return "cancelled";
            default:
                return "unknown";
        }
    }

    // Unknown strings read as pending: an unrecognised status is not done.
    inline TodoStatus todo_status_from_string(const std::string& text) {
        if (text == "in_progress") return TodoStatus::InProgress;
        if (text == "completed")   return TodoStatus::Completed;
        if (text == "cancelled")   return TodoStatus::Cancelled;
        return TodoStatus::Pending;
    }

    // Reads a todowrite-style payload ({"todos": [...]}) or a bare array.
    // Entries without content are skipped; missing ids are synthesized.
    TodoList parse_todo_list(const nlohmann::json& input);

} // namespace taskwarden::protocol

#include <string>
#include <nlohmann/json.hpp>
#include "protocol/completion_contract.hpp"
#include "protocol/todo_contract.hpp"

namespace taskwarden::protocol {

using nlohmann::json;

namespace {

std::string string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

TodoList parse_todo_list(const json& input) {
    const json* items = nullptr;
    if (input.is_array()) {
        items = &input;
    } else if (input.is_object()) {
        auto it = input.find("todos");
        if (it != input.end() && it->is_array()) {
            items = &(*it);
        }
    }

    TodoList todos;
    if (items == nullptr) {
        return todos;
    }

    for (const auto& entry : *items) {
        if (!entry.is_object()) {
            continue;
        }
        TodoItem item;
        item.content = string_field(entry, "content");
        if (item.content.empty()) {
            continue;
        }
        item.id = string_field(entry, "id");
        if (item.id.empty()) {
            item.id = "todo-" + std::to_string(todos.size() + 1);
        }
        item.status = todo_status_from_string(string_field(entry, "status"));
        const std::string priority = string_field(entry, "priority");
        if (!priority.empty()) {
            item.priority = priority;
        }
        todos.push_back(std::move(item));
    }
    return todos;
}

CompletionDeclaration parse_completion_declaration(const json& input) {
    CompletionDeclaration declaration;
    if (!input.is_object()) {
        return declaration;
    }
    declaration.status = completion_status_from_string(string_field(input, "status"));
    declaration.summary = string_field(input, "summary");
    declaration.original_request_summary = string_field(input, "original_request_summary");
    declaration.remaining_work = optional_string_field(input, "remaining_work");
    declaration.blocker = optional_string_field(input, "blocker");
    return declaration;
}

}  // namespace taskwarden::protocol

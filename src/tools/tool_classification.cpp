#include "tools/tool_classification.hpp"

#include <array>

namespace taskwarden::tools {

namespace {

constexpr std::array<const char*, 11> kNonTaskContinuationTools = {
    "discard",
    "extract",
    "context_info",
    "prune",
    "distill",
    "todowrite",
    "complete_task",
    "AskUserQuestion",
    "report_checkpoint",
    "report_thought",
    "request_file_permission"};

}  // namespace

bool matches_tool_name(const std::string& tool_name, const std::string& base_name) {
    if (tool_name == base_name) {
        return true;
    }
    const std::string suffix = "_" + base_name;
    return tool_name.size() > suffix.size() &&
           tool_name.compare(tool_name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_complete_task_tool(const std::string& tool_name) {
    return matches_tool_name(tool_name, "complete_task");
}

bool is_todo_write_tool(const std::string& tool_name) {
    return matches_tool_name(tool_name, "todowrite");
}

bool is_start_task_tool(const std::string& tool_name) {
    return matches_tool_name(tool_name, "start_task");
}

bool is_non_task_continuation_tool(const std::string& tool_name) {
    if (matches_tool_name(tool_name, "skill") || is_start_task_tool(tool_name)) {
        return true;
    }
    for (const char* tool : kNonTaskContinuationTools) {
        if (matches_tool_name(tool_name, tool)) {
            return true;
        }
    }
    return false;
}

}  // namespace taskwarden::tools

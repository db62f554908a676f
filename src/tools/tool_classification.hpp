#pragma once

#include <string>

namespace taskwarden::tools {

// MCP servers prefix tool names ("server_complete_task"), so every check
// accepts the bare name or an "_<name>" suffix.
bool matches_tool_name(const std::string& tool_name, const std::string& base_name);

bool is_complete_task_tool(const std::string& tool_name);
bool is_todo_write_tool(const std::string& tool_name);
bool is_start_task_tool(const std::string& tool_name);

// Bookkeeping tools that do not make a turn count as real work.
bool is_non_task_continuation_tool(const std::string& tool_name);

}  // namespace taskwarden::tools

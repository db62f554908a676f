#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace taskwarden::protocol {

    // A tool invocation observed in the agent's output stream
    struct ToolCall {
        std::string name;       // e.g., "todowrite", "complete_task", "bash"
        nlohmann::json input;   // raw arguments; may be null
        std::string status;     // "pending", "running", "completed", "error" or empty
        std::string output;
    };

} // namespace taskwarden::protocol

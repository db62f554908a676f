#pragma once
#include <string>
#include <variant>
#include "core/errors/task_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace taskwarden::protocol {

    // Lifecycle events of one agent CLI turn, one JSON object per line.
    struct StepStartEvent { std::string session_id; };
    struct TextEvent { std::string session_id; std::string text; };
    struct ToolCallEvent { std::string session_id; ToolCall call; };
    struct ToolResultEvent { std::string output; };
    struct StepFinishEvent { std::string session_id; std::string reason; };
    struct ErrorEvent { std::string message; };
    struct UnknownEvent { std::string type; };

    using AgentEvent = std::variant<
        StepStartEvent,
        TextEvent,
        ToolCallEvent,
        ToolResultEvent,
        StepFinishEvent,
        ErrorEvent,
        UnknownEvent
    >;

    // Reasons that end a turn; anything else means the agent keeps going.
    inline bool is_turn_ending_reason(const std::string& reason) {
        return reason == "stop" || reason == "end_turn";
    }

    core::errors::Result<AgentEvent> parse_event_line(const std::string& line);

} // namespace taskwarden::protocol

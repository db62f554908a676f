#include <string>
#include <nlohmann/json.hpp>
#include "protocol/event_contract.hpp"

namespace taskwarden::protocol {

using core::errors::ErrorCategory;
using core::errors::TaskError;
using nlohmann::json;

namespace {

std::string string_at(const json& object, const char* key) {
    if (!object.is_object()) {
        return "";
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

const json& object_at(const json& object, const char* key) {
    static const json kEmpty = json::object();
    if (!object.is_object()) {
        return kEmpty;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_object()) {
        return kEmpty;
    }
    return *it;
}

// The session id lives on the part, with the envelope as fallback.
std::string session_of(const json& root, const json& part) {
    std::string session = string_at(part, "sessionID");
    return session.empty() ? string_at(root, "sessionID") : session;
}

std::string error_message(const json& root) {
    auto it = root.find("error");
    if (it == root.end()) {
        return "unknown error";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_object()) {
        const std::string message = string_at(*it, "message");
        if (!message.empty()) {
            return message;
        }
        const std::string nested = string_at(object_at(*it, "data"), "message");
        if (!nested.empty()) {
            return nested;
        }
    }
    return it->dump();
}

}  // namespace

core::errors::Result<AgentEvent> parse_event_line(const std::string& line) {
    json root;
    try {
        root = json::parse(line);
    } catch (const json::parse_error& e) {
        return TaskError{ErrorCategory::Protocol,
                         std::string("Agent emitted a non-JSON line: ") + e.what(),
                         "invalid_event_json"};
    }
    if (!root.is_object()) {
        return TaskError{ErrorCategory::Protocol, "Agent event must be a JSON object.",
                         "invalid_event_shape"};
    }

    const std::string type = string_at(root, "type");
    const json& part = object_at(root, "part");

    if (type == "step_start") {
        return AgentEvent{StepStartEvent{session_of(root, part)}};
    }
    if (type == "text") {
        return AgentEvent{TextEvent{session_of(root, part), string_at(part, "text")}};
    }
    if (type == "tool_call" || type == "tool_use") {
        ToolCall call;
        call.name = string_at(part, "tool");
        if (call.name.empty()) {
            call.name = "unknown";
        }
        const json& state = object_at(part, "state");
        if (type == "tool_call") {
            auto input = part.find("input");
            call.input = input != part.end() ? *input : json();
        } else {
            auto input = state.find("input");
            call.input = input != state.end() ? *input : json();
            call.status = string_at(state, "status");
            call.output = string_at(state, "output");
        }
        return AgentEvent{ToolCallEvent{session_of(root, part), std::move(call)}};
    }
    if (type == "tool_result") {
        return AgentEvent{ToolResultEvent{string_at(part, "output")}};
    }
    if (type == "step_finish") {
        return AgentEvent{StepFinishEvent{session_of(root, part), string_at(part, "reason")}};
    }
    if (type == "error") {
        return AgentEvent{ErrorEvent{error_message(root)}};
    }
    return AgentEvent{UnknownEvent{type}};
}

}  // namespace taskwarden::protocol

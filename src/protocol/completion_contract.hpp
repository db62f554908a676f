#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace taskwarden::protocol {

    enum class CompletionStatus {
        Success,
        Partial,
        Blocked,
        Unknown     // missing or unrecognised; treated like Blocked
    };

    // Arguments of the agent's "complete_task" tool call.
    struct CompletionDeclaration {
        CompletionStatus status = CompletionStatus::Unknown;
        std::string summary;
        std::string original_request_summary;
        std::optional<std::string> remaining_work;
        std::optional<std::string> blocker;
    };

    inline std::string to_string(const CompletionStatus status) {
        switch (status) {
            case CompletionStatus::Success:
                return "success";
            case CompletionStatus::Partial:
                return "partial";
            case CompletionStatus::Blocked:
                return "blocked";
            default:
                return "unknown";
        }
    }

    inline CompletionStatus completion_status_from_string(const std::string& text) {
        if (text == "success") return CompletionStatus::Success;
        if (text == "partial") return CompletionStatus::Partial;
        if (text == "blocked") return CompletionStatus::Blocked;
        return CompletionStatus::Unknown;
    }

    // Never fails: a null, non-object or malformed payload yields an
    // Unknown declaration.
    CompletionDeclaration parse_completion_declaration(const nlohmann::json& input);

} // namespace taskwarden::protocol

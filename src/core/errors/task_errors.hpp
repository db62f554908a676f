#pragma once
#include <string>
#include <variant>

namespace taskwarden::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., bad CLI flag or unreadable config file
        Capacity,   // E.g., pool already runs maxTotal workers
        Startup,    // E.g., worker exited or timed out before answering
        Runtime,    // E.g., worker crashed after becoming ready
        Protocol,   // E.g., agent emitted a line that is not JSON
        Internal    // E.g., a syscall failed unexpectedly
    };

    // The standardized error payload
    struct TaskError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy: a Result holds either a T or a TaskError.
    template <typename T>
    using Result = std::variant<T, TaskError>;

    // For operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<TaskError>(result);
    }

    template <typename T>
    const TaskError& get_error(const Result<T>& result) {
        return std::get<TaskError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Capacity: return "capacity";
            case ErrorCategory::Startup:  return "startup";
            case ErrorCategory::Runtime:  return "runtime";
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace taskwarden::core::errors

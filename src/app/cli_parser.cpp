#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace taskwarden::app::cli {

    using namespace taskwarden::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> task;
        std::optional<std::string> config;
        std::optional<std::string> cwd;
        std::optional<std::string> max_continuations;
        bool verbose = false;
    };

    Result<TaskRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return TaskError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: taskwarden run --task \"...\""};
        }

        std::string command = argv[1];
        if (command != "run") {
            return TaskError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--task") {
                if (i + 1 < args.size()) raw.task = args[++i];
                else return TaskError{ErrorCategory::Input, "Missing value for --task", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return TaskError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--cwd") {
                if (i + 1 < args.size()) raw.cwd = args[++i];
                else return TaskError{ErrorCategory::Input, "Missing value for --cwd", "missing_value"};
            } else if (args[i] == "--max-continuations") {
                if (i + 1 < args.size()) raw.max_continuations = args[++i];
                else return TaskError{ErrorCategory::Input, "Missing value for --max-continuations", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return TaskError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        TaskRequest req;
        req.verbose = raw.verbose;

        if (!raw.task.has_value() || raw.task->empty()) {
            return TaskError{ErrorCategory::Input, "Must provide a non-empty --task", "missing_required_flag"};
        }
        req.task = raw.task.value();

        if (raw.config) req.config_file = std::filesystem::path(raw.config.value());

        // Exception-free integer parsing
        if (raw.max_continuations) {
            uint32_t attempts = 0;
            const char* begin = raw.max_continuations->data();
            const char* end = raw.max_continuations->data() + raw.max_continuations->size();
            auto [ptr, ec] = std::from_chars(begin, end, attempts);
            if (ec != std::errc() || ptr != end) {
                return TaskError{ErrorCategory::Input, "Invalid number for --max-continuations", "invalid_integer", "Provide a non-negative integer."};
            }
            if (attempts > 100) {
                return TaskError{ErrorCategory::Input, "--max-continuations out of bounds", "bounds_error", "Must be between 0 and 100."};
            }
            req.max_continuations = attempts;
        }

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || !exists) {
                return TaskError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return TaskError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return TaskError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            req.working_directory = std::move(canonical_path);
        }

        return req;
    }

} // namespace taskwarden::app::cli

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/task_errors.hpp"

namespace taskwarden::app::cli {

    // Validated "taskwarden run" invocation
    struct TaskRequest {
        std::string task;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> working_directory;
        std::optional<std::uint32_t> max_continuations;
        bool verbose = false;
    };

    taskwarden::core::errors::Result<TaskRequest> parse_and_validate(int argc, char* argv[]);
}

#pragma once
#include <string>
#include <random>
#include <sstream>

namespace taskwarden::core::config {

    // Generates a simple 8-character hex ID prefixed with "task-"
    inline std::string generate_task_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "task-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace taskwarden::core::config

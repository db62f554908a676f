#include "core/config/runtime_config.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace taskwarden::core::config {

using errors::ErrorCategory;
using errors::TaskError;
using nlohmann::json;

namespace {

constexpr std::uint32_t kDefaultMinIdle = 1;
constexpr std::uint32_t kDefaultMaxTotal = 2;
constexpr std::uint32_t kDefaultStartupTimeoutMs = 60000;
constexpr std::uint32_t kDefaultMaxContinuationAttempts = 10;
constexpr std::int64_t kCeiling = 0x7fffffff;

std::uint32_t to_positive(const std::optional<std::int64_t>& value,
                          const std::uint32_t fallback) {
    if (!value.has_value() || value.value() <= 0) {
        return fallback;
    }
    return static_cast<std::uint32_t>(std::min(value.value(), kCeiling));
}

std::optional<std::int64_t> read_number(const json& section, const char* key) {
    auto it = section.find(key);
    if (it == section.end() || !it->is_number()) {
        return std::nullopt;
    }
    // Fractional values are floored, like any other caller-provided count.
    // Out-of-range values are clamped before the cast.
    const double value = it->get<double>();
    if (value <= 0.0) {
        return 0;
    }
    if (value >= static_cast<double>(kCeiling)) {
        return kCeiling;
    }
    return static_cast<std::int64_t>(value);
}

std::optional<bool> read_bool(const json& section, const char* key) {
    auto it = section.find(key);
    if (it == section.end() || !it->is_boolean()) {
        return std::nullopt;
    }
    return it->get<bool>();
}

TaskError invalid_config(const std::string& message) {
    return TaskError{ErrorCategory::Input, message, "invalid_config",
                     "See README for the expected runtime config layout."};
}

}  // namespace

PoolConfig resolve_pool_options(const PoolOptions& options) {
    PoolConfig config;
    config.min_idle = to_positive(options.min_idle, kDefaultMinIdle);
    config.max_total =
        std::max(to_positive(options.max_total, kDefaultMaxTotal), config.min_idle);
    config.startup_timeout_ms =
        to_positive(options.startup_timeout_ms, kDefaultStartupTimeoutMs);
    config.cold_start_fallback = options.cold_start_fallback.value_or(true);
    config.enabled = options.enabled.value_or(true);
    return config;
}

errors::Result<RuntimeConfig> parse_runtime_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return invalid_config(std::string("Config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        return invalid_config("Config root must be a JSON object.");
    }

    RuntimeConfig config;

    if (auto cli = root.find("cli"); cli != root.end()) {
        if (!cli->is_object()) {
            return invalid_config("\"cli\" must be an object.");
        }
        if (auto command = cli->find("command"); command != cli->end()) {
            if (!command->is_string() || command->get<std::string>().empty()) {
                return invalid_config("\"cli.command\" must be a non-empty string.");
            }
            config.cli.command = command->get<std::string>();
        }
        if (auto args = cli->find("args"); args != cli->end()) {
            if (!args->is_array()) {
                return invalid_config("\"cli.args\" must be an array of strings.");
            }
            for (const auto& arg : *args) {
                if (!arg.is_string()) {
                    return invalid_config("\"cli.args\" must be an array of strings.");
                }
                config.cli.args.push_back(arg.get<std::string>());
            }
        }
        if (auto cwd = cli->find("cwd"); cwd != cli->end() && cwd->is_string()) {
            config.cwd = cwd->get<std::string>();
        }
        if (auto env = cli->find("env"); env != cli->end()) {
            if (!env->is_object()) {
                return invalid_config("\"cli.env\" must be an object of strings.");
            }
            for (auto it = env->begin(); it != env->end(); ++it) {
                if (!it.value().is_string()) {
                    return invalid_config("\"cli.env." + it.key() + "\" must be a string.");
                }
                config.env[it.key()] = it.value().get<std::string>();
            }
        }
    }

    if (auto pool = root.find("pool"); pool != root.end()) {
        if (!pool->is_object()) {
            return invalid_config("\"pool\" must be an object.");
        }
        config.pool.min_idle = read_number(*pool, "min_idle");
        config.pool.max_total = read_number(*pool, "max_total");
        config.pool.startup_timeout_ms = read_number(*pool, "startup_timeout_ms");
        config.pool.cold_start_fallback = read_bool(*pool, "cold_start_fallback");
        config.pool.enabled = read_bool(*pool, "enabled");
    }

    if (auto completion = root.find("completion"); completion != root.end()) {
        if (!completion->is_object()) {
            return invalid_config("\"completion\" must be an object.");
        }
        const auto attempts = read_number(*completion, "max_continuation_attempts");
        if (attempts.has_value() && attempts.value() >= 0) {
            config.max_continuation_attempts =
                static_cast<std::uint32_t>(std::min<std::int64_t>(attempts.value(), 1000));
        } else {
            config.max_continuation_attempts = kDefaultMaxContinuationAttempts;
        }
    }

    if (auto level = root.find("log_level"); level != root.end()) {
        if (!level->is_string() ||
            !logging::Logger::parse_level(level->get<std::string>(), config.log_level)) {
            return invalid_config("\"log_level\" must be one of debug, info, warn, error.");
        }
    }

    return config;
}

errors::Result<RuntimeConfig> load_runtime_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return TaskError{ErrorCategory::Input,
                         "Config file does not exist: " + path.string(),
                         "config_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return TaskError{ErrorCategory::Input,
                         "Failed to open config file: " + path.string(),
                         "config_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_runtime_config(buffer.str());
}

}  // namespace taskwarden::core::config

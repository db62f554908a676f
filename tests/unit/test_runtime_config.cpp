#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/runtime_config.hpp"
#include "core/config/task_id.hpp"

namespace {

using taskwarden::core::config::load_runtime_config;
using taskwarden::core::config::parse_runtime_config;
using taskwarden::core::config::PoolOptions;
using taskwarden::core::config::resolve_pool_options;
using taskwarden::core::errors::get_error;
using taskwarden::core::errors::get_value;
using taskwarden::core::errors::is_error;
using taskwarden::core::logging::LogLevel;

TEST(PoolOptionsTest, DefaultsApplyWhenUnset) {
    const auto config = resolve_pool_options();
    EXPECT_EQ(config.min_idle, 1u);
    EXPECT_EQ(config.max_total, 2u);
    EXPECT_TRUE(config.cold_start_fallback);
    EXPECT_EQ(config.startup_timeout_ms, 60000u);
    EXPECT_TRUE(config.enabled);
}

TEST(PoolOptionsTest, NonPositiveValuesFallBackToDefaults) {
    PoolOptions options;
    options.min_idle = 0;
    options.max_total = -3;
    options.startup_timeout_ms = 0;

    const auto config = resolve_pool_options(options);
    EXPECT_EQ(config.min_idle, 1u);
    EXPECT_EQ(config.max_total, 2u);
    EXPECT_EQ(config.startup_timeout_ms, 60000u);
}

TEST(PoolOptionsTest, MaxTotalIsRaisedToMinIdle) {
    PoolOptions options;
    options.min_idle = 4;
    options.max_total = 2;

    const auto config = resolve_pool_options(options);
    EXPECT_EQ(config.min_idle, 4u);
    EXPECT_EQ(config.max_total, 4u);
}

TEST(PoolOptionsTest, ExplicitFlagsAreKept) {
    PoolOptions options;
    options.cold_start_fallback = false;
    options.enabled = false;

    const auto config = resolve_pool_options(options);
    EXPECT_FALSE(config.cold_start_fallback);
    EXPECT_FALSE(config.enabled);
}

TEST(RuntimeConfigTest, ParsesFullDocument) {
    auto result = parse_runtime_config(R"({
        "cli": {"command": "agent", "args": ["--profile", "ci"], "cwd": "/tmp",
                "env": {"API_KEY": "secret"}},
        "pool": {"min_idle": 2, "max_total": 3, "cold_start_fallback": false,
                 "startup_timeout_ms": 5000, "enabled": true},
        "completion": {"max_continuation_attempts": 4},
        "log_level": "debug"
    })");
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.cli.command, "agent");
    ASSERT_EQ(config.cli.args.size(), 2u);
    EXPECT_EQ(config.cli.args[1], "ci");
    EXPECT_EQ(config.cwd, std::filesystem::path("/tmp"));
    EXPECT_EQ(config.env.at("API_KEY"), "secret");
    EXPECT_EQ(config.pool.min_idle.value(), 2);
    EXPECT_EQ(config.pool.max_total.value(), 3);
    EXPECT_FALSE(config.pool.cold_start_fallback.value());
    EXPECT_EQ(config.pool.startup_timeout_ms.value(), 5000);
    EXPECT_EQ(config.max_continuation_attempts, 4u);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST(RuntimeConfigTest, EmptyObjectKeepsDefaults) {
    auto result = parse_runtime_config("{}");
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.cli.command, "opencode");
    EXPECT_TRUE(config.cli.args.empty());
    EXPECT_FALSE(config.pool.min_idle.has_value());
    EXPECT_EQ(config.max_continuation_attempts, 10u);
    EXPECT_EQ(config.log_level, LogLevel::INFO);
}

TEST(RuntimeConfigTest, HugeNumbersAreClamped) {
    auto result = parse_runtime_config(
        R"({"pool": {"min_idle": 1, "max_total": 1e30, "startup_timeout_ms": -1e30}})");
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.pool.max_total.value(), 0x7fffffff);
    EXPECT_EQ(config.pool.startup_timeout_ms.value(), 0);

    const auto resolved = resolve_pool_options(config.pool);
    EXPECT_EQ(resolved.max_total, 0x7fffffffu);
    EXPECT_EQ(resolved.startup_timeout_ms, 60000u);
}

TEST(RuntimeConfigTest, RejectsInvalidJson) {
    auto result = parse_runtime_config("{not json");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

TEST(RuntimeConfigTest, RejectsWrongShapes) {
    EXPECT_TRUE(is_error(parse_runtime_config("[]")));
    EXPECT_TRUE(is_error(parse_runtime_config(R"({"cli": {"args": "x"}})")));
    EXPECT_TRUE(is_error(parse_runtime_config(R"({"cli": {"command": ""}})")));
    EXPECT_TRUE(is_error(parse_runtime_config(R"({"cli": {"env": {"A": 1}}})")));
    EXPECT_TRUE(is_error(parse_runtime_config(R"({"pool": 3})")));
    EXPECT_TRUE(is_error(parse_runtime_config(R"({"log_level": "loud"})")));
}

TEST(RuntimeConfigTest, LoadFailsForMissingFile) {
    const auto missing = std::filesystem::current_path() / "__missing_taskwarden_config__.json";
    auto result = load_runtime_config(missing);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_not_found");
}

TEST(RuntimeConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::current_path() /
                      (".tmp_config_" + taskwarden::core::config::generate_task_id() + ".json");
    {
        std::ofstream out(path);
        out << R"({"pool": {"enabled": false}})";
    }

    auto result = load_runtime_config(path);
    std::error_code ec;
    std::filesystem::remove(path, ec);

    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).pool.enabled.value());
}

}  // namespace

/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace tool_chain {

namespace {

Result<void> validate(const Config& config) {
    if (config.planner.reliability_threshold < 0.0 || config.planner.reliability_threshold > 1.0) {
        return Error{ErrorCode::InvalidConfig, "planner.reliability_threshold must be in [0, 1]"};
    }
    if (config.planner.timeout_factor <= 0.0) {
        return Error{ErrorCode::InvalidConfig, "planner.timeout_factor must be positive"};
    }
    if (config.engine.max_concurrent_steps == 0) {
        return Error{ErrorCode::InvalidConfig, "engine.max_concurrent_steps must be at least 1"};
    }
    if (config.engine.cost_threshold < 0.0) {
        return Error{ErrorCode::InvalidConfig, "engine.cost_threshold must not be negative"};
    }
    if (config.tracker.history_capacity == 0) {
        return Error{ErrorCode::InvalidConfig, "tracker.history_capacity must be at least 1"};
    }
    if (config.executor.time_scale < 0.0) {
        return Error{ErrorCode::InvalidConfig, "executor.time_scale must not be negative"};
    }
    if (config.executor.kind != "simulated" && config.executor.kind != "dispatch") {
        return Error{ErrorCode::InvalidConfig, "Unknown executor kind: " + config.executor.kind};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::InvalidConfig, "Unknown log level: " + config.telemetry.log_level};
    }
    return {};
}

/// Reads a non-negative integer setting. An out-of-range value records the
/// first such error in `fault` and yields zero.
template <typename T>
T read_count(toml::node_view<toml::node> table, std::string_view section,
             std::string_view key, int64_t fallback, std::optional<Error>& fault) {
    const int64_t value = table[key].value_or(fallback);
    bool in_range = value >= 0;
    if constexpr (sizeof(T) < sizeof(int64_t)) {
        in_range = in_range && value <= static_cast<int64_t>(std::numeric_limits<T>::max());
    }
    if (!in_range) {
        if (!fault) {
            fault = Error{ErrorCode::InvalidConfig,
                          std::string{section} + "." + std::string{key}
                              + " must be a non-negative integer within range, got "
                              + std::to_string(value)};
        }
        return T{0};
    }
    return static_cast<T>(value);
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::InvalidConfig, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;
        std::optional<Error> fault;

        // [planner]
        if (auto planner = tbl["planner"]; planner.is_table()) {
            config.planner.reliability_threshold =
                planner["reliability_threshold"].value_or(0.9);
            config.planner.enhanced_max_retries = read_count<uint32_t>(
                planner, "planner", "enhanced_max_retries", 3, fault);
            config.planner.backoff_ms = read_count<uint32_t>(
                planner, "planner", "backoff_ms", 1000, fault);
            config.planner.default_retries = read_count<uint32_t>(
                planner, "planner", "default_retries", 0, fault);
            config.planner.timeout_factor = planner["timeout_factor"].value_or(1.5);
            config.planner.timeout_floor_ms = read_count<uint32_t>(
                planner, "planner", "timeout_floor_ms", 60000, fault);
            config.planner.target_duration_ms = read_count<uint32_t>(
                planner, "planner", "target_duration_ms", 30000, fault);
            config.planner.strict_registration = planner["strict_registration"].value_or(false);
        }

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            config.engine.max_concurrent_steps = read_count<uint32_t>(
                engine, "engine", "max_concurrent_steps", 5, fault);
            config.engine.enable_parallel = engine["enable_parallel"].value_or(true);
            config.engine.cache_enabled = engine["cache_enabled"].value_or(true);
            config.engine.learning_enabled = engine["learning_enabled"].value_or(true);
            config.engine.cost_threshold = engine["cost_threshold"].value_or(1.0);

            auto policy = engine["dependency_failure"].value_or(std::string{"skip"});
            if (policy == "skip") {
                config.engine.dependency_failure = DependencyFailurePolicy::Skip;
            } else if (policy == "run") {
                config.engine.dependency_failure = DependencyFailurePolicy::Run;
            } else {
                return Error{ErrorCode::InvalidConfig,
                             "Unknown engine.dependency_failure policy: " + policy};
            }
        }

        // [cache]
        if (auto cache = tbl["cache"]; cache.is_table()) {
            config.cache.max_entries = read_count<uint32_t>(
                cache, "cache", "max_entries", 1024, fault);
            config.cache.hit_duration_ms = read_count<uint32_t>(
                cache, "cache", "hit_duration_ms", 50, fault);
            config.cache.ttl_ms = read_count<uint32_t>(cache, "cache", "ttl_ms", 0, fault);
        }

        // [tracker]
        if (auto tracker = tbl["tracker"]; tracker.is_table()) {
            config.tracker.history_capacity = read_count<uint32_t>(
                tracker, "tracker", "history_capacity", 1000, fault);
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.thread_count = read_count<uint32_t>(
                executor, "executor", "thread_count", 0, fault);
            config.executor.kind = executor["kind"].value_or(std::string{"simulated"});
            config.executor.seed = read_count<uint64_t>(executor, "executor", "seed", 42, fault);
            config.executor.time_scale = executor["time_scale"].value_or(1.0);
        }

        // [catalog]
        if (auto catalog = tbl["catalog"]; catalog.is_table()) {
            config.catalog.path = catalog["path"].value_or(std::string{});
            config.catalog.builtin = catalog["builtin"].value_or(true);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = read_count<uint32_t>(
                telemetry, "telemetry", "max_file_size_mb", 50, fault);
            config.telemetry.rotate_count = read_count<uint32_t>(
                telemetry, "telemetry", "rotate_count", 5, fault);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        if (fault) return *fault;
        if (auto valid = validate(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace tool_chain

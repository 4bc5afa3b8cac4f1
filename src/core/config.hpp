/**
 * @file config.hpp
 * @brief Optimizer configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace tool_chain {

struct PlannerConfig {
    double reliability_threshold = 0.9;     ///< Below this, steps get the enhanced retry policy
    uint32_t enhanced_max_retries = 3;
    uint32_t backoff_ms = 1000;             ///< Linear backoff base
    uint32_t default_retries = 0;           ///< Retries for steps above the threshold
    double timeout_factor = 1.5;
    uint32_t timeout_floor_ms = 60000;
    uint32_t target_duration_ms = 30000;
    bool strict_registration = false;       ///< Reject re-registration of a name
};

struct EngineConfig {
    uint32_t max_concurrent_steps = 5;
    bool enable_parallel = true;
    bool cache_enabled = true;
    bool learning_enabled = true;
    double cost_threshold = 1.0;            ///< Total cost above which a cost recommendation is made
    DependencyFailurePolicy dependency_failure = DependencyFailurePolicy::Skip;
};

struct CacheConfig {
    uint32_t max_entries = 1024;            ///< LRU bound, 0 = unbounded
    uint32_t hit_duration_ms = 50;          ///< Synthetic duration reported for a cache hit
    uint32_t ttl_ms = 0;                    ///< 0 = entries never expire
};

struct TrackerConfig {
    uint32_t history_capacity = 1000;
};

struct ExecutorConfig {
    uint32_t thread_count = 0;              ///< 0 = hardware_concurrency
    std::string kind = "simulated";        ///< "simulated" or "dispatch"
    uint64_t seed = 42;
    double time_scale = 1.0;                ///< Multiplier on simulated durations
};

struct CatalogConfig {
    std::filesystem::path path;             ///< Optional TOML item catalog
    bool builtin = true;                    ///< Register the built-in items
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    PlannerConfig planner;
    EngineConfig engine;
    CacheConfig cache;
    TrackerConfig tracker;
    ExecutorConfig executor;
    CatalogConfig catalog;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing tables and keys keep their defaults. Out-of-range values are
 * rejected with ErrorCode::InvalidConfig.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace tool_chain

/**
 * @file coordinator.hpp
 * @brief Top-level Coordinator facade tying all modules together.
 *
 * Provides a single entry point for:
 *   1. Registering items (built-in, catalog file or caller-defined)
 *   2. Creating and executing plans
 *   3. Querying suggestions, performance metrics and cache statistics
 *
 * The registry, tracker and work executor are injected by the caller; any
 * left null is built from the configuration. Injected registry and tracker
 * keep the settings they were constructed with.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/execution_engine.hpp"
#include "executor/item_executor.hpp"
#include "planner/plan_optimizer.hpp"
#include "registry/item_registry.hpp"
#include "telemetry/metrics_collector.hpp"
#include "tracker/performance_tracker.hpp"

#include <memory>
#include <vector>

namespace tool_chain {

/**
 * @brief Build the executor named by config.kind.
 *
 * "simulated" draws outcomes from the registry's declared estimates;
 * "dispatch" starts with no handlers.
 */
std::unique_ptr<IItemExecutor> make_executor(const ExecutorConfig& config,
                                             const ItemRegistry& registry);

class Coordinator {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;        ///< null = discard events
        std::unique_ptr<IItemExecutor> executor;       ///< null = make_executor(config.executor)
        std::shared_ptr<ItemRegistry> registry;        ///< null = fresh registry
        std::shared_ptr<PerformanceTracker> tracker;   ///< null = fresh tracker
    };

    explicit Coordinator(Options opts);
    ~Coordinator();

    // Non-copyable, non-movable
    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    /// Register the built-in items and the catalog file named in [catalog].
    Result<void> load_items();

    // ── Registry ─────────────────────────────
    Result<void> register_item(const ItemDefinition& definition);

    // ── Planning ─────────────────────────────
    Result<ExecutionPlan> create_plan(const PlanRequest& request);
    [[nodiscard]] std::vector<OptimizationSuggestion>
    suggest_optimizations(const ExecutionPlan& plan) const;

    // ── Execution ────────────────────────────
    ExecutionResult execute_plan(const ExecutionPlan& plan);

    // ── Metrics & Maintenance ────────────────
    [[nodiscard]] PerformanceReport performance_metrics() const;
    [[nodiscard]] CacheStats cache_stats() const;
    void clear_cache();
    void clear_performance_data();
    void clear_all();

    // ── Accessors (for testing) ─────────────
    ItemRegistry& registry() { return *registry_; }
    PerformanceTracker& tracker() { return *tracker_; }
    IItemExecutor& executor() { return *executor_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    Logger logger_;
    Logger engine_log_;                     // "engine" component, same sink as logger_
    MetricsCollector metrics_;

    std::shared_ptr<ItemRegistry> registry_;
    std::shared_ptr<PerformanceTracker> tracker_;
    std::unique_ptr<IItemExecutor> executor_;

    PlanOptimizer planner_;
    ExecutionEngine engine_;
};

}  // namespace tool_chain

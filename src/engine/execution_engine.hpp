/**
 * @file execution_engine.hpp
 * @brief Runs an ExecutionPlan group by group.
 *
 * Groups run in ascending parallel_group order; a group is a strict
 * barrier. Steps inside a group are dispatched to the ThreadPool, at most
 * max_concurrent_steps at a time, and their results are kept in
 * submission order. A failed step never aborts its siblings.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "engine/execution_result.hpp"
#include "engine/result_cache.hpp"
#include "executor/item_executor.hpp"
#include "executor/thread_pool.hpp"
#include "planner/plan.hpp"
#include "registry/item_registry.hpp"
#include "telemetry/metrics_collector.hpp"
#include "tracker/performance_tracker.hpp"

#include <stop_token>
#include <unordered_map>
#include <vector>

namespace tool_chain {

class ExecutionEngine {
public:
    ExecutionEngine(const ItemRegistry& registry,
                    PerformanceTracker& tracker,
                    IItemExecutor& executor,
                    EngineConfig engine,
                    CacheConfig cache,
                    size_t thread_count,
                    Logger& logger,
                    MetricsCollector* metrics = nullptr);
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    /**
     * @brief Execute every step of the plan.
     *
     * Step failures are reported in the result, never thrown. An engine
     * fault is converted to a failed result carrying the partial step
     * results and a single "Execution failed" recommendation.
     */
    ExecutionResult execute_plan(const ExecutionPlan& plan);

    [[nodiscard]] CacheStats cache_stats() const { return cache_.stats(); }
    void clear_cache();

    [[nodiscard]] ResultCache& cache() noexcept { return cache_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    using Outcomes = std::unordered_map<ItemName, bool>;

    std::vector<StepResult> run_group(const ExecutionPlan& plan,
                                      const std::vector<const PlanStep*>& group,
                                      const Outcomes& outcomes);

    /// Never throws: a fault inside one step becomes that step's permanent failure.
    StepResult execute_step(const ExecutionPlan& plan,
                            const PlanStep& step,
                            const Outcomes& outcomes,
                            std::stop_token stop);

    StepResult run_step(const ExecutionPlan& plan,
                        const PlanStep& step,
                        const Outcomes& outcomes,
                        std::stop_token stop);

    /// Executor call with thrown exceptions mapped to permanent failures.
    Result<Payload> invoke(const PlanStep& step, std::stop_token stop);

    [[nodiscard]] static ExecutionSummary summarize(const std::vector<StepResult>& results,
                                                    size_t parallel_steps);
    [[nodiscard]] std::vector<Recommendation> recommend(const ExecutionPlan& plan,
                                                        const ExecutionResult& result) const;

    const ItemRegistry& registry_;
    PerformanceTracker& tracker_;
    IItemExecutor& executor_;
    EngineConfig config_;
    Duration cache_hit_duration_;
    Logger& logger_;
    MetricsCollector* metrics_;

    ResultCache cache_;
    std::stop_source shutdown_;
    ThreadPool pool_;                       // last: joined before the members it uses
};

}  // namespace tool_chain

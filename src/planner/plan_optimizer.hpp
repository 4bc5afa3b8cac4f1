/**
 * @file plan_optimizer.hpp
 * @brief Turns a plan request into an ordered, grouped ExecutionPlan.
 *
 * Planning pipeline:
 *   1. Build the dependency graph (transitive dependencies included).
 *   2. DFS topological sort with parallel-level assignment.
 *   3. Attach retry policies from observed reliability.
 *   4. Stable-sort steps by group and compute plan metadata.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "planner/dependency_graph.hpp"
#include "planner/plan.hpp"
#include "registry/item_registry.hpp"
#include "tracker/performance_tracker.hpp"

#include <mutex>
#include <random>
#include <string_view>
#include <vector>

namespace tool_chain {

class PlanOptimizer {
public:
    PlanOptimizer(const ItemRegistry& registry,
                  const PerformanceTracker& tracker,
                  PlannerConfig planner,
                  EngineConfig engine);

    /**
     * @brief Create a plan for the requested items.
     *
     * Fails with ItemNotFound or CircularDependency; nothing partial is
     * returned.
     */
    [[nodiscard]] Result<ExecutionPlan> create_plan(const PlanRequest& request);

    /**
     * @brief Attach a retry policy to every step.
     *
     * Steps whose observed success rate (declared reliability while the
     * profile has no samples) is below the reliability threshold get the
     * enhanced policy. The others get constraints.default_retries.
     * Depends only on its inputs and the tracker, so a second pass
     * yields identical policies.
     */
    void apply_intelligent_optimizations(std::vector<PlanStep>& steps,
                                         const PlanConstraints& constraints) const;

    /// Suggestions ranked by EstimatedImpact::score(), highest first.
    [[nodiscard]] std::vector<OptimizationSuggestion>
    suggest_optimizations(const ExecutionPlan& plan) const;

    [[nodiscard]] const PlannerConfig& planner_config() const noexcept { return planner_; }
    [[nodiscard]] const EngineConfig& engine_config() const noexcept { return engine_; }

private:
    [[nodiscard]] PlanMetadata compute_metadata(const std::vector<PlanStep>& steps) const;
    [[nodiscard]] std::string generate_id(std::string_view prefix);

    const ItemRegistry& registry_;
    const PerformanceTracker& tracker_;
    PlannerConfig planner_;
    EngineConfig engine_;

    std::mutex id_mutex_;
    std::mt19937_64 id_rng_;
};

}  // namespace tool_chain

/**
 * @file plan.hpp
 * @brief Execution plan value types.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tool_chain {

/**
 * @brief A requested item and the payload it should receive.
 */
struct ItemRequest {
    ItemName name;
    Payload input = Payload::object();
};

/**
 * @brief One scheduled invocation of an item.
 *
 * Invariant: for every dependency d, group(d) < parallel_group.
 */
struct PlanStep {
    StepId step_id;
    ItemName item;
    Payload input = Payload::object();
    std::vector<ItemName> dependencies;
    uint32_t parallel_group{0};
    RetryPolicy retry;
};

struct OptimizationSettings {
    bool enable_parallel = true;
    bool enable_caching = true;
    Duration target_duration{from_ms(30000)};
    uint32_t max_concurrent_steps = 5;
    DependencyFailurePolicy dependency_failure = DependencyFailurePolicy::Skip;
};

struct PlanConstraints {
    std::optional<Duration> max_duration;
    std::optional<double> max_cost;
    std::optional<double> required_reliability;
    uint32_t default_retries = 0;           ///< Retries for steps not flagged as unreliable
};

/**
 * @brief Planning-time estimates. The timeout is advisory and not enforced.
 */
struct PlanMetadata {
    Timestamp created_at;
    uint32_t parallel_group_count{0};
    Duration estimated_duration{0};         ///< Σ over groups of the slowest estimate
    double estimated_cost{0.0};
    Duration optimal_timeout{0};
};

/**
 * @brief An ordered, grouped plan. Immutable once created.
 */
struct ExecutionPlan {
    PlanId id;
    std::string name;
    std::string description;
    std::vector<PlanStep> steps;
    std::unordered_map<ItemName, std::vector<ItemName>> dependencies;
    OptimizationSettings optimization;
    PlanConstraints constraints;
    PlanMetadata metadata;

    [[nodiscard]] const PlanStep* find_step(const ItemName& item) const {
        for (const auto& step : steps) {
            if (step.item == item) return &step;
        }
        return nullptr;
    }
};

/**
 * @brief Caller input for plan creation.
 */
struct PlanRequest {
    std::string name;
    std::string description;
    std::vector<ItemRequest> items;
    PlanConstraints constraints;
};

// ─────────────────────────────────────────────
// Optimization Suggestions
// ─────────────────────────────────────────────

enum class SuggestionType : uint8_t {
    Performance,
    Cost,
    Reliability,
    Parallelism
};

[[nodiscard]] constexpr std::string_view to_string(SuggestionType type) noexcept {
    switch (type) {
        case SuggestionType::Performance: return "performance";
        case SuggestionType::Cost:        return "cost";
        case SuggestionType::Reliability: return "reliability";
        case SuggestionType::Parallelism: return "parallelism";
    }
    return "unknown";
}

struct EstimatedImpact {
    double time_reduction{0.0};
    double cost_reduction{0.0};
    double reliability_improvement{0.0};
    double quality_improvement{0.0};

    /// Ranking score used to order suggestions.
    [[nodiscard]] double score() const noexcept {
        return time_reduction * 10.0 + cost_reduction * 100.0 + quality_improvement * 50.0;
    }
};

struct OptimizationSuggestion {
    SuggestionType type;
    std::string message;
    EstimatedImpact impact;
    std::string difficulty;                 ///< "low" or "medium"
};

}  // namespace tool_chain

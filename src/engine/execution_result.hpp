/**
 * @file execution_result.hpp
 * @brief Per-step and per-plan execution outcomes.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tool_chain {

/**
 * @brief Outcome of one step in one plan run. Never mutated afterwards.
 */
struct StepResult {
    StepId step_id;
    ItemName item;
    bool success{false};
    Duration duration{0};
    double cost{0.0};
    Payload output;                         ///< null when the step produced nothing
    std::optional<Error> error;
    uint32_t retry_count{0};
    bool cache_hit{false};
    bool skipped{false};                    ///< Not run because a dependency failed
};

/**
 * @brief A step flagged as slow or as needing retries.
 */
struct Bottleneck {
    enum class Kind : uint8_t { SlowExecution, Retries };

    ItemName item;
    Kind kind;
    Duration duration{0};
    uint32_t retry_count{0};

    [[nodiscard]] std::string describe() const;
};

struct ExecutionSummary {
    size_t parallel_steps{0};               ///< Steps that ran in a concurrent group of size > 1
    size_t cache_hits{0};
    size_t skipped_steps{0};                ///< Succeeded without producing output
    size_t cascaded_steps{0};               ///< Not run because a dependency failed
    std::vector<Bottleneck> bottlenecks;
};

enum class Priority : uint8_t { Low, Medium, High };

[[nodiscard]] constexpr std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::Low:    return "low";
        case Priority::Medium: return "medium";
        case Priority::High:   return "high";
    }
    return "unknown";
}

struct Recommendation {
    std::string type;                       ///< performance | cost | reliability | parallelism
    std::string message;
    Priority priority{Priority::Medium};
};

/**
 * @brief Outcome of one plan run.
 *
 * success is the logical AND of every step result.
 */
struct ExecutionResult {
    PlanId plan_id;
    bool success{false};
    Duration total_duration{0};
    double total_cost{0.0};
    std::vector<StepResult> step_results;
    ExecutionSummary summary;
    std::vector<Recommendation> recommendations;

    [[nodiscard]] const StepResult* find(const ItemName& item) const {
        for (const auto& r : step_results) {
            if (r.item == item) return &r;
        }
        return nullptr;
    }
};

}  // namespace tool_chain

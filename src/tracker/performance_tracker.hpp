/**
 * @file performance_tracker.hpp
 * @brief Per-item performance profiles and plan execution history.
 *
 * Profiles are cumulative running averages:
 *
 *     n   = n + 1
 *     avg = avg * (1 - 1/n) + sample * (1/n)
 *
 * Early samples never decay out as they would under a fixed-weight EMA.
 * History is a bounded append-only log; the oldest records are dropped once
 * the capacity is reached.
 */

#pragma once

#include "core/types.hpp"
#include "engine/execution_result.hpp"
#include "registry/item_registry.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tool_chain {

struct PerformanceProfile {
    ItemName item;
    Duration avg_duration{0};
    double avg_cost{0.0};
    double success_rate{1.0};
    uint64_t sample_count{0};
};

struct ExecutionRecord {
    PlanId plan_id;
    Timestamp timestamp;
    ExecutionResult result;
};

/**
 * @brief An item ranked by accumulated execution time across history.
 */
struct BottleneckItem {
    ItemName item;
    Duration average_duration{0};
    size_t frequency{0};
    Duration total_impact{0};               ///< average_duration × frequency
};

/**
 * @brief Older-half vs newer-half comparison, in percent. Positive is better.
 */
struct TrendAnalysis {
    double performance_improvement{0.0};
    double cost_reduction{0.0};
    double reliability_improvement{0.0};
};

/**
 * @brief Aggregate metrics over the retained history. Rates are percentages.
 */
struct PerformanceReport {
    size_t total_executions{0};
    Duration average_duration{0};
    double parallelism_rate{0.0};
    double cache_hit_rate{0.0};
    double error_rate{0.0};
    double cost_efficiency{0.0};            ///< successful plans per unit cost
    std::vector<BottleneckItem> bottleneck_items;
    TrendAnalysis trends;
};

/**
 * @brief Thread-safe store of profiles and history.
 *
 * Every profile update is one locked read-modify-write, so concurrent steps
 * of the same item never lose samples.
 */
class PerformanceTracker {
public:
    static constexpr size_t kDefaultHistoryCapacity = 1000;
    static constexpr size_t kTopBottlenecks = 5;

    explicit PerformanceTracker(size_t history_capacity = kDefaultHistoryCapacity,
                                bool learning_enabled = true);

    // ── Profiles ──────────────────────────────

    /// Create or reset the profile of an item from its declared estimates.
    void initialize_profile(const ItemDefinition& definition);

    /// Fold one observation into the item's running averages, creating the
    /// profile when the item has none yet.
    void update_profile(const ItemName& item, Duration duration, double cost, bool success);

    [[nodiscard]] std::optional<PerformanceProfile> profile(const ItemName& item) const;
    [[nodiscard]] std::vector<PerformanceProfile> profiles() const;

    /// Observed success rate, or the fallback when the item has no samples yet.
    [[nodiscard]] double success_rate_or(const ItemName& item, double fallback) const;

    /// Items whose current success rate (declared, until sampled) is below threshold.
    [[nodiscard]] std::vector<ItemName> find_unreliable(double threshold = 0.9) const;

    void set_learning_enabled(bool enabled) noexcept { learning_enabled_ = enabled; }
    [[nodiscard]] bool learning_enabled() const noexcept { return learning_enabled_; }

    // ── History ───────────────────────────────

    void record_execution(const PlanId& plan_id, const ExecutionResult& result);
    [[nodiscard]] std::vector<ExecutionRecord> history() const;
    [[nodiscard]] size_t history_size() const;
    [[nodiscard]] size_t history_capacity() const noexcept { return history_capacity_; }

    // ── Analysis ──────────────────────────────

    [[nodiscard]] PerformanceReport metrics() const;

    /// Profiles, metrics and a compact history as one JSON document.
    [[nodiscard]] nlohmann::json export_json() const;

    /// Drop history and reset every profile to its declared estimates.
    void clear();

private:
    static TrendAnalysis compute_trends(const std::deque<ExecutionRecord>& history);

    mutable std::mutex mutex_;
    std::unordered_map<ItemName, PerformanceProfile> profiles_;
    std::unordered_map<ItemName, PerformanceProfile> baselines_;
    std::deque<ExecutionRecord> history_;
    size_t history_capacity_;
    std::atomic<bool> learning_enabled_;
};

}  // namespace tool_chain

/**
 * @file types.hpp
 * @brief Fundamental types used throughout ToolChainOptimizer.
 *
 * Defines item names, time aliases, item categories, retry policy and the
 * payload type passed between the engine and work executors.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace tool_chain {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ItemName = std::string;
using StepId = std::string;
using PlanId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Input and output payloads. Object keys are held sorted by nlohmann::json,
/// so dump() yields a canonical serialization independent of insertion order.
using Payload = nlohmann::json;

[[nodiscard]] constexpr Duration from_ms(int64_t ms) noexcept {
    return std::chrono::duration_cast<Duration>(std::chrono::milliseconds{ms});
}

[[nodiscard]] constexpr double to_ms(Duration d) noexcept {
    return static_cast<double>(d.count()) / 1000.0;
}

// ─────────────────────────────────────────────
// Item Category
// ─────────────────────────────────────────────

enum class ItemCategory : uint8_t {
    Planning,
    Generation,
    Analysis,
    Transformation,
    Validation,
    Orchestration
};

[[nodiscard]] constexpr std::string_view to_string(ItemCategory category) noexcept {
    switch (category) {
        case ItemCategory::Planning:       return "planning";
        case ItemCategory::Generation:     return "generation";
        case ItemCategory::Analysis:       return "analysis";
        case ItemCategory::Transformation: return "transformation";
        case ItemCategory::Validation:     return "validation";
        case ItemCategory::Orchestration:  return "orchestration";
    }
    return "unknown";
}

[[nodiscard]] std::optional<ItemCategory> parse_category(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Retry Policy
// ─────────────────────────────────────────────

/// Retry conditions understood by the default policies.
inline constexpr std::string_view kConditionTimeout = "timeout";
inline constexpr std::string_view kConditionNetworkError = "network_error";
inline constexpr std::string_view kConditionUnavailable = "service_unavailable";

/**
 * @brief Per-step retry configuration.
 *
 * max_retries counts retries after the first attempt, so a step is invoked
 * at most max_retries + 1 times. Backoff is linear: backoff * attempt.
 */
struct RetryPolicy {
    uint32_t max_retries{0};
    Duration backoff{from_ms(1000)};
    std::vector<std::string> retry_on{std::string{kConditionTimeout},
                                      std::string{kConditionNetworkError},
                                      std::string{kConditionUnavailable}};

    [[nodiscard]] bool triggers_on(std::string_view condition) const noexcept;

    bool operator==(const RetryPolicy&) const = default;
};

// ─────────────────────────────────────────────
// Dependency Failure Policy
// ─────────────────────────────────────────────

enum class DependencyFailurePolicy : uint8_t {
    Skip,   ///< Dependents of a failed step are not executed
    Run     ///< Dependents execute regardless of upstream failure
};

[[nodiscard]] constexpr std::string_view to_string(DependencyFailurePolicy policy) noexcept {
    switch (policy) {
        case DependencyFailurePolicy::Skip: return "skip";
        case DependencyFailurePolicy::Run:  return "run";
    }
    return "unknown";
}

}  // namespace tool_chain

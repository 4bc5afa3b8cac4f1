/**
 * @file plan_optimizer.cpp
 * @brief PlanOptimizer implementation.
 */

#include "planner/plan_optimizer.hpp"

#include <algorithm>
#include <chrono>
#include <map>

namespace tool_chain {

namespace {

constexpr double kUnreliableBelow = 0.9;
constexpr double kExpensiveFactor = 2.0;

std::string to_base36(uint64_t value, size_t width) {
    static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string out(width, '0');
    for (size_t i = width; i > 0; --i) {
        out[i - 1] = kDigits[value % 36];
        value /= 36;
    }
    return out;
}

}  // anonymous namespace

PlanOptimizer::PlanOptimizer(const ItemRegistry& registry,
                             const PerformanceTracker& tracker,
                             PlannerConfig planner,
                             EngineConfig engine)
    : registry_(registry)
    , tracker_(tracker)
    , planner_(planner)
    , engine_(engine)
    , id_rng_(std::random_device{}()) {}

// ─────────────────────────────────────────────
// Plan Creation
// ─────────────────────────────────────────────

Result<ExecutionPlan> PlanOptimizer::create_plan(const PlanRequest& request) {
    auto graph = build_dependency_graph(request.items, registry_);
    if (!graph) return graph.error();

    auto ordered = graph->leveled_order();
    if (!ordered) return ordered.error();

    // First occurrence of a requested name supplies its input.
    std::unordered_map<ItemName, const Payload*> inputs;
    for (const auto& req : request.items) {
        inputs.try_emplace(req.name, &req.input);
    }

    ExecutionPlan plan;
    plan.id = generate_id("plan");
    plan.name = request.name;
    plan.description = request.description;
    plan.constraints = request.constraints;
    plan.dependencies = graph->adjacency();

    plan.steps.reserve(ordered->size());
    for (const auto& leveled : *ordered) {
        PlanStep step;
        step.step_id = generate_id("step");
        step.item = leveled.name;
        if (auto it = inputs.find(leveled.name); it != inputs.end()) {
            step.input = *it->second;
        }
        step.dependencies = graph->dependencies(leveled.name);
        step.parallel_group = leveled.level;
        plan.steps.push_back(std::move(step));
    }

    apply_intelligent_optimizations(plan.steps, plan.constraints);

    std::stable_sort(plan.steps.begin(), plan.steps.end(),
                     [](const PlanStep& a, const PlanStep& b) {
                         return a.parallel_group < b.parallel_group;
                     });

    plan.optimization.enable_parallel = engine_.enable_parallel;
    plan.optimization.enable_caching = engine_.cache_enabled;
    plan.optimization.max_concurrent_steps = engine_.max_concurrent_steps;
    plan.optimization.dependency_failure = engine_.dependency_failure;
    plan.optimization.target_duration = request.constraints.max_duration.value_or(
        from_ms(planner_.target_duration_ms));

    plan.metadata = compute_metadata(plan.steps);
    return plan;
}

void PlanOptimizer::apply_intelligent_optimizations(std::vector<PlanStep>& steps,
                                                    const PlanConstraints& constraints) const {
    const Duration backoff = from_ms(planner_.backoff_ms);
    const uint32_t light_retries = std::max(constraints.default_retries, planner_.default_retries);

    for (auto& step : steps) {
        auto def = registry_.get(step.item);
        const double declared = def ? def->reliability : 1.0;
        const double observed = tracker_.success_rate_or(step.item, declared);

        RetryPolicy policy;
        policy.backoff = backoff;
        policy.max_retries = observed < planner_.reliability_threshold
            ? planner_.enhanced_max_retries
            : light_retries;
        step.retry = std::move(policy);
    }
}

PlanMetadata PlanOptimizer::compute_metadata(const std::vector<PlanStep>& steps) const {
    PlanMetadata meta;
    meta.created_at = std::chrono::system_clock::now();

    std::map<uint32_t, Duration> slowest_per_group;
    Duration total_estimate{0};

    for (const auto& step : steps) {
        auto def = registry_.get(step.item);
        if (!def) continue;
        total_estimate += def->estimated_duration;
        meta.estimated_cost += def->cost_per_execution;

        auto& slowest = slowest_per_group[step.parallel_group];
        slowest = std::max(slowest, def->estimated_duration);
    }

    meta.parallel_group_count = static_cast<uint32_t>(slowest_per_group.size());
    for (const auto& [_, slowest] : slowest_per_group) {
        meta.estimated_duration += slowest;
    }

    const auto scaled = Duration{static_cast<int64_t>(
        static_cast<double>(total_estimate.count()) * planner_.timeout_factor)};
    meta.optimal_timeout = std::max(scaled, from_ms(planner_.timeout_floor_ms));
    return meta;
}

std::string PlanOptimizer::generate_id(std::string_view prefix) {
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    uint64_t suffix = 0;
    {
        std::lock_guard lock(id_mutex_);
        suffix = id_rng_();
    }
    return std::string{prefix} + "_" + std::to_string(now_ms) + "_" + to_base36(suffix, 9);
}

// ─────────────────────────────────────────────
// Suggestions
// ─────────────────────────────────────────────

std::vector<OptimizationSuggestion>
PlanOptimizer::suggest_optimizations(const ExecutionPlan& plan) const {
    std::vector<OptimizationSuggestion> suggestions;
    if (plan.steps.empty()) return suggestions;

    std::unordered_map<ItemName, ItemDefinition> defs;
    for (const auto& step : plan.steps) {
        if (auto def = registry_.get(step.item)) {
            defs.emplace(step.item, std::move(*def));
        }
    }

    std::map<uint32_t, size_t> group_sizes;
    for (const auto& step : plan.steps) {
        ++group_sizes[step.parallel_group];
    }

    // ── Parallelism ──
    Duration parallel_total{0};
    Duration parallel_max{0};
    size_t parallel_count = 0;
    for (const auto& step : plan.steps) {
        auto it = defs.find(step.item);
        if (it == defs.end() || !it->second.parallelizable) continue;
        if (group_sizes[step.parallel_group] < 2) continue;
        ++parallel_count;
        parallel_total += it->second.estimated_duration;
        parallel_max = std::max(parallel_max, it->second.estimated_duration);
    }
    if (parallel_count > 0) {
        OptimizationSuggestion s{SuggestionType::Parallelism,
                                 std::to_string(parallel_count)
                                     + " steps can be parallelized to reduce execution time",
                                 {}, "low"};
        if (parallel_total.count() > 0) {
            s.impact.time_reduction =
                static_cast<double>((parallel_total - parallel_max).count())
                / static_cast<double>(parallel_total.count()) * 100.0;
        }
        suggestions.push_back(std::move(s));
    }

    // ── Caching ──
    size_t cacheable = 0;
    for (const auto& step : plan.steps) {
        auto it = defs.find(step.item);
        if (it != defs.end() && it->second.cache_enabled) ++cacheable;
    }
    if (cacheable > 0) {
        OptimizationSuggestion s{SuggestionType::Performance,
                                 "Enable caching for " + std::to_string(cacheable)
                                     + " steps to improve performance",
                                 {}, "low"};
        s.impact.time_reduction = static_cast<double>(cacheable) * 0.3;
        s.impact.cost_reduction = static_cast<double>(cacheable) * 0.5;
        suggestions.push_back(std::move(s));
    }

    // ── Cost ──
    double cost_sum = 0.0;
    for (const auto& step : plan.steps) {
        auto it = defs.find(step.item);
        if (it != defs.end()) cost_sum += it->second.cost_per_execution;
    }
    const double mean_cost = cost_sum / static_cast<double>(plan.steps.size());

    size_t expensive = 0;
    double expensive_cost = 0.0;
    for (const auto& step : plan.steps) {
        auto it = defs.find(step.item);
        if (it == defs.end()) continue;
        if (it->second.cost_per_execution > mean_cost * kExpensiveFactor) {
            ++expensive;
            expensive_cost += it->second.cost_per_execution;
        }
    }
    if (expensive > 0) {
        OptimizationSuggestion s{SuggestionType::Cost,
                                 "Optimize " + std::to_string(expensive)
                                     + " high-cost steps through alternative approaches",
                                 {}, "medium"};
        s.impact.cost_reduction = expensive_cost * 0.3;
        suggestions.push_back(std::move(s));
    }

    // ── Reliability ──
    size_t unreliable = 0;
    for (const auto& step : plan.steps) {
        auto it = defs.find(step.item);
        if (it == defs.end()) continue;
        const double observed = tracker_.success_rate_or(step.item, it->second.reliability);
        if (it->second.reliability < kUnreliableBelow || observed < kUnreliableBelow) {
            ++unreliable;
        }
    }
    if (unreliable > 0) {
        OptimizationSuggestion s{SuggestionType::Reliability,
                                 "Add fallback strategies for " + std::to_string(unreliable)
                                     + " potentially unreliable steps",
                                 {}, "medium"};
        s.impact.reliability_improvement = 0.15;
        suggestions.push_back(std::move(s));
    }

    std::stable_sort(suggestions.begin(), suggestions.end(),
                     [](const OptimizationSuggestion& a, const OptimizationSuggestion& b) {
                         return a.impact.score() > b.impact.score();
                     });
    return suggestions;
}

}  // namespace tool_chain

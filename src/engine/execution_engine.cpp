/**
 * @file execution_engine.cpp
 * @brief ExecutionEngine implementation.
 *
 * Per step:
 *   1. Cascade check against the outcomes of earlier groups
 *   2. Cache lookup (plan caching and item cache flag both required)
 *   3. Executor call, retried on matching transient errors with
 *      backoff × attempt between attempts
 *   4. One profile update for the terminal outcome
 */

#include "engine/execution_engine.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <map>
#include <numeric>
#include <semaphore>
#include <sstream>

namespace tool_chain {

namespace {

constexpr double kSlowFactor = 2.0;
constexpr double kRetryRateLimit = 0.2;

/// Returns a semaphore slot when the step finishes, even by exception.
class SlotRelease {
public:
    explicit SlotRelease(std::counting_semaphore<>& slots) : slots_(slots) {}
    ~SlotRelease() { slots_.release(); }

    SlotRelease(const SlotRelease&) = delete;
    SlotRelease& operator=(const SlotRelease&) = delete;

private:
    std::counting_semaphore<>& slots_;
};

Duration elapsed_since(SteadyTime start) {
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
}

std::string format_ms(Duration d) {
    std::ostringstream oss;
    oss << std::chrono::duration_cast<std::chrono::milliseconds>(d).count() << "ms";
    return oss.str();
}

}  // anonymous namespace

ExecutionEngine::ExecutionEngine(const ItemRegistry& registry,
                                 PerformanceTracker& tracker,
                                 IItemExecutor& executor,
                                 EngineConfig engine,
                                 CacheConfig cache,
                                 size_t thread_count,
                                 Logger& logger,
                                 MetricsCollector* metrics)
    : registry_(registry)
    , tracker_(tracker)
    , executor_(executor)
    , config_(engine)
    , cache_hit_duration_(from_ms(cache.hit_duration_ms))
    , logger_(logger)
    , metrics_(metrics)
    , cache_(cache.max_entries, std::chrono::milliseconds{cache.ttl_ms})
    , pool_(thread_count) {}

ExecutionEngine::~ExecutionEngine() {
    // Interrupt backoff sleeps and simulated work before the pool joins.
    shutdown_.request_stop();
}

void ExecutionEngine::clear_cache() {
    const size_t dropped = cache_.size();
    cache_.clear();
    if (metrics_) metrics_->record_cache_cleared(dropped);
    logger_.info("Cache cleared (" + std::to_string(dropped) + " entries)");
}

// ─────────────────────────────────────────────
// Plan Execution
// ─────────────────────────────────────────────

ExecutionResult ExecutionEngine::execute_plan(const ExecutionPlan& plan) {
    const auto start = std::chrono::steady_clock::now();

    ExecutionResult result;
    result.plan_id = plan.id;

    logger_.info("Executing plan " + plan.id + " (" + std::to_string(plan.steps.size())
                 + " steps, " + std::to_string(plan.metadata.parallel_group_count) + " groups)");

    size_t parallel_steps = 0;
    try {
        std::map<uint32_t, std::vector<const PlanStep*>> groups;
        for (const auto& step : plan.steps) {
            groups[step.parallel_group].push_back(&step);
        }

        const bool concurrent = plan.optimization.enable_parallel
                             && plan.optimization.max_concurrent_steps > 1;

        Outcomes outcomes;
        for (const auto& [group_id, group] : groups) {
            logger_.debug("Running group " + std::to_string(group_id) + " with "
                          + std::to_string(group.size()) + " steps");

            auto group_results = run_group(plan, group, outcomes);
            if (concurrent && group.size() > 1) parallel_steps += group.size();

            for (auto& step_result : group_results) {
                outcomes[step_result.item] = step_result.success;
                if (metrics_) metrics_->record_step_result(plan.id, step_result);
                result.step_results.push_back(std::move(step_result));
            }
        }
    } catch (const std::exception& e) {
        logger_.error("Plan " + plan.id + " aborted: " + e.what());
        result.success = false;
        result.total_duration = elapsed_since(start);
        result.total_cost = 0.0;
        result.summary = summarize(result.step_results, parallel_steps);
        result.recommendations = {Recommendation{
            "reliability", std::string{"Execution failed: "} + e.what(), Priority::High}};
        if (metrics_) metrics_->record_plan_executed(result);
        return result;
    }

    result.total_duration = elapsed_since(start);
    result.success = std::all_of(result.step_results.begin(), result.step_results.end(),
                                 [](const StepResult& r) { return r.success; });
    result.total_cost = std::accumulate(result.step_results.begin(), result.step_results.end(),
                                        0.0, [](double sum, const StepResult& r) {
                                            return sum + r.cost;
                                        });
    result.summary = summarize(result.step_results, parallel_steps);
    result.recommendations = recommend(plan, result);

    logger_.info("Plan " + plan.id + (result.success ? " succeeded" : " failed")
                 + " in " + format_ms(result.total_duration));
    if (metrics_) metrics_->record_plan_executed(result);
    return result;
}

std::vector<StepResult> ExecutionEngine::run_group(const ExecutionPlan& plan,
                                                   const std::vector<const PlanStep*>& group,
                                                   const Outcomes& outcomes) {
    std::vector<StepResult> results;
    results.reserve(group.size());

    const bool concurrent = plan.optimization.enable_parallel && group.size() > 1;
    if (!concurrent) {
        for (const auto* step : group) {
            results.push_back(execute_step(plan, *step, outcomes, shutdown_.get_token()));
        }
        return results;
    }

    const auto limit = static_cast<std::ptrdiff_t>(
        std::max<uint32_t>(plan.optimization.max_concurrent_steps, 1));
    std::counting_semaphore<> slots(limit);
    std::vector<std::future<StepResult>> futures;
    futures.reserve(group.size());

    auto wait_all = [&futures] {
        for (auto& f : futures) {
            if (f.valid()) f.wait();
        }
    };

    try {
        for (const auto* step : group) {
            slots.acquire();
            try {
                futures.push_back(pool_.submit([this, &plan, step, &outcomes, &slots] {
                    SlotRelease release(slots);
                    return execute_step(plan, *step, outcomes, shutdown_.get_token());
                }));
            } catch (...) {
                slots.release();
                throw;
            }
        }
    } catch (...) {
        // Tasks already queued reference this frame.
        wait_all();
        throw;
    }

    wait_all();
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    return results;
}

// ─────────────────────────────────────────────
// Step Execution
// ─────────────────────────────────────────────

StepResult ExecutionEngine::execute_step(const ExecutionPlan& plan,
                                         const PlanStep& step,
                                         const Outcomes& outcomes,
                                         std::stop_token stop) {
    try {
        return run_step(plan, step, outcomes, stop);
    } catch (const std::exception& e) {
        logger_.error("Step " + step.item + " faulted: " + e.what());
        StepResult result;
        result.step_id = step.step_id;
        result.item = step.item;
        result.error = Error::permanent("Step " + step.item + " failed: " + e.what());
        return result;
    }
}

StepResult ExecutionEngine::run_step(const ExecutionPlan& plan,
                                     const PlanStep& step,
                                     const Outcomes& outcomes,
                                     std::stop_token stop) {
    StepResult result;
    result.step_id = step.step_id;
    result.item = step.item;

    // ── Cascade ──
    if (plan.optimization.dependency_failure == DependencyFailurePolicy::Skip) {
        for (const auto& dep : step.dependencies) {
            auto it = outcomes.find(dep);
            if (it != outcomes.end() && !it->second) {
                result.skipped = true;
                result.error = Error{ErrorCode::Permanent, "dependency failed: " + dep};
                logger_.warn("Skipping " + step.item + ": dependency " + dep + " failed");
                return result;
            }
        }
    }

    auto def = registry_.get(step.item);
    if (!def) {
        result.error = Error{ErrorCode::ItemNotFound, "Item not found: " + step.item};
        return result;
    }

    // ── Cache ──
    const bool use_cache = plan.optimization.enable_caching && def->cache_enabled;
    const std::string key = use_cache ? ResultCache::make_key(step.item, step.input) : std::string{};

    if (use_cache) {
        if (auto entry = cache_.lookup(key)) {
            result.success = true;
            result.duration = cache_hit_duration_;
            result.output = std::move(entry->output);
            result.cache_hit = true;
            logger_.debug("Cache hit for " + step.item);
            return result;
        }
    }

    // ── Invoke with retry ──
    const auto start = std::chrono::steady_clock::now();
    uint32_t attempt = 0;

    while (true) {
        auto outcome = invoke(step, stop);

        if (outcome) {
            result.success = true;
            result.duration = elapsed_since(start);
            result.cost = def->cost_per_execution;
            result.output = std::move(*outcome);
            result.retry_count = attempt;

            if (use_cache) {
                cache_.store(CacheEntry{
                    .key = key,
                    .item = step.item,
                    .output = result.output,
                    .created_at = std::chrono::system_clock::now(),
                    .observed_duration = result.duration,
                    .hit_count = 0
                });
            }
            tracker_.update_profile(step.item, result.duration, result.cost, true);
            return result;
        }

        Error error = outcome.error();
        const bool retryable = error.is_transient() && step.retry.triggers_on(error.condition);

        if (retryable && attempt < step.retry.max_retries) {
            ++attempt;
            logger_.debug("Retrying " + step.item + " (attempt " + std::to_string(attempt + 1)
                          + "): " + error.message);
            if (sleep_interruptible(step.retry.backoff * attempt, stop)) continue;
            error = Error::transient(std::string{kConditionTimeout},
                                     "Retry of " + step.item + " interrupted by shutdown");
        }

        result.success = false;
        result.duration = elapsed_since(start);
        result.retry_count = attempt;
        logger_.warn("Step " + step.item + " failed after " + std::to_string(attempt)
                     + " retries: " + error.message);
        result.error = std::move(error);
        tracker_.update_profile(step.item, result.duration, 0.0, false);
        return result;
    }
}

Result<Payload> ExecutionEngine::invoke(const PlanStep& step, std::stop_token stop) {
    try {
        return executor_.invoke(step.item, step.input, stop);
    } catch (const std::exception& e) {
        return Error::permanent("Executor threw for " + step.item + ": " + e.what());
    }
}

// ─────────────────────────────────────────────
// Summary & Recommendations
// ─────────────────────────────────────────────

ExecutionSummary ExecutionEngine::summarize(const std::vector<StepResult>& results,
                                            size_t parallel_steps) {
    ExecutionSummary summary;
    summary.parallel_steps = parallel_steps;

    Duration total{0};
    for (const auto& r : results) {
        total += r.duration;
        if (r.cache_hit) ++summary.cache_hits;
        if (r.skipped) ++summary.cascaded_steps;
        if (r.success && r.output.is_null()) ++summary.skipped_steps;
    }
    if (results.empty()) return summary;

    const double mean_us = static_cast<double>(total.count()) / static_cast<double>(results.size());
    for (const auto& r : results) {
        if (static_cast<double>(r.duration.count()) > mean_us * kSlowFactor) {
            summary.bottlenecks.push_back(Bottleneck{
                r.item, Bottleneck::Kind::SlowExecution, r.duration, r.retry_count});
        }
        if (r.retry_count > 0) {
            summary.bottlenecks.push_back(Bottleneck{
                r.item, Bottleneck::Kind::Retries, r.duration, r.retry_count});
        }
    }
    return summary;
}

std::vector<Recommendation> ExecutionEngine::recommend(const ExecutionPlan& plan,
                                                       const ExecutionResult& result) const {
    std::vector<Recommendation> out;

    const Duration target = plan.optimization.target_duration;
    if (result.total_duration > target) {
        out.push_back({"performance",
                       "Execution took " + format_ms(result.total_duration)
                           + ", exceeding the target of " + format_ms(target)
                           + "; enable parallel execution or caching",
                       Priority::Medium});
    }

    const double cost_limit = plan.constraints.max_cost.value_or(config_.cost_threshold);
    if (result.total_cost > cost_limit) {
        std::ostringstream oss;
        oss << "Execution cost " << result.total_cost << " exceeds " << cost_limit
            << "; consider cheaper items or caching";
        out.push_back({"cost", oss.str(), Priority::Medium});
    }

    const auto failed = std::count_if(result.step_results.begin(), result.step_results.end(),
                                      [](const StepResult& r) { return !r.success; });
    if (failed > 0) {
        out.push_back({"reliability",
                       std::to_string(failed) + " steps failed; review error handling and fallbacks",
                       Priority::High});
    }

    if (!result.step_results.empty()) {
        uint64_t retries = 0;
        for (const auto& r : result.step_results) retries += r.retry_count;
        const double rate = static_cast<double>(retries)
                          / static_cast<double>(result.step_results.size());
        if (rate > kRetryRateLimit) {
            out.push_back({"reliability",
                           "High retry rate (" + std::to_string(retries)
                               + " retries); investigate unstable items",
                           Priority::High});
        }
    }
    return out;
}

}  // namespace tool_chain

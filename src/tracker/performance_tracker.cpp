/**
 * @file performance_tracker.cpp
 * @brief PerformanceTracker implementation.
 */

#include "tracker/performance_tracker.hpp"

#include <algorithm>
#include <map>

namespace tool_chain {

namespace {

double percent_change(double older, double newer) {
    if (older == 0.0) return 0.0;
    return (older - newer) / older * 100.0;
}

}  // namespace

PerformanceTracker::PerformanceTracker(size_t history_capacity, bool learning_enabled)
    : history_capacity_(history_capacity == 0 ? 1 : history_capacity)
    , learning_enabled_(learning_enabled) {}

// ─────────────────────────────────────────────
// Profiles
// ─────────────────────────────────────────────

void PerformanceTracker::initialize_profile(const ItemDefinition& definition) {
    PerformanceProfile profile{
        .item = definition.name,
        .avg_duration = definition.estimated_duration,
        .avg_cost = definition.cost_per_execution,
        .success_rate = definition.reliability,
        .sample_count = 0
    };

    std::lock_guard lock(mutex_);
    baselines_[definition.name] = profile;
    profiles_[definition.name] = std::move(profile);
}

void PerformanceTracker::update_profile(const ItemName& item, Duration duration,
                                        double cost, bool success) {
    if (!learning_enabled_) return;

    std::lock_guard lock(mutex_);
    // Items registered without declared estimates start from their first sample.
    auto& p = profiles_.try_emplace(item, PerformanceProfile{.item = item}).first->second;
    p.sample_count += 1;
    const double weight = 1.0 / static_cast<double>(p.sample_count);

    const double avg_us = static_cast<double>(p.avg_duration.count()) * (1.0 - weight)
                        + static_cast<double>(duration.count()) * weight;
    p.avg_duration = Duration{static_cast<int64_t>(avg_us)};
    p.avg_cost = p.avg_cost * (1.0 - weight) + cost * weight;
    p.success_rate = p.success_rate * (1.0 - weight) + (success ? 1.0 : 0.0) * weight;
}

std::optional<PerformanceProfile> PerformanceTracker::profile(const ItemName& item) const {
    std::lock_guard lock(mutex_);
    auto it = profiles_.find(item);
    if (it == profiles_.end()) return std::nullopt;
    return it->second;
}

std::vector<PerformanceProfile> PerformanceTracker::profiles() const {
    std::lock_guard lock(mutex_);
    std::vector<PerformanceProfile> out;
    out.reserve(profiles_.size());
    for (const auto& [_, p] : profiles_) {
        out.push_back(p);
    }
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.item < b.item; });
    return out;
}

double PerformanceTracker::success_rate_or(const ItemName& item, double fallback) const {
    std::lock_guard lock(mutex_);
    auto it = profiles_.find(item);
    if (it == profiles_.end() || it->second.sample_count == 0) return fallback;
    return it->second.success_rate;
}

std::vector<ItemName> PerformanceTracker::find_unreliable(double threshold) const {
    std::vector<ItemName> out;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [name, p] : profiles_) {
            if (p.success_rate < threshold) out.push_back(name);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

// ─────────────────────────────────────────────
// History
// ─────────────────────────────────────────────

void PerformanceTracker::record_execution(const PlanId& plan_id, const ExecutionResult& result) {
    std::lock_guard lock(mutex_);
    history_.push_back(ExecutionRecord{
        .plan_id = plan_id,
        .timestamp = std::chrono::system_clock::now(),
        .result = result
    });
    while (history_.size() > history_capacity_) {
        history_.pop_front();
    }
}

std::vector<ExecutionRecord> PerformanceTracker::history() const {
    std::lock_guard lock(mutex_);
    return {history_.begin(), history_.end()};
}

size_t PerformanceTracker::history_size() const {
    std::lock_guard lock(mutex_);
    return history_.size();
}

// ─────────────────────────────────────────────
// Analysis
// ─────────────────────────────────────────────

PerformanceReport PerformanceTracker::metrics() const {
    std::lock_guard lock(mutex_);
    PerformanceReport report;
    if (history_.empty()) return report;

    report.total_executions = history_.size();
    const auto n = static_cast<double>(history_.size());

    int64_t duration_sum = 0;
    double total_cost = 0.0;
    size_t total_steps = 0;
    size_t parallel_steps = 0;
    size_t cache_hits = 0;
    size_t failed = 0;

    struct ItemTime {
        int64_t total_us{0};
        size_t count{0};
    };
    std::map<ItemName, ItemTime> per_item;

    for (const auto& record : history_) {
        const auto& r = record.result;
        duration_sum += r.total_duration.count();
        total_cost += r.total_cost;
        total_steps += r.step_results.size();
        parallel_steps += r.summary.parallel_steps;
        cache_hits += r.summary.cache_hits;
        if (!r.success) ++failed;

        for (const auto& step : r.step_results) {
            auto& t = per_item[step.item];
            t.total_us += step.duration.count();
            t.count += 1;
        }
    }

    report.average_duration = Duration{static_cast<int64_t>(static_cast<double>(duration_sum) / n)};
    if (total_steps > 0) {
        report.parallelism_rate = static_cast<double>(parallel_steps)
                                / static_cast<double>(total_steps) * 100.0;
        report.cache_hit_rate = static_cast<double>(cache_hits)
                              / static_cast<double>(total_steps) * 100.0;
    }
    report.error_rate = static_cast<double>(failed) / n * 100.0;

    const auto successful = static_cast<double>(history_.size() - failed);
    report.cost_efficiency = total_cost > 0.0 ? successful / total_cost : 0.0;

    // Rank items by total time impact: mean duration × frequency.
    for (const auto& [item, t] : per_item) {
        Duration mean{t.total_us / static_cast<int64_t>(t.count)};
        report.bottleneck_items.push_back(BottleneckItem{
            .item = item,
            .average_duration = mean,
            .frequency = t.count,
            .total_impact = mean * static_cast<int64_t>(t.count)
        });
    }
    std::stable_sort(report.bottleneck_items.begin(), report.bottleneck_items.end(),
                     [](const auto& a, const auto& b) { return a.total_impact > b.total_impact; });
    if (report.bottleneck_items.size() > kTopBottlenecks) {
        report.bottleneck_items.resize(kTopBottlenecks);
    }

    report.trends = compute_trends(history_);
    return report;
}

TrendAnalysis PerformanceTracker::compute_trends(const std::deque<ExecutionRecord>& history) {
    TrendAnalysis trends;
    const size_t half = history.size() / 2;
    if (half == 0 || half == history.size()) return trends;

    struct Window {
        double duration{0.0};
        double cost{0.0};
        double success{0.0};
    };

    auto average = [&](size_t begin, size_t end) {
        Window w;
        for (size_t i = begin; i < end; ++i) {
            const auto& r = history[i].result;
            w.duration += static_cast<double>(r.total_duration.count());
            w.cost += r.total_cost;
            w.success += r.success ? 1.0 : 0.0;
        }
        const auto count = static_cast<double>(end - begin);
        w.duration /= count;
        w.cost /= count;
        w.success /= count;
        return w;
    };

    const auto older = average(0, half);
    const auto newer = average(half, history.size());

    trends.performance_improvement = percent_change(older.duration, newer.duration);
    trends.cost_reduction = percent_change(older.cost, newer.cost);
    // Success rate improves upwards, so the sign is reversed.
    trends.reliability_improvement = -percent_change(older.success, newer.success);
    return trends;
}

nlohmann::json PerformanceTracker::export_json() const {
    auto report = metrics();

    nlohmann::json doc;
    doc["profiles"] = nlohmann::json::array();
    for (const auto& p : profiles()) {
        doc["profiles"].push_back({
            {"item", p.item},
            {"avg_duration_ms", to_ms(p.avg_duration)},
            {"avg_cost", p.avg_cost},
            {"success_rate", p.success_rate},
            {"samples", p.sample_count}
        });
    }

    doc["history"] = nlohmann::json::array();
    for (const auto& record : history()) {
        doc["history"].push_back({
            {"plan_id", record.plan_id},
            {"timestamp_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                                 record.timestamp.time_since_epoch()).count()},
            {"success", record.result.success},
            {"duration_ms", to_ms(record.result.total_duration)},
            {"cost", record.result.total_cost},
            {"steps", record.result.step_results.size()}
        });
    }

    nlohmann::json bottlenecks = nlohmann::json::array();
    for (const auto& b : report.bottleneck_items) {
        bottlenecks.push_back({
            {"item", b.item},
            {"average_duration_ms", to_ms(b.average_duration)},
            {"frequency", b.frequency}
        });
    }

    doc["metrics"] = {
        {"total_executions", report.total_executions},
        {"average_duration_ms", to_ms(report.average_duration)},
        {"parallelism_rate", report.parallelism_rate},
        {"cache_hit_rate", report.cache_hit_rate},
        {"error_rate", report.error_rate},
        {"cost_efficiency", report.cost_efficiency},
        {"bottleneck_items", bottlenecks},
        {"trends", {
            {"performance_improvement", report.trends.performance_improvement},
            {"cost_reduction", report.trends.cost_reduction},
            {"reliability_improvement", report.trends.reliability_improvement}
        }}
    };
    return doc;
}

void PerformanceTracker::clear() {
    std::lock_guard lock(mutex_);
    history_.clear();
    profiles_ = baselines_;
}

}  // namespace tool_chain

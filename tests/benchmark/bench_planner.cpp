/**
 * @file bench_planner.cpp
 * @brief Performance benchmarks for planning and execution overhead.
 *
 * Measures dependency resolution, plan construction, cache lookups and
 * per-step engine overhead with a zero-latency simulated executor.
 *
 * Usage: ./bench_planner [--csv]
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/execution_engine.hpp"
#include "engine/result_cache.hpp"
#include "executor/simulated_executor.hpp"
#include "executor/thread_pool.hpp"
#include "planner/dependency_graph.hpp"
#include "planner/plan_optimizer.hpp"
#include "registry/item_registry.hpp"
#include "telemetry/json_sink.hpp"
#include "tracker/performance_tracker.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace tool_chain;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

/// n items in a chain: item_i depends on item_{i-1}.
bool register_chain(ItemRegistry& registry, PerformanceTracker& tracker, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        ItemDefinition def;
        def.name = "chain_" + std::to_string(i);
        if (i > 0) def.dependencies.push_back("chain_" + std::to_string(i - 1));
        def.reliability = 1.0;
        if (!registry.register_item(def)) return false;
        tracker.initialize_profile(def);
    }
    return true;
}

/// width independent roots feeding one sink.
bool register_fan_in(ItemRegistry& registry, PerformanceTracker& tracker, size_t width) {
    ItemDefinition sink;
    sink.name = "fan_sink";
    sink.reliability = 1.0;
    for (size_t i = 0; i < width; ++i) {
        ItemDefinition def;
        def.name = "fan_" + std::to_string(i);
        def.reliability = 1.0;
        if (!registry.register_item(def)) return false;
        tracker.initialize_profile(def);
        sink.dependencies.push_back(def.name);
    }
    if (!registry.register_item(sink)) return false;
    tracker.initialize_profile(sink);
    return true;
}

std::vector<ItemRequest> requests_for(std::vector<ItemName> names) {
    std::vector<ItemRequest> out;
    for (auto& n : names) out.push_back(ItemRequest{std::move(n), Payload::object()});
    return out;
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_graph() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    for (size_t n : {10, 50, 200}) {
        ItemRegistry registry;
        PerformanceTracker tracker;
        if (!register_chain(registry, tracker, n)) continue;
        auto requests = requests_for({"chain_" + std::to_string(n - 1)});

        R.push_back(run_bench("build_graph_chain(" + std::to_string(n) + ")", "Dependency Graph", N,
            [&]{ auto g = build_dependency_graph(requests, registry); (void)g; },
            std::to_string(n) + " items"));

        auto graph = build_dependency_graph(requests, registry);
        if (!graph) continue;
        R.push_back(run_bench("leveled_order_chain(" + std::to_string(n) + ")", "Dependency Graph", N,
            [&]{ auto o = graph->leveled_order(); (void)o; }, std::to_string(n) + " items"));
        R.push_back(run_bench("has_cycle_chain(" + std::to_string(n) + ")", "Dependency Graph", N,
            [&]{ auto c = graph->has_cycle(); (void)c; }, std::to_string(n) + " items"));
    }

    return R;
}

std::vector<BenchResult> bench_planning() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    for (size_t width : {8, 64}) {
        ItemRegistry registry;
        PerformanceTracker tracker;
        if (!register_fan_in(registry, tracker, width)) continue;
        PlanOptimizer optimizer(registry, tracker, PlannerConfig{}, EngineConfig{});

        PlanRequest request;
        request.name = "bench";
        request.items = requests_for({"fan_sink"});
        auto label = std::to_string(width + 1) + " items, 2 groups";

        R.push_back(run_bench("create_plan_fan_in(" + std::to_string(width) + ")", "Planning", N,
            [&]{ auto p = optimizer.create_plan(request); (void)p; }, label));

        auto plan = optimizer.create_plan(request);
        if (!plan) continue;
        R.push_back(run_bench("suggest_fan_in(" + std::to_string(width) + ")", "Planning", N,
            [&]{ auto s = optimizer.suggest_optimizations(*plan); (void)s; }, label));
    }

    return R;
}

std::vector<BenchResult> bench_cache() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    ResultCache cache(1024);
    Payload input{{"query", "benchmark"}, {"limit", 10}};
    const auto key = ResultCache::make_key("item", input);
    cache.store(CacheEntry{.key = key, .item = "item", .output = Payload{{"ok", true}},
                           .created_at = std::chrono::system_clock::now(),
                           .observed_duration = from_ms(1), .hit_count = 0});

    R.push_back(run_bench("make_key", "Cache", N,
        [&]{ auto k = ResultCache::make_key("item", input); (void)k; }));
    R.push_back(run_bench("lookup_hit", "Cache", N,
        [&]{ auto e = cache.lookup(key); (void)e; }));
    R.push_back(run_bench("lookup_miss", "Cache", N,
        [&]{ auto e = cache.lookup("missing"); (void)e; }));

    return R;
}

std::vector<BenchResult> bench_engine() {
    std::vector<BenchResult> R;
    constexpr size_t N = 100;

    ItemRegistry registry;
    PerformanceTracker tracker;
    if (!register_fan_in(registry, tracker, 16)) return R;
    SimulatedExecutor executor(registry, 42, 0.0);
    Logger logger(std::make_unique<NullSink>(), LogLevel::Error);

    PlanOptimizer optimizer(registry, tracker, PlannerConfig{}, EngineConfig{});
    PlanRequest request;
    request.name = "bench";
    request.items = requests_for({"fan_sink"});
    auto plan = optimizer.create_plan(request);
    if (!plan) return R;

    ExecutionEngine engine(registry, tracker, executor, EngineConfig{}, CacheConfig{}, 4, logger);
    R.push_back(run_bench("execute_plan_fan_in(16)", "Engine", N,
        [&]{ auto r = engine.execute_plan(*plan); (void)r; }, "17 steps, 0 latency"));

    ThreadPool pool(4);
    R.push_back(run_bench("threadpool_submit", "Engine", N * 5, [&]{
        auto f = pool.submit([]{ return 1; });
        f.wait();
    }));

    return R;
}

// ─────────────────────────────────────────────
// Main
// ─────────────────────────────────────────────

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  ToolChainOptimizer Performance Benchmarks\n"
                  << "  " << std::string(42, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_graph());
    append(bench_planning());
    append(bench_cache());
    append(bench_engine());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}

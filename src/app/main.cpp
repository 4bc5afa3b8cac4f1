/**
 * @file main.cpp
 * @brief toolchain_optimizer entry point.
 *
 * Wires all modules into a complete planning pipeline:
 *   Config → Logger → Registry → Planner → Engine → Tracker → Telemetry
 */

#include "coordinator/coordinator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "telemetry/json_sink.hpp"

#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace tool_chain;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║        ToolChainOptimizer v1.0.0          ║
  ║   Dependency-aware planning and           ║
  ║   execution of tool chains                ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path catalog_path;
    std::string log_dir;
    std::vector<std::string> items;
    uint32_t runs = 1;
    bool demo_mode = false;
    bool export_json = false;
};

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream iss(text);
    std::string token;
    while (std::getline(iss, token, ',')) {
        if (!token.empty()) out.push_back(token);
    }
    return out;
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--catalog" && i + 1 < argc) {
            args.catalog_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--items" && i + 1 < argc) {
            args.items = split_list(argv[++i]);
        } else if (arg == "--runs" && i + 1 < argc) {
            args.runs = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--json") {
            args.export_json = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: toolchain_optimizer [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --catalog <path>   TOML item catalog to register\n"
                      << "  --log-dir <path>   Log output directory\n"
                      << "  --items a,b,c      Items to plan (default: the built-in workflow)\n"
                      << "  --runs <n>         Execute the plan n times (default: 1)\n"
                      << "  --json             Print the performance export as JSON\n"
                      << "  --demo             Run the built-in demo, then exit\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

void print_plan(const ExecutionPlan& plan) {
    std::cout << "Plan " << plan.id << " (" << plan.steps.size() << " steps, "
              << plan.metadata.parallel_group_count << " groups)\n";
    for (const auto& step : plan.steps) {
        std::cout << "  [group " << step.parallel_group << "] " << step.item
                  << "  retries=" << step.retry.max_retries;
        if (!step.dependencies.empty()) {
            std::cout << "  after:";
            for (const auto& dep : step.dependencies) std::cout << ' ' << dep;
        }
        std::cout << '\n';
    }
    std::cout << "  estimated " << to_ms(plan.metadata.estimated_duration) << " ms, cost "
              << plan.metadata.estimated_cost << ", timeout "
              << to_ms(plan.metadata.optimal_timeout) << " ms\n";
}

void print_suggestions(const std::vector<OptimizationSuggestion>& suggestions) {
    if (suggestions.empty()) return;
    std::cout << "Suggestions:\n";
    for (const auto& s : suggestions) {
        std::cout << "  [" << to_string(s.type) << ", " << s.difficulty << "] "
                  << s.message << " (score " << std::fixed << std::setprecision(1)
                  << s.impact.score() << ")\n";
    }
    std::cout.unsetf(std::ios::fixed);
}

void print_result(const ExecutionResult& result) {
    std::cout << "Execution " << (result.success ? "succeeded" : "failed")
              << " in " << to_ms(result.total_duration) << " ms, cost " << result.total_cost
              << "\n";
    for (const auto& step : result.step_results) {
        std::cout << "  " << std::left << std::setw(20) << step.item << std::right
                  << (step.success ? "ok    " : (step.skipped ? "skip  " : "FAIL  "))
                  << to_ms(step.duration) << " ms";
        if (step.cache_hit) std::cout << "  (cached)";
        if (step.retry_count > 0) std::cout << "  retries=" << step.retry_count;
        if (step.error) std::cout << "  " << step.error->message;
        std::cout << '\n';
    }
    for (const auto& b : result.summary.bottlenecks) {
        std::cout << "  bottleneck: " << b.describe() << '\n';
    }
    for (const auto& r : result.recommendations) {
        std::cout << "  recommend [" << r.type << ", " << to_string(r.priority) << "] "
                  << r.message << '\n';
    }
}

void print_metrics(const Coordinator& coordinator) {
    auto report = coordinator.performance_metrics();
    auto cache = coordinator.cache_stats();
    std::cout << "Metrics: " << report.total_executions << " executions, avg "
              << to_ms(report.average_duration) << " ms, parallelism "
              << report.parallelism_rate << "%, cache hits " << report.cache_hit_rate
              << "%, errors " << report.error_rate << "%\n";
    for (const auto& b : report.bottleneck_items) {
        std::cout << "  slowest: " << b.item << " avg " << to_ms(b.average_duration)
                  << " ms x" << b.frequency << '\n';
    }
    std::cout << "Cache: " << cache.size << " entries, hit rate " << cache.hit_rate
              << ", evictions " << cache.evictions << '\n';
}

/**
 * @brief Run the built-in workflow twice: the second run is served from the cache.
 */
int run_demo(Coordinator& coordinator) {
    auto& logger = coordinator.logger();
    logger.info("=== Demo Mode ===");

    PlanRequest request{
        .name = "demo",
        .description = "Built-in project workflow",
        .items = {
            {"smart_begin", Payload{{"project", "demo"}}},
            {"smart_finish", Payload{{"project", "demo"}}},
            {"smart_orchestrate", Payload{{"goal", "ship"}}},
        },
        .constraints = {}
    };

    auto plan = coordinator.create_plan(request);
    if (!plan) {
        std::cerr << "Plan creation failed: " << plan.error().message << std::endl;
        return 1;
    }
    print_plan(*plan);
    print_suggestions(coordinator.suggest_optimizations(*plan));

    for (int run = 1; run <= 2 && !g_shutdown_requested; ++run) {
        std::cout << "\n── Run " << run << " ──\n";
        print_result(coordinator.execute_plan(*plan));
    }

    std::cout << '\n';
    print_metrics(coordinator);
    logger.info("=== Demo Complete ===");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.catalog_path.empty()) config.catalog.path = args.catalog_path;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logging ───────────────────
    Coordinator::Options options;
    if (!config.telemetry.log_dir.empty()) {
        options.log_sink = std::make_unique<JsonFileSink>(
            config.telemetry.log_dir, "toolchain_optimizer",
            config.telemetry.max_file_size_mb, config.telemetry.rotate_count);
        options.metrics_sink = std::make_unique<JsonFileSink>(
            config.telemetry.log_dir, "metrics",
            config.telemetry.max_file_size_mb, config.telemetry.rotate_count);
    } else {
        options.log_sink = std::make_unique<StdoutSink>();
    }
    options.log_level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    options.config = config;

    Coordinator coordinator(std::move(options));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (auto loaded = coordinator.load_items(); !loaded) {
        std::cerr << "Failed to register items: " << loaded.error().message << std::endl;
        return 1;
    }

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        return run_demo(coordinator);
    }

    // ── Plan ─────────────────────────────────
    PlanRequest request;
    request.name = "cli";
    auto names = args.items.empty() ? coordinator.registry().names() : args.items;
    for (const auto& name : names) {
        request.items.push_back(ItemRequest{name, Payload::object()});
    }

    auto plan = coordinator.create_plan(request);
    if (!plan) {
        std::cerr << "Plan creation failed: " << plan.error().message << std::endl;
        return 1;
    }
    print_plan(*plan);
    print_suggestions(coordinator.suggest_optimizations(*plan));

    // ── Execute ──────────────────────────────
    bool all_succeeded = true;
    for (uint32_t run = 1; run <= args.runs && !g_shutdown_requested; ++run) {
        std::cout << "\n── Run " << run << " of " << args.runs << " ──\n";
        auto result = coordinator.execute_plan(*plan);
        print_result(result);
        all_succeeded = all_succeeded && result.success;
    }

    std::cout << '\n';
    print_metrics(coordinator);
    if (args.export_json) {
        std::cout << coordinator.tracker().export_json().dump(2) << std::endl;
    }

    return all_succeeded ? 0 : 2;
}

/**
 * @file coordinator.cpp
 * @brief Coordinator implementation.
 */

#include "coordinator/coordinator.hpp"

#include "executor/dispatch_executor.hpp"
#include "executor/simulated_executor.hpp"
#include "registry/catalog.hpp"
#include "telemetry/json_sink.hpp"

namespace tool_chain {

namespace {

std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

}  // anonymous namespace

std::unique_ptr<IItemExecutor> make_executor(const ExecutorConfig& config,
                                             const ItemRegistry& registry) {
    if (config.kind == "dispatch") {
        return std::make_unique<DispatchExecutor>();
    }
    return std::make_unique<SimulatedExecutor>(registry, config.seed, config.time_scale);
}

Coordinator::Coordinator(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_null_sink(std::move(opts.log_sink)), opts.log_level)
    , engine_log_(logger_.child("engine"))
    , metrics_(or_null_sink(std::move(opts.metrics_sink)))
    , registry_(opts.registry ? std::move(opts.registry)
                              : std::make_shared<ItemRegistry>(config_.planner.strict_registration))
    , tracker_(opts.tracker ? std::move(opts.tracker)
                            : std::make_shared<PerformanceTracker>(
                                  config_.tracker.history_capacity,
                                  config_.engine.learning_enabled))
    , executor_(opts.executor ? std::move(opts.executor)
                              : make_executor(config_.executor, *registry_))
    , planner_(*registry_, *tracker_, config_.planner, config_.engine)
    , engine_(*registry_, *tracker_, *executor_, config_.engine, config_.cache,
              config_.executor.thread_count, engine_log_, &metrics_) {
    logger_.info("Coordinator ready: executor=" + std::string{executor_->name()}
                 + " max_concurrent=" + std::to_string(config_.engine.max_concurrent_steps)
                 + " cache=" + (config_.engine.cache_enabled ? "on" : "off"));
}

Coordinator::~Coordinator() {
    metrics_.flush();
    logger_.flush();
}

Result<void> Coordinator::load_items() {
    if (config_.catalog.builtin) {
        for (const auto& def : builtin_catalog()) {
            if (auto r = register_item(def); !r) return r;
        }
    }

    if (!config_.catalog.path.empty()) {
        auto items = load_catalog(config_.catalog.path).map_error([](Error e) {
            e.message = "catalog: " + e.message;
            return e;
        });
        if (!items) {
            logger_.error(items.error().message);
            return items.error();
        }
        for (const auto& def : *items) {
            if (auto r = register_item(def); !r) return r;
        }
        logger_.info("Loaded " + std::to_string(items->size()) + " items from "
                     + config_.catalog.path.string());
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Registry
// ─────────────────────────────────────────────

Result<void> Coordinator::register_item(const ItemDefinition& definition) {
    auto result = registry_->register_item(definition);
    if (!result) {
        logger_.warn("Registration of " + definition.name + " rejected: "
                     + result.error().message);
        return result;
    }
    tracker_->initialize_profile(definition);
    logger_.debug("Registered item " + definition.name + " (" + std::string{to_string(definition.category)}
                  + ", v" + definition.version + ")");
    return result;
}

// ─────────────────────────────────────────────
// Planning & Execution
// ─────────────────────────────────────────────

Result<ExecutionPlan> Coordinator::create_plan(const PlanRequest& request) {
    auto plan = planner_.create_plan(request);
    if (!plan) {
        logger_.error("Plan creation failed: " + plan.error().message);
        return plan;
    }

    logger_.info("Created plan " + plan->id + " with " + std::to_string(plan->steps.size())
                 + " steps in " + std::to_string(plan->metadata.parallel_group_count) + " groups");
    metrics_.record_plan_created(*plan);
    return plan;
}

std::vector<OptimizationSuggestion>
Coordinator::suggest_optimizations(const ExecutionPlan& plan) const {
    return planner_.suggest_optimizations(plan);
}

ExecutionResult Coordinator::execute_plan(const ExecutionPlan& plan) {
    auto result = engine_.execute_plan(plan);
    tracker_->record_execution(plan.id, result);
    return result;
}

// ─────────────────────────────────────────────
// Metrics & Maintenance
// ─────────────────────────────────────────────

PerformanceReport Coordinator::performance_metrics() const {
    return tracker_->metrics();
}

CacheStats Coordinator::cache_stats() const {
    return engine_.cache_stats();
}

void Coordinator::clear_cache() {
    engine_.clear_cache();
}

void Coordinator::clear_performance_data() {
    tracker_->clear();
    logger_.info("Performance data cleared");
}

void Coordinator::clear_all() {
    clear_cache();
    clear_performance_data();
}

}  // namespace tool_chain

/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/execution_result.hpp"
#include "planner/plan.hpp"

#include <memory>
#include <mutex>

namespace tool_chain {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Event names: plan_created, step_result, plan_executed, cache_cleared
 * and caller-defined custom events.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_plan_created(const ExecutionPlan& plan);
    void record_step_result(const PlanId& plan_id, const StepResult& result);
    void record_plan_executed(const ExecutionResult& result);
    void record_cache_cleared(size_t entries_dropped);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace tool_chain

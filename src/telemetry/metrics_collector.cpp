/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace tool_chain {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_plan_created(const ExecutionPlan& plan) {
    std::ostringstream oss;
    oss << R"({"event":"plan_created")"
        << R"(,"plan":")" << json_escape(plan.id) << "\""
        << R"(,"name":")" << json_escape(plan.name) << "\""
        << R"(,"steps":)" << plan.steps.size()
        << R"(,"groups":)" << plan.metadata.parallel_group_count
        << R"(,"estimated_ms":)" << to_ms(plan.metadata.estimated_duration)
        << R"(,"estimated_cost":)" << plan.metadata.estimated_cost
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_step_result(const PlanId& plan_id, const StepResult& result) {
    std::ostringstream oss;
    oss << R"({"event":"step_result")"
        << R"(,"plan":")" << json_escape(plan_id) << "\""
        << R"(,"step":")" << json_escape(result.step_id) << "\""
        << R"(,"item":")" << json_escape(result.item) << "\""
        << R"(,"success":)" << (result.success ? "true" : "false")
        << R"(,"duration_ms":)" << to_ms(result.duration)
        << R"(,"cost":)" << result.cost
        << R"(,"retries":)" << result.retry_count
        << R"(,"cache_hit":)" << (result.cache_hit ? "true" : "false")
        << R"(,"skipped":)" << (result.skipped ? "true" : "false");
    if (result.error) {
        oss << R"(,"error_code":")" << to_string(result.error->code) << "\""
            << R"(,"error":")" << json_escape(result.error->message) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_plan_executed(const ExecutionResult& result) {
    std::ostringstream oss;
    oss << R"({"event":"plan_executed")"
        << R"(,"plan":")" << json_escape(result.plan_id) << "\""
        << R"(,"success":)" << (result.success ? "true" : "false")
        << R"(,"duration_ms":)" << to_ms(result.total_duration)
        << R"(,"cost":)" << result.total_cost
        << R"(,"steps":)" << result.step_results.size()
        << R"(,"parallel_steps":)" << result.summary.parallel_steps
        << R"(,"cache_hits":)" << result.summary.cache_hits
        << R"(,"cascaded":)" << result.summary.cascaded_steps
        << R"(,"recommendations":)" << result.recommendations.size()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_cache_cleared(size_t entries_dropped) {
    std::ostringstream oss;
    oss << R"({"event":"cache_cleared")"
        << R"(,"entries":)" << entries_dropped
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace tool_chain

/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace agent_orchestrator {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_agent_execution(const AgentName& agent, bool success,
                                              Duration duration, uint32_t attempts,
                                              std::optional<std::string_view> error) {
    std::ostringstream oss;
    oss << R"({"event":"agent_execution")"
        << R"(,"agent":")" << json_escape(agent) << "\""
        << R"(,"success":)" << (success ? "true" : "false")
        << R"(,"duration_ms":)" << duration.count()
        << R"(,"attempts":)" << attempts;
    if (error) {
        oss << R"(,"error":")" << json_escape(*error) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_agent_refused(const AgentName& agent, RefusalReason reason) {
    std::ostringstream oss;
    oss << R"({"event":"agent_refused")"
        << R"(,"agent":")" << json_escape(agent) << "\""
        << R"(,"reason":")" << to_string(reason) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_agent_skipped(const AgentName& agent, std::string_view reason) {
    std::ostringstream oss;
    oss << R"({"event":"agent_skipped")"
        << R"(,"agent":")" << json_escape(agent) << "\""
        << R"(,"reason":")" << json_escape(reason) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_execution_plan(const std::vector<ParallelGroup>& groups,
                                             size_t total_agents) {
    std::ostringstream oss;
    oss << R"({"event":"execution_plan")"
        << R"(,"total_agents":)" << total_agents
        << R"(,"levels":[)";
    for (size_t i = 0; i < groups.size(); ++i) {
        if (i > 0) oss << ",";
        oss << R"({"level":)" << groups[i].level << R"(,"agents":[)";
        for (size_t j = 0; j < groups[i].agents.size(); ++j) {
            if (j > 0) oss << ",";
            oss << "\"" << json_escape(groups[i].agents[j]) << "\"";
        }
        oss << "]}";
    }
    oss << "]}";
    emit(oss.str());
}

void MetricsCollector::record_orchestration_complete(bool success, size_t executed,
                                                     size_t failed, size_t skipped,
                                                     Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"orchestration_complete")"
        << R"(,"success":)" << (success ? "true" : "false")
        << R"(,"executed":)" << executed
        << R"(,"failed":)" << failed
        << R"(,"skipped":)" << skipped
        << R"(,"duration_ms":)" << duration.count()
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
    ++events_;
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

uint64_t MetricsCollector::events_recorded() const {
    std::lock_guard lock(write_mutex_);
    return events_;
}

}  // namespace agent_orchestrator

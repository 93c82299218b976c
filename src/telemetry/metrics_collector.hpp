/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "graph/dependency_graph.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * One line per event, e.g.
 * {"event":"agent_execution","agent":"docs","success":true,"duration_ms":12,"attempts":1}
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_agent_execution(const AgentName& agent, bool success, Duration duration,
                                uint32_t attempts,
                                std::optional<std::string_view> error = std::nullopt);
    void record_agent_refused(const AgentName& agent, RefusalReason reason);
    void record_agent_skipped(const AgentName& agent, std::string_view reason);
    void record_execution_plan(const std::vector<ParallelGroup>& groups, size_t total_agents);
    void record_orchestration_complete(bool success, size_t executed, size_t failed,
                                       size_t skipped, Duration duration);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

    [[nodiscard]] uint64_t events_recorded() const;

private:
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    uint64_t events_{0};

    void emit(std::string_view json_line);
};

}  // namespace agent_orchestrator

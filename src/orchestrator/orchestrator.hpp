/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade tying graph, pool and telemetry together.
 *
 * Provides a single entry point for:
 *   1. Registering an agent's operation, invocation policy and dependencies
 *   2. Turning changed inputs into a level-grouped execution plan
 *   3. Running that plan level by level with bounded concurrency
 *
 * The graph and the pool are owned by the embedding application and
 * injected by reference; the orchestrator serializes its own use of the
 * graph and leaves the pool to guard itself.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/invocable.hpp"
#include "graph/dependency_graph.hpp"
#include "pool/agent_pool.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief Agents selected for one run, grouped by dependency level.
 */
struct ExecutionPlan {
    std::vector<AgentName> affected_agents;   ///< In execution order
    std::vector<ParallelGroup> groups;        ///< Ascending level, empty groups dropped
    size_t total_agents = 0;
};

enum class RunOutcome : uint8_t {
    Succeeded,
    Failed,
    Skipped
};

[[nodiscard]] constexpr std::string_view to_string(RunOutcome outcome) noexcept {
    switch (outcome) {
        case RunOutcome::Succeeded: return "succeeded";
        case RunOutcome::Failed:    return "failed";
        case RunOutcome::Skipped:   return "skipped";
    }
    return "unknown";
}

/**
 * @brief What happened to one agent of the plan.
 */
struct AgentRunResult {
    RunOutcome outcome = RunOutcome::Skipped;
    Duration duration{0};
    uint32_t attempts = 0;
    std::optional<AgentOutput> output;
    std::optional<std::string> error;         ///< Failure message or skip reason
    std::optional<RefusalReason> refusal;     ///< Set when the pool refused to start it
};

struct OrchestrationResult {
    bool success = false;                     ///< Every attempted agent succeeded
    bool stopped = false;                     ///< request_stop() cut the run short
    Duration duration{0};
    size_t agents_executed = 0;
    size_t agents_failed = 0;
    size_t agents_skipped = 0;
    std::map<AgentName, AgentRunResult> per_agent_results;
};

struct OrchestratorStatus {
    bool is_executing = false;
    std::vector<AgentName> currently_running;
    std::vector<AgentName> completed_agents;
    std::vector<AgentName> registered_agents;
};

/// Named precondition evaluated before any agent of a run starts.
using PreExecutionCheck = std::function<Result<void>()>;

/**
 * @brief Runs execution plans over an injected graph and pool.
 *
 * Only one execute() may be in flight; a concurrent call fails fast.
 */
class Orchestrator {
public:
    Orchestrator(DependencyGraph& graph,
                 AgentPool& pool,
                 const Logger& logger,
                 OrchestratorConfig config = {},
                 MetricsCollector* metrics = nullptr);

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Registration ─────────────────────────
    Result<void> register_agent(const AgentName& name,
                                std::shared_ptr<IInvocable> operation,
                                const std::vector<AgentName>& dependencies = {},
                                const AgentConfigOverrides& overrides = {});

    template <AgentOperation F>
    Result<void> register_agent(const AgentName& name,
                                F&& operation,
                                const std::vector<AgentName>& dependencies = {},
                                const AgentConfigOverrides& overrides = {}) {
        return register_agent(name, make_invocable(std::forward<F>(operation)),
                              dependencies, overrides);
    }

    bool unregister_agent(const AgentName& name);
    [[nodiscard]] std::vector<AgentName> registered_agents() const;

    void add_pre_execution_check(std::string name, PreExecutionCheck check);
    void clear_pre_execution_checks();

    // ── Planning & execution ─────────────────
    Result<ExecutionPlan> build_execution_plan(const std::vector<std::string>& changed_inputs = {});
    Result<OrchestrationResult> execute(const std::vector<std::string>& changed_inputs = {});

    /// Emergency stop: agents of the current run that have not started are skipped.
    void request_stop();

    // ── Observability ────────────────────────
    [[nodiscard]] OrchestratorStatus get_status() const;
    [[nodiscard]] bool is_executing() const noexcept { return executing_.load(); }

    Result<void> set_max_concurrency(uint32_t max_concurrency);
    [[nodiscard]] uint32_t max_concurrency() const noexcept { return max_concurrency_.load(); }
    [[nodiscard]] FailurePolicy failure_policy() const noexcept { return failure_policy_; }

private:
    Result<ExecutionPlan> build_plan_locked(const std::vector<std::string>& changed_inputs);
    Result<void> run_pre_execution_checks();
    AgentRunResult run_agent(const AgentName& name, const std::shared_ptr<IInvocable>& operation);
    std::optional<std::string> blocked_by(const AgentName& name,
                                          const std::set<AgentName>& blocked) const;

    DependencyGraph& graph_;
    AgentPool& pool_;
    Logger logger_;
    MetricsCollector* metrics_;

    std::atomic<uint32_t> max_concurrency_;
    FailurePolicy failure_policy_;

    mutable std::mutex registry_mutex_;       ///< Guards graph_ and operations_
    std::unordered_map<AgentName, std::shared_ptr<IInvocable>> operations_;
    std::vector<AgentName> registration_order_;

    std::mutex checks_mutex_;
    std::vector<std::pair<std::string, PreExecutionCheck>> checks_;

    std::atomic<bool> executing_{false};
    std::atomic<bool> stop_requested_{false};

    mutable std::mutex status_mutex_;
    std::vector<AgentName> currently_running_;
    std::vector<AgentName> completed_agents_;
};

}  // namespace agent_orchestrator

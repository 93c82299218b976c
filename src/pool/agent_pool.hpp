/**
 * @file agent_pool.hpp
 * @brief Runtime state and invocation policy of every registered agent.
 *
 * The pool is the only component that runs agent work. Before each
 * invocation it checks, in order: registration, an in-flight invocation,
 * the agent's cooldown, the rate-limit window and the circular-update
 * window. It then runs the operation with timeout and retries, and books
 * the outcome in the agent's counters and the bounded execution history.
 */

#pragma once

#include "core/clock.hpp"
#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/attempt_runner.hpp"
#include "executor/invocable.hpp"

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief Runtime record of one agent. Handed out as a value snapshot.
 */
struct Agent {
    AgentName name;
    AgentStatus status = AgentStatus::Idle;
    AgentConfig config;

    uint64_t total_executions = 0;
    uint64_t successful_executions = 0;
    uint64_t failed_executions = 0;
    uint32_t retry_count = 0;

    std::optional<Timestamp> last_execution_time;
    std::optional<Duration> last_execution_duration;
    bool cooldown_waived = false;      ///< Set by reset_agent(), cleared by the next invocation
};

/**
 * @brief One completed top-level invocation.
 */
struct ExecutionRecord {
    AgentName agent;
    Timestamp start_time;
    Duration duration{0};
    bool success = false;
    std::optional<std::string> error;
    uint32_t attempts = 1;
};

/**
 * @brief Answer of can_execute().
 */
struct ExecutionPermission {
    bool allowed = true;
    std::optional<RefusalReason> reason;
    std::optional<Duration> remaining_cooldown;
};

/**
 * @brief Error returned by execute_agent().
 */
struct ExecutionError {
    enum class Kind : uint8_t {
        Refused,     ///< Scheduling refusal, no side effects
        Failed,      ///< Operation failed on every attempt
        TimedOut     ///< Final attempt exceeded the timeout
    };

    Kind kind = Kind::Failed;
    std::optional<RefusalReason> reason;
    std::string message;
    uint32_t attempts = 0;

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result of one invocation together with how many attempts it took.
 */
struct Invocation {
    Result<AgentOutput, ExecutionError> result;
    uint32_t attempts = 0;                ///< 0 when refused
};

struct AgentStats {
    AgentName name;
    AgentStatus status = AgentStatus::Idle;
    uint64_t total_executions = 0;
    uint64_t successful_executions = 0;
    uint64_t failed_executions = 0;
    uint32_t retry_count = 0;
    std::string success_rate;             ///< e.g. "66.67%"
    Duration average_duration{0};         ///< Over retained history records
    std::optional<Timestamp> last_execution_time;
    std::optional<Duration> last_execution_duration;
    bool is_in_cooldown = false;
    bool is_rate_limited = false;
    size_t recent_execution_count = 0;    ///< Retained history records
};

struct PoolStats {
    size_t total_agents = 0;
    size_t idle_agents = 0;
    size_t running_agents = 0;
    size_t failed_agents = 0;
    uint64_t total_executions = 0;
    std::map<AgentName, AgentStats> agents;
};

/**
 * @brief Format `successful / total` as a percentage with two decimals.
 */
[[nodiscard]] std::string format_success_rate(uint64_t successful, uint64_t total);

/**
 * @brief Owns agent records and enforces per-agent invocation policy.
 *
 * Thread-safe. Agent records and the history are guarded by one mutex; the
 * operation itself runs outside the lock.
 */
class AgentPool {
public:
    AgentPool(PoolConfig config, const Logger& logger,
              std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());

    // Non-copyable
    AgentPool(const AgentPool&) = delete;
    AgentPool& operator=(const AgentPool&) = delete;

    // ── Registration ─────────────────────────
    void register_agent(const AgentName& name, const AgentConfigOverrides& overrides = {});
    /// Both refuse (return false) while an invocation of the agent is in flight.
    bool unregister_agent(const AgentName& name);
    bool reset_agent(const AgentName& name);

    // ── Admission ────────────────────────────
    [[nodiscard]] ExecutionPermission can_execute(const AgentName& name) const;
    [[nodiscard]] bool is_in_cooldown(const AgentName& name) const;
    [[nodiscard]] bool is_rate_limited(const AgentName& name) const;
    [[nodiscard]] bool has_circular_update(const AgentName& name) const;

    // ── Execution ────────────────────────────
    Result<AgentOutput, ExecutionError> execute_agent(const AgentName& name,
                                                      std::shared_ptr<IInvocable> operation);

    template <AgentOperation F>
    Result<AgentOutput, ExecutionError> execute_agent(const AgentName& name, F&& operation) {
        return execute_agent(name, make_invocable(std::forward<F>(operation)));
    }

    /// execute_agent() that also reports the attempt count on success.
    Invocation invoke_agent(const AgentName& name, std::shared_ptr<IInvocable> operation);

    // ── Queries ──────────────────────────────
    [[nodiscard]] std::optional<Agent> get_agent(const AgentName& name) const;
    [[nodiscard]] std::optional<AgentStats> get_agent_stats(const AgentName& name) const;
    [[nodiscard]] PoolStats get_pool_stats() const;
    [[nodiscard]] std::vector<ExecutionRecord> history() const;
    [[nodiscard]] std::vector<AgentName> agent_names() const;
    [[nodiscard]] bool contains(const AgentName& name) const;
    [[nodiscard]] const PoolConfig& config() const noexcept { return config_; }

    // ── History ──────────────────────────────
    void clear_agent_history(const AgentName& name);
    void clear_all_history();

private:
    // Unlocked helpers; callers hold mutex_.
    ExecutionPermission check_locked(const AgentName& name, Timestamp now) const;
    bool in_cooldown_locked(const Agent& agent, Timestamp now) const;
    size_t count_recent_locked(const AgentName& name, Timestamp now, Duration window) const;
    AgentStats stats_locked(const Agent& agent, Timestamp now) const;
    void append_record_locked(ExecutionRecord record);

    Duration retry_delay(const AgentConfig& config, uint32_t retry) const;

    PoolConfig config_;
    mutable Logger logger_;
    std::shared_ptr<IClock> clock_;
    AttemptRunner runner_;

    mutable std::mutex mutex_;
    std::unordered_map<AgentName, Agent> agents_;
    std::vector<AgentName> registration_order_;
    std::deque<ExecutionRecord> history_;
};

}  // namespace agent_orchestrator

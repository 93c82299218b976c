/**
 * @file agent_pool.cpp
 * @brief AgentPool implementation: admission checks and retry bookkeeping.
 */

#include "pool/agent_pool.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace agent_orchestrator {

std::string format_success_rate(uint64_t successful, uint64_t total) {
    double rate = total > 0
        ? 100.0 * static_cast<double>(successful) / static_cast<double>(total)
        : 0.0;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << rate << '%';
    return oss.str();
}

AgentPool::AgentPool(PoolConfig config, const Logger& logger, std::shared_ptr<IClock> clock)
    : config_(std::move(config))
    , logger_(logger.with_component("AgentPool"))
    , clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {}

// ─────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────

void AgentPool::register_agent(const AgentName& name, const AgentConfigOverrides& overrides) {
    std::lock_guard lock(mutex_);

    if (auto it = agents_.find(name); it != agents_.end()) {
        it->second.config = overrides.apply_to(it->second.config);
        logger_.warn("Agent " + name + " already registered, updating config");
        return;
    }

    Agent agent;
    agent.name = name;
    agent.config = overrides.apply_to(config_.defaults);
    agents_.emplace(name, std::move(agent));
    registration_order_.push_back(name);
    logger_.debug("Registered agent: " + name);
}

bool AgentPool::unregister_agent(const AgentName& name) {
    std::lock_guard lock(mutex_);

    auto it = agents_.find(name);
    if (it == agents_.end()) {
        logger_.warn("Cannot unregister agent " + name + ": not registered");
        return false;
    }
    if (it->second.status == AgentStatus::Running) {
        logger_.warn("Cannot unregister agent " + name + ": an invocation is in flight");
        return false;
    }
    agents_.erase(it);
    std::erase(registration_order_, name);
    std::erase_if(history_, [&](const ExecutionRecord& r) { return r.agent == name; });

    logger_.info("Unregistered agent: " + name);
    return true;
}

bool AgentPool::reset_agent(const AgentName& name) {
    std::lock_guard lock(mutex_);

    auto it = agents_.find(name);
    if (it == agents_.end()) {
        logger_.warn("Cannot reset agent " + name + ": not registered");
        return false;
    }
    if (it->second.status == AgentStatus::Running) {
        logger_.warn("Cannot reset agent " + name + ": an invocation is in flight");
        return false;
    }

    it->second.status = AgentStatus::Idle;
    it->second.retry_count = 0;
    it->second.cooldown_waived = true;
    logger_.info("Reset agent: " + name);
    return true;
}

// ─────────────────────────────────────────────
// Admission
// ─────────────────────────────────────────────

ExecutionPermission AgentPool::can_execute(const AgentName& name) const {
    std::lock_guard lock(mutex_);
    return check_locked(name, clock_->now());
}

bool AgentPool::is_in_cooldown(const AgentName& name) const {
    std::lock_guard lock(mutex_);
    auto it = agents_.find(name);
    if (it == agents_.end()) return false;
    return in_cooldown_locked(it->second, clock_->now());
}

bool AgentPool::is_rate_limited(const AgentName& name) const {
    std::lock_guard lock(mutex_);
    if (config_.rate_limit_max == 0) return false;
    return count_recent_locked(name, clock_->now(), config_.rate_limit_window)
           >= config_.rate_limit_max;
}

bool AgentPool::has_circular_update(const AgentName& name) const {
    std::lock_guard lock(mutex_);
    if (config_.circular_update_threshold == 0) return false;
    return count_recent_locked(name, clock_->now(), config_.circular_update_window)
           >= config_.circular_update_threshold;
}

ExecutionPermission AgentPool::check_locked(const AgentName& name, Timestamp now) const {
    auto it = agents_.find(name);
    if (it == agents_.end()) {
        logger_.error("Agent " + name + " not registered");
        return {.allowed = false, .reason = RefusalReason::NotRegistered, .remaining_cooldown = {}};
    }
    const Agent& agent = it->second;

    if (agent.status == AgentStatus::Running) {
        return {.allowed = false, .reason = RefusalReason::AlreadyRunning, .remaining_cooldown = {}};
    }

    if (in_cooldown_locked(agent, now)) {
        auto since = std::chrono::duration_cast<Duration>(now - *agent.last_execution_time);
        return {.allowed = false,
                .reason = RefusalReason::Cooldown,
                .remaining_cooldown = agent.config.cooldown - since};
    }

    if (config_.rate_limit_max > 0 &&
        count_recent_locked(name, now, config_.rate_limit_window) >= config_.rate_limit_max) {
        return {.allowed = false, .reason = RefusalReason::RateLimited, .remaining_cooldown = {}};
    }

    if (config_.circular_update_threshold > 0) {
        auto recent = count_recent_locked(name, now, config_.circular_update_window);
        if (recent >= config_.circular_update_threshold) {
            logger_.warn("Circular update detected for " + name + ": "
                         + std::to_string(recent) + " executions in "
                         + std::to_string(config_.circular_update_window.count()) + "ms window");
            return {.allowed = false, .reason = RefusalReason::CircularUpdate, .remaining_cooldown = {}};
        }
    }

    return {.allowed = true, .reason = {}, .remaining_cooldown = {}};
}

bool AgentPool::in_cooldown_locked(const Agent& agent, Timestamp now) const {
    if (agent.cooldown_waived || !agent.last_execution_time) return false;
    if (agent.config.cooldown.count() <= 0) return false;
    return now - *agent.last_execution_time < agent.config.cooldown;
}

size_t AgentPool::count_recent_locked(const AgentName& name, Timestamp now, Duration window) const {
    const Timestamp window_start = now - window;
    return static_cast<size_t>(std::count_if(history_.begin(), history_.end(),
        [&](const ExecutionRecord& r) { return r.agent == name && r.start_time >= window_start; }));
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

Result<AgentOutput, ExecutionError> AgentPool::execute_agent(const AgentName& name,
                                                             std::shared_ptr<IInvocable> operation) {
    return invoke_agent(name, std::move(operation)).result;
}

Invocation AgentPool::invoke_agent(const AgentName& name, std::shared_ptr<IInvocable> operation) {
    AgentConfig agent_config;
    Timestamp start_time;
    {
        std::lock_guard lock(mutex_);
        start_time = clock_->now();

        auto permission = check_locked(name, start_time);
        if (!permission.allowed) {
            std::string message = "Agent " + name + " cannot execute: "
                                  + std::string{to_string(*permission.reason)};
            logger_.warn(message);
            return Invocation{
                .result = ExecutionError{
                    .kind = ExecutionError::Kind::Refused,
                    .reason = permission.reason,
                    .message = std::move(message),
                    .attempts = 0
                },
                .attempts = 0
            };
        }

        Agent& agent = agents_.at(name);
        agent.status = AgentStatus::Running;
        agent.retry_count = 0;
        agent.cooldown_waived = false;
        agent_config = agent.config;
    }

    const auto steady_start = std::chrono::steady_clock::now();
    uint32_t attempts = 0;
    AttemptOutcome outcome;

    while (true) {
        ++attempts;
        logger_.info("Executing agent: " + name + " (attempt " + std::to_string(attempts)
                     + "/" + std::to_string(agent_config.max_retries + 1) + ")");

        outcome = runner_.run(name, operation, agent_config.timeout);
        if (outcome.success) break;

        logger_.warn("Agent " + name + " failed: " + outcome.error);

        uint32_t retry = 0;
        {
            std::lock_guard lock(mutex_);
            Agent& agent = agents_.at(name);
            if (agent.retry_count >= agent_config.max_retries) break;
            retry = ++agent.retry_count;
        }

        auto delay = retry_delay(agent_config, retry);
        logger_.info("Retrying agent " + name + " in " + std::to_string(delay.count()) + "ms");
        clock_->sleep_for(delay);
    }

    const auto duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - steady_start);

    std::lock_guard lock(mutex_);
    const Timestamp end_time = clock_->now();

    // The record stays registered: unregister_agent() refuses while Running.
    Agent& agent = agents_.at(name);
    ++agent.total_executions;
    agent.last_execution_time = end_time;
    agent.last_execution_duration = duration;

    if (outcome.success) {
        ++agent.successful_executions;
        agent.retry_count = 0;
        agent.status = AgentStatus::Idle;
    } else {
        ++agent.failed_executions;
        agent.status = AgentStatus::Failed;
    }

    append_record_locked(ExecutionRecord{
        .agent = name,
        .start_time = start_time,
        .duration = duration,
        .success = outcome.success,
        .error = outcome.success ? std::nullopt : std::optional<std::string>{outcome.error},
        .attempts = attempts
    });

    if (outcome.success) {
        logger_.info("Agent " + name + " completed successfully in "
                     + std::to_string(duration.count()) + "ms");
        return Invocation{.result = std::move(outcome.output), .attempts = attempts};
    }

    logger_.error("Agent " + name + " failed after " + std::to_string(attempts)
                  + " attempt(s): " + outcome.error);
    return Invocation{
        .result = ExecutionError{
            .kind = outcome.timed_out ? ExecutionError::Kind::TimedOut : ExecutionError::Kind::Failed,
            .reason = std::nullopt,
            .message = outcome.error,
            .attempts = attempts
        },
        .attempts = attempts
    };
}

Duration AgentPool::retry_delay(const AgentConfig& config, uint32_t retry) const {
    Duration backoff{0};
    if (config_.retry_backoff_base.count() > 0 && retry > 0) {
        const uint32_t exponent = std::min<uint32_t>(retry - 1, 20);
        backoff = std::min(config_.retry_backoff_base * (int64_t{1} << exponent),
                           config_.retry_backoff_max);
    }
    return config.cooldown + backoff;
}

void AgentPool::append_record_locked(ExecutionRecord record) {
    history_.push_back(std::move(record));
    while (history_.size() > config_.max_history_size) {
        history_.pop_front();
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<Agent> AgentPool::get_agent(const AgentName& name) const {
    std::lock_guard lock(mutex_);
    auto it = agents_.find(name);
    if (it == agents_.end()) return std::nullopt;
    return it->second;
}

AgentStats AgentPool::stats_locked(const Agent& agent, Timestamp now) const {
    AgentStats stats;
    stats.name = agent.name;
    stats.status = agent.status;
    stats.total_executions = agent.total_executions;
    stats.successful_executions = agent.successful_executions;
    stats.failed_executions = agent.failed_executions;
    stats.retry_count = agent.retry_count;
    stats.success_rate = format_success_rate(agent.successful_executions, agent.total_executions);
    stats.last_execution_time = agent.last_execution_time;
    stats.last_execution_duration = agent.last_execution_duration;
    stats.is_in_cooldown = in_cooldown_locked(agent, now);
    stats.is_rate_limited = config_.rate_limit_max > 0 &&
        count_recent_locked(agent.name, now, config_.rate_limit_window) >= config_.rate_limit_max;

    Duration total{0};
    for (const auto& record : history_) {
        if (record.agent != agent.name) continue;
        total += record.duration;
        ++stats.recent_execution_count;
    }
    if (stats.recent_execution_count > 0) {
        stats.average_duration = total / static_cast<int64_t>(stats.recent_execution_count);
    }
    return stats;
}

std::optional<AgentStats> AgentPool::get_agent_stats(const AgentName& name) const {
    std::lock_guard lock(mutex_);
    auto it = agents_.find(name);
    if (it == agents_.end()) return std::nullopt;
    return stats_locked(it->second, clock_->now());
}

PoolStats AgentPool::get_pool_stats() const {
    std::lock_guard lock(mutex_);
    const auto now = clock_->now();

    PoolStats stats;
    stats.total_agents = agents_.size();
    for (const auto& [name, agent] : agents_) {
        stats.total_executions += agent.total_executions;
        switch (agent.status) {
            case AgentStatus::Idle:    ++stats.idle_agents; break;
            case AgentStatus::Running: ++stats.running_agents; break;
            case AgentStatus::Failed:  ++stats.failed_agents; break;
        }
        stats.agents.emplace(name, stats_locked(agent, now));
    }
    return stats;
}

std::vector<ExecutionRecord> AgentPool::history() const {
    std::lock_guard lock(mutex_);
    return {history_.begin(), history_.end()};
}

std::vector<AgentName> AgentPool::agent_names() const {
    std::lock_guard lock(mutex_);
    return registration_order_;
}

bool AgentPool::contains(const AgentName& name) const {
    std::lock_guard lock(mutex_);
    return agents_.contains(name);
}

// ─────────────────────────────────────────────
// History
// ─────────────────────────────────────────────

void AgentPool::clear_agent_history(const AgentName& name) {
    std::lock_guard lock(mutex_);
    std::erase_if(history_, [&](const ExecutionRecord& r) { return r.agent == name; });
    logger_.info("Cleared execution history for agent: " + name);
}

void AgentPool::clear_all_history() {
    std::lock_guard lock(mutex_);
    history_.clear();
    logger_.info("Cleared all execution history");
}

}  // namespace agent_orchestrator

/**
 * @file orchestrator.cpp
 * @brief Orchestrator implementation: planning and level-by-level execution.
 */

#include "orchestrator/orchestrator.hpp"

#include "executor/thread_pool.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <unordered_set>
#include <utility>

namespace agent_orchestrator {

namespace {

// Clears the in-progress flag and the live status on every exit path.
class ExecutionGuard {
public:
    ExecutionGuard(std::atomic<bool>& flag, std::mutex& status_mutex,
                   std::vector<AgentName>& running)
        : flag_(flag), status_mutex_(status_mutex), running_(running) {}

    ~ExecutionGuard() {
        {
            std::lock_guard lock(status_mutex_);
            running_.clear();
        }
        flag_.store(false);
    }

    ExecutionGuard(const ExecutionGuard&) = delete;
    ExecutionGuard& operator=(const ExecutionGuard&) = delete;

private:
    std::atomic<bool>& flag_;
    std::mutex& status_mutex_;
    std::vector<AgentName>& running_;
};

AgentRunResult skipped(std::string reason) {
    AgentRunResult result;
    result.outcome = RunOutcome::Skipped;
    result.error = std::move(reason);
    return result;
}

}  // namespace

Orchestrator::Orchestrator(DependencyGraph& graph,
                           AgentPool& pool,
                           const Logger& logger,
                           OrchestratorConfig config,
                           MetricsCollector* metrics)
    : graph_(graph)
    , pool_(pool)
    , logger_(logger.with_component("Orchestrator"))
    , metrics_(metrics)
    , max_concurrency_(config.max_concurrency == 0 ? 1 : config.max_concurrency)
    , failure_policy_(config.failure_policy) {
    if (config.max_concurrency == 0) {
        logger_.warn("max_concurrency of 0 is invalid, using 1");
    }
}

// ─────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────

Result<void> Orchestrator::register_agent(const AgentName& name,
                                          std::shared_ptr<IInvocable> operation,
                                          const std::vector<AgentName>& dependencies,
                                          const AgentConfigOverrides& overrides) {
    if (name.empty()) {
        return Error{"Agent name must not be empty"};
    }
    if (!operation) {
        return Error{"Agent " + name + " registered without an operation"};
    }
    if (std::find(dependencies.begin(), dependencies.end(), name) != dependencies.end()) {
        return Error{"Agent " + name + " cannot depend on itself"};
    }

    pool_.register_agent(name, overrides);
    {
        std::lock_guard lock(registry_mutex_);
        graph_.add_agent(name, dependencies);
        if (!operations_.contains(name)) {
            registration_order_.push_back(name);
        }
        operations_[name] = std::move(operation);
    }

    logger_.info("Registered agent " + name + " with "
                 + std::to_string(dependencies.size()) + " dependencies");
    return Result<void>{};
}

bool Orchestrator::unregister_agent(const AgentName& name) {
    bool removed = false;
    if (pool_.contains(name)) {
        if (!pool_.unregister_agent(name)) return false;
        removed = true;
    }
    {
        std::lock_guard lock(registry_mutex_);
        removed = operations_.erase(name) > 0 || removed;
        std::erase(registration_order_, name);
        removed = graph_.remove_agent(name) || removed;
    }

    if (removed) {
        logger_.info("Unregistered agent " + name);
    }
    return removed;
}

std::vector<AgentName> Orchestrator::registered_agents() const {
    std::lock_guard lock(registry_mutex_);
    return registration_order_;
}

void Orchestrator::add_pre_execution_check(std::string name, PreExecutionCheck check) {
    std::lock_guard lock(checks_mutex_);
    checks_.emplace_back(std::move(name), std::move(check));
}

void Orchestrator::clear_pre_execution_checks() {
    std::lock_guard lock(checks_mutex_);
    checks_.clear();
}

Result<void> Orchestrator::set_max_concurrency(uint32_t max_concurrency) {
    if (max_concurrency == 0) {
        return Error{"max_concurrency must be at least 1"};
    }
    max_concurrency_.store(max_concurrency);
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Planning
// ─────────────────────────────────────────────

Result<ExecutionPlan> Orchestrator::build_execution_plan(const std::vector<std::string>& changed_inputs) {
    std::lock_guard lock(registry_mutex_);
    return build_plan_locked(changed_inputs);
}

Result<ExecutionPlan> Orchestrator::build_plan_locked(const std::vector<std::string>& changed_inputs) {
    auto order = graph_.build_execution_order();
    if (!order) {
        logger_.error("Cannot build execution plan: " + order.error().message);
        return order.error();
    }

    std::unordered_set<AgentName> selected;
    if (changed_inputs.empty()) {
        selected.insert(order->begin(), order->end());
    } else {
        auto affected = graph_.get_affected_agents(changed_inputs);
        selected.insert(affected.begin(), affected.end());
    }

    ExecutionPlan plan;
    for (const auto& name : *order) {
        if (selected.contains(name)) plan.affected_agents.push_back(name);
    }

    for (auto& group : graph_.get_parallel_groups()) {
        std::erase_if(group.agents, [&](const AgentName& a) { return !selected.contains(a); });
        if (!group.agents.empty()) {
            plan.groups.push_back(std::move(group));
        }
    }
    plan.total_agents = plan.affected_agents.size();

    logger_.info("Execution plan: " + std::to_string(plan.total_agents) + " agents in "
                 + std::to_string(plan.groups.size()) + " levels");
    return plan;
}

Result<void> Orchestrator::run_pre_execution_checks() {
    std::lock_guard lock(checks_mutex_);
    for (const auto& [name, check] : checks_) {
        auto result = check();
        if (!result) {
            return Error{"Pre-execution check '" + name + "' failed: " + result.error().message};
        }
        logger_.debug("Pre-execution check passed: " + name);
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

Result<OrchestrationResult> Orchestrator::execute(const std::vector<std::string>& changed_inputs) {
    if (executing_.exchange(true)) {
        logger_.warn("Orchestration already in progress");
        return Error{"Orchestration already in progress"};
    }
    ExecutionGuard guard(executing_, status_mutex_, currently_running_);

    stop_requested_.store(false);
    {
        std::lock_guard lock(status_mutex_);
        completed_agents_.clear();
    }

    const auto start_time = std::chrono::steady_clock::now();

    if (auto checked = run_pre_execution_checks(); !checked) {
        logger_.error(checked.error().message);
        return checked.error();
    }

    ExecutionPlan plan;
    std::unordered_map<AgentName, std::shared_ptr<IInvocable>> operations;
    {
        std::lock_guard lock(registry_mutex_);
        auto built = build_plan_locked(changed_inputs);
        if (!built) return built.error();
        plan = std::move(*built);
        operations = operations_;
    }

    if (metrics_) metrics_->record_execution_plan(plan.groups, plan.total_agents);

    OrchestrationResult result;
    std::set<AgentName> blocked;   // failed, or skipped because of a failure
    ThreadPool workers(max_concurrency_.load());

    for (const auto& group : plan.groups) {
        logger_.info("Executing level " + std::to_string(group.level) + " with "
                     + std::to_string(group.agents.size()) + " agents");

        std::vector<std::pair<AgentName, std::future<AgentRunResult>>> pending;
        pending.reserve(group.agents.size());

        for (const auto& name : group.agents) {
            std::optional<AgentRunResult> immediate;

            if (auto blocker = blocked_by(name, blocked)) {
                immediate = skipped("dependency failed: " + *blocker);
                blocked.insert(name);
            } else if (auto it = operations.find(name); it == operations.end()) {
                logger_.warn("Agent " + name + " has no operation registered, skipping");
                immediate = skipped("no operation registered");
            } else {
                pending.emplace_back(name, workers.submit([this, name, op = it->second] {
                    if (stop_requested_.load()) return skipped("orchestration stopped");
                    return run_agent(name, op);
                }));
                continue;
            }

            std::promise<AgentRunResult> ready;
            ready.set_value(std::move(*immediate));
            pending.emplace_back(name, ready.get_future());
        }

        // Hard barrier: the next level starts only after every agent here settled.
        for (auto& [name, future] : pending) {
            auto run = future.get();
            switch (run.outcome) {
                case RunOutcome::Succeeded:
                    ++result.agents_executed;
                    break;
                case RunOutcome::Failed:
                    ++result.agents_executed;
                    ++result.agents_failed;
                    blocked.insert(name);
                    break;
                case RunOutcome::Skipped:
                    ++result.agents_skipped;
                    if (metrics_) metrics_->record_agent_skipped(name, run.error.value_or(""));
                    break;
            }
            result.per_agent_results.insert_or_assign(name, std::move(run));
        }
    }

    result.stopped = stop_requested_.load();
    result.success = result.agents_failed == 0 && !result.stopped;
    result.duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start_time);

    if (metrics_) {
        metrics_->record_orchestration_complete(result.success, result.agents_executed,
                                                result.agents_failed, result.agents_skipped,
                                                result.duration);
    }

    logger_.info("Orchestration " + std::string{result.success ? "completed" : "finished with failures"}
                 + ": executed=" + std::to_string(result.agents_executed)
                 + " failed=" + std::to_string(result.agents_failed)
                 + " skipped=" + std::to_string(result.agents_skipped)
                 + " duration=" + std::to_string(result.duration.count()) + "ms");
    return result;
}

std::optional<std::string> Orchestrator::blocked_by(const AgentName& name,
                                                    const std::set<AgentName>& blocked) const {
    if (failure_policy_ == FailurePolicy::Continue || blocked.empty()) return std::nullopt;

    std::lock_guard lock(registry_mutex_);
    for (const auto& dependency : graph_.get_dependencies(name)) {
        if (blocked.contains(dependency)) return dependency;
    }
    return std::nullopt;
}

AgentRunResult Orchestrator::run_agent(const AgentName& name,
                                       const std::shared_ptr<IInvocable>& operation) {
    {
        std::lock_guard lock(status_mutex_);
        currently_running_.push_back(name);
    }

    const auto start = std::chrono::steady_clock::now();
    auto [executed, attempts] = pool_.invoke_agent(name, operation);
    const auto elapsed = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start);

    {
        std::lock_guard lock(status_mutex_);
        std::erase(currently_running_, name);
        completed_agents_.push_back(name);
    }

    AgentRunResult run;
    run.duration = elapsed;

    if (executed) {
        run.outcome = RunOutcome::Succeeded;
        run.attempts = attempts;
        run.output = std::move(*executed);
        if (metrics_) metrics_->record_agent_execution(name, true, elapsed, run.attempts);
        return run;
    }

    const auto& error = executed.error();
    run.outcome = RunOutcome::Failed;
    run.attempts = error.attempts;
    run.error = error.message;
    run.refusal = error.reason;

    if (metrics_) {
        if (error.kind == ExecutionError::Kind::Refused && error.reason) {
            metrics_->record_agent_refused(name, *error.reason);
        } else {
            metrics_->record_agent_execution(name, false, elapsed, error.attempts, error.message);
        }
    }
    return run;
}

// ─────────────────────────────────────────────
// Control & status
// ─────────────────────────────────────────────

void Orchestrator::request_stop() {
    if (!executing_.load()) {
        logger_.debug("Stop requested with no orchestration in progress");
        return;
    }
    stop_requested_.store(true);
    logger_.warn("Emergency stop requested, pending agents will be skipped");
}

OrchestratorStatus Orchestrator::get_status() const {
    OrchestratorStatus status;
    status.is_executing = executing_.load();
    {
        std::lock_guard lock(status_mutex_);
        status.currently_running = currently_running_;
        status.completed_agents = completed_agents_;
    }
    status.registered_agents = registered_agents();
    return status;
}

}  // namespace agent_orchestrator

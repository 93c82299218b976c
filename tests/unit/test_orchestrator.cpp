/**
 * @file test_orchestrator.cpp
 * @brief Tests for the Orchestrator facade: planning, level barriers and failure policy.
 */

#include "core/clock.hpp"
#include "orchestrator/orchestrator.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace agent_orchestrator;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines)
        : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

/// Thread-safe start/finish journal shared with agent operations.
struct Journal {
    std::mutex mutex;
    std::vector<std::string> events;

    void add(std::string event) {
        std::lock_guard lock(mutex);
        events.push_back(std::move(event));
    }

    size_t index_of(const std::string& event) {
        std::lock_guard lock(mutex);
        return static_cast<size_t>(std::find(events.begin(), events.end(), event) - events.begin());
    }
};

bool wait_until(const std::function<bool()>& predicate) {
    for (int i = 0; i < 1000; ++i) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

}  // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest() {
        pool_config_.circular_update_threshold = 0;
        pool_config_.rate_limit_max = 0;
        pool_ = std::make_unique<AgentPool>(pool_config_, logger_, clock_);
    }

    std::unique_ptr<Orchestrator> make_orchestrator(OrchestratorConfig config = {}) {
        return std::make_unique<Orchestrator>(graph_, *pool_, logger_, config, &metrics_);
    }

    auto journaled(const std::string& name) {
        auto journal = journal_;
        return [journal, name]() -> Result<AgentOutput> {
            journal->add("start:" + name);
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            journal->add("end:" + name);
            return AgentOutput{name + " output"};
        };
    }

    static auto failing() {
        return []() -> Result<AgentOutput> { throw std::runtime_error("broken"); };
    }

    static AgentConfigOverrides no_retries() {
        return AgentConfigOverrides{.timeout = {}, .max_retries = 0u, .cooldown = {}};
    }

    Logger logger_{std::make_unique<NullSink>()};
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    PoolConfig pool_config_;
    DependencyGraph graph_;
    std::unique_ptr<AgentPool> pool_;
    std::shared_ptr<std::vector<std::string>> metric_lines_ = std::make_shared<std::vector<std::string>>();
    MetricsCollector metrics_{std::make_unique<CaptureSink>(metric_lines_)};
    std::shared_ptr<Journal> journal_ = std::make_shared<Journal>();
};

// ═══════════════════════════════════════════════
// Registration
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, RegisterWiresGraphAndPool) {
    auto orch = make_orchestrator();
    ASSERT_TRUE(orch->register_agent("backend-agent", journaled("backend-agent"),
                                     {"document-agent"}).has_value());

    EXPECT_TRUE(pool_->contains("backend-agent"));
    EXPECT_TRUE(graph_.contains("backend-agent"));
    EXPECT_EQ(graph_.get_dependencies("backend-agent"), std::vector<AgentName>{"document-agent"});
    EXPECT_EQ(orch->registered_agents(), std::vector<AgentName>{"backend-agent"});
    EXPECT_EQ(orch->get_status().registered_agents.size(), 1u);
}

TEST_F(OrchestratorTest, RegisterRejectsInvalidInput) {
    auto orch = make_orchestrator();
    EXPECT_FALSE(orch->register_agent("a", std::shared_ptr<IInvocable>{}).has_value());
    EXPECT_FALSE(orch->register_agent("", journaled("x")).has_value());
    EXPECT_FALSE(orch->register_agent("a", journaled("a"), {"a"}).has_value());
    EXPECT_FALSE(pool_->contains("a"));
}

TEST_F(OrchestratorTest, UnregisterRemovesEverywhere) {
    auto orch = make_orchestrator();
    ASSERT_TRUE(orch->register_agent("a", journaled("a")).has_value());

    EXPECT_TRUE(orch->unregister_agent("a"));
    EXPECT_FALSE(pool_->contains("a"));
    EXPECT_FALSE(graph_.contains("a"));
    EXPECT_TRUE(orch->registered_agents().empty());
    EXPECT_FALSE(orch->unregister_agent("a"));
}

TEST_F(OrchestratorTest, MaxConcurrencyMustBePositive) {
    auto orch = make_orchestrator();
    EXPECT_FALSE(orch->set_max_concurrency(0).has_value());
    ASSERT_TRUE(orch->set_max_concurrency(3).has_value());
    EXPECT_EQ(orch->max_concurrency(), 3u);
}

// ═══════════════════════════════════════════════
// Planning
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, PlanCoversEveryAgentWithoutChangedInputs) {
    auto orch = make_orchestrator();
    ASSERT_TRUE(orch->register_agent("backend-agent", journaled("b"), {"document-agent"}).has_value());
    ASSERT_TRUE(orch->register_agent("document-agent", journaled("d")).has_value());

    auto plan = orch->build_execution_plan();
    ASSERT_TRUE(plan.has_value()) << plan.error().message;
    EXPECT_EQ(plan->total_agents, 2u);
    EXPECT_EQ(plan->affected_agents, (std::vector<AgentName>{"document-agent", "backend-agent"}));
    ASSERT_EQ(plan->groups.size(), 2u);
    EXPECT_EQ(plan->groups[0], (ParallelGroup{.level = 1, .agents = {"document-agent"}}));
    EXPECT_EQ(plan->groups[1], (ParallelGroup{.level = 2, .agents = {"backend-agent"}}));
}

TEST_F(OrchestratorTest, PlanKeepsFullGraphLevelsForAffectedSubset) {
    InputPatternTable patterns;
    ASSERT_TRUE(patterns.add("backend-agent", R"(backend/.*\.ts$)").has_value());
    graph_.set_input_patterns(std::move(patterns));

    auto orch = make_orchestrator();
    ASSERT_TRUE(orch->register_agent("document-agent", journaled("d")).has_value());
    ASSERT_TRUE(orch->register_agent("backend-agent", journaled("b"), {"document-agent"}).has_value());
    ASSERT_TRUE(orch->register_agent("users-agent", journaled("u"), {"backend-agent"}).has_value());
    ASSERT_TRUE(orch->register_agent("admin-agent", journaled("a")).has_value());

    auto plan = orch->build_execution_plan({"backend/src/api.ts"});
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->total_agents, 2u);
    ASSERT_EQ(plan->groups.size(), 2u);
    EXPECT_EQ(plan->groups[0].level, 2u);
    EXPECT_EQ(plan->groups[0].agents, std::vector<AgentName>{"backend-agent"});
    EXPECT_EQ(plan->groups[1].level, 3u);
    EXPECT_EQ(plan->groups[1].agents, std::vector<AgentName>{"users-agent"});

    auto none = orch->build_execution_plan({"README.md"});
    ASSERT_TRUE(none.has_value());
    EXPECT_EQ(none->total_agents, 0u);
    EXPECT_TRUE(none->groups.empty());
}

TEST_F(OrchestratorTest, CycleFailsPlanAndExecuteWithoutWedging) {
    auto orch = make_orchestrator();
    ASSERT_TRUE(orch->register_agent("a", journaled("a"), {"b"}).has_value());
    ASSERT_TRUE(orch->register_agent("b", journaled("b"), {"a"}).has_value());

    auto plan = orch->build_execution_plan();
    ASSERT_FALSE(plan.has_value());
    EXPECT_NE(plan.error().message.find("Circular dependency"), std::string::npos);

    auto run = orch->execute();
    ASSERT_FALSE(run.has_value());
    EXPECT_FALSE(orch->is_executing());
    EXPECT_TRUE(journal_->events.empty());

    // Correct the graph and run again.
    ASSERT_TRUE(graph_.remove_dependency("a", "b"));
    auto fixed = orch->execute();
    ASSERT_TRUE(fixed.has_value()) << fixed.error().message;
    EXPECT_TRUE(fixed->success);
}

// ═══════════════════════════════════════════════
// Execution
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, LevelsRunBehindAHardBarrier) {
    auto orch = make_orchestrator();
    ASSERT_TRUE(orch->register_agent("a", journaled("a")).has_value());
    ASSERT_TRUE(orch->register_agent("b", journaled("b")).has_value());
    ASSERT_TRUE(orch->register_agent("c", journaled("c"), {"a"}).has_value());
    ASSERT_TRUE(orch->register_agent("d", journaled("d"), {"c", "b"}).has_value());

    auto result = orch->execute();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->agents_executed, 4u);
    EXPECT_EQ(result->agents_failed, 0u);
    EXPECT_EQ(result->agents_skipped, 0u);

    EXPECT_LT(journal_->index_of("end:a"), journal_->index_of("start:c"));
    EXPECT_LT(journal_->index_of("end:b"), journal_->index_of("start:c"));
    EXPECT_LT(journal_->index_of("end:c"), journal_->index_of("start:d"));

    const auto& d = result->per_agent_results.at("d");
    EXPECT_EQ(d.outcome, RunOutcome::Succeeded);
    EXPECT_EQ(d.output, AgentOutput{"d output"});
    EXPECT_EQ(d.attempts, 1u);

    auto status = orch->get_status();
    EXPECT_FALSE(status.is_executing);
    EXPECT_TRUE(status.currently_running.empty());
    EXPECT_EQ(status.completed_agents.size(), 4u);
}

TEST_F(OrchestratorTest, FailureSkipsTransitiveDependentsButNotSiblings) {
    auto orch = make_orchestrator();
    ASSERT_TRUE(orch->register_agent("a", failing(), {}, no_retries()).has_value());
    ASSERT_TRUE(orch->register_agent("sibling", journaled("sibling")).has_value());
    ASSERT_TRUE(orch->register_agent("b", journaled("b"), {"a"}).has_value());
    ASSERT_TRUE(orch->register_agent("c", journaled("c"), {"b"}).has_value());
    ASSERT_TRUE(orch->register_agent("other", journaled("other"), {"sibling"}).has_value());

    auto result = orch->execute();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->agents_failed, 1u);
    EXPECT_EQ(result->agents_skipped, 2u);
    EXPECT_EQ(result->agents_executed, 3u);

    const auto& a = result->per_agent_results.at("a");
    EXPECT_EQ(a.outcome, RunOutcome::Failed);
    EXPECT_EQ(a.error, "broken");
    EXPECT_EQ(a.attempts, 1u);

    EXPECT_EQ(result->per_agent_results.at("b").outcome, RunOutcome::Skipped);
    EXPECT_EQ(result->per_agent_results.at("b").error, "dependency failed: a");
    EXPECT_EQ(result->per_agent_results.at("c").error, "dependency failed: b");
    EXPECT_EQ(result->per_agent_results.at("other").outcome, RunOutcome::Succeeded);
    EXPECT_EQ(journal_->index_of("start:b"), journal_->events.size());
}

TEST_F(OrchestratorTest, ContinuePolicyAttemptsDependents) {
    auto orch = make_orchestrator(OrchestratorConfig{.max_concurrency = 5,
                                                     .failure_policy = FailurePolicy::Continue});
    ASSERT_TRUE(orch->register_agent("a", failing(), {}, no_retries()).has_value());
    ASSERT_TRUE(orch->register_agent("b", journaled("b"), {"a"}).has_value());

    auto result = orch->execute();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->per_agent_results.at("b").outcome, RunOutcome::Succeeded);
    EXPECT_EQ(result->agents_skipped, 0u);
}

TEST_F(OrchestratorTest, PlaceholderWithoutOperationIsSkippedAndDoesNotBlock) {
    auto orch = make_orchestrator();
    ASSERT_TRUE(orch->register_agent("b", journaled("b"), {"external"}).has_value());

    auto result = orch->execute();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->per_agent_results.at("external").outcome, RunOutcome::Skipped);
    EXPECT_EQ(result->per_agent_results.at("external").error, "no operation registered");
    EXPECT_EQ(result->per_agent_results.at("b").outcome, RunOutcome::Succeeded);
}

TEST_F(OrchestratorTest, PoolRefusalIsReportedAsFailure) {
    auto orch = make_orchestrator();
    ASSERT_TRUE(orch->register_agent("a", journaled("a"), {},
        AgentConfigOverrides{.timeout = {}, .max_retries = {}, .cooldown = Duration{1000}}).has_value());
    ASSERT_TRUE(orch->register_agent("b", journaled("b"), {"a"}).has_value());

    ASSERT_TRUE(orch->execute().has_value());
    auto second = orch->execute();
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(second->success);

    const auto& a = second->per_agent_results.at("a");
    EXPECT_EQ(a.outcome, RunOutcome::Failed);
    EXPECT_EQ(a.refusal, RefusalReason::Cooldown);
    EXPECT_EQ(a.error, "Agent a cannot execute: cooldown");
    EXPECT_EQ(second->per_agent_results.at("b").outcome, RunOutcome::Skipped);
    EXPECT_EQ(pool_->get_agent("a")->total_executions, 1u);
}

TEST_F(OrchestratorTest, SecondExecuteWhileRunningFailsFast) {
    auto orch = make_orchestrator();
    auto release = std::make_shared<std::promise<void>>();
    std::shared_future<void> gate = release->get_future().share();
    ASSERT_TRUE(orch->register_agent("slow", [gate] {
        gate.wait();
        return AgentOutput{"done"};
    }).has_value());

    auto first = std::async(std::launch::async, [&orch] { return orch->execute(); });
    ASSERT_TRUE(wait_until([&] {
        auto running = orch->get_status().currently_running;
        return std::find(running.begin(), running.end(), "slow") != running.end();
    }));

    auto second = orch->execute();
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().message, "Orchestration already in progress");
    EXPECT_TRUE(orch->get_status().is_executing);

    release->set_value();
    auto result = first.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_FALSE(orch->is_executing());
}

TEST_F(OrchestratorTest, RunningAgentCannotBeUnregistered) {
    auto orch = make_orchestrator();
    auto release = std::make_shared<std::promise<void>>();
    std::shared_future<void> gate = release->get_future().share();
    ASSERT_TRUE(orch->register_agent("slow", [gate] {
        gate.wait();
        return AgentOutput{"done"};
    }).has_value());

    auto run = std::async(std::launch::async, [&orch] { return orch->execute(); });
    ASSERT_TRUE(wait_until([&] {
        auto agent = pool_->get_agent("slow");
        return agent && agent->status == AgentStatus::Running;
    }));

    EXPECT_FALSE(orch->unregister_agent("slow"));
    EXPECT_TRUE(graph_.contains("slow"));
    EXPECT_EQ(orch->registered_agents(), std::vector<AgentName>{"slow"});

    release->set_value();
    auto result = run.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(pool_->get_agent("slow")->total_executions, 1u);
    EXPECT_TRUE(orch->unregister_agent("slow"));
}

TEST_F(OrchestratorTest, AttemptsReportedEvenWithoutRetainedHistory) {
    PoolConfig no_history = pool_config_;
    no_history.max_history_size = 0;
    AgentPool pool(no_history, logger_, clock_);
    DependencyGraph graph;
    Orchestrator orch(graph, pool, logger_);

    auto calls = std::make_shared<std::atomic<int>>(0);
    ASSERT_TRUE(orch.register_agent("flaky", [calls]() -> Result<AgentOutput> {
        if (calls->fetch_add(1) < 2) throw std::runtime_error("not yet");
        return AgentOutput{"ok"};
    }).has_value());

    auto result = orch.execute();
    ASSERT_TRUE(result.has_value());
    const auto& flaky = result->per_agent_results.at("flaky");
    EXPECT_EQ(flaky.outcome, RunOutcome::Succeeded);
    EXPECT_EQ(flaky.attempts, 3u);
    EXPECT_TRUE(pool.history().empty());
}

TEST_F(OrchestratorTest, FailedPreExecutionCheckAbortsBeforeAnyAgent) {
    auto orch = make_orchestrator();
    ASSERT_TRUE(orch->register_agent("a", journaled("a")).has_value());

    orch->add_pre_execution_check("workspace-clean", [] { return Result<void>{}; });
    orch->add_pre_execution_check("disk-space", []() -> Result<void> { return Error{"only 1MB free"}; });

    auto result = orch->execute();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "Pre-execution check 'disk-space' failed: only 1MB free");
    EXPECT_TRUE(journal_->events.empty());
    EXPECT_FALSE(orch->is_executing());

    orch->clear_pre_execution_checks();
    EXPECT_TRUE(orch->execute().has_value());
}

TEST_F(OrchestratorTest, RequestStopSkipsAgentsNotYetStarted) {
    auto orch = make_orchestrator(OrchestratorConfig{.max_concurrency = 1,
                                                     .failure_policy = FailurePolicy::SkipDependents});
    auto release = std::make_shared<std::promise<void>>();
    std::shared_future<void> gate = release->get_future().share();

    ASSERT_TRUE(orch->register_agent("first", [gate] {
        gate.wait();
        return AgentOutput{"first"};
    }).has_value());
    ASSERT_TRUE(orch->register_agent("second", journaled("second")).has_value());
    ASSERT_TRUE(orch->register_agent("later", journaled("later"), {"first"}).has_value());

    auto run = std::async(std::launch::async, [&orch] { return orch->execute(); });
    ASSERT_TRUE(wait_until([&] { return !orch->get_status().currently_running.empty(); }));

    orch->request_stop();
    release->set_value();

    auto result = run.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->stopped);
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->per_agent_results.at("first").outcome, RunOutcome::Succeeded);
    EXPECT_EQ(result->per_agent_results.at("second").outcome, RunOutcome::Skipped);
    EXPECT_EQ(result->per_agent_results.at("second").error, "orchestration stopped");
    EXPECT_EQ(result->per_agent_results.at("later").outcome, RunOutcome::Skipped);
    EXPECT_TRUE(journal_->events.empty());
}

TEST_F(OrchestratorTest, EmitsTelemetryEvents) {
    auto orch = make_orchestrator();
    ASSERT_TRUE(orch->register_agent("a", journaled("a")).has_value());
    ASSERT_TRUE(orch->register_agent("b", failing(), {"a"}, no_retries()).has_value());
    ASSERT_TRUE(orch->register_agent("c", journaled("c"), {"b"}).has_value());

    ASSERT_TRUE(orch->execute().has_value());

    auto has_event = [&](const std::string& needle) {
        return std::any_of(metric_lines_->begin(), metric_lines_->end(),
                           [&](const std::string& line) { return line.find(needle) != std::string::npos; });
    };
    EXPECT_TRUE(has_event(R"("event":"execution_plan")"));
    EXPECT_TRUE(has_event(R"("event":"agent_execution","agent":"a","success":true)"));
    EXPECT_TRUE(has_event(R"("event":"agent_execution","agent":"b","success":false)"));
    EXPECT_TRUE(has_event(R"("event":"agent_skipped","agent":"c")"));
    EXPECT_TRUE(has_event(R"("event":"orchestration_complete","success":false)"));
}

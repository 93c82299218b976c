/**
 * @file main.cpp
 * @brief agent_orchestrator command line driver.
 *
 * Wires the modules into one orchestration run:
 *   Config → Logger → InputPatternTable → DependencyGraph → AgentPool → Orchestrator → Telemetry
 *
 * Declared agents get a simulated-work operation that sleeps for
 * `simulated_work_ms` and honours cancellation.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/invocable.hpp"
#include "graph/dependency_graph.hpp"
#include "graph/input_patterns.hpp"
#include "orchestrator/orchestrator.hpp"
#include "pool/agent_pool.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace agent_orchestrator;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitConfigError = 2;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool config_explicit = false;
    std::vector<std::string> changed_inputs;
    std::optional<std::string> log_level;
    bool plan_only = false;
};

void print_usage() {
    std::cout << "Usage: agent_orchestrator [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --changed <path>     Changed input; repeatable. Without any, all agents run\n"
              << "  --plan               Print the execution plan and exit\n"
              << "  --log-level <level>  debug | info | warn | error\n"
              << "  --help, -h           Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
            args.config_explicit = true;
        } else if (arg == "--changed" && i + 1 < argc) {
            args.changed_inputs.emplace_back(argv[++i]);
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--plan") {
            args.plan_only = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(kExitSuccess);
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            print_usage();
            return std::nullopt;
        }
    }
    return args;
}

/**
 * @brief Stand-in agent work: sleeps in small slices until done or cancelled.
 */
class SimulatedWork final : public IInvocable {
public:
    SimulatedWork(AgentName name, Duration work) : name_(std::move(name)), work_(work) {}

    Result<AgentOutput> invoke(std::stop_token stop) override {
        const auto deadline = std::chrono::steady_clock::now() + work_;
        while (std::chrono::steady_clock::now() < deadline) {
            if (stop.stop_requested()) {
                return Error{"Agent " + name_ + " cancelled"};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return AgentOutput{name_ + " finished after " + std::to_string(work_.count()) + "ms"};
    }

private:
    AgentName name_;
    Duration work_;
};

void print_plan(const ExecutionPlan& plan) {
    std::cout << "Execution plan: " << plan.total_agents << " agents in "
              << plan.groups.size() << " levels\n";
    for (const auto& group : plan.groups) {
        std::cout << "  level " << group.level << ":";
        for (const auto& agent : group.agents) {
            std::cout << " " << agent;
        }
        std::cout << "\n";
    }
}

void print_summary(const OrchestrationResult& result, const PoolStats& stats) {
    std::cout << (result.success ? "Orchestration succeeded" : "Orchestration failed")
              << " in " << result.duration.count() << "ms"
              << " (executed " << result.agents_executed
              << ", failed " << result.agents_failed
              << ", skipped " << result.agents_skipped << ")\n";

    for (const auto& [name, run] : result.per_agent_results) {
        std::cout << "  " << name << ": " << to_string(run.outcome);
        if (run.outcome != RunOutcome::Skipped) {
            std::cout << " in " << run.duration.count() << "ms";
        }
        if (run.error) {
            std::cout << " (" << *run.error << ")";
        }
        if (auto it = stats.agents.find(name); it != stats.agents.end()) {
            std::cout << " [success rate " << it->second.success_rate << "]";
        }
        std::cout << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) return kExitConfigError;

    // Load configuration
    Config config = default_config();
    auto config_result = load_config(args->config_path);
    if (config_result) {
        config = std::move(*config_result);
    } else if (args->config_explicit) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        return kExitConfigError;
    } else {
        std::cerr << "No configuration loaded (" << config_result.error().message
                  << "), using defaults." << std::endl;
    }

    auto level = parse_log_level(args->log_level.value_or(config.telemetry.log_level));
    if (!level) {
        std::cerr << level.error().message << std::endl;
        return kExitConfigError;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "agent_orchestrator",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), *level);
    logger.info("agent_orchestrator starting with " + std::to_string(config.agents.size())
                + " declared agents");

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<MetricsCollector> metrics;
    if (config.telemetry.metrics_enabled && !config.telemetry.log_dir.empty()) {
        metrics = std::make_unique<MetricsCollector>(std::make_unique<JsonFileSink>(
            config.telemetry.log_dir, "agent_metrics",
            config.telemetry.max_file_size_mb, config.telemetry.rotate_count));
    }

    // ── Build graph, pool and orchestrator ───
    InputPatternTable patterns;
    for (const auto& decl : config.agents) {
        for (const auto& pattern : decl.patterns) {
            if (auto added = patterns.add(decl.name, pattern); !added) {
                logger.error(added.error().message);
                return kExitConfigError;
            }
        }
    }

    DependencyGraph graph(std::move(patterns));
    AgentPool pool(config.pool, logger);
    Orchestrator orchestrator(graph, pool, logger, config.orchestrator, metrics.get());

    for (const auto& decl : config.agents) {
        auto registered = orchestrator.register_agent(
            decl.name, std::make_shared<SimulatedWork>(decl.name, decl.simulated_work),
            decl.dependencies, decl.overrides);
        if (!registered) {
            logger.error(registered.error().message);
            return kExitConfigError;
        }
    }

    if (args->plan_only) {
        auto plan = orchestrator.build_execution_plan(args->changed_inputs);
        if (!plan) {
            std::cerr << plan.error().message << std::endl;
            return kExitFailure;
        }
        print_plan(*plan);
        return kExitSuccess;
    }

    // Register signal handlers; a watcher turns them into an emergency stop.
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::jthread stop_watcher([&orchestrator](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                orchestrator.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    auto result = orchestrator.execute(args->changed_inputs);
    stop_watcher.request_stop();

    if (metrics) metrics->flush();
    logger.flush();

    if (!result) {
        std::cerr << "Orchestration failed: " << result.error().message << std::endl;
        return kExitFailure;
    }

    print_summary(*result, pool.get_pool_stats());
    return result->success ? kExitSuccess : kExitFailure;
}

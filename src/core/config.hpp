/**
 * @file config.hpp
 * @brief Orchestrator configuration with TOML deserialization.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief Pool-wide invocation policy.
 *
 * `defaults` applies to every agent field not overridden at registration.
 */
struct PoolConfig {
    AgentConfig defaults;
    uint32_t rate_limit_max = 10;               ///< Invocations allowed per rate window
    Duration rate_limit_window{60000};
    uint32_t circular_update_threshold = 5;     ///< Invocations allowed per circular window
    Duration circular_update_window{10000};
    size_t max_history_size = 100;
    Duration retry_backoff_base{0};             ///< 0 = wait only the cooldown between retries
    Duration retry_backoff_max{10000};
};

struct OrchestratorConfig {
    uint32_t max_concurrency = 5;
    FailurePolicy failure_policy = FailurePolicy::SkipDependents;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;              ///< Empty = log to stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool metrics_enabled = true;
};

/**
 * @brief One `[[agents]]` entry.
 */
struct AgentDeclaration {
    AgentName name;
    std::vector<AgentName> dependencies;
    std::vector<std::string> patterns;          ///< ECMAScript regexes over changed inputs
    AgentConfigOverrides overrides;
    Duration simulated_work{0};                 ///< Used by the command line driver only
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    PoolConfig pool;
    OrchestratorConfig orchestrator;
    TelemetryConfig telemetry;
    std::vector<AgentDeclaration> agents;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Parse "skip_dependents" / "continue".
 */
Result<FailurePolicy> parse_failure_policy(std::string_view text);

}  // namespace agent_orchestrator

/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <unordered_set>

namespace agent_orchestrator {

namespace {

/// Reads a non-negative integer key, keeping `fallback` when absent.
Result<int64_t> read_non_negative(const toml::node_view<const toml::node>& node,
                                  std::string_view key,
                                  int64_t fallback) {
    auto value = node[key].value<int64_t>();
    if (!value) {
        if (node[key]) {
            return Error{"Expected integer for '" + std::string{key} + "'"};
        }
        return fallback;
    }
    if (*value < 0) {
        return Error{"Negative value for '" + std::string{key} + "'"};
    }
    return *value;
}

Result<std::vector<std::string>> read_string_array(const toml::node_view<const toml::node>& node,
                                                   std::string_view key) {
    std::vector<std::string> out;
    if (!node[key]) return out;

    const auto* arr = node[key].as_array();
    if (!arr) {
        return Error{"Expected array of strings for '" + std::string{key} + "'"};
    }
    for (const auto& element : *arr) {
        auto text = element.value<std::string>();
        if (!text) {
            return Error{"Expected array of strings for '" + std::string{key} + "'"};
        }
        out.push_back(std::move(*text));
    }
    return out;
}

Result<AgentDeclaration> read_agent(const toml::node_view<const toml::node>& entry, size_t index) {
    AgentDeclaration decl;

    auto name = entry["name"].value<std::string>();
    if (!name || name->empty()) {
        return Error{"agents[" + std::to_string(index) + "] is missing a name"};
    }
    decl.name = std::move(*name);

    auto deps = read_string_array(entry, "dependencies");
    if (!deps) return deps.error();
    decl.dependencies = std::move(*deps);

    auto patterns = read_string_array(entry, "patterns");
    if (!patterns) return patterns.error();
    decl.patterns = std::move(*patterns);

    if (entry["timeout_ms"]) {
        auto timeout = read_non_negative(entry, "timeout_ms", 0);
        if (!timeout) return timeout.error();
        decl.overrides.timeout = Duration{*timeout};
    }
    if (entry["max_retries"]) {
        auto retries = read_non_negative(entry, "max_retries", 0);
        if (!retries) return retries.error();
        decl.overrides.max_retries = static_cast<uint32_t>(*retries);
    }
    if (entry["cooldown_ms"]) {
        auto cooldown = read_non_negative(entry, "cooldown_ms", 0);
        if (!cooldown) return cooldown.error();
        decl.overrides.cooldown = Duration{*cooldown};
    }

    auto work = read_non_negative(entry, "simulated_work_ms", 0);
    if (!work) return work.error();
    decl.simulated_work = Duration{*work};

    return decl;
}

Result<Config> build_config(const toml::table& tbl) {
    Config config;
    const toml::node_view<const toml::node> root{tbl};

    // [pool]
    if (auto pool = root["pool"]; pool.is_table()) {
        auto& p = config.pool;

        auto timeout = read_non_negative(pool, "default_timeout_ms", p.defaults.timeout.count());
        if (!timeout) return timeout.error();
        p.defaults.timeout = Duration{*timeout};

        auto retries = read_non_negative(pool, "default_max_retries", p.defaults.max_retries);
        if (!retries) return retries.error();
        p.defaults.max_retries = static_cast<uint32_t>(*retries);

        auto cooldown = read_non_negative(pool, "default_cooldown_ms", p.defaults.cooldown.count());
        if (!cooldown) return cooldown.error();
        p.defaults.cooldown = Duration{*cooldown};

        auto rate_max = read_non_negative(pool, "rate_limit_max", p.rate_limit_max);
        if (!rate_max) return rate_max.error();
        p.rate_limit_max = static_cast<uint32_t>(*rate_max);

        auto rate_window = read_non_negative(pool, "rate_limit_window_ms", p.rate_limit_window.count());
        if (!rate_window) return rate_window.error();
        p.rate_limit_window = Duration{*rate_window};

        auto circ_max = read_non_negative(pool, "circular_update_threshold",
                                          p.circular_update_threshold);
        if (!circ_max) return circ_max.error();
        p.circular_update_threshold = static_cast<uint32_t>(*circ_max);

        auto circ_window = read_non_negative(pool, "circular_update_window_ms",
                                             p.circular_update_window.count());
        if (!circ_window) return circ_window.error();
        p.circular_update_window = Duration{*circ_window};

        auto history = read_non_negative(pool, "max_history_size",
                                         static_cast<int64_t>(p.max_history_size));
        if (!history) return history.error();
        p.max_history_size = static_cast<size_t>(*history);

        auto backoff = read_non_negative(pool, "retry_backoff_base_ms", p.retry_backoff_base.count());
        if (!backoff) return backoff.error();
        p.retry_backoff_base = Duration{*backoff};

        auto backoff_max = read_non_negative(pool, "retry_backoff_max_ms", p.retry_backoff_max.count());
        if (!backoff_max) return backoff_max.error();
        p.retry_backoff_max = Duration{*backoff_max};
    }

    // [orchestrator]
    if (auto orch = root["orchestrator"]; orch.is_table()) {
        auto concurrency = read_non_negative(orch, "max_concurrency",
                                             config.orchestrator.max_concurrency);
        if (!concurrency) return concurrency.error();
        if (*concurrency == 0) {
            return Error{"orchestrator.max_concurrency must be at least 1"};
        }
        config.orchestrator.max_concurrency = static_cast<uint32_t>(*concurrency);

        if (auto policy = orch["failure_policy"].value<std::string>()) {
            auto parsed = parse_failure_policy(*policy);
            if (!parsed) return parsed.error();
            config.orchestrator.failure_policy = *parsed;
        }
    }

    // [telemetry]
    if (auto telemetry = root["telemetry"]; telemetry.is_table()) {
        auto& t = config.telemetry;
        t.log_dir = telemetry["log_dir"].value_or(std::string{});

        auto file_size = read_non_negative(telemetry, "max_file_size_mb", t.max_file_size_mb);
        if (!file_size) return file_size.error();
        t.max_file_size_mb = static_cast<uint32_t>(*file_size);

        auto rotate = read_non_negative(telemetry, "rotate_count", t.rotate_count);
        if (!rotate) return rotate.error();
        t.rotate_count = static_cast<uint32_t>(*rotate);

        t.log_level = telemetry["log_level"].value_or(std::string{"info"});
        if (auto level = parse_log_level(t.log_level); !level) {
            return level.error();
        }
        t.metrics_enabled = telemetry["metrics"].value_or(true);
    }

    // [[agents]]
    if (root["agents"]) {
        const auto* agents = root["agents"].as_array();
        if (!agents) {
            return Error{"'agents' must be an array of tables"};
        }

        std::unordered_set<AgentName> seen;
        for (size_t i = 0; i < agents->size(); ++i) {
            const toml::node_view<const toml::node> entry{agents->get(i)};
            if (!entry.is_table()) {
                return Error{"agents[" + std::to_string(i) + "] must be a table"};
            }
            auto decl = read_agent(entry, i);
            if (!decl) return decl.error();
            if (!seen.insert(decl->name).second) {
                return Error{"Duplicate agent declaration: " + decl->name};
            }
            config.agents.push_back(std::move(*decl));
        }
    }

    return config;
}

}  // namespace

Result<FailurePolicy> parse_failure_policy(std::string_view text) {
    if (text == "skip_dependents") return FailurePolicy::SkipDependents;
    if (text == "continue") return FailurePolicy::Continue;
    return Error{"Unknown failure policy: " + std::string{text}};
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return build_config(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return build_config(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace agent_orchestrator

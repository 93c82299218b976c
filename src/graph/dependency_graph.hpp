/**
 * @file dependency_graph.hpp
 * @brief Agent-to-agent dependency graph.
 *
 * Stores "agent X requires agent Y" edges, produces a dependency-respecting
 * execution order, detects cycles and assigns every agent a level such that
 * agents sharing a level have no dependency relation and may run together.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/input_patterns.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief A single agent node in the dependency graph.
 */
struct DependencyNode {
    AgentName name;
    std::vector<AgentName> dependencies;   ///< Agents this node requires
    std::vector<AgentName> dependents;     ///< Reverse edges, derived
    uint32_t level = 1;                    ///< 1 + max(level of dependencies)

    bool operator==(const DependencyNode&) const = default;
};

/**
 * @brief Agents that share a level.
 */
struct ParallelGroup {
    uint32_t level = 1;
    std::vector<AgentName> agents;

    bool operator==(const ParallelGroup&) const = default;
};

struct GraphStats {
    size_t total_agents = 0;
    uint32_t max_level = 0;
    size_t parallel_groups = 0;
};

/**
 * @brief Dependency graph over agent names.
 *
 * Not internally synchronized: the orchestrator only touches it from the
 * thread driving an execution.
 */
class DependencyGraph {
public:
    explicit DependencyGraph(InputPatternTable patterns = {});

    // ── Construction ──────────────────────────
    void add_agent(const AgentName& name, const std::vector<AgentName>& dependencies = {});
    bool remove_dependency(const AgentName& name, const AgentName& dependency);
    bool remove_agent(const AgentName& name);
    void clear();

    void set_input_patterns(InputPatternTable patterns);
    [[nodiscard]] const InputPatternTable& input_patterns() const noexcept { return patterns_; }

    // ── Ordering ──────────────────────────────
    /// Depth-first topological order; also re-derives levels on success.
    Result<std::vector<AgentName>> build_execution_order();
    [[nodiscard]] std::vector<ParallelGroup> get_parallel_groups() const;
    [[nodiscard]] bool has_circular_dependencies();

    // ── Queries ───────────────────────────────
    [[nodiscard]] std::vector<AgentName> get_dependents(const AgentName& name) const;
    [[nodiscard]] std::vector<AgentName> get_dependencies(const AgentName& name) const;
    [[nodiscard]] std::vector<AgentName> get_transitive_dependents(const AgentName& name) const;
    [[nodiscard]] std::vector<AgentName> get_affected_agents(
        const std::vector<std::string>& changed_inputs) const;

    [[nodiscard]] bool contains(const AgentName& name) const;
    [[nodiscard]] std::optional<uint32_t> level(const AgentName& name) const;
    [[nodiscard]] std::optional<DependencyNode> get_node(const AgentName& name) const;
    [[nodiscard]] const std::vector<AgentName>& agent_names() const noexcept { return insertion_order_; }
    [[nodiscard]] const std::vector<AgentName>& execution_order() const noexcept { return execution_order_; }
    [[nodiscard]] size_t agent_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] GraphStats stats() const;

private:
    DependencyNode& ensure_node(const AgentName& name);
    void calculate_levels();

    std::unordered_map<AgentName, DependencyNode> nodes_;
    std::vector<AgentName> insertion_order_;
    std::vector<AgentName> execution_order_;
    InputPatternTable patterns_;
};

}  // namespace agent_orchestrator

/**
 * @file dependency_graph.cpp
 * @brief DependencyGraph implementation: ordering, levels and impact queries.
 *
 * Ordering is an iterative DFS post-order (dependencies before dependents)
 * walked in registration order. Levels are re-derived by relaxation until a
 * fixpoint, bounded by the node count.
 */

#include "graph/dependency_graph.hpp"

#include <algorithm>
#include <map>
#include <queue>
#include <stack>
#include <unordered_set>

namespace agent_orchestrator {

DependencyGraph::DependencyGraph(InputPatternTable patterns)
    : patterns_(std::move(patterns)) {}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

DependencyNode& DependencyGraph::ensure_node(const AgentName& name) {
    auto it = nodes_.find(name);
    if (it != nodes_.end()) return it->second;

    insertion_order_.push_back(name);
    auto [inserted, _] = nodes_.emplace(name, DependencyNode{.name = name});
    return inserted->second;
}

void DependencyGraph::add_agent(const AgentName& name, const std::vector<AgentName>& dependencies) {
    ensure_node(name);

    std::vector<AgentName> unique_deps;
    unique_deps.reserve(dependencies.size());
    for (const auto& dep : dependencies) {
        if (std::find(unique_deps.begin(), unique_deps.end(), dep) == unique_deps.end()) {
            unique_deps.push_back(dep);
        }
    }

    // Drop reverse edges for dependencies that are no longer listed.
    for (const auto& old_dep : nodes_.at(name).dependencies) {
        if (std::find(unique_deps.begin(), unique_deps.end(), old_dep) != unique_deps.end()) continue;
        if (auto it = nodes_.find(old_dep); it != nodes_.end()) {
            std::erase(it->second.dependents, name);
        }
    }

    for (const auto& dep : unique_deps) {
        auto& dep_node = ensure_node(dep);
        if (std::find(dep_node.dependents.begin(), dep_node.dependents.end(), name)
            == dep_node.dependents.end()) {
            dep_node.dependents.push_back(name);
        }
    }

    // ensure_node() may rehash, so look the node up again.
    nodes_.at(name).dependencies = std::move(unique_deps);
}

bool DependencyGraph::remove_dependency(const AgentName& name, const AgentName& dependency) {
    auto it = nodes_.find(name);
    if (it == nodes_.end()) return false;

    auto& deps = it->second.dependencies;
    auto dep_it = std::find(deps.begin(), deps.end(), dependency);
    if (dep_it == deps.end()) return false;
    deps.erase(dep_it);

    if (auto d = nodes_.find(dependency); d != nodes_.end()) {
        std::erase(d->second.dependents, name);
    }
    return true;
}

bool DependencyGraph::remove_agent(const AgentName& name) {
    auto it = nodes_.find(name);
    if (it == nodes_.end()) return false;

    for (const auto& dep : it->second.dependencies) {
        if (auto d = nodes_.find(dep); d != nodes_.end()) {
            std::erase(d->second.dependents, name);
        }
    }
    for (const auto& dependent : it->second.dependents) {
        if (auto d = nodes_.find(dependent); d != nodes_.end()) {
            std::erase(d->second.dependencies, name);
        }
    }

    nodes_.erase(it);
    std::erase(insertion_order_, name);
    std::erase(execution_order_, name);
    return true;
}

void DependencyGraph::clear() {
    nodes_.clear();
    insertion_order_.clear();
    execution_order_.clear();
}

void DependencyGraph::set_input_patterns(InputPatternTable patterns) {
    patterns_ = std::move(patterns);
}

// ─────────────────────────────────────────────
// Execution Order (DFS post-order)
// ─────────────────────────────────────────────

Result<std::vector<AgentName>> DependencyGraph::build_execution_order() {
    std::vector<AgentName> order;
    order.reserve(nodes_.size());

    std::unordered_set<AgentName> visited;
    std::unordered_set<AgentName> visiting;

    struct Frame {
        const DependencyNode* node;
        size_t dep_idx;
    };

    for (const auto& start : insertion_order_) {
        if (visited.contains(start)) continue;

        std::stack<Frame> dfs_stack;
        dfs_stack.push({&nodes_.at(start), 0});
        visiting.insert(start);

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.top();
            const auto& deps = frame.node->dependencies;

            if (frame.dep_idx >= deps.size()) {
                visiting.erase(frame.node->name);
                visited.insert(frame.node->name);
                order.push_back(frame.node->name);
                dfs_stack.pop();
                continue;
            }

            const auto& dep = deps[frame.dep_idx];
            ++frame.dep_idx;

            if (visited.contains(dep)) continue;
            if (visiting.contains(dep)) {
                return Error{"Circular dependency detected involving " + dep};
            }

            auto dep_it = nodes_.find(dep);
            if (dep_it == nodes_.end()) continue;

            visiting.insert(dep);
            dfs_stack.push({&dep_it->second, 0});
        }
    }

    execution_order_ = order;
    calculate_levels();
    return order;
}

void DependencyGraph::calculate_levels() {
    for (auto& [_, node] : nodes_) {
        node.level = 1;
    }

    // Each pass can only raise levels; an acyclic graph settles within
    // |nodes| passes, the bound guards against anything pathological.
    bool changed = true;
    size_t passes = 0;
    while (changed && passes <= nodes_.size()) {
        changed = false;
        ++passes;
        for (const auto& name : insertion_order_) {
            auto& node = nodes_.at(name);
            if (node.dependencies.empty()) continue;

            uint32_t max_dep_level = 0;
            for (const auto& dep : node.dependencies) {
                auto it = nodes_.find(dep);
                max_dep_level = std::max(max_dep_level, it != nodes_.end() ? it->second.level : 1u);
            }

            if (max_dep_level + 1 > node.level) {
                node.level = max_dep_level + 1;
                changed = true;
            }
        }
    }
}

std::vector<ParallelGroup> DependencyGraph::get_parallel_groups() const {
    std::map<uint32_t, std::vector<AgentName>> by_level;
    for (const auto& name : insertion_order_) {
        by_level[nodes_.at(name).level].push_back(name);
    }

    std::vector<ParallelGroup> groups;
    groups.reserve(by_level.size());
    for (auto& [level, agents] : by_level) {
        groups.push_back(ParallelGroup{.level = level, .agents = std::move(agents)});
    }
    return groups;
}

bool DependencyGraph::has_circular_dependencies() {
    return !build_execution_order().has_value();
}

// ─────────────────────────────────────────────
// Query Methods
// ─────────────────────────────────────────────

std::vector<AgentName> DependencyGraph::get_dependents(const AgentName& name) const {
    auto it = nodes_.find(name);
    if (it == nodes_.end()) return {};
    return it->second.dependents;
}

std::vector<AgentName> DependencyGraph::get_dependencies(const AgentName& name) const {
    auto it = nodes_.find(name);
    if (it == nodes_.end()) return {};
    return it->second.dependencies;
}

std::vector<AgentName> DependencyGraph::get_transitive_dependents(const AgentName& name) const {
    std::vector<AgentName> result;
    std::unordered_set<AgentName> seen{name};
    std::queue<AgentName> frontier;
    frontier.push(name);

    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();

        auto it = nodes_.find(current);
        if (it == nodes_.end()) continue;

        for (const auto& dependent : it->second.dependents) {
            if (seen.insert(dependent).second) {
                result.push_back(dependent);
                frontier.push(dependent);
            }
        }
    }
    return result;
}

std::vector<AgentName> DependencyGraph::get_affected_agents(
    const std::vector<std::string>& changed_inputs) const {
    std::vector<AgentName> affected;
    std::unordered_set<AgentName> seen;

    auto mark = [&](const AgentName& agent) {
        if (seen.insert(agent).second) {
            affected.push_back(agent);
        }
    };

    for (const auto& input : changed_inputs) {
        for (const auto& agent : patterns_.match(input)) {
            mark(agent);
            for (const auto& dependent : get_transitive_dependents(agent)) {
                mark(dependent);
            }
        }
    }
    return affected;
}

bool DependencyGraph::contains(const AgentName& name) const {
    return nodes_.contains(name);
}

std::optional<uint32_t> DependencyGraph::level(const AgentName& name) const {
    auto it = nodes_.find(name);
    if (it == nodes_.end()) return std::nullopt;
    return it->second.level;
}

std::optional<DependencyNode> DependencyGraph::get_node(const AgentName& name) const {
    auto it = nodes_.find(name);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

GraphStats DependencyGraph::stats() const {
    GraphStats stats;
    stats.total_agents = nodes_.size();
    for (const auto& [_, node] : nodes_) {
        stats.max_level = std::max(stats.max_level, node.level);
    }
    stats.parallel_groups = get_parallel_groups().size();
    return stats;
}

}  // namespace agent_orchestrator

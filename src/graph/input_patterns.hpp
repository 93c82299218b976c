/**
 * @file input_patterns.hpp
 * @brief Maps changed inputs (file paths) onto the agents they affect.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <regex>
#include <string>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief Table of `{agent: [pattern...]}` used for change-driven planning.
 *
 * Patterns are ECMAScript regular expressions matched anywhere in the input
 * (regex_search semantics). Agents keep the order in which they were first
 * added so query results are deterministic.
 */
class InputPatternTable {
public:
    InputPatternTable() = default;

    /// Compile and append a pattern for `agent`. Invalid expressions are rejected.
    Result<void> add(const AgentName& agent, const std::string& pattern);

    /// Agents with at least one pattern matching `input`.
    [[nodiscard]] std::vector<AgentName> match(const std::string& input) const;

    [[nodiscard]] bool matches(const AgentName& agent, const std::string& input) const;
    [[nodiscard]] std::vector<std::string> patterns_for(const AgentName& agent) const;
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    struct Entry {
        AgentName agent;
        std::vector<std::string> sources;
        std::vector<std::regex> compiled;
    };

    Entry* find(const AgentName& agent);
    const Entry* find(const AgentName& agent) const;

    std::vector<Entry> entries_;
};

}  // namespace agent_orchestrator

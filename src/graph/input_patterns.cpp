/**
 * @file input_patterns.cpp
 * @brief InputPatternTable implementation.
 */

#include "graph/input_patterns.hpp"

#include <algorithm>

namespace agent_orchestrator {

Result<void> InputPatternTable::add(const AgentName& agent, const std::string& pattern) {
    std::regex compiled;
    try {
        compiled = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& err) {
        return Error{"Invalid pattern for " + agent + " '" + pattern + "': " + err.what()};
    }

    Entry* entry = find(agent);
    if (!entry) {
        entries_.push_back(Entry{.agent = agent, .sources = {}, .compiled = {}});
        entry = &entries_.back();
    }
    entry->sources.push_back(pattern);
    entry->compiled.push_back(std::move(compiled));
    return Result<void>{};
}

std::vector<AgentName> InputPatternTable::match(const std::string& input) const {
    std::vector<AgentName> matched;
    for (const auto& entry : entries_) {
        bool hit = std::any_of(entry.compiled.begin(), entry.compiled.end(),
                               [&](const std::regex& re) { return std::regex_search(input, re); });
        if (hit) {
            matched.push_back(entry.agent);
        }
    }
    return matched;
}

bool InputPatternTable::matches(const AgentName& agent, const std::string& input) const {
    const Entry* entry = find(agent);
    if (!entry) return false;
    return std::any_of(entry->compiled.begin(), entry->compiled.end(),
                       [&](const std::regex& re) { return std::regex_search(input, re); });
}

std::vector<std::string> InputPatternTable::patterns_for(const AgentName& agent) const {
    const Entry* entry = find(agent);
    if (!entry) return {};
    return entry->sources;
}

InputPatternTable::Entry* InputPatternTable::find(const AgentName& agent) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.agent == agent; });
    return it == entries_.end() ? nullptr : &*it;
}

const InputPatternTable::Entry* InputPatternTable::find(const AgentName& agent) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.agent == agent; });
    return it == entries_.end() ? nullptr : &*it;
}

}  // namespace agent_orchestrator

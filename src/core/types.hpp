/**
 * @file types.hpp
 * @brief Fundamental types used throughout AgentOrchestrator.
 *
 * Defines AgentName, per-agent configuration, status and refusal vocabulary.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace agent_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using AgentName = std::string;
using AgentOutput = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Agent Configuration
// ─────────────────────────────────────────────

/**
 * @brief Effective invocation policy of a single agent.
 */
struct AgentConfig {
    Duration timeout{30000};          ///< Upper bound for one attempt
    uint32_t max_retries{3};          ///< Retries after the first attempt
    Duration cooldown{0};             ///< Gap enforced between invocations

    auto operator<=>(const AgentConfig&) const = default;
};

/**
 * @brief Partial configuration supplied at registration time.
 *
 * Unset fields keep their current value (re-registration) or fall back to
 * the pool-wide defaults (first registration).
 */
struct AgentConfigOverrides {
    std::optional<Duration> timeout;
    std::optional<uint32_t> max_retries;
    std::optional<Duration> cooldown;

    [[nodiscard]] AgentConfig apply_to(AgentConfig base) const {
        if (timeout) base.timeout = *timeout;
        if (max_retries) base.max_retries = *max_retries;
        if (cooldown) base.cooldown = *cooldown;
        return base;
    }
};

// ─────────────────────────────────────────────
// Agent Status
// ─────────────────────────────────────────────

enum class AgentStatus : uint8_t {
    Idle,          ///< Ready to be invoked
    Running,       ///< An invocation is in flight
    Failed         ///< Last invocation exhausted its retries
};

[[nodiscard]] constexpr std::string_view to_string(AgentStatus status) noexcept {
    switch (status) {
        case AgentStatus::Idle:    return "idle";
        case AgentStatus::Running: return "running";
        case AgentStatus::Failed:  return "failed";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Scheduling Refusals
// ─────────────────────────────────────────────

/**
 * @brief Why the pool declined to start an invocation.
 *
 * Listed in the order the checks are evaluated.
 */
enum class RefusalReason : uint8_t {
    NotRegistered,
    AlreadyRunning,
    Cooldown,
    RateLimited,
    CircularUpdate
};

[[nodiscard]] constexpr std::string_view to_string(RefusalReason reason) noexcept {
    switch (reason) {
        case RefusalReason::NotRegistered:  return "not_registered";
        case RefusalReason::AlreadyRunning: return "already_running";
        case RefusalReason::Cooldown:       return "cooldown";
        case RefusalReason::RateLimited:    return "rate_limited";
        case RefusalReason::CircularUpdate: return "circular_update";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Failure Policy
// ─────────────────────────────────────────────

/**
 * @brief What the orchestrator does with agents whose upstream failed.
 */
enum class FailurePolicy : uint8_t {
    SkipDependents,   ///< Never start a transitive dependent of a failed agent
    Continue          ///< Attempt dependents anyway
};

[[nodiscard]] constexpr std::string_view to_string(FailurePolicy policy) noexcept {
    switch (policy) {
        case FailurePolicy::SkipDependents: return "skip_dependents";
        case FailurePolicy::Continue:       return "continue";
    }
    return "unknown";
}

}  // namespace agent_orchestrator

/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for AgentOrchestrator interfaces.
 *
 * Constrains the callables that may be handed to the pool as agent work, so
 * a lambda with the wrong shape fails at the call site rather than deep in
 * the attempt runner.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <stop_token>
#include <type_traits>

namespace agent_orchestrator {

// ─────────────────────────────────────────────
// AgentOperation
// ─────────────────────────────────────────────

/**
 * @concept CancellableOperation
 * @brief Work that observes a stop_token and yields an output or an error.
 *
 * The token is signalled when the attempt times out; honouring it is
 * optional but lets abandoned attempts end early.
 */
template <typename F>
concept CancellableOperation =
    std::invocable<F&, std::stop_token> &&
    (std::is_void_v<std::invoke_result_t<F&, std::stop_token>> ||
     std::convertible_to<std::invoke_result_t<F&, std::stop_token>, Result<AgentOutput>>);

/**
 * @concept PlainOperation
 * @brief Zero-argument work yielding an output, an error, or nothing.
 */
template <typename F>
concept PlainOperation =
    std::invocable<F&> &&
    (std::is_void_v<std::invoke_result_t<F&>> ||
     std::convertible_to<std::invoke_result_t<F&>, Result<AgentOutput>>);

/**
 * @concept AgentOperation
 * @brief Anything the AgentPool accepts as the body of an agent.
 */
template <typename F>
concept AgentOperation = CancellableOperation<F> || PlainOperation<F>;

}  // namespace agent_orchestrator

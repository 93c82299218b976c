/**
 * @file invocable.hpp
 * @brief Capability interface for the work an agent performs.
 *
 * The scheduler knows nothing about what an agent does; it only needs
 * something it can invoke that yields an output or an error.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <stop_token>
#include <type_traits>
#include <utility>

namespace agent_orchestrator {

/**
 * @brief Abstract unit of agent work.
 *
 * invoke() may be called from a worker thread and, after a timeout, may
 * still be running while the pool retries. The stop_token is signalled when
 * the pool stops waiting for an attempt.
 */
class IInvocable {
public:
    virtual ~IInvocable() = default;

    virtual Result<AgentOutput> invoke(std::stop_token stop) = 0;
};

/**
 * @brief Adapts any AgentOperation callable to IInvocable.
 */
template <AgentOperation F>
class FunctionInvocable final : public IInvocable {
public:
    explicit FunctionInvocable(F func) : func_(std::move(func)) {}

    Result<AgentOutput> invoke(std::stop_token stop) override {
        if constexpr (CancellableOperation<F>) {
            using R = std::invoke_result_t<F&, std::stop_token>;
            if constexpr (std::is_void_v<R>) {
                func_(stop);
                return AgentOutput{};
            } else {
                return Result<AgentOutput>(func_(stop));
            }
        } else {
            using R = std::invoke_result_t<F&>;
            if constexpr (std::is_void_v<R>) {
                func_();
                return AgentOutput{};
            } else {
                return Result<AgentOutput>(func_());
            }
        }
    }

private:
    F func_;
};

template <AgentOperation F>
std::shared_ptr<IInvocable> make_invocable(F&& func) {
    return std::make_shared<FunctionInvocable<std::decay_t<F>>>(std::forward<F>(func));
}

}  // namespace agent_orchestrator

/**
 * @file attempt_runner.cpp
 * @brief AttemptRunner implementation with cooperative cancellation.
 */

#include "executor/attempt_runner.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <system_error>
#include <thread>

namespace agent_orchestrator {

namespace {

// Outlives the runner when an attempt is abandoned after a timeout.
struct AttemptState {
    std::promise<Result<AgentOutput>> promise;
    std::stop_source stop;
};

}  // namespace

AttemptOutcome AttemptRunner::run(const AgentName& agent,
                                  const std::shared_ptr<IInvocable>& operation,
                                  Duration timeout) {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
    };

    if (!operation) {
        return AttemptOutcome{
            .success = false,
            .timed_out = false,
            .output = {},
            .error = "Agent " + agent + " has no operation",
            .elapsed = Duration{0}
        };
    }

    auto state = std::make_shared<AttemptState>();
    auto future = state->promise.get_future();

    try {
        std::thread([state, operation] {
            try {
                state->promise.set_value(operation->invoke(state->stop.get_token()));
            } catch (const std::exception& e) {
                state->promise.set_value(Error{e.what()});
            } catch (...) {
                state->promise.set_value(Error{"unknown exception"});
            }
        }).detach();
    } catch (const std::system_error& e) {
        return AttemptOutcome{
            .success = false,
            .timed_out = false,
            .output = {},
            .error = std::string{"Could not start attempt thread: "} + e.what(),
            .elapsed = elapsed()
        };
    }

    if (timeout.count() > 0 && future.wait_for(timeout) != std::future_status::ready) {
        state->stop.request_stop();
        return AttemptOutcome{
            .success = false,
            .timed_out = true,
            .output = {},
            .error = "Agent " + agent + " timed out after " + std::to_string(timeout.count()) + "ms",
            .elapsed = elapsed()
        };
    }

    auto result = future.get();
    if (!result.has_value()) {
        return AttemptOutcome{
            .success = false,
            .timed_out = false,
            .output = {},
            .error = result.error().message,
            .elapsed = elapsed()
        };
    }

    return AttemptOutcome{
        .success = true,
        .timed_out = false,
        .output = std::move(*result),
        .error = {},
        .elapsed = elapsed()
    };
}

}  // namespace agent_orchestrator

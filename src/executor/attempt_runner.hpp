/**
 * @file attempt_runner.hpp
 * @brief Runs a single attempt of an agent operation under a time budget.
 */

#pragma once

#include "core/types.hpp"
#include "executor/invocable.hpp"

#include <memory>
#include <string>

namespace agent_orchestrator {

struct AttemptOutcome {
    bool success = false;
    bool timed_out = false;
    AgentOutput output;
    std::string error;
    Duration elapsed{0};
};

/**
 * @brief Executes one attempt on a dedicated thread and waits at most `timeout`.
 *
 * On expiry the runner requests a stop on the attempt's stop_token and
 * returns a timed-out outcome; the operation itself may keep running in the
 * background until it notices or finishes. Exceptions escaping the
 * operation are reported as failed attempts. A zero timeout waits forever.
 */
class AttemptRunner {
public:
    AttemptOutcome run(const AgentName& agent,
                       const std::shared_ptr<IInvocable>& operation,
                       Duration timeout);
};

}  // namespace agent_orchestrator

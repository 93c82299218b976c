/**
 * @file clock.cpp
 * @brief SystemClock and ManualClock implementations.
 */

#include "core/clock.hpp"

#include <thread>

namespace agent_orchestrator {

// ── SystemClock ──────────────────────────────

Timestamp SystemClock::now() const {
    return std::chrono::system_clock::now();
}

void SystemClock::sleep_for(Duration duration) {
    if (duration.count() <= 0) return;
    std::this_thread::sleep_for(duration);
}

// ── ManualClock ──────────────────────────────

ManualClock::ManualClock(Timestamp start) : now_(start) {}

Timestamp ManualClock::now() const {
    std::lock_guard lock(mutex_);
    return now_;
}

void ManualClock::sleep_for(Duration duration) {
    if (duration.count() <= 0) return;
    advance(duration);
}

void ManualClock::advance(Duration duration) {
    std::lock_guard lock(mutex_);
    now_ += duration;
}

void ManualClock::set(Timestamp time) {
    std::lock_guard lock(mutex_);
    now_ = time;
}

}  // namespace agent_orchestrator

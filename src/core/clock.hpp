/**
 * @file clock.hpp
 * @brief Injectable time source for cooldown, rate-limit and retry decisions.
 *
 * SystemClock reads the wall clock and really sleeps. ManualClock holds a
 * simulated time that only moves when advanced, so window logic can be
 * tested deterministically without sleeping.
 */

#pragma once

#include "core/types.hpp"

#include <mutex>

namespace agent_orchestrator {

/**
 * @brief Abstract time source.
 */
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual Timestamp now() const = 0;
    virtual void sleep_for(Duration duration) = 0;
};

/**
 * @brief Wall-clock implementation backed by std::chrono::system_clock.
 */
class SystemClock final : public IClock {
public:
    [[nodiscard]] Timestamp now() const override;
    void sleep_for(Duration duration) override;
};

/**
 * @brief Simulated clock for tests. Thread-safe.
 *
 * sleep_for() advances the simulated time instead of blocking.
 */
class ManualClock final : public IClock {
public:
    explicit ManualClock(Timestamp start = Timestamp{Duration{1'700'000'000'000}});

    [[nodiscard]] Timestamp now() const override;
    void sleep_for(Duration duration) override;

    void advance(Duration duration);
    void set(Timestamp time);

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

}  // namespace agent_orchestrator

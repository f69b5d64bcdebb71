/**
 * @file clock.hpp
 * @brief Declares the wall-clock and simulated clock time sources.
 */

#pragma once

#include "core/types.hpp"

namespace core {

/**
 * @class Clock
 * @brief Abstract source of "now".
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Returns the current time in milliseconds since the Unix epoch.
     */
    virtual Timestamp timeNow() const = 0;
};

/**
 * @class LiveClock
 * @brief Reads the system wall clock. Used for measuring engine and run durations.
 */
class LiveClock : public Clock {
public:
    Timestamp timeNow() const override;
};

/**
 * @class TestClock
 * @brief A controllable simulated clock.
 *
 * Only the owner writes to it; collaborators receive a const reference.
 */
class TestClock : public Clock {
public:
    explicit TestClock(Timestamp initial = 0) : time_(initial) {}

    Timestamp timeNow() const override { return time_; }

    /**
     * @brief Sets the clock to the given time.
     * @param time New simulated time
     */
    void setTime(Timestamp time) { time_ = time; }

    /**
     * @brief Advances the clock by the given number of milliseconds.
     * @param step_ms Increment in milliseconds
     */
    void iterateTime(int64_t step_ms) { time_ += step_ms; }

private:
    Timestamp time_;
};

}

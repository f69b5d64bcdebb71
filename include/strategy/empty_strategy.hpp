/**
 * @file empty_strategy.hpp
 * @brief Declares a strategy that never trades.
 */

#pragma once

#include "strategy/strategy.hpp"

namespace strategy {

/**
 * @class EmptyStrategy
 * @brief Counts steps and never submits orders. Baseline for engine behaviour.
 */
class EmptyStrategy : public Strategy {
public:
    explicit EmptyStrategy(const std::string& id = "empty-001") : Strategy(id) {}

    std::string name() const override { return "EmptyStrategy"; }

    uint64_t stepCount() const { return step_count_; }
    core::Timestamp lastStepTime() const { return last_step_time_; }

protected:
    void onStep(core::Timestamp time) override {
        ++step_count_;
        last_step_time_ = time;
    }

    void onReset() override {
        step_count_ = 0;
        last_step_time_ = 0;
    }

private:
    uint64_t step_count_ = 0;
    core::Timestamp last_step_time_ = 0;
};

}

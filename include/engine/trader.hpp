/**
 * @file trader.hpp
 * @brief Declares the coordinator owning the active strategy set and its lifecycle.
 */

#pragma once

#include "core/clock.hpp"
#include "core/logger.hpp"
#include "engine/data_client.hpp"
#include "engine/execution_client.hpp"
#include "portfolio/account.hpp"
#include "portfolio/portfolio.hpp"
#include "strategy/strategy.hpp"

#include <vector>

namespace engine {

/**
 * @class Trader
 * @brief Starts, stops, resets and disposes the strategies of a backtest and steps them in order.
 */
class Trader {
public:
    /**
     * @brief Constructs a Trader over the given strategies and collaborators.
     * @throws core::TypeMismatch if a strategy pointer is null
     * @throws std::invalid_argument if two strategies share an ID
     */
    Trader(const std::vector<strategy::StrategyPtr>& strategies,
           BacktestDataClient& data_client,
           BacktestExecClient& exec_client,
           const portfolio::Account& account,
           const portfolio::Portfolio& portfolio,
           const core::TestClock& clock,
           core::Logger& logger);

    /**
     * @brief Starts every strategy.
     * @throws std::logic_error if disposed
     */
    void start();

    /**
     * @brief Stops every running strategy and cancels its working orders.
     */
    void stop();

    /**
     * @brief Resets every strategy.
     * @throws std::logic_error if running or disposed
     */
    void reset();

    /**
     * @brief Disposes every strategy. Terminal.
     */
    void dispose();

    /**
     * @brief Replaces the strategy set and registers it with the data and execution clients.
     *
     * Working orders of the outgoing strategies are cancelled.
     * @throws std::logic_error if running or disposed
     * @throws core::TypeMismatch if a strategy pointer is null
     * @throws std::invalid_argument if two strategies share an ID
     */
    void changeStrategies(const std::vector<strategy::StrategyPtr>& strategies);

    /**
     * @brief Steps every strategy to time, in set order.
     */
    void stepStrategies(core::Timestamp time);

    const std::vector<strategy::StrategyPtr>& strategies() const { return strategies_; }
    bool isRunning() const { return running_; }
    bool isDisposed() const { return disposed_; }

    /**
     * @brief Checks that a strategy set holds only valid, uniquely identified strategies.
     */
    static void validateStrategies(const std::vector<strategy::StrategyPtr>& strategies);

private:
    std::vector<strategy::StrategyPtr> strategies_;
    BacktestDataClient& data_client_;
    BacktestExecClient& exec_client_;
    const portfolio::Account& account_;
    const portfolio::Portfolio& portfolio_;
    const core::TestClock& clock_;
    core::LoggerAdapter log_;
    bool running_ = false;
    bool disposed_ = false;

    void registerStrategies();
};

}

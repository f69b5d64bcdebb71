/**
 * @file backtest_engine.hpp
 * @brief Declares the backtest engine driving data replay, execution and strategies on a simulated clock.
 */

#pragma once

#include "core/clock.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/config.hpp"
#include "engine/data_client.hpp"
#include "engine/execution_client.hpp"
#include "engine/market_model.hpp"
#include "engine/trader.hpp"
#include "portfolio/account.hpp"
#include "portfolio/portfolio.hpp"
#include "strategy/strategy.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace engine {

/**
 * @class BacktestEngine
 * @brief Replays historical data through simulated execution and steps strategies in a fixed order.
 *
 * The engine owns a single simulated clock shared read-only with the data and
 * execution clients; only run() writes to it. Every strategy gets its own
 * clock, set to the same time before each step. Runs are single-threaded and
 * step-synchronous: at each step the execution client processes the market,
 * both cursors advance, then every running strategy is stepped in set order.
 */
class BacktestEngine {
public:
    /**
     * @brief Constructs and wires a backtest.
     *
     * Strategies are mutated in place: each receives a fresh simulated clock
     * and the engine's logger.
     *
     * @param instruments Instrument universe
     * @param ticks Tick data per symbol (may be empty)
     * @param bars Bar data per symbol and resolution; MINUTE bid/ask are required
     * @param strategies Initial strategy set (may be empty)
     * @param config Validated backtest configuration
     * @param market_model Fill and slippage probabilities
     * @throws core::TypeMismatch for an invalid instrument or a null strategy
     * @throws core::DataInconsistency if the engine, data client and execution client minute indices differ
     */
    BacktestEngine(const std::vector<core::Instrument>& instruments,
                   const core::TickDataMap& ticks,
                   const core::BarDataMap& bars,
                   const std::vector<strategy::StrategyPtr>& strategies,
                   const BacktestConfig& config = BacktestConfig(),
                   const MarketModel& market_model = MarketModel());

    BacktestEngine(const BacktestEngine&) = delete;
    BacktestEngine& operator=(const BacktestEngine&) = delete;

    /**
     * @brief Runs the backtest over [start, stop] in steps of step_minutes.
     * @throws core::InvalidArgument if start >= stop, start precedes the minute index,
     *         stop follows it, or step_minutes <= 0; nothing is mutated in that case
     *
     * An exception raised while stepping stops the strategies and propagates;
     * call reset() before running again.
     */
    void run(core::Timestamp start, core::Timestamp stop, int step_minutes = 1);

    /**
     * @brief Replaces the strategy set; takes effect on the next run().
     * @throws core::TypeMismatch if a strategy pointer is null
     */
    void changeStrategies(const std::vector<strategy::StrategyPtr>& strategies);

    /**
     * @brief Resets the data client, execution client and trader, in that order.
     */
    void reset();

    /**
     * @brief Disposes the trader. No further operation is valid afterwards.
     */
    void dispose();

    /**
     * @brief Returns the portfolio analyzer's performance statistics.
     */
    std::map<std::string, double> getPerformanceStats() const;

    /**
     * @brief Sets the daily benchmark returns used for Alpha and Beta.
     *
     * Kept across reset(). Alpha and Beta stay 0 unless there is one benchmark
     * return per daily return of the run.
     */
    void setBenchmarkReturns(const std::vector<double>& returns);

    const BacktestConfig& config() const { return config_; }
    const std::vector<core::Timestamp>& minuteIndex() const { return minute_index_; }
    uint64_t iteration() const { return exec_client_->iteration(); }
    double totalCommissions() const { return exec_client_->totalCommissions(); }
    const portfolio::Account& account() const { return *account_; }
    const portfolio::Portfolio& portfolio() const { return *portfolio_; }
    const Trader& trader() const { return *trader_; }
    const BacktestExecClient& execClient() const { return *exec_client_; }
    const core::TestClock& clock() const { return *test_clock_; }
    core::Logger& logger() const { return *test_logger_; }
    int64_t timeToInitializeMs() const { return time_to_initialize_ms_; }
    bool isDisposed() const { return disposed_; }

private:
    BacktestConfig config_;
    core::LiveClock live_clock_;
    core::Timestamp created_time_;
    std::unique_ptr<core::TestClock> test_clock_;
    std::unique_ptr<core::TestLogger> test_logger_;

    std::vector<core::Instrument> instruments_;
    std::vector<core::Timestamp> minute_index_;

    std::unique_ptr<portfolio::Account> account_;
    std::unique_ptr<portfolio::Portfolio> portfolio_;
    std::unique_ptr<BacktestDataClient> data_client_;
    std::unique_ptr<BacktestExecClient> exec_client_;
    std::unique_ptr<Trader> trader_;

    int64_t time_to_initialize_ms_ = 0;
    bool disposed_ = false;

    void configureStrategies(const std::vector<strategy::StrategyPtr>& strategies);
    void checkNotDisposed(const char* operation) const;
    void logDiagnostics(core::Timestamp run_started) const;
};

}

/**
 * @file strategy.hpp
 * @brief Defines the Strategy base class for backtested trading strategies.
 */

#pragma once

#include "core/clock.hpp"
#include "core/logger.hpp"
#include "core/order.hpp"
#include "core/trade.hpp"
#include "engine/data_client.hpp"
#include "engine/execution_client.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strategy {

/**
 * @enum StrategyState
 * @brief Lifecycle state of a strategy.
 */
enum class StrategyState {
    INITIALIZED,
    RUNNING,
    STOPPED,
    DISPOSED
};

std::string toString(StrategyState state);

/**
 * @class Strategy
 * @brief Abstract base class for trading strategies.
 *
 * The engine injects a simulated clock, a logger and the data/execution
 * clients, then drives the strategy one step at a time. Subclasses implement
 * the on* hooks. Every market query is answered as of the strategy's own
 * clock, which the engine sets before each step.
 */
class Strategy {
public:
    /**
     * @param id Unique strategy identifier within a backtest
     */
    explicit Strategy(const std::string& id);
    virtual ~Strategy() = default;

    Strategy(const Strategy&) = delete;
    Strategy& operator=(const Strategy&) = delete;

    /**
     * @brief Gets the name of the strategy.
     * @return Name as a string
     */
    virtual std::string name() const = 0;

    const std::string& id() const { return id_; }
    StrategyState state() const { return state_; }
    bool isRunning() const { return state_ == StrategyState::RUNNING; }

    /**
     * @brief Replaces the strategy's clock. The strategy owns it from now on.
     */
    void changeClock(std::unique_ptr<core::TestClock> clock);

    /**
     * @brief Replaces the logger the strategy writes to.
     * @param logger Logger that must outlive the strategy's use of it
     */
    void changeLogger(core::Logger& logger);

    void registerDataClient(const engine::BacktestDataClient& data) { data_ = &data; }
    void registerExecutionClient(engine::BacktestExecClient& exec) { exec_ = &exec; }

    const core::TestClock& clock() const { return *clock_; }

    /**
     * @brief Starts the strategy. No effect if already running.
     * @throws std::logic_error if disposed
     */
    void start();

    /**
     * @brief Stops the strategy. No effect if not running.
     * @throws std::logic_error if disposed
     */
    void stop();

    /**
     * @brief Clears the strategy's internal state.
     * @throws std::logic_error if running or disposed
     */
    void reset();

    /**
     * @brief Releases the strategy; it cannot be used afterwards.
     */
    void dispose();

    /**
     * @brief Moves the strategy clock to time and, when running, invokes onStep().
     */
    void iterate(core::Timestamp time);

    /**
     * @brief Receives a fill of one of this strategy's orders.
     */
    void handleTrade(const core::Trade& trade);

protected:
    virtual void onStart() {}
    virtual void onStep(core::Timestamp time) = 0;
    virtual void onStop() {}
    virtual void onReset() {}
    virtual void onDispose() {}
    virtual void onTrade(const core::Trade& /*trade*/) {}

    core::Timestamp timeNow() const { return clock_->timeNow(); }

    std::optional<double> latestBid(const std::string& symbol) const;
    std::optional<double> latestAsk(const std::string& symbol) const;

    /**
     * @brief Returns up to count bars visible at the strategy's current time.
     */
    std::vector<core::Bar> bars(const std::string& symbol,
                                core::BarResolution resolution,
                                core::PriceType price_type,
                                size_t count) const;

    uint64_t submitMarketOrder(const std::string& symbol, core::Side side, uint32_t quantity);
    uint64_t submitLimitOrder(const std::string& symbol, core::Side side, uint32_t quantity, double price);
    uint64_t submitStopOrder(const std::string& symbol, core::Side side, uint32_t quantity, double price);
    bool cancelOrder(uint64_t order_id);

    void log(core::LogLevel level, const std::string& message) const;

private:
    std::string id_;
    StrategyState state_ = StrategyState::INITIALIZED;
    std::unique_ptr<core::TestClock> clock_;
    core::Logger* logger_ = nullptr;
    const engine::BacktestDataClient* data_ = nullptr;
    engine::BacktestExecClient* exec_ = nullptr;

    const engine::BacktestDataClient& data() const;
    uint64_t submit(const std::string& symbol, core::OrderType type, core::Side side,
                    uint32_t quantity, double price);
};

using StrategyPtr = std::shared_ptr<Strategy>;

}

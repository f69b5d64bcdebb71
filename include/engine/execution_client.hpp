/**
 * @file execution_client.hpp
 * @brief Declares the simulated execution venue of the backtest.
 */

#pragma once

#include "core/clock.hpp"
#include "core/logger.hpp"
#include "core/order.hpp"
#include "core/trade.hpp"
#include "engine/commission.hpp"
#include "engine/market_model.hpp"
#include "portfolio/account.hpp"
#include "portfolio/portfolio.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace engine {

/**
 * @class BacktestExecClient
 * @brief Resolves working orders against replayed minute bid/ask prices.
 *
 * Fills follow the MarketModel (see market_model.hpp); random decisions are
 * drawn from a generator seeded with MarketModel::randomSeed(). Each fill
 * charges commission, updates the portfolio, books realized P&L less
 * commission to the account and is reported to the submitting strategy.
 *
 * Resting limit fills are MAKER, everything else is TAKER. Amounts quoted in
 * another currency are converted into the account currency at the current
 * mid of a pair instrument in the universe (e.g. USDJPY for JPY into USD).
 */
class BacktestExecClient {
public:
    using TradeHandler = std::function<void(const core::Trade&)>;

    /**
     * @brief Constructs the execution client.
     * @param instruments Instrument universe
     * @param minute_bars Minute bid/ask bars per symbol
     * @param starting_capital Opening account balance
     * @param slippage_ticks Ticks a slipped fill moves against the order
     * @param commission_model Commission charged per fill
     * @param market_model Fill and slippage probabilities
     * @param account Account ledger (not owned)
     * @param portfolio Position tracker (not owned)
     * @param clock Shared simulated clock (read only)
     * @param logger Logger for fill reports
     * @throws core::DataInconsistency if the minute bars are unsorted or mismatched
     * @throws core::InvalidConfiguration if a quote currency has no conversion pair into the account currency
     */
    BacktestExecClient(const std::vector<core::Instrument>& instruments,
                       const std::map<std::string, core::BarData>& minute_bars,
                       double starting_capital,
                       int slippage_ticks,
                       std::unique_ptr<CommissionModel> commission_model,
                       const MarketModel& market_model,
                       portfolio::Account& account,
                       portfolio::Portfolio& portfolio,
                       const core::TestClock& clock,
                       core::Logger& logger);

    /**
     * @brief Accepts an order; it is resolved from the next processMarket() on.
     * @return Assigned order ID
     * @throws std::invalid_argument for unknown instruments, zero quantity or non-positive limit/stop prices
     */
    uint64_t submitOrder(core::Order order);

    /**
     * @brief Cancels a working order.
     * @return True if the order was working
     */
    bool cancelOrder(uint64_t order_id);

    /**
     * @brief Cancels every working order of a strategy.
     * @return Number of orders cancelled
     */
    size_t cancelOrders(const std::string& strategy_id);

    /**
     * @brief Routes fills of the given strategy to a handler.
     */
    void registerTradeHandler(const std::string& strategy_id, TradeHandler handler);

    void clearTradeHandlers() { trade_handlers_.clear(); }

    /**
     * @brief Resolves every working order against the prices visible at the cursor
     *        and marks the portfolio to market.
     * @throws core::DataInconsistency if the cursor has drifted from the shared clock
     */
    void processMarket();

    /**
     * @brief Positions the cursor at start with the given step.
     * @throws core::InvalidArgument if start is outside the minute index or step_minutes <= 0
     */
    void setInitialIteration(core::Timestamp start, int step_minutes);

    /**
     * @brief Advances the cursor one step.
     * @throws std::logic_error if called before setInitialIteration()
     */
    void iterate();

    /**
     * @brief Clears orders, fills and counters, reseeds the generator and resets account and portfolio.
     */
    void reset();

    core::Timestamp timeNow() const { return time_now_; }
    uint64_t iteration() const { return iteration_; }
    double totalCommissions() const { return total_commissions_; }
    const std::vector<core::Timestamp>& minuteIndex() const { return minute_index_; }
    const std::vector<core::Order>& workingOrders() const { return working_; }
    const std::vector<core::Trade>& fills() const { return fills_; }

private:
    struct Quote {
        double bid;
        double ask;
    };

    struct Fill {
        double price;
        LiquiditySide liquidity;
    };

    std::map<std::string, core::Instrument> instruments_;
    std::map<std::string, core::BarData> minute_bars_;
    std::vector<core::Timestamp> minute_index_;
    double starting_capital_;
    int slippage_ticks_;
    std::unique_ptr<CommissionModel> commission_model_;
    MarketModel market_model_;
    portfolio::Account& account_;
    portfolio::Portfolio& portfolio_;
    const core::TestClock& clock_;
    core::LoggerAdapter log_;

    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};

    std::vector<core::Order> working_;
    std::vector<core::Trade> fills_;
    std::map<std::string, TradeHandler> trade_handlers_;

    core::Timestamp time_now_ = 0;
    uint64_t iteration_ = 0;
    int64_t step_ms_ = 0;
    uint64_t next_order_id_ = 1;
    uint64_t next_trade_id_ = 1;
    double total_commissions_ = 0.0;

    std::optional<Quote> quoteAt(const std::string& symbol, core::Timestamp time) const;
    std::optional<Fill> fillPrice(const core::Order& order, const Quote& quote, const core::Instrument& instrument);
    double applySlippage(double price, core::Side side, const core::Instrument& instrument);
    bool sample(double probability);
    void fill(const core::Order& order, const Fill& fill);
    std::optional<double> conversionRate(core::Currency from, core::Currency to) const;
    double exchangeRate(const core::Instrument& instrument) const;
};

}

/**
 * @file momentum_trader.hpp
 * @brief Declares a simple momentum-based trading strategy.
 */

#pragma once

#include "strategy/strategy.hpp"

namespace strategy {

/**
 * @class MomentumTrader
 * @brief A trading strategy that reacts to short-term price momentum.
 *
 * Buys when the latest mid close is above the average of the preceding
 * closes and sells when below, with a cooldown in simulated time and a net
 * position limit. Stops itself once P&L falls below max_loss.
 */
class MomentumTrader : public Strategy {
public:
    /**
     * @param id Strategy identifier
     * @param symbol Instrument to trade
     * @param trade_size Units per order
     * @param max_position Maximum absolute net position in units
     * @param max_loss P&L (negative) at which the strategy stops
     * @param lookback Number of minute bars compared, at least 3
     * @param cooldown_minutes Minimum simulated minutes between orders
     */
    MomentumTrader(const std::string& id,
                   const std::string& symbol,
                   uint32_t trade_size,
                   int64_t max_position,
                   double max_loss,
                   size_t lookback = 5,
                   int cooldown_minutes = 1);

    std::string name() const override { return "MomentumTrader"; }

    size_t totalTrades() const { return total_trades_; }
    double averageTradeSize() const {
        return total_trades_ > 0 ? static_cast<double>(total_quantity_) / total_trades_ : 0.0;
    }
    double maxDrawdown() const { return max_drawdown_; }
    bool riskViolated() const { return risk_violated_; }
    int64_t position() const { return position_; }
    double pnl() const { return pnl_; }

protected:
    void onStep(core::Timestamp time) override;
    void onTrade(const core::Trade& trade) override;
    void onStop() override;
    void onReset() override;

private:
    std::string symbol_;
    uint32_t trade_size_;
    int64_t max_position_;
    double max_loss_;
    size_t lookback_;
    int64_t cooldown_ms_;

    core::Timestamp cooldown_end_ts_ = 0;

    int64_t position_ = 0;
    double cash_flow_ = 0.0;
    double pnl_ = 0.0;

    // PnL tracking fields
    double peak_pnl_ = 0.0;
    double max_drawdown_ = 0.0;
    bool risk_violated_ = false;
    size_t total_trades_ = 0;
    uint64_t total_quantity_ = 0;

    void printSummary() const;
};

}

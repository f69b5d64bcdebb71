/**
 * @file market_maker.hpp
 * @brief Declares a simple market-making strategy.
 */

#pragma once

#include "strategy/strategy.hpp"

namespace strategy {

/**
 * @class MarketMaker
 * @brief A simple market-making strategy that rests passive limit orders at the touch.
 *
 * Each step it quotes a BUY limit at the bid and a SELL limit at the ask,
 * requoting when the touch moves. A side is not quoted once inventory
 * reaches the limit in that direction.
 */
class MarketMaker : public Strategy {
public:
    /**
     * @brief Constructs a MarketMaker strategy.
     * @param id Strategy identifier
     * @param symbol Instrument to trade
     * @param quote_size Units per quote
     * @param inventory_limit Maximum absolute inventory in units
     * @param max_loss P&L (negative) at which the strategy stops
     */
    MarketMaker(const std::string& id,
                const std::string& symbol,
                uint32_t quote_size,
                int64_t inventory_limit,
                double max_loss);

    std::string name() const override { return "MarketMaker"; }

    size_t totalTrades() const { return total_trades_; }
    size_t totalQuotes() const { return total_quotes_; }
    double averageTradeSize() const {
        return total_trades_ > 0 ? static_cast<double>(total_quantity_) / total_trades_ : 0.0;
    }
    double maxDrawdown() const { return max_drawdown_; }
    bool riskViolated() const { return risk_violated_; }
    int64_t inventory() const { return inventory_; }
    double pnl() const { return pnl_; }

protected:
    void onStep(core::Timestamp time) override;
    void onTrade(const core::Trade& trade) override;
    void onStop() override;
    void onReset() override;

private:
    struct Quote {
        uint64_t order_id = 0;
        double price = 0.0;
    };

    std::string symbol_;
    uint32_t quote_size_;
    int64_t inventory_limit_;
    double max_loss_;

    Quote bid_quote_;
    Quote ask_quote_;

    int64_t inventory_ = 0;
    double cash_flow_ = 0.0;
    double pnl_ = 0.0;

    size_t total_quotes_ = 0;
    size_t total_trades_ = 0;

    // PnL tracking fields
    double peak_pnl_ = 0.0;
    double max_drawdown_ = 0.0;
    bool risk_violated_ = false;
    uint64_t total_quantity_ = 0;

    /**
     * @brief Cancels a resting quote if its price differs from the target.
     */
    void cancelIfStale(Quote& quote, double target);

    void printSummary() const;
};

}

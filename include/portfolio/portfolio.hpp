/**
 * @file portfolio.hpp
 * @brief Declares position tracking and mark-to-market for the backtest.
 */

#pragma once

#include "core/trade.hpp"
#include "portfolio/performance_analyzer.hpp"

#include <map>
#include <string>

namespace portfolio {

/**
 * @struct Position
 * @brief Net position in one instrument.
 */
struct Position {
    int64_t quantity = 0;      ///< Signed: + long, - short
    double avg_price = 0.0;    ///< Average entry price of the open quantity
    double realized_pnl = 0.0; ///< Realized P&L before commission, in account currency
};

/**
 * @class Portfolio
 * @brief Tracks net positions per instrument and feeds the performance analyzer.
 *
 * Positions are kept in quote currency; P&L is converted into account
 * currency with the exchange rate supplied by the execution client.
 */
class Portfolio {
public:
    /**
     * @brief Applies a fill to the instrument's position.
     * @param trade Fill reported by the execution client
     * @param exchange_rate Quote currency to account currency rate at the fill
     * @return Realized P&L of the fill in account currency (non-zero only when the position is reduced)
     */
    double update(const core::Trade& trade, double exchange_rate = 1.0);

    /**
     * @brief Records the equity (cash plus unrealized P&L) at the given time.
     * @param time Simulated time
     * @param cash_balance Account cash balance
     * @param mid_prices Current mid price per instrument
     * @param exchange_rates Quote to account currency rate per instrument; 1 if absent
     */
    void markToMarket(core::Timestamp time,
                      double cash_balance,
                      const std::map<std::string, double>& mid_prices,
                      const std::map<std::string, double>& exchange_rates = {});

    /**
     * @brief Unrealized P&L of all open positions at the given prices, in account currency.
     */
    double unrealizedPnl(const std::map<std::string, double>& mid_prices,
                         const std::map<std::string, double>& exchange_rates = {}) const;

    /**
     * @brief Returns the position in an instrument (flat if never traded).
     */
    Position position(const std::string& instrument) const;

    const std::map<std::string, Position>& positions() const { return positions_; }
    double realizedPnl() const { return realized_pnl_; }

    PerformanceAnalyzer& analyzer() { return analyzer_; }
    const PerformanceAnalyzer& analyzer() const { return analyzer_; }

    void reset();

private:
    std::map<std::string, Position> positions_;
    double realized_pnl_ = 0.0;
    PerformanceAnalyzer analyzer_;
};

}

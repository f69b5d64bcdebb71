/**
 * @file performance_analyzer.hpp
 * @brief Declares the analyzer producing backtest performance statistics.
 */

#pragma once

#include "core/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace portfolio {

/**
 * @class PerformanceAnalyzer
 * @brief Collects equity snapshots and closed-trade P&L and derives performance metrics.
 *
 * Equity is sampled every step; the last sample of each UTC day forms the
 * daily equity series from which returns are computed. Returns are annualized
 * over 252 trading days.
 */
class PerformanceAnalyzer {
public:
    /**
     * @brief Records the portfolio equity at a point in simulated time.
     */
    void addEquity(core::Timestamp time, double equity);

    /**
     * @brief Records the realized P&L of a position reduction.
     */
    void addTradePnl(double pnl);

    /**
     * @brief Sets daily benchmark returns used for alpha and beta.
     *
     * Alpha and beta are reported as 0 unless the benchmark has one return per
     * recorded daily return.
     */
    void setBenchmarkReturns(const std::vector<double>& returns) { benchmark_returns_ = returns; }

    /**
     * @brief Returns the named performance metrics.
     *
     * Keys: PNL, PNL%, MaxWinner, AvgWinner, MinWinner, MinLoser, AvgLoser,
     * MaxLoser, WinRate, Expectancy, AnnualReturn, CumReturn, MaxDrawdown,
     * AnnualVol, SharpeRatio, CalmarRatio, SortinoRatio, OmegaRatio, Stability,
     * ReturnsMean, ReturnsVariance, ReturnsSkew, ReturnsKurtosis, TailRatio,
     * Alpha, Beta. Every key is present; undefined metrics are 0.
     */
    std::map<std::string, double> getPerformanceStats() const;

    /**
     * @brief Daily simple returns derived from the recorded equity.
     */
    std::vector<double> dailyReturns() const;

    const std::vector<double>& tradePnls() const { return trade_pnls_; }

    void reset();

private:
    bool has_equity_ = false;
    double starting_equity_ = 0.0;
    double last_equity_ = 0.0;
    std::map<int64_t, double> daily_equity_;  ///< UTC day -> last equity of the day
    std::vector<double> trade_pnls_;
    std::vector<double> benchmark_returns_;
};

}

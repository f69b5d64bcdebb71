/**
 * @file performance_analyzer.cpp
 * @brief Implements performance statistics over daily returns and closed trades.
 */

#include "portfolio/performance_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace portfolio {

using namespace core;

namespace {

constexpr int64_t kMillisPerDay = 86'400'000;
constexpr double kTradingDays = 252.0;

double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

// sample variance (n - 1)
double variance(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    double m = mean(v);
    double ss = 0.0;
    for (double x : v) ss += (x - m) * (x - m);
    return ss / static_cast<double>(v.size() - 1);
}

double centralMoment(const std::vector<double>& v, int order) {
    double m = mean(v);
    double acc = 0.0;
    for (double x : v) acc += std::pow(x - m, order);
    return acc / static_cast<double>(v.size());
}

double percentile(std::vector<double> v, double q) {
    std::sort(v.begin(), v.end());
    double pos = q * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = static_cast<size_t>(std::ceil(pos));
    double frac = pos - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
}

double safeDivide(double num, double den) {
    return den != 0.0 ? num / den : 0.0;
}

}

void PerformanceAnalyzer::addEquity(Timestamp time, double equity) {
    if (!has_equity_) {
        starting_equity_ = equity;
        has_equity_ = true;
    }
    int64_t day = time / kMillisPerDay;
    if (time < 0 && time % kMillisPerDay != 0) --day;
    daily_equity_[day] = equity;
    last_equity_ = equity;
}

void PerformanceAnalyzer::addTradePnl(double pnl) {
    trade_pnls_.push_back(pnl);
}

std::vector<double> PerformanceAnalyzer::dailyReturns() const {
    std::vector<double> returns;
    double previous = starting_equity_;
    for (const auto& [day, equity] : daily_equity_) {
        returns.push_back(previous != 0.0 ? equity / previous - 1.0 : 0.0);
        previous = equity;
    }
    return returns;
}

void PerformanceAnalyzer::reset() {
    has_equity_ = false;
    starting_equity_ = 0.0;
    last_equity_ = 0.0;
    daily_equity_.clear();
    trade_pnls_.clear();
}

std::map<std::string, double> PerformanceAnalyzer::getPerformanceStats() const {
    std::map<std::string, double> stats;

    // trade statistics
    std::vector<double> winners;
    std::vector<double> losers;
    for (double pnl : trade_pnls_) {
        if (pnl > 0.0) winners.push_back(pnl);
        else if (pnl < 0.0) losers.push_back(pnl);
    }

    stats["PNL"] = has_equity_ ? last_equity_ - starting_equity_ : 0.0;
    stats["PNL%"] = safeDivide(stats["PNL"], starting_equity_) * 100.0;

    stats["MaxWinner"] = winners.empty() ? 0.0 : *std::max_element(winners.begin(), winners.end());
    stats["AvgWinner"] = mean(winners);
    stats["MinWinner"] = winners.empty() ? 0.0 : *std::min_element(winners.begin(), winners.end());
    stats["MinLoser"] = losers.empty() ? 0.0 : *std::max_element(losers.begin(), losers.end());
    stats["AvgLoser"] = mean(losers);
    stats["MaxLoser"] = losers.empty() ? 0.0 : *std::min_element(losers.begin(), losers.end());

    double decided = static_cast<double>(winners.size() + losers.size());
    double win_rate = safeDivide(static_cast<double>(winners.size()), decided);
    stats["WinRate"] = win_rate;
    stats["Expectancy"] = decided > 0.0
        ? win_rate * stats["AvgWinner"] + (1.0 - win_rate) * stats["AvgLoser"]
        : 0.0;

    // return statistics
    std::vector<double> returns = dailyReturns();
    size_t n = returns.size();

    double growth = 1.0;
    double peak = 1.0;
    double max_drawdown = 0.0;
    std::vector<double> cum_log;
    for (double r : returns) {
        growth *= (1.0 + r);
        peak = std::max(peak, growth);
        max_drawdown = std::min(max_drawdown, growth / peak - 1.0);
        cum_log.push_back(growth > 0.0 ? std::log(growth) : 0.0);
    }

    double cum_return = growth - 1.0;
    double annual_return = (n > 0 && growth > 0.0)
        ? std::pow(growth, kTradingDays / static_cast<double>(n)) - 1.0
        : 0.0;
    double m = mean(returns);
    double var = variance(returns);
    double sd = std::sqrt(var);

    stats["CumReturn"] = cum_return;
    stats["AnnualReturn"] = annual_return;
    stats["MaxDrawdown"] = max_drawdown;
    stats["AnnualVol"] = sd * std::sqrt(kTradingDays);
    stats["SharpeRatio"] = safeDivide(m, sd) * std::sqrt(kTradingDays);
    stats["CalmarRatio"] = safeDivide(annual_return, std::abs(max_drawdown));

    double downside_ss = 0.0;
    double gains = 0.0;
    double losses = 0.0;
    for (double r : returns) {
        if (r < 0.0) {
            downside_ss += r * r;
            losses -= r;
        } else {
            gains += r;
        }
    }
    double downside_dev = n > 0 ? std::sqrt(downside_ss / static_cast<double>(n)) * std::sqrt(kTradingDays) : 0.0;
    stats["SortinoRatio"] = safeDivide(m * kTradingDays, downside_dev);
    stats["OmegaRatio"] = safeDivide(gains, losses);

    // R^2 of cumulative log returns against time
    double stability = 0.0;
    if (n >= 2) {
        std::vector<double> xs(n);
        std::iota(xs.begin(), xs.end(), 0.0);
        double mx = mean(xs);
        double my = mean(cum_log);
        double sxy = 0.0, sxx = 0.0, syy = 0.0;
        for (size_t i = 0; i < n; ++i) {
            sxy += (xs[i] - mx) * (cum_log[i] - my);
            sxx += (xs[i] - mx) * (xs[i] - mx);
            syy += (cum_log[i] - my) * (cum_log[i] - my);
        }
        stability = safeDivide(sxy * sxy, sxx * syy);
    }
    stats["Stability"] = stability;

    stats["ReturnsMean"] = m;
    stats["ReturnsVariance"] = var;
    if (n >= 2) {
        double m2 = centralMoment(returns, 2);
        stats["ReturnsSkew"] = safeDivide(centralMoment(returns, 3), std::pow(m2, 1.5));
        stats["ReturnsKurtosis"] = m2 > 0.0 ? centralMoment(returns, 4) / (m2 * m2) - 3.0 : 0.0;
        stats["TailRatio"] = safeDivide(std::abs(percentile(returns, 0.95)), std::abs(percentile(returns, 0.05)));
    } else {
        stats["ReturnsSkew"] = 0.0;
        stats["ReturnsKurtosis"] = 0.0;
        stats["TailRatio"] = 0.0;
    }

    double alpha = 0.0;
    double beta = 0.0;
    if (n >= 2 && benchmark_returns_.size() == n) {
        double mb = mean(benchmark_returns_);
        double cov = 0.0;
        for (size_t i = 0; i < n; ++i) {
            cov += (returns[i] - m) * (benchmark_returns_[i] - mb);
        }
        cov /= static_cast<double>(n - 1);
        beta = safeDivide(cov, variance(benchmark_returns_));
        alpha = (m - beta * mb) * kTradingDays;
    }
    stats["Alpha"] = alpha;
    stats["Beta"] = beta;

    return stats;
}

}

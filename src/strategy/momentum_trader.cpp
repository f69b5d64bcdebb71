/**
 * @file momentum_trader.cpp
 * @brief Implements the MomentumTrader strategy logic.
 */

#include "strategy/momentum_trader.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace strategy {
using namespace core;

MomentumTrader::MomentumTrader(
    const std::string& id,
    const std::string& symbol,
    uint32_t trade_size,
    int64_t max_position,
    double max_loss,
    size_t lookback,
    int cooldown_minutes)
    : Strategy(id),
      symbol_(symbol),
      trade_size_(trade_size),
      max_position_(max_position),
      max_loss_(max_loss),
      lookback_(lookback),
      cooldown_ms_(static_cast<int64_t>(cooldown_minutes) * kMillisPerMinute) {
    if (lookback_ < 3) {
        throw std::invalid_argument("MomentumTrader lookback must be at least 3");
    }
    if (trade_size_ == 0) {
        throw std::invalid_argument("MomentumTrader trade_size must be positive");
    }
}

void MomentumTrader::onStep(Timestamp time) {
    if (time < cooldown_end_ts_) return;  // still cooling down

    auto recent = bars(symbol_, BarResolution::MINUTE, PriceType::MID, lookback_);
    if (recent.size() < 3) return;

    // Simple momentum logic: last close > average of previous?
    double current = recent.back().close;
    double average = 0.0;
    for (size_t i = 0; i + 1 < recent.size(); ++i) {
        average += recent[i].close;
    }
    average /= static_cast<double>(recent.size() - 1);

    if (current == average) return;

    Side action = (current > average) ? Side::BUY : Side::SELL;
    int64_t signed_qty = action == Side::BUY ? trade_size_ : -static_cast<int64_t>(trade_size_);
    if (std::abs(position_ + signed_qty) > max_position_) return;

    submitMarketOrder(symbol_, action, trade_size_);
    cooldown_end_ts_ = time + cooldown_ms_;
}

void MomentumTrader::onTrade(const Trade& trade) {
    if (trade.instrument != symbol_) return;

    int64_t qty = trade.side == Side::BUY ? trade.quantity : -static_cast<int64_t>(trade.quantity);
    position_ += qty;
    cash_flow_ -= qty * trade.price * trade.exchange_rate + trade.commission;
    pnl_ = cash_flow_ + position_ * trade.price * trade.exchange_rate;

    total_trades_++;
    total_quantity_ += trade.quantity;

    peak_pnl_ = std::max(peak_pnl_, pnl_);
    double drawdown = peak_pnl_ - pnl_;
    max_drawdown_ = std::max(max_drawdown_, drawdown);

    if (pnl_ < max_loss_) {
        risk_violated_ = true;
        log(LogLevel::WARNING, "Max loss breached, stopping");
        stop();
    }
}

void MomentumTrader::onStop() {
    printSummary();
}

void MomentumTrader::onReset() {
    cooldown_end_ts_ = 0;
    position_ = 0;
    cash_flow_ = 0.0;
    pnl_ = 0.0;
    peak_pnl_ = 0.0;
    max_drawdown_ = 0.0;
    risk_violated_ = false;
    total_trades_ = 0;
    total_quantity_ = 0;
}

void MomentumTrader::printSummary() const {
    std::ostringstream out;
    out << "PnL: " << pnl_
        << ", Position [" << symbol_ << "]: " << position_
        << ", Total Trades: " << totalTrades()
        << ", Average Trade Size: " << averageTradeSize()
        << ", Max Drawdown: " << maxDrawdown()
        << ", Risk Breached: " << (riskViolated() ? "Yes" : "No");
    log(LogLevel::INFO, out.str());
}

}

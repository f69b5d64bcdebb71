/**
 * @file market_maker.cpp
 * @brief Implements the MarketMaker strategy logic.
 */

#include "strategy/market_maker.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace strategy {
using namespace core;

MarketMaker::MarketMaker(
    const std::string& id,
    const std::string& symbol,
    uint32_t quote_size,
    int64_t inventory_limit,
    double max_loss)
    : Strategy(id),
      symbol_(symbol),
      quote_size_(quote_size),
      inventory_limit_(inventory_limit),
      max_loss_(max_loss) {
    if (quote_size_ == 0) {
        throw std::invalid_argument("MarketMaker quote_size must be positive");
    }
}

void MarketMaker::onStep(Timestamp /*time*/) {
    auto bid = latestBid(symbol_);
    auto ask = latestAsk(symbol_);
    if (!bid || !ask) return;

    cancelIfStale(bid_quote_, *bid);
    cancelIfStale(ask_quote_, *ask);

    if (bid_quote_.order_id == 0 && inventory_ + quote_size_ <= inventory_limit_) {
        bid_quote_.order_id = submitLimitOrder(symbol_, Side::BUY, quote_size_, *bid);
        bid_quote_.price = *bid;
        total_quotes_++;
    }

    if (ask_quote_.order_id == 0 && inventory_ - quote_size_ >= -inventory_limit_) {
        ask_quote_.order_id = submitLimitOrder(symbol_, Side::SELL, quote_size_, *ask);
        ask_quote_.price = *ask;
        total_quotes_++;
    }
}

void MarketMaker::cancelIfStale(Quote& quote, double target) {
    if (quote.order_id == 0 || quote.price == target) return;

    if (!cancelOrder(quote.order_id)) {
        log(LogLevel::DEBUG, "Quote " + std::to_string(quote.order_id) + " no longer working");
    }
    quote = Quote{};
}

void MarketMaker::onTrade(const Trade& trade) {
    if (trade.instrument != symbol_) return;

    if (trade.order_id == bid_quote_.order_id) bid_quote_ = Quote{};
    if (trade.order_id == ask_quote_.order_id) ask_quote_ = Quote{};

    int64_t qty = trade.side == Side::BUY ? trade.quantity : -static_cast<int64_t>(trade.quantity);
    inventory_ += qty;
    cash_flow_ -= qty * trade.price * trade.exchange_rate + trade.commission;
    pnl_ = cash_flow_ + inventory_ * trade.price * trade.exchange_rate;

    total_trades_++;
    total_quantity_ += trade.quantity;

    peak_pnl_ = std::max(peak_pnl_, pnl_);
    double drawdown = peak_pnl_ - pnl_;
    max_drawdown_ = std::max(max_drawdown_, drawdown);

    std::ostringstream out;
    out << "Inventory: " << inventory_ << ", P&L: " << pnl_;
    log(LogLevel::DEBUG, out.str());

    if (pnl_ <= max_loss_) {
        risk_violated_ = true;
        log(LogLevel::WARNING, "Risk violation detected post-trade. Stopping strategy.");
        stop();
    }
}

void MarketMaker::onStop() {
    cancelIfStale(bid_quote_, 0.0);
    cancelIfStale(ask_quote_, 0.0);
    printSummary();
}

void MarketMaker::onReset() {
    bid_quote_ = Quote{};
    ask_quote_ = Quote{};
    inventory_ = 0;
    cash_flow_ = 0.0;
    pnl_ = 0.0;
    total_quotes_ = 0;
    total_trades_ = 0;
    peak_pnl_ = 0.0;
    max_drawdown_ = 0.0;
    risk_violated_ = false;
    total_quantity_ = 0;
}

void MarketMaker::printSummary() const {
    std::ostringstream out;
    out << "P&L: " << pnl_
        << ", Inventory [" << symbol_ << "]: " << inventory_
        << ", Total Quotes: " << total_quotes_
        << ", Total Trades: " << totalTrades()
        << ", Quote-to-Trade Ratio: "
        << (totalTrades() > 0 ? static_cast<double>(total_quotes_) / totalTrades() : 0.0)
        << ", Max Drawdown: " << maxDrawdown()
        << ", Risk Breached: " << (riskViolated() ? "Yes" : "No");
    log(LogLevel::INFO, out.str());
}

}

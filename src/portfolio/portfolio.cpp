/**
 * @file portfolio.cpp
 * @brief Implements position accounting for simulated fills.
 */

#include "portfolio/portfolio.hpp"

#include <algorithm>
#include <cstdlib>

namespace portfolio {

using namespace core;

double Portfolio::update(const Trade& trade, double exchange_rate) {
    Position& pos = positions_[trade.instrument];

    int64_t qty = trade.side == Side::BUY
        ? static_cast<int64_t>(trade.quantity)
        : -static_cast<int64_t>(trade.quantity);
    double pnl = 0.0;

    if (pos.quantity == 0 || (pos.quantity > 0) == (qty > 0)) {
        // opening or adding
        int64_t open = std::llabs(pos.quantity);
        int64_t added = std::llabs(qty);
        pos.avg_price = (pos.avg_price * open + trade.price * added) / static_cast<double>(open + added);
        pos.quantity += qty;
    } else {
        // reducing, possibly flipping
        int64_t closed = std::min(std::llabs(qty), std::llabs(pos.quantity));
        double direction = pos.quantity > 0 ? 1.0 : -1.0;
        pnl = static_cast<double>(closed) * (trade.price - pos.avg_price) * direction * exchange_rate;

        pos.quantity += qty;
        if (pos.quantity == 0) {
            pos.avg_price = 0.0;
        } else if ((pos.quantity > 0) == (qty > 0)) {
            pos.avg_price = trade.price;
        }

        pos.realized_pnl += pnl;
        realized_pnl_ += pnl;
        analyzer_.addTradePnl(pnl - trade.commission);
    }

    return pnl;
}

double Portfolio::unrealizedPnl(const std::map<std::string, double>& mid_prices,
                                const std::map<std::string, double>& exchange_rates) const {
    double total = 0.0;
    for (const auto& [instrument, pos] : positions_) {
        if (pos.quantity == 0) continue;
        auto it = mid_prices.find(instrument);
        if (it == mid_prices.end()) continue;
        auto rate = exchange_rates.find(instrument);
        double conversion = rate != exchange_rates.end() ? rate->second : 1.0;
        total += static_cast<double>(pos.quantity) * (it->second - pos.avg_price) * conversion;
    }
    return total;
}

void Portfolio::markToMarket(Timestamp time,
                             double cash_balance,
                             const std::map<std::string, double>& mid_prices,
                             const std::map<std::string, double>& exchange_rates) {
    analyzer_.addEquity(time, cash_balance + unrealizedPnl(mid_prices, exchange_rates));
}

Position Portfolio::position(const std::string& instrument) const {
    auto it = positions_.find(instrument);
    return it != positions_.end() ? it->second : Position{};
}

void Portfolio::reset() {
    positions_.clear();
    realized_pnl_ = 0.0;
    analyzer_.reset();
}

}

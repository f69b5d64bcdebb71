/**
 * @file execution_client.cpp
 * @brief Implements order resolution against replayed bid/ask prices.
 */

#include "engine/execution_client.hpp"
#include "engine/data_client.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace engine {

using namespace core;

BacktestExecClient::BacktestExecClient(const std::vector<Instrument>& instruments,
                                       const std::map<std::string, BarData>& minute_bars,
                                       double starting_capital,
                                       int slippage_ticks,
                                       std::unique_ptr<CommissionModel> commission_model,
                                       const MarketModel& market_model,
                                       portfolio::Account& account,
                                       portfolio::Portfolio& portfolio,
                                       const TestClock& clock,
                                       Logger& logger)
    : minute_bars_(minute_bars),
      minute_index_(buildMinuteIndex(instruments, minute_bars)),
      starting_capital_(starting_capital),
      slippage_ticks_(slippage_ticks),
      commission_model_(std::move(commission_model)),
      market_model_(market_model),
      account_(account),
      portfolio_(portfolio),
      clock_(clock),
      log_("ExecClient", logger),
      rng_(market_model.randomSeed()) {
    if (!commission_model_) {
        throw std::invalid_argument("BacktestExecClient requires a commission model");
    }
    for (const auto& instrument : instruments) {
        instruments_[instrument.symbol] = instrument;
    }
    for (const auto& [symbol, instrument] : instruments_) {
        Currency from = instrument.quote_currency;
        Currency to = account_.currency();
        if (from != to
            && minute_bars_.count(toString(from) + toString(to)) == 0
            && minute_bars_.count(toString(to) + toString(from)) == 0) {
            throw InvalidConfiguration(symbol + " is quoted in " + toString(from) + " but no "
                                       + toString(from) + toString(to) + " or " + toString(to) + toString(from)
                                       + " instrument converts it into the " + toString(to) + " account");
        }
    }
    reset();
}

uint64_t BacktestExecClient::submitOrder(Order order) {
    if (instruments_.find(order.instrument) == instruments_.end()) {
        throw std::invalid_argument("order for unknown instrument " + order.instrument);
    }
    if (order.quantity == 0) {
        throw std::invalid_argument("order quantity must be positive");
    }
    if (order.type != OrderType::MARKET && !(order.price > 0.0)) {
        throw std::invalid_argument(toString(order.type) + " order requires a positive price");
    }

    order.id = next_order_id_++;
    order.status = OrderStatus::WORKING;
    working_.push_back(order);

    log_.debug("Submitted " + toString(order.side) + " " + toString(order.type) + " "
               + std::to_string(order.quantity) + " " + order.instrument
               + " (order " + std::to_string(order.id) + ")");
    return order.id;
}

bool BacktestExecClient::cancelOrder(uint64_t order_id) {
    for (auto& order : working_) {
        if (order.id == order_id && order.status == OrderStatus::WORKING) {
            order.status = OrderStatus::CANCELLED;
            return true;
        }
    }
    return false;
}

size_t BacktestExecClient::cancelOrders(const std::string& strategy_id) {
    size_t cancelled = 0;
    for (auto& order : working_) {
        if (order.strategy_id == strategy_id && order.status == OrderStatus::WORKING) {
            order.status = OrderStatus::CANCELLED;
            ++cancelled;
        }
    }
    if (cancelled > 0) {
        log_.debug("Cancelled " + std::to_string(cancelled) + " working order(s) of " + strategy_id);
    }
    return cancelled;
}

void BacktestExecClient::registerTradeHandler(const std::string& strategy_id, TradeHandler handler) {
    trade_handlers_[strategy_id] = std::move(handler);
}

void BacktestExecClient::processMarket() {
    if (time_now_ != clock_.timeNow()) {
        throw DataInconsistency("execution cursor " + formatTimestamp(time_now_)
                                + " differs from clock " + formatTimestamp(clock_.timeNow()));
    }

    // orders submitted by trade handlers wait for the next step
    size_t count = working_.size();
    for (size_t i = 0; i < count; ++i) {
        if (working_[i].status != OrderStatus::WORKING) continue;

        Order order = working_[i];
        auto quote = quoteAt(order.instrument, time_now_);
        if (!quote) continue;

        auto decision = fillPrice(order, *quote, instruments_.at(order.instrument));
        if (!decision) continue;

        working_[i].status = OrderStatus::FILLED;
        fill(order, *decision);
    }

    working_.erase(std::remove_if(working_.begin(), working_.end(),
        [](const Order& o) { return o.status != OrderStatus::WORKING; }), working_.end());

    std::map<std::string, double> mids;
    std::map<std::string, double> rates;
    for (const auto& [symbol, instrument] : instruments_) {
        auto quote = quoteAt(symbol, time_now_);
        if (quote) mids[symbol] = (quote->bid + quote->ask) / 2.0;
        auto rate = conversionRate(instrument.quote_currency, account_.currency());
        if (rate) rates[symbol] = *rate;
    }
    portfolio_.markToMarket(time_now_, account_.cashBalance(), mids, rates);
}

void BacktestExecClient::setInitialIteration(Timestamp start, int step_minutes) {
    if (step_minutes <= 0) {
        throw InvalidArgument("step_minutes must be positive, was " + std::to_string(step_minutes));
    }
    if (minute_index_.empty() || start < minute_index_.front() || start > minute_index_.back()) {
        throw InvalidArgument("initial iteration " + formatTimestamp(start) + " is outside the minute index");
    }

    step_ms_ = static_cast<int64_t>(step_minutes) * kMillisPerMinute;
    time_now_ = start;
    iteration_ = 0;
}

void BacktestExecClient::iterate() {
    if (step_ms_ == 0) {
        throw std::logic_error("BacktestExecClient::iterate called before setInitialIteration");
    }
    time_now_ += step_ms_;
    ++iteration_;
}

void BacktestExecClient::reset() {
    working_.clear();
    fills_.clear();
    next_order_id_ = 1;
    next_trade_id_ = 1;
    total_commissions_ = 0.0;
    rng_.seed(market_model_.randomSeed());
    uniform_.reset();

    account_.initialize(starting_capital_);
    portfolio_.reset();

    time_now_ = minute_index_.empty() ? 0 : minute_index_.front();
    iteration_ = 0;
    step_ms_ = 0;
}

std::optional<BacktestExecClient::Quote> BacktestExecClient::quoteAt(const std::string& symbol, Timestamp time) const {
    auto it = minute_bars_.find(symbol);
    if (it == minute_bars_.end()) return std::nullopt;

    const auto& bid = it->second.bid;
    auto pos = std::upper_bound(bid.begin(), bid.end(), time,
        [](Timestamp t, const Bar& b) { return t < b.timestamp; });
    if (pos == bid.begin()) return std::nullopt;

    size_t idx = static_cast<size_t>(std::distance(bid.begin(), pos)) - 1;
    return Quote{bid[idx].close, it->second.ask[idx].close};
}

std::optional<BacktestExecClient::Fill> BacktestExecClient::fillPrice(const Order& order, const Quote& quote, const Instrument& instrument) {
    const double mid = (quote.bid + quote.ask) / 2.0;
    const bool buy = order.side == Side::BUY;

    switch (order.type) {
        case OrderType::MARKET:
            return Fill{applySlippage(buy ? quote.ask : quote.bid, order.side, instrument), LiquiditySide::TAKER};

        case OrderType::LIMIT: {
            // best/cross levels seen from the order's side
            const double best = buy ? quote.bid : quote.ask;
            const double cross = buy ? quote.ask : quote.bid;
            auto reaches = [&](double level) { return buy ? order.price >= level : order.price <= level; };

            if (reaches(cross)) {
                if (sample(market_model_.probFillAtCross())) return Fill{cross, LiquiditySide::TAKER};
            } else if (reaches(mid)) {
                if (sample(market_model_.probFillAtMid())) return Fill{order.price, LiquiditySide::MAKER};
            } else if (reaches(best)) {
                if (sample(market_model_.probFillAtBest())) return Fill{order.price, LiquiditySide::MAKER};
            }
            return std::nullopt;
        }

        case OrderType::STOP: {
            bool triggered = buy ? quote.ask >= order.price : quote.bid <= order.price;
            if (!triggered) return std::nullopt;

            double price = order.price;
            if (!sample(market_model_.probFillOnStop())) {
                price += buy ? instrument.tick_size : -instrument.tick_size;
            }
            return Fill{applySlippage(price, order.side, instrument), LiquiditySide::TAKER};
        }
    }
    return std::nullopt;
}

double BacktestExecClient::applySlippage(double price, Side side, const Instrument& instrument) {
    if (slippage_ticks_ == 0 || !sample(market_model_.probSlippage())) {
        return price;
    }
    double slip = slippage_ticks_ * instrument.tick_size;
    return side == Side::BUY ? price + slip : price - slip;
}

bool BacktestExecClient::sample(double probability) {
    if (probability >= 1.0) return true;
    if (probability <= 0.0) return false;
    return uniform_(rng_) < probability;
}

std::optional<double> BacktestExecClient::conversionRate(Currency from, Currency to) const {
    if (from == to) return 1.0;

    if (auto direct = quoteAt(toString(from) + toString(to), time_now_)) {
        return (direct->bid + direct->ask) / 2.0;
    }
    if (auto inverse = quoteAt(toString(to) + toString(from), time_now_)) {
        double mid = (inverse->bid + inverse->ask) / 2.0;
        if (mid > 0.0) return 1.0 / mid;
    }
    return std::nullopt;
}

double BacktestExecClient::exchangeRate(const Instrument& instrument) const {
    auto rate = conversionRate(instrument.quote_currency, account_.currency());
    if (!rate) {
        throw DataInconsistency("no " + toString(instrument.quote_currency) + "/" + toString(account_.currency())
                                + " rate at " + formatTimestamp(time_now_));
    }
    return *rate;
}

void BacktestExecClient::fill(const Order& order, const Fill& decision) {
    const double rate = exchangeRate(instruments_.at(order.instrument));
    const double price = decision.price;
    double commission = commission_model_->calculate(order.quantity, price, rate, decision.liquidity);
    Trade trade(next_trade_id_++, order.id, order.strategy_id, order.instrument,
                order.side, price, order.quantity, commission, time_now_, rate);

    double pnl = portfolio_.update(trade, rate);
    account_.credit(pnl);
    account_.debit(commission);
    total_commissions_ += commission;
    fills_.push_back(trade);

    std::ostringstream msg;
    msg << "Filled " << toString(order.side) << " " << order.quantity << " " << order.instrument
        << " @ " << price << " " << toString(decision.liquidity)
        << " (order " << order.id << ", commission " << commission << ")";
    log_.info(msg.str());

    auto handler = trade_handlers_.find(order.strategy_id);
    if (handler != trade_handlers_.end()) {
        handler->second(trade);
    }
}

}

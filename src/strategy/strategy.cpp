/**
 * @file strategy.cpp
 * @brief Implements the Strategy lifecycle and its market access helpers.
 */

#include "strategy/strategy.hpp"

#include <stdexcept>

namespace strategy {

using namespace core;

std::string toString(StrategyState state) {
    switch (state) {
        case StrategyState::INITIALIZED: return "INITIALIZED";
        case StrategyState::RUNNING: return "RUNNING";
        case StrategyState::STOPPED: return "STOPPED";
        case StrategyState::DISPOSED: return "DISPOSED";
    }
    return "UNKNOWN";
}

Strategy::Strategy(const std::string& id)
    : id_(id), clock_(std::make_unique<TestClock>()) {}

void Strategy::changeClock(std::unique_ptr<TestClock> clock) {
    if (!clock) {
        throw std::invalid_argument("Strategy " + id_ + ": clock must not be null");
    }
    clock_ = std::move(clock);
}

void Strategy::changeLogger(Logger& logger) {
    logger_ = &logger;
}

void Strategy::start() {
    if (state_ == StrategyState::DISPOSED) {
        throw std::logic_error("Strategy " + id_ + " cannot start after dispose");
    }
    if (state_ == StrategyState::RUNNING) return;

    state_ = StrategyState::RUNNING;
    onStart();
    log(LogLevel::INFO, "Started");
}

void Strategy::stop() {
    if (state_ == StrategyState::DISPOSED) {
        throw std::logic_error("Strategy " + id_ + " cannot stop after dispose");
    }
    if (state_ != StrategyState::RUNNING) return;

    state_ = StrategyState::STOPPED;
    onStop();
    log(LogLevel::INFO, "Stopped");
}

void Strategy::reset() {
    if (state_ == StrategyState::RUNNING || state_ == StrategyState::DISPOSED) {
        throw std::logic_error("Strategy " + id_ + " cannot reset while " + toString(state_));
    }
    onReset();
    state_ = StrategyState::INITIALIZED;
}

void Strategy::dispose() {
    if (state_ == StrategyState::DISPOSED) return;
    if (state_ == StrategyState::RUNNING) stop();

    onDispose();
    state_ = StrategyState::DISPOSED;
}

void Strategy::iterate(Timestamp time) {
    clock_->setTime(time);
    if (state_ == StrategyState::RUNNING) {
        onStep(time);
    }
}

void Strategy::handleTrade(const Trade& trade) {
    onTrade(trade);
}

const engine::BacktestDataClient& Strategy::data() const {
    if (data_ == nullptr) {
        throw std::logic_error("Strategy " + id_ + " has no data client registered");
    }
    return *data_;
}

std::optional<double> Strategy::latestBid(const std::string& symbol) const {
    return data().latestBid(symbol, timeNow());
}

std::optional<double> Strategy::latestAsk(const std::string& symbol) const {
    return data().latestAsk(symbol, timeNow());
}

std::vector<Bar> Strategy::bars(const std::string& symbol,
                                BarResolution resolution,
                                PriceType price_type,
                                size_t count) const {
    return data().barsUpTo(symbol, resolution, price_type, timeNow(), count);
}

uint64_t Strategy::submitMarketOrder(const std::string& symbol, Side side, uint32_t quantity) {
    return submit(symbol, OrderType::MARKET, side, quantity, 0.0);
}

uint64_t Strategy::submitLimitOrder(const std::string& symbol, Side side, uint32_t quantity, double price) {
    return submit(symbol, OrderType::LIMIT, side, quantity, price);
}

uint64_t Strategy::submitStopOrder(const std::string& symbol, Side side, uint32_t quantity, double price) {
    return submit(symbol, OrderType::STOP, side, quantity, price);
}

uint64_t Strategy::submit(const std::string& symbol, OrderType type, Side side, uint32_t quantity, double price) {
    if (exec_ == nullptr) {
        throw std::logic_error("Strategy " + id_ + " has no execution client registered");
    }
    if (state_ != StrategyState::RUNNING) {
        throw std::logic_error("Strategy " + id_ + " cannot submit orders while " + toString(state_));
    }
    return exec_->submitOrder(Order(0, id_, symbol, type, side, price, quantity, timeNow()));
}

bool Strategy::cancelOrder(uint64_t order_id) {
    if (exec_ == nullptr) {
        throw std::logic_error("Strategy " + id_ + " has no execution client registered");
    }
    return exec_->cancelOrder(order_id);
}

void Strategy::log(LogLevel level, const std::string& message) const {
    if (logger_ != nullptr) {
        logger_->log(level, name() + "-" + id_, message);
    }
}

}

/**
 * @file trader.cpp
 * @brief Implements strategy registration, lifecycle and stepping.
 */

#include "engine/trader.hpp"
#include "core/errors.hpp"

#include <set>
#include <sstream>
#include <stdexcept>

namespace engine {

using namespace core;
using strategy::StrategyPtr;

Trader::Trader(const std::vector<StrategyPtr>& strategies,
               BacktestDataClient& data_client,
               BacktestExecClient& exec_client,
               const portfolio::Account& account,
               const portfolio::Portfolio& portfolio,
               const TestClock& clock,
               Logger& logger)
    : data_client_(data_client),
      exec_client_(exec_client),
      account_(account),
      portfolio_(portfolio),
      clock_(clock),
      log_("Trader", logger) {
    validateStrategies(strategies);
    strategies_ = strategies;
    registerStrategies();
}

void Trader::validateStrategies(const std::vector<StrategyPtr>& strategies) {
    std::set<std::string> ids;
    for (size_t i = 0; i < strategies.size(); ++i) {
        if (!strategies[i]) {
            throw TypeMismatch("strategies[" + std::to_string(i) + "] is not a strategy (null)");
        }
        if (!ids.insert(strategies[i]->id()).second) {
            throw std::invalid_argument("duplicate strategy id " + strategies[i]->id());
        }
    }
}

void Trader::registerStrategies() {
    exec_client_.clearTradeHandlers();
    for (const auto& s : strategies_) {
        s->registerDataClient(data_client_);
        s->registerExecutionClient(exec_client_);
        strategy::Strategy* target = s.get();
        exec_client_.registerTradeHandler(s->id(), [target](const Trade& trade) {
            target->handleTrade(trade);
        });
    }
}

void Trader::start() {
    if (disposed_) {
        throw std::logic_error("Trader cannot start after dispose");
    }
    for (const auto& s : strategies_) {
        s->start();
    }
    running_ = true;

    std::ostringstream msg;
    msg << "Started " << strategies_.size() << " strategies, cash balance "
        << account_.cashBalance() << " " << toString(account_.currency());
    log_.info(msg.str());
}

void Trader::stop() {
    // orders must not outlive the run that placed them
    for (const auto& s : strategies_) {
        s->stop();
        exec_client_.cancelOrders(s->id());
    }
    running_ = false;

    std::ostringstream msg;
    msg << "Stopped at " << formatTimestamp(clock_.timeNow())
        << ", cash balance " << account_.cashBalance()
        << ", realized P&L " << portfolio_.realizedPnl();
    log_.info(msg.str());
}

void Trader::reset() {
    if (running_ || disposed_) {
        throw std::logic_error("Trader cannot reset while running or disposed");
    }
    for (const auto& s : strategies_) {
        s->reset();
    }
    log_.debug("Reset");
}

void Trader::dispose() {
    if (disposed_) return;
    for (const auto& s : strategies_) {
        s->dispose();
    }
    running_ = false;
    disposed_ = true;
    log_.debug("Disposed");
}

void Trader::changeStrategies(const std::vector<StrategyPtr>& strategies) {
    if (running_ || disposed_) {
        throw std::logic_error("Trader cannot change strategies while running or disposed");
    }
    validateStrategies(strategies);

    for (const auto& s : strategies_) {
        exec_client_.cancelOrders(s->id());
    }
    strategies_ = strategies;
    registerStrategies();
    log_.info("Changed strategies, now " + std::to_string(strategies_.size()));
}

void Trader::stepStrategies(Timestamp time) {
    for (const auto& s : strategies_) {
        s->iterate(time);
    }
}

}

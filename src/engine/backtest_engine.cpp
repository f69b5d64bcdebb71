/**
 * @file backtest_engine.cpp
 * @brief Implements engine wiring, the run loop and lifecycle operations.
 */

#include "engine/backtest_engine.hpp"
#include "engine/commission.hpp"
#include "core/errors.hpp"

#include <set>
#include <sstream>
#include <stdexcept>

namespace engine {

using namespace core;
using strategy::StrategyPtr;

namespace {

const char* kComponent = "BacktestEngine";

void validateInstruments(const std::vector<Instrument>& instruments) {
    std::set<std::string> symbols;
    for (size_t i = 0; i < instruments.size(); ++i) {
        if (!instruments[i].valid()) {
            throw TypeMismatch("instruments[" + std::to_string(i) + "] is not a valid instrument");
        }
        if (!symbols.insert(instruments[i].symbol).second) {
            throw std::invalid_argument("duplicate instrument " + instruments[i].symbol);
        }
    }
}

}

BacktestEngine::BacktestEngine(const std::vector<Instrument>& instruments,
                               const TickDataMap& ticks,
                               const BarDataMap& bars,
                               const std::vector<StrategyPtr>& strategies,
                               const BacktestConfig& config,
                               const MarketModel& market_model)
    : config_(config),
      created_time_(live_clock_.timeNow()) {
    validateInstruments(instruments);
    Trader::validateStrategies(strategies);

    // seed value only; run() sets the simulated start time
    test_clock_ = std::make_unique<TestClock>(live_clock_.timeNow());
    test_logger_ = std::make_unique<TestLogger>(kComponent, *test_clock_, config_.logging());

    instruments_ = instruments;
    auto minute_bars = extractMinuteBars(instruments_, bars);
    minute_index_ = buildMinuteIndex(instruments_, minute_bars);

    account_ = std::make_unique<portfolio::Account>(config_.accountCurrency());
    portfolio_ = std::make_unique<portfolio::Portfolio>();

    data_client_ = std::make_unique<BacktestDataClient>(instruments_, ticks, bars, *test_clock_);
    exec_client_ = std::make_unique<BacktestExecClient>(
        instruments_,
        minute_bars,
        config_.startingCapital(),
        config_.slippageTicks(),
        config_.makeCommissionModel(),
        market_model,
        *account_,
        *portfolio_,
        *test_clock_,
        *test_logger_);

    checkMinuteIndex(minute_index_, data_client_->minuteIndex(), "data client");
    checkMinuteIndex(minute_index_, exec_client_->minuteIndex(), "execution client");

    configureStrategies(strategies);
    trader_ = std::make_unique<Trader>(strategies,
                                       *data_client_,
                                       *exec_client_,
                                       *account_,
                                       *portfolio_,
                                       *test_clock_,
                                       *test_logger_);

    time_to_initialize_ms_ = live_clock_.timeNow() - created_time_;

    std::ostringstream msg;
    msg << "Initialized with " << instruments_.size() << " instruments, "
        << minute_index_.size() << " minute bars, "
        << strategies.size() << " strategies in " << time_to_initialize_ms_ << " ms";
    test_logger_->info(kComponent, msg.str());
}

void BacktestEngine::configureStrategies(const std::vector<StrategyPtr>& strategies) {
    for (const auto& s : strategies) {
        s->changeClock(std::make_unique<TestClock>(test_clock_->timeNow()));
        s->changeLogger(*test_logger_);
    }
}

void BacktestEngine::checkNotDisposed(const char* operation) const {
    if (disposed_) {
        throw std::logic_error(std::string("BacktestEngine::") + operation + " called after dispose");
    }
}

void BacktestEngine::run(Timestamp start, Timestamp stop, int step_minutes) {
    checkNotDisposed("run");

    if (!(start < stop)) {
        throw InvalidArgument("start " + formatTimestamp(start) + " must be before stop " + formatTimestamp(stop));
    }
    if (minute_index_.empty() || start < minute_index_.front()) {
        throw InvalidArgument("start " + formatTimestamp(start) + " precedes the first data timestamp");
    }
    if (stop > minute_index_.back()) {
        throw InvalidArgument("stop " + formatTimestamp(stop) + " follows the last data timestamp "
                              + formatTimestamp(minute_index_.back()));
    }
    if (step_minutes <= 0) {
        throw InvalidArgument("step_minutes must be positive, was " + std::to_string(step_minutes));
    }

    Timestamp run_started = live_clock_.timeNow();

    test_clock_->setTime(start);
    configureStrategies(trader_->strategies());
    try {
        trader_->start();
        data_client_->setInitialIteration(start, step_minutes);
        exec_client_->setInitialIteration(start, step_minutes);
        if (data_client_->iteration() != exec_client_->iteration()
            || data_client_->timeNow() != start
            || exec_client_->timeNow() != start) {
            throw DataInconsistency("data and execution clients disagree on the initial iteration");
        }

        test_logger_->info(kComponent, "Running from " + formatTimestamp(start) + " to " + formatTimestamp(stop)
                                       + " in steps of " + std::to_string(step_minutes) + " minute(s)");

        const int64_t step_ms = static_cast<int64_t>(step_minutes) * kMillisPerMinute;
        Timestamp time = start;
        while (time <= stop) {
            test_clock_->setTime(time);
            exec_client_->processMarket();
            data_client_->iterate();
            exec_client_->iterate();
            trader_->stepStrategies(time);
            time += step_ms;
        }
    } catch (const std::exception& ex) {
        test_logger_->error(kComponent, std::string("Run aborted at ") + formatTimestamp(test_clock_->timeNow())
                                        + ": " + ex.what());
        trader_->stop();
        throw;
    }

    trader_->stop();
    logDiagnostics(run_started);
}

void BacktestEngine::logDiagnostics(Timestamp run_started) const {
    std::ostringstream out;
    out << "Elapsed time (engine initialization): " << time_to_initialize_ms_ << " ms";
    test_logger_->info(kComponent, out.str());

    out.str("");
    out << "Elapsed time (running backtest): " << live_clock_.timeNow() - run_started << " ms";
    test_logger_->info(kComponent, out.str());

    test_logger_->info(kComponent, "Iterations: " + std::to_string(exec_client_->iteration()));

    out.str("");
    out << "Account balance (starting): " << account_->startingBalance() << " " << toString(account_->currency());
    test_logger_->info(kComponent, out.str());

    out.str("");
    out << "Account balance (ending): " << account_->cashBalance() << " " << toString(account_->currency());
    test_logger_->info(kComponent, out.str());

    out.str("");
    out << "Commissions (total): " << exec_client_->totalCommissions() << " " << toString(account_->currency());
    test_logger_->info(kComponent, out.str());
}

void BacktestEngine::changeStrategies(const std::vector<StrategyPtr>& strategies) {
    checkNotDisposed("changeStrategies");
    Trader::validateStrategies(strategies);
    if (trader_->isRunning()) {
        throw std::logic_error("BacktestEngine::changeStrategies called while running");
    }

    configureStrategies(strategies);
    trader_->changeStrategies(strategies);
}

void BacktestEngine::reset() {
    checkNotDisposed("reset");

    data_client_->reset();
    exec_client_->reset();
    trader_->reset();

    test_logger_->info(kComponent, "Reset");
}

void BacktestEngine::dispose() {
    checkNotDisposed("dispose");

    trader_->dispose();
    disposed_ = true;
}

void BacktestEngine::setBenchmarkReturns(const std::vector<double>& returns) {
    checkNotDisposed("setBenchmarkReturns");
    portfolio_->analyzer().setBenchmarkReturns(returns);
}

std::map<std::string, double> BacktestEngine::getPerformanceStats() const {
    checkNotDisposed("getPerformanceStats");
    return portfolio_->analyzer().getPerformanceStats();
}

}

/**
 * @file data_client.hpp
 * @brief Declares the historical data replay client of the backtest.
 */

#pragma once

#include "core/clock.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace engine {

/**
 * @brief Extracts the MINUTE bid/ask series of every instrument.
 * @throws core::DataInconsistency if an instrument has no minute bars
 */
std::map<std::string, core::BarData> extractMinuteBars(const std::vector<core::Instrument>& instruments,
                                                       const core::BarDataMap& bars);

/**
 * @brief Builds the sorted minute timestamps common to every instrument.
 *
 * Each series must be strictly ascending and bid/ask must share timestamps.
 * @throws core::DataInconsistency on unsorted or mismatched series
 */
std::vector<core::Timestamp> buildMinuteIndex(const std::vector<core::Instrument>& instruments,
                                              const std::map<std::string, core::BarData>& minute_bars);

/**
 * @brief Requires a component's minute index to equal the expected one.
 * @throws core::DataInconsistency naming the component and the first differing position
 */
void checkMinuteIndex(const std::vector<core::Timestamp>& expected,
                      const std::vector<core::Timestamp>& actual,
                      const std::string& component);

/**
 * @class BacktestDataClient
 * @brief Replays pre-loaded ticks and bars over the minute index.
 *
 * Market queries are "as of" a time and never return records stamped after it.
 * The cursor (timeNow/iteration) is moved only by the engine through
 * setInitialIteration() and iterate().
 */
class BacktestDataClient {
public:
    /**
     * @brief Constructs the data client.
     * @param instruments Instrument universe
     * @param ticks Tick data per symbol (may be empty)
     * @param bars Bar data per symbol and resolution; MINUTE bid/ask are required
     * @param clock Shared simulated clock (read only)
     * @throws core::DataInconsistency if the data is unsorted, mismatched or refers to unknown symbols
     */
    BacktestDataClient(const std::vector<core::Instrument>& instruments,
                       const core::TickDataMap& ticks,
                       const core::BarDataMap& bars,
                       const core::TestClock& clock);

    /**
     * @brief Positions the cursor at start with the given step.
     * @throws core::InvalidArgument if start is outside the minute index or step_minutes <= 0
     */
    void setInitialIteration(core::Timestamp start, int step_minutes);

    /**
     * @brief Advances the cursor one step.
     * @throws core::DataInconsistency if the cursor has drifted from the shared clock
     * @throws std::logic_error if called before setInitialIteration()
     */
    void iterate();

    /**
     * @brief Returns the cursor to its construction state.
     */
    void reset();

    core::Timestamp timeNow() const { return time_now_; }
    uint64_t iteration() const { return iteration_; }
    const std::vector<core::Timestamp>& minuteIndex() const { return minute_index_; }
    const std::vector<core::Instrument>& instruments() const { return instruments_; }

    /**
     * @brief Looks up an instrument by symbol.
     * @throws std::invalid_argument if the symbol is not in the universe
     */
    const core::Instrument& instrument(const std::string& symbol) const;

    /**
     * @brief Returns up to count bars stamped at or before as_of, oldest first.
     */
    std::vector<core::Bar> barsUpTo(const std::string& symbol,
                                    core::BarResolution resolution,
                                    core::PriceType price_type,
                                    core::Timestamp as_of,
                                    size_t count) const;

    /**
     * @brief Returns the last bar stamped at or before as_of, if any.
     */
    std::optional<core::Bar> latestBar(const std::string& symbol,
                                       core::BarResolution resolution,
                                       core::PriceType price_type,
                                       core::Timestamp as_of) const;

    /**
     * @brief Returns up to count ticks stamped at or before as_of, oldest first.
     */
    std::vector<core::Tick> ticksUpTo(const std::string& symbol, core::Timestamp as_of, size_t count) const;

    std::optional<double> latestBid(const std::string& symbol, core::Timestamp as_of) const;
    std::optional<double> latestAsk(const std::string& symbol, core::Timestamp as_of) const;

private:
    std::vector<core::Instrument> instruments_;
    core::TickDataMap ticks_;
    core::BarDataMap bars_;
    const core::TestClock& clock_;
    std::vector<core::Timestamp> minute_index_;

    core::Timestamp time_now_ = 0;
    uint64_t iteration_ = 0;
    int64_t step_ms_ = 0;

    const core::BarData* series(const std::string& symbol, core::BarResolution resolution) const;
};

}

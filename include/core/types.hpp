/**
 * @file types.hpp
 * @brief Defines timestamps, currencies, instruments and the historical price records.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace core {

/// Milliseconds since the Unix epoch (UTC).
using Timestamp = int64_t;

constexpr int64_t kMillisPerSecond = 1'000;
constexpr int64_t kMillisPerMinute = 60'000;

/**
 * @brief Renders a timestamp as ISO-8601 (e.g. 2020-01-02T09:30:00.000Z).
 */
std::string formatTimestamp(Timestamp ts);

/**
 * @enum Currency
 * @brief Account and quote currencies supported by the simulator.
 */
enum class Currency {
    USD,
    EUR,
    GBP,
    JPY,
    AUD,
    CAD,
    CHF,
    NZD
};

std::string toString(Currency currency);

/**
 * @brief Parses an ISO currency code.
 * @throws InvalidConfiguration if the code is unknown
 */
Currency currencyFromString(const std::string& code);

/**
 * @struct Instrument
 * @brief A tradable instrument in the backtest universe.
 */
struct Instrument {
    std::string symbol;                    ///< Unique symbol (e.g. "AUDUSD")
    Currency quote_currency = Currency::USD;
    double tick_size = 0.00001;            ///< Minimum price increment
    int price_precision = 5;

    /**
     * @brief Whether the instrument is a usable entity (named, positive tick size).
     */
    bool valid() const { return !symbol.empty() && tick_size > 0.0; }
};

/**
 * @struct Tick
 * @brief A top-of-book quote.
 */
struct Tick {
    Timestamp timestamp = 0;
    double bid = 0.0;
    double ask = 0.0;
};

/**
 * @struct Bar
 * @brief An OHLCV bar; the timestamp marks the bar close.
 */
struct Bar {
    Timestamp timestamp = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

enum class BarResolution {
    SECOND,
    MINUTE,
    HOUR,
    DAY
};

enum class PriceType {
    BID,
    ASK,
    MID
};

std::string toString(BarResolution resolution);
std::string toString(PriceType price_type);

/**
 * @struct BarData
 * @brief Bid and ask bar series for one instrument at one resolution.
 */
struct BarData {
    std::vector<Bar> bid;
    std::vector<Bar> ask;
};

using TickDataMap = std::map<std::string, std::vector<Tick>>;
using BarDataMap = std::map<std::string, std::map<BarResolution, BarData>>;

}

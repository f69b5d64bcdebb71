/**
 * @file data_client.cpp
 * @brief Implements historical data validation, the minute index and as-of queries.
 */

#include "engine/data_client.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace engine {

using namespace core;

namespace {

void checkAscending(const std::vector<Bar>& bars, const std::string& what) {
    for (size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp <= bars[i - 1].timestamp) {
            throw DataInconsistency(what + " bars are not strictly ascending at "
                                    + formatTimestamp(bars[i].timestamp));
        }
    }
}

void checkBidAsk(const BarData& data, const std::string& what) {
    checkAscending(data.bid, what + " bid");
    checkAscending(data.ask, what + " ask");
    if (data.bid.size() != data.ask.size()) {
        throw DataInconsistency(what + " bid and ask series differ in length ("
                                + std::to_string(data.bid.size()) + " vs "
                                + std::to_string(data.ask.size()) + ")");
    }
    for (size_t i = 0; i < data.bid.size(); ++i) {
        if (data.bid[i].timestamp != data.ask[i].timestamp) {
            throw DataInconsistency(what + " bid and ask timestamps differ at position " + std::to_string(i));
        }
    }
}

// last element stamped at or before as_of, or end
template <typename T>
typename std::vector<T>::const_iterator upToEnd(const std::vector<T>& records, Timestamp as_of) {
    return std::upper_bound(records.begin(), records.end(), as_of,
        [](Timestamp t, const T& r) { return t < r.timestamp; });
}

Bar midBar(const Bar& bid, const Bar& ask) {
    return Bar{bid.timestamp,
               (bid.open + ask.open) / 2.0,
               (bid.high + ask.high) / 2.0,
               (bid.low + ask.low) / 2.0,
               (bid.close + ask.close) / 2.0,
               (bid.volume + ask.volume) / 2.0};
}

}

std::map<std::string, BarData> extractMinuteBars(const std::vector<Instrument>& instruments,
                                                 const BarDataMap& bars) {
    std::map<std::string, BarData> minute_bars;
    for (const auto& instrument : instruments) {
        auto it = bars.find(instrument.symbol);
        if (it == bars.end()) {
            throw DataInconsistency("no bar data for " + instrument.symbol);
        }
        auto res = it->second.find(BarResolution::MINUTE);
        if (res == it->second.end() || res->second.bid.empty() || res->second.ask.empty()) {
            throw DataInconsistency("no minute bid/ask bars for " + instrument.symbol);
        }
        minute_bars[instrument.symbol] = res->second;
    }
    return minute_bars;
}

std::vector<Timestamp> buildMinuteIndex(const std::vector<Instrument>& instruments,
                                        const std::map<std::string, BarData>& minute_bars) {
    std::vector<Timestamp> index;
    bool first = true;

    for (const auto& instrument : instruments) {
        auto it = minute_bars.find(instrument.symbol);
        if (it == minute_bars.end()) {
            throw DataInconsistency("no minute bars for " + instrument.symbol);
        }
        checkBidAsk(it->second, instrument.symbol + " MINUTE");

        std::vector<Timestamp> stamps;
        stamps.reserve(it->second.bid.size());
        for (const auto& bar : it->second.bid) {
            stamps.push_back(bar.timestamp);
        }

        if (first) {
            index = std::move(stamps);
            first = false;
        } else {
            std::vector<Timestamp> common;
            std::set_intersection(index.begin(), index.end(), stamps.begin(), stamps.end(),
                                  std::back_inserter(common));
            index = std::move(common);
        }
    }

    return index;
}

void checkMinuteIndex(const std::vector<Timestamp>& expected,
                      const std::vector<Timestamp>& actual,
                      const std::string& component) {
    if (expected.size() != actual.size()) {
        throw DataInconsistency(component + " minute index has " + std::to_string(actual.size())
                                + " entries, expected " + std::to_string(expected.size()));
    }
    auto diff = std::mismatch(expected.begin(), expected.end(), actual.begin());
    if (diff.first != expected.end()) {
        throw DataInconsistency(component + " minute index differs at position "
                                + std::to_string(std::distance(expected.begin(), diff.first)) + ": "
                                + formatTimestamp(*diff.second) + " instead of " + formatTimestamp(*diff.first));
    }
}

BacktestDataClient::BacktestDataClient(const std::vector<Instrument>& instruments,
                                       const TickDataMap& ticks,
                                       const BarDataMap& bars,
                                       const TestClock& clock)
    : instruments_(instruments),
      ticks_(ticks),
      bars_(bars),
      clock_(clock) {
    for (const auto& [symbol, by_resolution] : bars_) {
        bool known = std::any_of(instruments_.begin(), instruments_.end(),
            [&](const Instrument& i) { return i.symbol == symbol; });
        if (!known) {
            throw DataInconsistency("bar data supplied for unknown instrument " + symbol);
        }
        for (const auto& [resolution, data] : by_resolution) {
            checkBidAsk(data, symbol + " " + toString(resolution));
        }
    }

    for (const auto& [symbol, series] : ticks_) {
        for (size_t i = 1; i < series.size(); ++i) {
            if (series[i].timestamp < series[i - 1].timestamp) {
                throw DataInconsistency(symbol + " ticks are not in time order at "
                                        + formatTimestamp(series[i].timestamp));
            }
        }
    }

    minute_index_ = buildMinuteIndex(instruments_, extractMinuteBars(instruments_, bars_));
    reset();
}

void BacktestDataClient::setInitialIteration(Timestamp start, int step_minutes) {
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

void BacktestDataClient::iterate() {
    if (step_ms_ == 0) {
        throw std::logic_error("BacktestDataClient::iterate called before setInitialIteration");
    }
    if (time_now_ != clock_.timeNow()) {
        throw DataInconsistency("data cursor " + formatTimestamp(time_now_)
                                + " differs from clock " + formatTimestamp(clock_.timeNow()));
    }
    time_now_ += step_ms_;
    ++iteration_;
}

void BacktestDataClient::reset() {
    time_now_ = minute_index_.empty() ? 0 : minute_index_.front();
    iteration_ = 0;
    step_ms_ = 0;
}

const Instrument& BacktestDataClient::instrument(const std::string& symbol) const {
    for (const auto& instrument : instruments_) {
        if (instrument.symbol == symbol) return instrument;
    }
    throw std::invalid_argument("unknown instrument " + symbol);
}

const BarData* BacktestDataClient::series(const std::string& symbol, BarResolution resolution) const {
    auto it = bars_.find(symbol);
    if (it == bars_.end()) return nullptr;
    auto res = it->second.find(resolution);
    return res != it->second.end() ? &res->second : nullptr;
}

std::vector<Bar> BacktestDataClient::barsUpTo(const std::string& symbol,
                                              BarResolution resolution,
                                              PriceType price_type,
                                              Timestamp as_of,
                                              size_t count) const {
    const BarData* data = series(symbol, resolution);
    if (data == nullptr) return {};

    auto end = upToEnd(data->bid, as_of);
    size_t last = static_cast<size_t>(std::distance(data->bid.begin(), end));
    size_t first = last > count ? last - count : 0;

    std::vector<Bar> out;
    out.reserve(last - first);
    for (size_t i = first; i < last; ++i) {
        switch (price_type) {
            case PriceType::BID: out.push_back(data->bid[i]); break;
            case PriceType::ASK: out.push_back(data->ask[i]); break;
            case PriceType::MID: out.push_back(midBar(data->bid[i], data->ask[i])); break;
        }
    }
    return out;
}

std::optional<Bar> BacktestDataClient::latestBar(const std::string& symbol,
                                                 BarResolution resolution,
                                                 PriceType price_type,
                                                 Timestamp as_of) const {
    auto bars = barsUpTo(symbol, resolution, price_type, as_of, 1);
    if (bars.empty()) return std::nullopt;
    return bars.back();
}

std::vector<Tick> BacktestDataClient::ticksUpTo(const std::string& symbol, Timestamp as_of, size_t count) const {
    auto it = ticks_.find(symbol);
    if (it == ticks_.end()) return {};

    auto end = upToEnd(it->second, as_of);
    auto begin = std::distance(it->second.begin(), end) > static_cast<std::ptrdiff_t>(count)
        ? end - static_cast<std::ptrdiff_t>(count)
        : it->second.begin();
    return std::vector<Tick>(begin, end);
}

std::optional<double> BacktestDataClient::latestBid(const std::string& symbol, Timestamp as_of) const {
    auto bar = latestBar(symbol, BarResolution::MINUTE, PriceType::BID, as_of);
    if (!bar) return std::nullopt;
    return bar->close;
}

std::optional<double> BacktestDataClient::latestAsk(const std::string& symbol, Timestamp as_of) const {
    auto bar = latestBar(symbol, BarResolution::MINUTE, PriceType::ASK, as_of);
    if (!bar) return std::nullopt;
    return bar->close;
}

}

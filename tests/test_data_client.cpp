#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "engine/data_client.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

#include <utility>

using namespace core;
using namespace engine;
using testutil::minute;

namespace {

BarDataMap sampleBars() {
    return testutil::barMap("AUDUSD", testutil::makeMinuteBars({0.70000, 0.70010, 0.70020, 0.70030, 0.70040}));
}

}

TEST_CASE("BacktestDataClient builds the minute index", "[data]") {
    TestClock clock(testutil::kStart);
    BacktestDataClient data({testutil::makeInstrument()}, {}, sampleBars(), clock);

    REQUIRE(data.minuteIndex().size() == 5);
    REQUIRE(data.minuteIndex().front() == testutil::kStart);
    REQUIRE(data.minuteIndex().back() == minute(4));
    REQUIRE(data.timeNow() == testutil::kStart);
    REQUIRE(data.iteration() == 0);
    REQUIRE(data.instrument("AUDUSD").tick_size == Catch::Approx(0.00001));
    REQUIRE_THROWS_AS(data.instrument("EURUSD"), std::invalid_argument);
}

TEST_CASE("BacktestDataClient answers queries as of a time", "[data]") {
    TestClock clock(testutil::kStart);
    BacktestDataClient data({testutil::makeInstrument()}, {}, sampleBars(), clock);

    auto bars = data.barsUpTo("AUDUSD", BarResolution::MINUTE, PriceType::BID, minute(2), 10);
    REQUIRE(bars.size() == 3);
    REQUIRE(bars.back().timestamp == minute(2));
    REQUIRE(bars.back().close == Catch::Approx(0.70020));

    // never returns a bar stamped after as_of
    bars = data.barsUpTo("AUDUSD", BarResolution::MINUTE, PriceType::ASK, minute(2) + 30'000, 2);
    REQUIRE(bars.size() == 2);
    REQUIRE(bars.front().timestamp == minute(1));
    REQUIRE(bars.back().timestamp == minute(2));
    REQUIRE(bars.back().close == Catch::Approx(0.70040));

    REQUIRE(data.barsUpTo("AUDUSD", BarResolution::MINUTE, PriceType::BID, testutil::kStart - 1, 5).empty());
    REQUIRE_FALSE(data.latestBar("AUDUSD", BarResolution::MINUTE, PriceType::BID, testutil::kStart - 1));
    REQUIRE(data.barsUpTo("EURUSD", BarResolution::MINUTE, PriceType::BID, minute(4), 5).empty());
    REQUIRE(data.barsUpTo("AUDUSD", BarResolution::HOUR, PriceType::BID, minute(4), 5).empty());
}

TEST_CASE("BacktestDataClient averages bid and ask for MID bars", "[data]") {
    TestClock clock(testutil::kStart);
    BacktestDataClient data({testutil::makeInstrument()}, {}, sampleBars(), clock);

    auto mid = data.latestBar("AUDUSD", BarResolution::MINUTE, PriceType::MID, minute(1));
    REQUIRE(mid);
    REQUIRE(mid->timestamp == minute(1));
    REQUIRE(mid->close == Catch::Approx(0.70020));

    REQUIRE(*data.latestBid("AUDUSD", minute(3)) == Catch::Approx(0.70030));
    REQUIRE(*data.latestAsk("AUDUSD", minute(3)) == Catch::Approx(0.70050));
    REQUIRE_FALSE(data.latestBid("EURUSD", minute(3)));
}

TEST_CASE("BacktestDataClient replays ticks as of a time", "[data]") {
    TestClock clock(testutil::kStart);
    TickDataMap ticks;
    ticks["AUDUSD"] = {
        Tick{testutil::kStart + 100, 0.7, 0.7002},
        Tick{testutil::kStart + 200, 0.7001, 0.7003},
        Tick{testutil::kStart + 300, 0.7002, 0.7004},
    };
    BacktestDataClient data({testutil::makeInstrument()}, ticks, sampleBars(), clock);

    auto visible = data.ticksUpTo("AUDUSD", testutil::kStart + 250, 10);
    REQUIRE(visible.size() == 2);
    REQUIRE(visible.back().bid == Catch::Approx(0.7001));

    visible = data.ticksUpTo("AUDUSD", testutil::kStart + 300, 1);
    REQUIRE(visible.size() == 1);
    REQUIRE(visible[0].timestamp == testutil::kStart + 300);

    REQUIRE(data.ticksUpTo("AUDUSD", testutil::kStart, 10).empty());
}

TEST_CASE("BacktestDataClient rejects inconsistent data", "[data]") {
    TestClock clock;
    std::vector<Instrument> instruments{testutil::makeInstrument()};

    SECTION("unsorted bars") {
        auto bars = testutil::makeMinuteBars({0.7, 0.7, 0.7});
        std::swap(bars.bid[0], bars.bid[1]);
        std::swap(bars.ask[0], bars.ask[1]);
        REQUIRE_THROWS_AS(BacktestDataClient(instruments, {}, testutil::barMap("AUDUSD", bars), clock),
                          DataInconsistency);
    }

    SECTION("bid and ask of different length") {
        auto bars = testutil::makeMinuteBars({0.7, 0.7, 0.7});
        bars.ask.pop_back();
        REQUIRE_THROWS_AS(BacktestDataClient(instruments, {}, testutil::barMap("AUDUSD", bars), clock),
                          DataInconsistency);
    }

    SECTION("no minute bars") {
        BarDataMap bars;
        bars["AUDUSD"][BarResolution::HOUR] = testutil::makeMinuteBars({0.7});
        REQUIRE_THROWS_AS(BacktestDataClient(instruments, {}, bars, clock), DataInconsistency);
    }

    SECTION("bars for an unknown instrument") {
        auto bars = sampleBars();
        bars["EURUSD"][BarResolution::MINUTE] = testutil::makeMinuteBars({1.1});
        REQUIRE_THROWS_AS(BacktestDataClient(instruments, {}, bars, clock), DataInconsistency);
    }

    SECTION("unsorted ticks") {
        TickDataMap ticks;
        ticks["AUDUSD"] = {Tick{200, 0.7, 0.7002}, Tick{100, 0.7, 0.7002}};
        REQUIRE_THROWS_AS(BacktestDataClient(instruments, ticks, sampleBars(), clock), DataInconsistency);
    }
}

TEST_CASE("buildMinuteIndex intersects instruments", "[data]") {
    std::vector<Instrument> instruments{testutil::makeInstrument("AUDUSD"), testutil::makeInstrument("EURUSD")};
    std::map<std::string, BarData> minute_bars;
    minute_bars["AUDUSD"] = testutil::makeMinuteBars({0.7, 0.7, 0.7, 0.7});
    minute_bars["EURUSD"] = testutil::makeMinuteBars({1.1, 1.1, 1.1, 1.1}, 0.0002, minute(2));

    auto index = buildMinuteIndex(instruments, minute_bars);
    REQUIRE(index == std::vector<Timestamp>{minute(2), minute(3)});

    minute_bars.erase("EURUSD");
    REQUIRE_THROWS_AS(buildMinuteIndex(instruments, minute_bars), DataInconsistency);
}

TEST_CASE("BacktestDataClient iterates with the shared clock", "[data]") {
    TestClock clock(testutil::kStart);
    BacktestDataClient data({testutil::makeInstrument()}, {}, sampleBars(), clock);

    REQUIRE_THROWS_AS(data.iterate(), std::logic_error);
    REQUIRE_THROWS_AS(data.setInitialIteration(testutil::kStart, 0), InvalidArgument);
    REQUIRE_THROWS_AS(data.setInitialIteration(minute(5), 1), InvalidArgument);
    REQUIRE_THROWS_AS(data.setInitialIteration(testutil::kStart - 1, 1), InvalidArgument);

    data.setInitialIteration(minute(1), 2);
    clock.setTime(minute(1));
    data.iterate();
    REQUIRE(data.timeNow() == minute(3));
    REQUIRE(data.iteration() == 1);

    // clock left behind
    REQUIRE_THROWS_AS(data.iterate(), DataInconsistency);

    data.reset();
    REQUIRE(data.timeNow() == testutil::kStart);
    REQUIRE(data.iteration() == 0);
}

TEST_CASE("checkMinuteIndex reports a diverging component", "[data]") {
    std::vector<Timestamp> expected{minute(0), minute(1), minute(2)};

    REQUIRE_NOTHROW(checkMinuteIndex(expected, expected, "data client"));
    REQUIRE_THROWS_AS(checkMinuteIndex(expected, {minute(0), minute(1)}, "data client"), DataInconsistency);
    REQUIRE_THROWS_WITH(checkMinuteIndex(expected, {minute(0), minute(2), minute(3)}, "execution client"),
                        Catch::Matchers::ContainsSubstring("execution client minute index differs at position 1"));
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "engine/execution_client.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

#include <utility>

using namespace core;
using namespace engine;
using testutil::minute;

namespace {

constexpr double kCapital = 100'000.0;

/**
 * Execution client over AUDUSD minute bars, driven one step at a time.
 */
struct ExecFixture {
    TestClock clock{testutil::kStart};
    TestLogger logger{"test", clock, testutil::quietLogging()};
    portfolio::Account account{Currency::USD};
    portfolio::Portfolio portfolio;
    std::unique_ptr<BacktestExecClient> exec;

    explicit ExecFixture(const BarData& bars,
                         const MarketModel& model = MarketModel(),
                         int slippage_ticks = 0,
                         double commission_rate_bp = 0.0) {
        std::map<std::string, BarData> minute_bars;
        minute_bars["AUDUSD"] = bars;
        exec = std::make_unique<BacktestExecClient>(
            std::vector<Instrument>{testutil::makeInstrument()},
            minute_bars,
            kCapital,
            slippage_ticks,
            std::make_unique<GenericCommissionModel>(commission_rate_bp),
            model,
            account,
            portfolio,
            clock,
            logger);
        exec->setInitialIteration(testutil::kStart, 1);
    }

    uint64_t submit(OrderType type, Side side, uint32_t quantity, double price = 0.0) {
        return exec->submitOrder(Order(0, "strategy-1", "AUDUSD", type, side, price, quantity, clock.timeNow()));
    }

    void step() {
        exec->processMarket();
        exec->iterate();
        clock.iterateTime(kMillisPerMinute);
    }
};

/**
 * Execution client over an arbitrary universe with certain fills.
 */
struct VenueFixture {
    TestClock clock{testutil::kStart};
    TestLogger logger{"test", clock, testutil::quietLogging()};
    portfolio::Account account{Currency::USD};
    portfolio::Portfolio portfolio;
    std::unique_ptr<BacktestExecClient> exec;

    VenueFixture(const std::vector<Instrument>& instruments,
                 const std::map<std::string, BarData>& minute_bars,
                 std::unique_ptr<CommissionModel> commission) {
        exec = std::make_unique<BacktestExecClient>(
            instruments,
            minute_bars,
            kCapital,
            0,
            std::move(commission),
            MarketModel(1.0, 1.0, 1.0, 1.0, 0.0),
            account,
            portfolio,
            clock,
            logger);
        exec->setInitialIteration(testutil::kStart, 1);
    }

    void submit(const std::string& symbol, OrderType type, Side side, uint32_t quantity, double price = 0.0) {
        exec->submitOrder(Order(0, "strategy-1", symbol, type, side, price, quantity, clock.timeNow()));
    }

    void step() {
        exec->processMarket();
        exec->iterate();
        clock.iterateTime(kMillisPerMinute);
    }
};

Instrument usdJpy() {
    Instrument instrument = testutil::makeInstrument("USDJPY");
    instrument.quote_currency = Currency::JPY;
    instrument.tick_size = 0.001;
    instrument.price_precision = 3;
    return instrument;
}

// all fills certain, no slippage
MarketModel certainModel() {
    return MarketModel(1.0, 1.0, 1.0, 1.0, 0.0);
}

}

TEST_CASE("Market orders fill at the touch", "[execution]") {
    // bid 0.70000, ask 0.70020
    ExecFixture f(testutil::flatMinuteBars(5));

    uint64_t id = f.submit(OrderType::MARKET, Side::BUY, 100'000);
    REQUIRE(id == 1);
    REQUIRE(f.exec->workingOrders().size() == 1);

    f.step();
    REQUIRE(f.exec->fills().size() == 1);
    REQUIRE(f.exec->fills()[0].price == Catch::Approx(0.70020));
    REQUIRE(f.exec->fills()[0].order_id == id);
    REQUIRE(f.exec->workingOrders().empty());
    REQUIRE(f.portfolio.position("AUDUSD").quantity == 100'000);

    f.submit(OrderType::MARKET, Side::SELL, 100'000);
    f.step();
    REQUIRE(f.exec->fills().size() == 2);
    REQUIRE(f.exec->fills()[1].price == Catch::Approx(0.70000));
    REQUIRE(f.portfolio.position("AUDUSD").quantity == 0);

    // round trip pays the spread
    REQUIRE(f.account.cashBalance() == Catch::Approx(kCapital - 20.0));
}

TEST_CASE("Limit orders fill by price level", "[execution]") {
    SECTION("crossing the spread fills at the opposite touch") {
        ExecFixture f(testutil::flatMinuteBars(5), certainModel());
        f.submit(OrderType::LIMIT, Side::BUY, 1'000, 0.70030);
        f.submit(OrderType::LIMIT, Side::SELL, 1'000, 0.69990);
        f.step();

        REQUIRE(f.exec->fills().size() == 2);
        REQUIRE(f.exec->fills()[0].price == Catch::Approx(0.70020));
        REQUIRE(f.exec->fills()[1].price == Catch::Approx(0.70000));
    }

    SECTION("at or through the mid fills at the limit price") {
        ExecFixture f(testutil::flatMinuteBars(5), certainModel());
        f.submit(OrderType::LIMIT, Side::BUY, 1'000, 0.70015);
        f.step();

        REQUIRE(f.exec->fills().size() == 1);
        REQUIRE(f.exec->fills()[0].price == Catch::Approx(0.70015));
    }

    SECTION("at the best price fills at the limit price") {
        ExecFixture f(testutil::flatMinuteBars(5), certainModel());
        f.submit(OrderType::LIMIT, Side::SELL, 1'000, 0.70015);
        f.submit(OrderType::LIMIT, Side::BUY, 1'000, 0.70005);
        f.step();

        REQUIRE(f.exec->fills().size() == 2);
        REQUIRE(f.exec->fills()[0].price == Catch::Approx(0.70015));
        REQUIRE(f.exec->fills()[1].price == Catch::Approx(0.70005));
    }

    SECTION("outside the touch never fills") {
        ExecFixture f(testutil::flatMinuteBars(5), certainModel());
        f.submit(OrderType::LIMIT, Side::BUY, 1'000, 0.69990);
        f.submit(OrderType::LIMIT, Side::SELL, 1'000, 0.70030);
        f.step();
        f.step();

        REQUIRE(f.exec->fills().empty());
        REQUIRE(f.exec->workingOrders().size() == 2);
    }

    SECTION("zero probabilities leave the order working") {
        ExecFixture f(testutil::flatMinuteBars(5), MarketModel(0.0, 0.0, 1.0, 1.0, 0.0));
        f.submit(OrderType::LIMIT, Side::BUY, 1'000, 0.70015);
        f.submit(OrderType::LIMIT, Side::BUY, 1'000, 0.70005);
        f.step();

        REQUIRE(f.exec->fills().empty());
        REQUIRE(f.exec->workingOrders().size() == 2);
    }
}

TEST_CASE("Stop orders trigger when the market trades through", "[execution]") {
    SECTION("buy stop waits for the ask to reach the stop price") {
        ExecFixture f(testutil::makeMinuteBars({0.70000, 0.70000, 0.70050}), certainModel());
        f.submit(OrderType::STOP, Side::BUY, 1'000, 0.70050);
        f.step();
        f.step();
        REQUIRE(f.exec->fills().empty());

        f.step();
        REQUIRE(f.exec->fills().size() == 1);
        REQUIRE(f.exec->fills()[0].price == Catch::Approx(0.70050));
        REQUIRE(f.exec->fills()[0].timestamp == minute(2));
    }

    SECTION("sell stop triggers on the bid") {
        ExecFixture f(testutil::makeMinuteBars({0.70000, 0.69950}), certainModel());
        f.submit(OrderType::STOP, Side::SELL, 1'000, 0.69990);
        f.step();
        REQUIRE(f.exec->fills().empty());

        f.step();
        REQUIRE(f.exec->fills().size() == 1);
        REQUIRE(f.exec->fills()[0].price == Catch::Approx(0.69990));
    }

    SECTION("a missed stop fills one tick worse") {
        ExecFixture f(testutil::flatMinuteBars(3), MarketModel(1.0, 1.0, 1.0, 0.0, 0.0));
        f.submit(OrderType::STOP, Side::BUY, 1'000, 0.70010);
        f.submit(OrderType::STOP, Side::SELL, 1'000, 0.70010);
        f.step();

        REQUIRE(f.exec->fills().size() == 2);
        REQUIRE(f.exec->fills()[0].price == Catch::Approx(0.70011));
        REQUIRE(f.exec->fills()[1].price == Catch::Approx(0.70009));
    }
}

TEST_CASE("Slippage moves fills against the order", "[execution]") {
    SECTION("certain slippage") {
        ExecFixture f(testutil::flatMinuteBars(3), MarketModel(1.0, 1.0, 1.0, 1.0, 1.0), 3);
        f.submit(OrderType::MARKET, Side::BUY, 1'000);
        f.submit(OrderType::MARKET, Side::SELL, 1'000);
        f.step();

        REQUIRE(f.exec->fills()[0].price == Catch::Approx(0.70023));
        REQUIRE(f.exec->fills()[1].price == Catch::Approx(0.69997));
    }

    SECTION("no slippage when its probability is zero") {
        ExecFixture f(testutil::flatMinuteBars(3), MarketModel(1.0, 1.0, 1.0, 1.0, 0.0), 3);
        f.submit(OrderType::MARKET, Side::BUY, 1'000);
        f.step();

        REQUIRE(f.exec->fills()[0].price == Catch::Approx(0.70020));
    }

    SECTION("limit fills never slip") {
        ExecFixture f(testutil::flatMinuteBars(3), MarketModel(1.0, 1.0, 1.0, 1.0, 1.0), 3);
        f.submit(OrderType::LIMIT, Side::BUY, 1'000, 0.70015);
        f.step();

        REQUIRE(f.exec->fills()[0].price == Catch::Approx(0.70015));
    }
}

TEST_CASE("Fills are charged commission", "[execution]") {
    ExecFixture f(testutil::flatMinuteBars(3), certainModel(), 0, 0.20);
    f.submit(OrderType::MARKET, Side::BUY, 1'000'000);
    f.step();

    // 1,000,000 * 0.70020 * 0.2bp = 14.004
    REQUIRE(f.exec->fills()[0].commission == Catch::Approx(14.00));
    REQUIRE(f.exec->totalCommissions() == Catch::Approx(14.00));
    REQUIRE(f.account.cashBalance() == Catch::Approx(kCapital - 14.00));
}

TEST_CASE("Orders are validated on submission", "[execution]") {
    ExecFixture f(testutil::flatMinuteBars(3));

    REQUIRE_THROWS_AS(f.exec->submitOrder(Order(0, "s", "EURUSD", OrderType::MARKET, Side::BUY, 0.0, 1, 0)),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(f.submit(OrderType::MARKET, Side::BUY, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(f.submit(OrderType::LIMIT, Side::BUY, 1'000, 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(f.submit(OrderType::STOP, Side::SELL, 1'000, -1.0), std::invalid_argument);
    REQUIRE(f.exec->workingOrders().empty());
}

TEST_CASE("Working orders can be cancelled", "[execution]") {
    ExecFixture f(testutil::flatMinuteBars(3), certainModel());
    uint64_t id = f.submit(OrderType::LIMIT, Side::BUY, 1'000, 0.69990);

    REQUIRE(f.exec->cancelOrder(id));
    REQUIRE_FALSE(f.exec->cancelOrder(id));
    REQUIRE_FALSE(f.exec->cancelOrder(99));

    f.step();
    REQUIRE(f.exec->workingOrders().empty());
    REQUIRE(f.exec->fills().empty());
}

TEST_CASE("Fills are routed to the submitting strategy", "[execution]") {
    ExecFixture f(testutil::flatMinuteBars(3));
    std::vector<Trade> received;

    f.exec->registerTradeHandler("strategy-1", [&](const Trade& t) {
        received.push_back(t);
        // submitted from a fill: resolved on the next step
        f.submit(OrderType::MARKET, Side::SELL, t.quantity);
    });

    f.submit(OrderType::MARKET, Side::BUY, 1'000);
    f.step();
    REQUIRE(received.size() == 1);
    REQUIRE(received[0].strategy_id == "strategy-1");
    REQUIRE(f.exec->workingOrders().size() == 1);

    f.exec->clearTradeHandlers();
    f.step();
    REQUIRE(received.size() == 1);
    REQUIRE(f.exec->fills().size() == 2);
}

TEST_CASE("Execution cursor follows the shared clock", "[execution]") {
    ExecFixture f(testutil::flatMinuteBars(5));

    f.step();
    REQUIRE(f.exec->iteration() == 1);
    REQUIRE(f.exec->timeNow() == minute(1));

    f.clock.setTime(minute(3));
    REQUIRE_THROWS_AS(f.exec->processMarket(), DataInconsistency);

    REQUIRE_THROWS_AS(f.exec->setInitialIteration(minute(9), 1), InvalidArgument);
    REQUIRE_THROWS_AS(f.exec->setInitialIteration(testutil::kStart, -1), InvalidArgument);
}

TEST_CASE("Reset restores the initial execution state", "[execution]") {
    ExecFixture f(testutil::flatMinuteBars(30), MarketModel(0.5, 0.5, 1.0, 0.95, 0.5, 7), 1, 0.20);

    auto runPattern = [&]() {
        std::vector<size_t> pattern;
        for (int i = 0; i < 20; ++i) {
            f.submit(OrderType::LIMIT, i % 2 == 0 ? Side::BUY : Side::SELL, 10'000, i % 2 == 0 ? 0.70015 : 0.70005);
            f.submit(OrderType::MARKET, Side::BUY, 10'000);
            f.step();
            pattern.push_back(f.exec->fills().size());
        }
        return pattern;
    };

    auto first = runPattern();
    double first_balance = f.account.cashBalance();
    REQUIRE(f.exec->totalCommissions() > 0.0);

    f.exec->reset();
    REQUIRE(f.exec->fills().empty());
    REQUIRE(f.exec->workingOrders().empty());
    REQUIRE(f.exec->totalCommissions() == 0.0);
    REQUIRE(f.account.cashBalance() == Catch::Approx(kCapital));
    REQUIRE(f.portfolio.positions().empty());
    REQUIRE_THROWS_AS(f.exec->iterate(), std::logic_error);

    f.clock.setTime(testutil::kStart);
    f.exec->setInitialIteration(testutil::kStart, 1);
    REQUIRE(f.submit(OrderType::LIMIT, Side::BUY, 1, 0.69000) == 1);
    REQUIRE(f.exec->cancelOrder(1));

    auto second = runPattern();
    REQUIRE(first == second);
    REQUIRE(f.account.cashBalance() == Catch::Approx(first_balance));
}

TEST_CASE("Resting limit fills pay the maker rate", "[execution][commission]") {
    // bid 0.70000, ask 0.70020
    VenueFixture f({testutil::makeInstrument()},
                   {{"AUDUSD", testutil::flatMinuteBars(5)}},
                   std::make_unique<MakerTakerCommissionModel>(1.0, 3.0));

    f.submit("AUDUSD", OrderType::MARKET, Side::BUY, 100'000);
    f.submit("AUDUSD", OrderType::LIMIT, Side::BUY, 100'000, 0.70000);
    f.submit("AUDUSD", OrderType::LIMIT, Side::BUY, 100'000, 0.70030);
    f.step();

    const auto& fills = f.exec->fills();
    REQUIRE(fills.size() == 3);
    // 70020 notional at 3bp
    REQUIRE(fills[0].commission == Catch::Approx(21.01));
    // 70000 notional at 1bp
    REQUIRE(fills[1].commission == Catch::Approx(7.00));
    // crossing limit fills at the ask as a taker
    REQUIRE(fills[2].price == Catch::Approx(0.70020));
    REQUIRE(fills[2].commission == Catch::Approx(21.01));
    REQUIRE(f.exec->totalCommissions() == Catch::Approx(49.02));
}

TEST_CASE("Fills in another quote currency are booked in account currency", "[execution][fx]") {
    VenueFixture f({usdJpy()},
                   {{"USDJPY", testutil::makeMinuteBars({95.0, 96.0, 96.0}, 0.0)}},
                   std::make_unique<GenericCommissionModel>(0.20));

    f.submit("USDJPY", OrderType::MARKET, Side::BUY, 1'000'000);
    f.step();

    REQUIRE(f.exec->fills()[0].exchange_rate == Catch::Approx(1.0 / 95.0));
    REQUIRE(f.exec->fills()[0].commission == Catch::Approx(20.00));
    REQUIRE(f.account.cashBalance() == Catch::Approx(kCapital - 20.00));

    f.submit("USDJPY", OrderType::MARKET, Side::SELL, 1'000'000);
    f.step();

    // 1,000,000 JPY of profit at 96 JPY per USD
    REQUIRE(f.exec->fills()[1].commission == Catch::Approx(20.00));
    REQUIRE(f.portfolio.realizedPnl() == Catch::Approx(1'000'000.0 / 96.0));
    REQUIRE(f.account.cashBalance() == Catch::Approx(kCapital - 40.00 + 1'000'000.0 / 96.0));
}

TEST_CASE("A quote currency without a conversion pair is rejected", "[execution][fx]") {
    TestClock clock{testutil::kStart};
    TestLogger logger{"test", clock, testutil::quietLogging()};
    portfolio::Account account{Currency::USD};
    portfolio::Portfolio portfolio;

    Instrument eurJpy = testutil::makeInstrument("EURJPY");
    eurJpy.quote_currency = Currency::JPY;

    REQUIRE_THROWS_AS(BacktestExecClient({eurJpy},
                                         {{"EURJPY", testutil::flatMinuteBars(3, 160.0)}},
                                         kCapital,
                                         0,
                                         std::make_unique<GenericCommissionModel>(),
                                         MarketModel(),
                                         account,
                                         portfolio,
                                         clock,
                                         logger),
                      InvalidConfiguration);
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "portfolio/account.hpp"
#include "portfolio/performance_analyzer.hpp"
#include "portfolio/portfolio.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace core;
using namespace portfolio;

namespace {

constexpr int64_t kDay = 86'400'000;

Trade fill(Side side, double price, uint32_t quantity, double commission = 0.0) {
    static uint64_t next_id = 1;
    uint64_t id = next_id++;
    return Trade(id, id, "strategy-1", "AUDUSD", side, price, quantity, commission, testutil::kStart);
}

}

TEST_CASE("Account tracks its cash balance", "[account]") {
    Account account(Currency::EUR);
    account.initialize(10'000.0);

    account.credit(250.0);
    account.debit(50.0);
    REQUIRE(account.cashBalance() == Catch::Approx(10'200.0));
    REQUIRE(account.startingBalance() == Catch::Approx(10'000.0));
    REQUIRE(account.currency() == Currency::EUR);

    account.reset();
    REQUIRE(account.cashBalance() == Catch::Approx(10'000.0));
}

TEST_CASE("Portfolio realizes P&L when a position is closed", "[portfolio]") {
    Portfolio book;

    REQUIRE(book.update(fill(Side::BUY, 0.70000, 100'000)) == Catch::Approx(0.0));
    REQUIRE(book.position("AUDUSD").quantity == 100'000);
    REQUIRE(book.position("AUDUSD").avg_price == Catch::Approx(0.70000));

    double pnl = book.update(fill(Side::SELL, 0.71000, 100'000, 2.0));
    REQUIRE(pnl == Catch::Approx(1'000.0));
    REQUIRE(book.position("AUDUSD").quantity == 0);
    REQUIRE(book.realizedPnl() == Catch::Approx(1'000.0));

    // analyzer records P&L net of commission
    REQUIRE(book.analyzer().tradePnls().size() == 1);
    REQUIRE(book.analyzer().tradePnls()[0] == Catch::Approx(998.0));
}

TEST_CASE("Portfolio averages entries and handles flips", "[portfolio]") {
    Portfolio book;
    book.update(fill(Side::BUY, 1.00, 100));
    book.update(fill(Side::BUY, 1.20, 100));
    REQUIRE(book.position("AUDUSD").avg_price == Catch::Approx(1.10));

    double pnl = book.update(fill(Side::SELL, 1.30, 300));
    REQUIRE(pnl == Catch::Approx(40.0));
    REQUIRE(book.position("AUDUSD").quantity == -100);
    REQUIRE(book.position("AUDUSD").avg_price == Catch::Approx(1.30));

    // covering a short below entry is a gain
    pnl = book.update(fill(Side::BUY, 1.25, 50));
    REQUIRE(pnl == Catch::Approx(2.5));
    REQUIRE(book.position("AUDUSD").quantity == -50);
    REQUIRE(book.position("AUDUSD").avg_price == Catch::Approx(1.30));
}

TEST_CASE("Portfolio marks open positions to market", "[portfolio]") {
    Portfolio book;
    book.update(fill(Side::SELL, 0.70000, 10'000));

    std::map<std::string, double> mids{{"AUDUSD", 0.69000}};
    REQUIRE(book.unrealizedPnl(mids) == Catch::Approx(100.0));
    REQUIRE(book.unrealizedPnl({}) == Catch::Approx(0.0));
    REQUIRE(book.position("EURUSD").quantity == 0);

    book.markToMarket(testutil::kStart, 1'000.0, mids);
    REQUIRE(book.analyzer().getPerformanceStats()["PNL"] == Catch::Approx(0.0));
    book.markToMarket(testutil::kStart + kDay, 1'000.0, {{"AUDUSD", 0.68000}});
    REQUIRE(book.analyzer().getPerformanceStats()["PNL"] == Catch::Approx(100.0));

    book.reset();
    REQUIRE(book.positions().empty());
    REQUIRE(book.realizedPnl() == 0.0);
    REQUIRE(book.analyzer().dailyReturns().empty());
}

TEST_CASE("PerformanceAnalyzer reports every key as zero without data", "[analyzer]") {
    PerformanceAnalyzer analyzer;
    auto stats = analyzer.getPerformanceStats();

    const std::vector<std::string> keys{
        "PNL", "PNL%", "MaxWinner", "AvgWinner", "MinWinner", "MinLoser", "AvgLoser", "MaxLoser",
        "WinRate", "Expectancy", "AnnualReturn", "CumReturn", "MaxDrawdown", "AnnualVol",
        "SharpeRatio", "CalmarRatio", "SortinoRatio", "OmegaRatio", "Stability", "ReturnsMean",
        "ReturnsVariance", "ReturnsSkew", "ReturnsKurtosis", "TailRatio", "Alpha", "Beta"};

    REQUIRE(stats.size() == keys.size());
    for (const auto& key : keys) {
        INFO(key);
        REQUIRE(stats.count(key) == 1);
        REQUIRE(stats[key] == 0.0);
    }
}

TEST_CASE("PerformanceAnalyzer derives daily returns and drawdown", "[analyzer]") {
    PerformanceAnalyzer analyzer;
    analyzer.addEquity(testutil::kStart, 100.0);
    analyzer.addEquity(testutil::kStart + kDay, 105.0);
    // last sample of the day wins
    analyzer.addEquity(testutil::kStart + kDay + 60'000, 110.0);
    analyzer.addEquity(testutil::kStart + 2 * kDay, 99.0);

    auto returns = analyzer.dailyReturns();
    REQUIRE(returns.size() == 3);
    REQUIRE(returns[0] == Catch::Approx(0.0));
    REQUIRE(returns[1] == Catch::Approx(0.1));
    REQUIRE(returns[2] == Catch::Approx(-0.1));

    auto stats = analyzer.getPerformanceStats();
    REQUIRE(stats["PNL"] == Catch::Approx(-1.0));
    REQUIRE(stats["PNL%"] == Catch::Approx(-1.0));
    REQUIRE(stats["CumReturn"] == Catch::Approx(-0.01));
    REQUIRE(stats["MaxDrawdown"] == Catch::Approx(-0.1));
    REQUIRE(stats["ReturnsMean"] == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(stats["ReturnsVariance"] == Catch::Approx(0.01));
    REQUIRE(stats["OmegaRatio"] == Catch::Approx(1.0));
    REQUIRE(stats["AnnualVol"] == Catch::Approx(0.1 * std::sqrt(252.0)));
}

TEST_CASE("PerformanceAnalyzer summarizes closed trades", "[analyzer]") {
    PerformanceAnalyzer analyzer;
    analyzer.addTradePnl(10.0);
    analyzer.addTradePnl(-5.0);
    analyzer.addTradePnl(20.0);

    auto stats = analyzer.getPerformanceStats();
    REQUIRE(stats["MaxWinner"] == Catch::Approx(20.0));
    REQUIRE(stats["MinWinner"] == Catch::Approx(10.0));
    REQUIRE(stats["AvgWinner"] == Catch::Approx(15.0));
    REQUIRE(stats["AvgLoser"] == Catch::Approx(-5.0));
    REQUIRE(stats["MaxLoser"] == Catch::Approx(-5.0));
    REQUIRE(stats["WinRate"] == Catch::Approx(2.0 / 3.0));
    REQUIRE(stats["Expectancy"] == Catch::Approx(2.0 / 3.0 * 15.0 - 5.0 / 3.0));
}

TEST_CASE("PerformanceAnalyzer measures alpha and beta against a benchmark", "[analyzer]") {
    PerformanceAnalyzer analyzer;
    analyzer.addEquity(testutil::kStart, 100.0);
    analyzer.addEquity(testutil::kStart + kDay, 110.0);
    analyzer.addEquity(testutil::kStart + 2 * kDay, 99.0);

    analyzer.setBenchmarkReturns(analyzer.dailyReturns());
    auto stats = analyzer.getPerformanceStats();
    REQUIRE(stats["Beta"] == Catch::Approx(1.0));
    REQUIRE(stats["Alpha"] == Catch::Approx(0.0).margin(1e-9));

    analyzer.setBenchmarkReturns({0.01});
    REQUIRE(analyzer.getPerformanceStats()["Beta"] == 0.0);

    analyzer.reset();
    REQUIRE(analyzer.getPerformanceStats()["PNL"] == 0.0);
}

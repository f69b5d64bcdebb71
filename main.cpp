#include "core/errors.hpp"
#include "core/logger.hpp"
#include "engine/backtest_engine.hpp"
#include "engine/config.hpp"
#include "engine/market_data_loader.hpp"
#include "engine/market_model.hpp"
#include "strategy/empty_strategy.hpp"
#include "strategy/market_maker.hpp"
#include "strategy/momentum_trader.hpp"
#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <sstream>
#include <unordered_map>
#include <vector>

using json = nlohmann::json;

using namespace core;
using namespace engine;
using namespace strategy;

int main(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> args;
    for (int i = 1; i < argc - 1; ++i) {
        std::string key = argv[i];
        if (key.rfind("--", 0) == 0 && (i + 1 < argc)) {
            args[key.substr(2)] = argv[i + 1];
            ++i;
        }
    }

    std::string config_path = args.count("config") ? args["config"] : "config.json";

    LiveLogger logger("tradesim");

    try {
        json config = loadConfigJson(config_path);
        BacktestConfig backtest_config = BacktestConfig::fromJson(config);
        MarketModel market_model = config.contains("market_model")
            ? MarketModel::fromJson(config["market_model"])
            : MarketModel();

        json instrument_cfg = config.value("instrument", json::object());
        Instrument instrument;
        instrument.symbol = args.count("symbol") ? args["symbol"] : instrument_cfg.value("symbol", std::string("AUDUSD"));
        instrument.quote_currency = currencyFromString(instrument_cfg.value("quote_currency", std::string("USD")));
        instrument.tick_size = instrument_cfg.value("tick_size", 0.00001);
        instrument.price_precision = instrument_cfg.value("price_precision", 5);

        json data_cfg = config.value("data", json::object());
        std::string bid_file = args.count("bid") ? args["bid"] : data_cfg.value("bid", std::string());
        std::string ask_file = args.count("ask") ? args["ask"] : data_cfg.value("ask", std::string());
        std::string strategy_name = args.count("strategy") ? args["strategy"] : config.value("strategy", std::string("empty"));
        int step = args.count("step") ? std::stoi(args["step"]) : config.value("step_minutes", 1);

        logger.info("Main", "Strategy: " + strategy_name + ", Symbol: " + instrument.symbol
                            + ", Bid: " + bid_file + ", Ask: " + ask_file + ", Step: " + std::to_string(step));

        BarDataMap bars;
        bars[instrument.symbol][BarResolution::MINUTE] = loadBidAskBars(bid_file, ask_file, logger);

        StrategyPtr strat;
        if (strategy_name == "empty") {
            strat = std::make_shared<EmptyStrategy>();
        } else if (strategy_name == "momentum") {
            json p = config.value("momentum", json::object());
            strat = std::make_shared<MomentumTrader>(
                "momentum-001", instrument.symbol,
                p.value("trade_size", 100000u),
                p.value("max_position", static_cast<int64_t>(300000)),
                p.value("max_loss", -5000.0),
                p.value("lookback", static_cast<size_t>(5)),
                p.value("cooldown_minutes", 5));
        } else if (strategy_name == "marketmaker") {
            json p = config.value("marketmaker", json::object());
            strat = std::make_shared<MarketMaker>(
                "marketmaker-001", instrument.symbol,
                p.value("quote_size", 100000u),
                p.value("inventory_limit", static_cast<int64_t>(500000)),
                p.value("max_loss", -5000.0));
        } else {
            logger.error("Main", "Unknown strategy: " + strategy_name);
            return 1;
        }

        BacktestEngine engine({instrument}, {}, bars, {strat}, backtest_config, market_model);

        const auto& index = engine.minuteIndex();
        if (index.size() < 2) {
            logger.error("Main", "Not enough minute bars to run a backtest");
            return 1;
        }
        engine.run(index.front(), index.back(), step);

        std::ostringstream stats;
        for (const auto& [key, value] : engine.getPerformanceStats()) {
            stats << "\n  " << key << ": " << value;
        }
        logger.info("Main", "Performance statistics:" + stats.str());

        engine.dispose();
    } catch (const std::exception& ex) {
        logger.error("Main", ex.what());
        return 1;
    }

    logger.info("Main", "Shutdown complete.");
    return 0;
}

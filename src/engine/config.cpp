/**
 * @file config.cpp
 * @brief Implements BacktestConfig validation and JSON loading.
 */

#include "engine/config.hpp"
#include "core/errors.hpp"

#include <fstream>
#include <limits>

namespace engine {

using namespace core;
using json = nlohmann::json;

BacktestConfig::BacktestConfig(double starting_capital,
                               Currency account_currency,
                               int slippage_ticks,
                               double commission_rate_bp,
                               const LoggingOptions& logging,
                               CommissionType commission_type,
                               double maker_fee_bp,
                               double taker_fee_bp)
    : starting_capital_(starting_capital),
      account_currency_(account_currency),
      slippage_ticks_(slippage_ticks),
      commission_rate_bp_(commission_rate_bp),
      logging_(logging),
      commission_type_(commission_type),
      maker_fee_bp_(maker_fee_bp),
      taker_fee_bp_(taker_fee_bp) {
    // negated comparisons also reject NaN
    if (!(starting_capital_ > 0.0)) {
        throw InvalidConfiguration("starting_capital must be positive, was " + std::to_string(starting_capital_));
    }
    if (slippage_ticks_ < 0) {
        throw InvalidConfiguration("slippage_ticks must be non-negative, was " + std::to_string(slippage_ticks_));
    }
    if (!(commission_rate_bp_ >= 0.0)) {
        throw InvalidConfiguration("commission_rate_bp must be non-negative, was " + std::to_string(commission_rate_bp_));
    }
    if (!(maker_fee_bp_ >= 0.0)) {
        throw InvalidConfiguration("maker_fee_bp must be non-negative, was " + std::to_string(maker_fee_bp_));
    }
    if (!(taker_fee_bp_ >= 0.0)) {
        throw InvalidConfiguration("taker_fee_bp must be non-negative, was " + std::to_string(taker_fee_bp_));
    }
}

std::unique_ptr<CommissionModel> BacktestConfig::makeCommissionModel() const {
    if (commission_type_ == CommissionType::MAKER_TAKER) {
        return std::make_unique<MakerTakerCommissionModel>(maker_fee_bp_, taker_fee_bp_);
    }
    return std::make_unique<GenericCommissionModel>(commission_rate_bp_);
}

BacktestConfig BacktestConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw InvalidConfiguration("configuration must be a JSON object");
    }

    try {
        double capital = j.value("starting_capital", 1'000'000.0);
        Currency currency = currencyFromString(j.value("account_currency", std::string("USD")));

        int slippage = 0;
        if (j.contains("slippage_ticks")) {
            const json& ticks = j["slippage_ticks"];
            if (!ticks.is_number_integer()) {
                throw InvalidConfiguration("slippage_ticks must be an integer");
            }
            bool in_range = ticks.is_number_unsigned()
                ? ticks.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
                : ticks.get<int64_t>() >= std::numeric_limits<int>::min()
                      && ticks.get<int64_t>() <= std::numeric_limits<int>::max();
            if (!in_range) {
                throw InvalidConfiguration("slippage_ticks is out of range: " + ticks.dump());
            }
            slippage = static_cast<int>(ticks.get<int64_t>());
        }

        double commission = j.value("commission_rate_bp", 0.20);
        CommissionType commission_type = commissionTypeFromString(j.value("commission_model", std::string("GENERIC")));
        double maker_fee = j.value("maker_fee_bp", 2.5);
        double taker_fee = j.value("taker_fee_bp", 7.5);

        LoggingOptions logging;
        if (j.contains("logging")) {
            const json& lj = j["logging"];
            logging.level_console = logLevelFromString(lj.value("level_console", std::string("INFO")));
            logging.level_file = logLevelFromString(lj.value("level_file", std::string("DEBUG")));
            logging.level_store = logLevelFromString(lj.value("level_store", std::string("WARNING")));
            logging.console_prints = lj.value("console_prints", true);
            logging.log_to_file = lj.value("log_to_file", false);
            logging.log_file_path = lj.value("log_file_path", logging.log_file_path);
            logging.bypass_logging = lj.value("bypass_logging", false);
        }

        return BacktestConfig(capital, currency, slippage, commission, logging,
                              commission_type, maker_fee, taker_fee);
    } catch (const json::exception& ex) {
        throw InvalidConfiguration(std::string("malformed configuration: ") + ex.what());
    }
}

json loadConfigJson(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw InvalidConfiguration("failed to open configuration file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& ex) {
        throw InvalidConfiguration("failed to parse " + path + ": " + ex.what());
    }
    return j;
}

BacktestConfig loadBacktestConfig(const std::string& path) {
    return BacktestConfig::fromJson(loadConfigJson(path));
}

}

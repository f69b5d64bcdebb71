/**
 * @file config.hpp
 * @brief Declares the validated, immutable backtest configuration.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/commission.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace engine {

/**
 * @class BacktestConfig
 * @brief Simulation parameters: capital, account currency, slippage, commission and logging.
 *
 * Every field is validated on construction; the object is read-only afterwards.
 */
class BacktestConfig {
public:
    /**
     * @brief Constructs a configuration.
     * @param starting_capital Starting account balance, must be > 0
     * @param account_currency Account currency
     * @param slippage_ticks Slippage applied to slipped fills in price ticks, must be >= 0
     * @param commission_rate_bp Commission rate in basis points of notional, must be >= 0
     * @param logging Logging verbosity and destinations
     * @param commission_type GENERIC charges commission_rate_bp, MAKER_TAKER the maker/taker rates
     * @param maker_fee_bp Maker rate in basis points, must be >= 0
     * @param taker_fee_bp Taker rate in basis points, must be >= 0
     * @throws core::InvalidConfiguration naming the offending field
     */
    explicit BacktestConfig(double starting_capital = 1'000'000.0,
                            core::Currency account_currency = core::Currency::USD,
                            int slippage_ticks = 0,
                            double commission_rate_bp = 0.20,
                            const core::LoggingOptions& logging = {},
                            CommissionType commission_type = CommissionType::GENERIC,
                            double maker_fee_bp = 2.5,
                            double taker_fee_bp = 7.5);

    /**
     * @brief Builds a configuration from a JSON object. Missing keys take their defaults.
     * @throws core::InvalidConfiguration on malformed or out-of-bounds values
     */
    static BacktestConfig fromJson(const nlohmann::json& j);

    double startingCapital() const { return starting_capital_; }
    core::Currency accountCurrency() const { return account_currency_; }
    int slippageTicks() const { return slippage_ticks_; }
    double commissionRateBp() const { return commission_rate_bp_; }
    const core::LoggingOptions& logging() const { return logging_; }
    CommissionType commissionType() const { return commission_type_; }
    double makerFeeBp() const { return maker_fee_bp_; }
    double takerFeeBp() const { return taker_fee_bp_; }

    /**
     * @brief Builds the commission model the configuration selects.
     */
    std::unique_ptr<CommissionModel> makeCommissionModel() const;

private:
    double starting_capital_;
    core::Currency account_currency_;
    int slippage_ticks_;
    double commission_rate_bp_;
    core::LoggingOptions logging_;
    CommissionType commission_type_;
    double maker_fee_bp_;
    double taker_fee_bp_;
};

/**
 * @brief Reads and parses a JSON configuration file.
 * @param path Path to the JSON file
 * @throws core::InvalidConfiguration if the file is unreadable or not valid JSON
 */
nlohmann::json loadConfigJson(const std::string& path);

/**
 * @brief Reads a JSON configuration file into a BacktestConfig.
 * @param path Path to the JSON file
 * @throws core::InvalidConfiguration if the file is unreadable or invalid
 */
BacktestConfig loadBacktestConfig(const std::string& path);

}

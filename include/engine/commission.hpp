/**
 * @file commission.hpp
 * @brief Declares commission models used by the execution client.
 */

#pragma once

#include <cstdint>
#include <string>

namespace engine {

/**
 * @enum LiquiditySide
 * @brief Whether a fill added liquidity (resting order) or removed it.
 */
enum class LiquiditySide {
    MAKER,
    TAKER
};

std::string toString(LiquiditySide side);

/**
 * @enum CommissionType
 * @brief Commission model selected by the backtest configuration.
 */
enum class CommissionType {
    GENERIC,
    MAKER_TAKER
};

std::string toString(CommissionType type);

/**
 * @brief Parses "GENERIC" or "MAKER_TAKER".
 * @throws core::InvalidConfiguration if the name is unknown
 */
CommissionType commissionTypeFromString(const std::string& name);

/**
 * @class CommissionModel
 * @brief Computes the commission charged on a fill, in account currency.
 */
class CommissionModel {
public:
    virtual ~CommissionModel() = default;

    /**
     * @brief Commission for a fill of the given quantity and price.
     * @param quantity Filled quantity
     * @param filled_price Fill price in quote currency
     * @param exchange_rate Quote currency to account currency rate, must be > 0
     * @param liquidity Liquidity side of the fill
     * @throws std::invalid_argument on a negative price or a non-positive exchange rate
     */
    double calculate(uint32_t quantity, double filled_price, double exchange_rate, LiquiditySide liquidity) const;

    /**
     * @brief Commission for a fill of the given notional value in account currency.
     * @throws std::invalid_argument on a negative notional
     */
    virtual double calculateForNotional(double notional, LiquiditySide liquidity) const = 0;
};

/**
 * @class GenericCommissionModel
 * @brief Charges a fixed rate in basis points of notional, floored at a minimum.
 */
class GenericCommissionModel : public CommissionModel {
public:
    /**
     * @param rate_bp Commission rate in basis points, must be >= 0
     * @param minimum Minimum charge per fill, must be >= 0
     * @throws core::InvalidConfiguration on negative inputs
     */
    explicit GenericCommissionModel(double rate_bp = 0.20, double minimum = 0.0);

    double calculateForNotional(double notional, LiquiditySide liquidity) const override;

    double rateBp() const { return rate_bp_; }
    double minimum() const { return minimum_; }

private:
    double rate_bp_;
    double minimum_;
};

/**
 * @class MakerTakerCommissionModel
 * @brief Charges separate basis-point rates for maker and taker fills.
 */
class MakerTakerCommissionModel : public CommissionModel {
public:
    /**
     * @param maker_fee_bp Rate for fills that rested on the book, must be >= 0
     * @param taker_fee_bp Rate for fills that crossed the spread, must be >= 0
     * @param minimum Minimum charge per fill, must be >= 0
     * @throws core::InvalidConfiguration on negative inputs
     */
    explicit MakerTakerCommissionModel(double maker_fee_bp = 2.5, double taker_fee_bp = 7.5, double minimum = 0.0);

    double calculateForNotional(double notional, LiquiditySide liquidity) const override;

    double makerFeeBp() const { return maker_fee_bp_; }
    double takerFeeBp() const { return taker_fee_bp_; }

private:
    double maker_fee_bp_;
    double taker_fee_bp_;
    double minimum_;
};

}

/**
 * @file commission.cpp
 * @brief Implements the basis-point commission models.
 */

#include "engine/commission.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace engine {

using namespace core;

namespace {

constexpr double kBasisPoint = 0.0001;

// commissions are booked in cents
double roundToCents(double value) {
    return std::round(value * 100.0) / 100.0;
}

void requireNonNegative(double value, const std::string& field) {
    if (!(value >= 0.0)) {
        throw InvalidConfiguration("commission " + field + " must be non-negative, was " + std::to_string(value));
    }
}

double charge(double notional, double rate_bp, double minimum) {
    if (notional < 0.0) {
        throw std::invalid_argument("notional must be non-negative");
    }
    return std::max(minimum, roundToCents(notional * rate_bp * kBasisPoint));
}

}

std::string toString(LiquiditySide side) {
    return side == LiquiditySide::MAKER ? "MAKER" : "TAKER";
}

std::string toString(CommissionType type) {
    return type == CommissionType::GENERIC ? "GENERIC" : "MAKER_TAKER";
}

CommissionType commissionTypeFromString(const std::string& name) {
    if (name == "GENERIC") return CommissionType::GENERIC;
    if (name == "MAKER_TAKER") return CommissionType::MAKER_TAKER;
    throw InvalidConfiguration("unknown commission model: " + name);
}

double CommissionModel::calculate(uint32_t quantity,
                                  double filled_price,
                                  double exchange_rate,
                                  LiquiditySide liquidity) const {
    if (filled_price < 0.0) {
        throw std::invalid_argument("filled_price must be non-negative");
    }
    if (!(exchange_rate > 0.0)) {
        throw std::invalid_argument("exchange_rate must be positive");
    }
    return calculateForNotional(static_cast<double>(quantity) * filled_price * exchange_rate, liquidity);
}

GenericCommissionModel::GenericCommissionModel(double rate_bp, double minimum)
    : rate_bp_(rate_bp), minimum_(minimum) {
    requireNonNegative(rate_bp_, "rate_bp");
    requireNonNegative(minimum_, "minimum");
}

double GenericCommissionModel::calculateForNotional(double notional, LiquiditySide /*liquidity*/) const {
    return charge(notional, rate_bp_, minimum_);
}

MakerTakerCommissionModel::MakerTakerCommissionModel(double maker_fee_bp, double taker_fee_bp, double minimum)
    : maker_fee_bp_(maker_fee_bp), taker_fee_bp_(taker_fee_bp), minimum_(minimum) {
    requireNonNegative(maker_fee_bp_, "maker_fee_bp");
    requireNonNegative(taker_fee_bp_, "taker_fee_bp");
    requireNonNegative(minimum_, "minimum");
}

double MakerTakerCommissionModel::calculateForNotional(double notional, LiquiditySide liquidity) const {
    double rate = liquidity == LiquiditySide::MAKER ? maker_fee_bp_ : taker_fee_bp_;
    return charge(notional, rate, minimum_);
}

}

/**
 * @file market_model.cpp
 * @brief Implements MarketModel validation and JSON loading.
 */

#include "engine/market_model.hpp"
#include "core/errors.hpp"

#include <string>

namespace engine {

using namespace core;
using json = nlohmann::json;

namespace {

void checkProbability(const char* field, double value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw InvalidConfiguration(std::string(field) + " must be in [0, 1], was " + std::to_string(value));
    }
}

}

MarketModel::MarketModel(double prob_fill_at_best,
                         double prob_fill_at_mid,
                         double prob_fill_at_cross,
                         double prob_fill_on_stop,
                         double prob_slippage,
                         uint64_t random_seed)
    : prob_fill_at_best_(prob_fill_at_best),
      prob_fill_at_mid_(prob_fill_at_mid),
      prob_fill_at_cross_(prob_fill_at_cross),
      prob_fill_on_stop_(prob_fill_on_stop),
      prob_slippage_(prob_slippage),
      random_seed_(random_seed) {
    checkProbability("prob_fill_at_best", prob_fill_at_best_);
    checkProbability("prob_fill_at_mid", prob_fill_at_mid_);
    checkProbability("prob_fill_at_cross", prob_fill_at_cross_);
    checkProbability("prob_fill_on_stop", prob_fill_on_stop_);
    checkProbability("prob_slippage", prob_slippage_);
}

MarketModel MarketModel::fromJson(const json& j) {
    if (!j.is_object()) {
        throw InvalidConfiguration("market_model must be a JSON object");
    }

    try {
        return MarketModel(
            j.value("prob_fill_at_best", 0.2),
            j.value("prob_fill_at_mid", 0.5),
            j.value("prob_fill_at_cross", 1.0),
            j.value("prob_fill_on_stop", 0.95),
            j.value("prob_slippage", 0.5),
            j.value("random_seed", static_cast<uint64_t>(0)));
    } catch (const json::exception& ex) {
        throw InvalidConfiguration(std::string("malformed market_model: ") + ex.what());
    }
}

}

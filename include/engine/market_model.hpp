/**
 * @file market_model.hpp
 * @brief Declares the probabilistic market model governing simulated fills.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>

namespace engine {

/**
 * @class MarketModel
 * @brief Immutable fill and slippage probabilities plus the seed of the fill sampler.
 *
 * Price selection for limit orders:
 *  - BUY-LIMIT:  best = bid, mid = midpoint, cross = ask
 *  - SELL-LIMIT: best = ask, mid = midpoint, cross = bid
 *
 * The execution client draws one uniform sample per decision from a
 * generator seeded with randomSeed(), so equal seeds give equal fills.
 */
class MarketModel {
public:
    /**
     * @brief Constructs a market model.
     * @param prob_fill_at_best Probability a limit order resting at the best price fills
     * @param prob_fill_at_mid Probability a limit order at or through the mid fills
     * @param prob_fill_at_cross Probability a limit order crossing the spread fills
     * @param prob_fill_on_stop Probability a triggered stop fills at its stop price
     * @param prob_slippage Probability a market or stop fill slips
     * @param random_seed Seed of the execution client's generator
     * @throws core::InvalidConfiguration naming the first probability outside [0, 1]
     */
    explicit MarketModel(double prob_fill_at_best = 0.2,
                         double prob_fill_at_mid = 0.5,
                         double prob_fill_at_cross = 1.0,
                         double prob_fill_on_stop = 0.95,
                         double prob_slippage = 0.5,
                         uint64_t random_seed = 0);

    /**
     * @brief Builds a market model from a JSON object. Missing keys take their defaults.
     * @throws core::InvalidConfiguration on malformed or out-of-bounds values
     */
    static MarketModel fromJson(const nlohmann::json& j);

    double probFillAtBest() const { return prob_fill_at_best_; }
    double probFillAtMid() const { return prob_fill_at_mid_; }
    double probFillAtCross() const { return prob_fill_at_cross_; }
    double probFillOnStop() const { return prob_fill_on_stop_; }
    double probSlippage() const { return prob_slippage_; }
    uint64_t randomSeed() const { return random_seed_; }

private:
    double prob_fill_at_best_;
    double prob_fill_at_mid_;
    double prob_fill_at_cross_;
    double prob_fill_on_stop_;
    double prob_slippage_;
    uint64_t random_seed_;
};

}

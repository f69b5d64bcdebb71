/**
 * @file trade.hpp
 * @brief Defines the Trade structure to represent simulated fills.
 */

#pragma once

#include "core/order.hpp"

#include <string>
#include <cstdint>

namespace core {

/**
 * @struct Trade
 * @brief Represents the fill of a simulated order.
 *
 * Created when the execution client resolves a working order against market prices.
 */
struct Trade {
    uint64_t trade_id;        ///< Unique trade identifier
    uint64_t order_id;        ///< ID of the filled order
    std::string strategy_id;  ///< Strategy that submitted the order
    std::string instrument;   ///< Symbol of traded instrument
    core::Side side;          ///< Direction of the fill (BUY or SELL)
    double price;             ///< Executed price per unit
    uint32_t quantity;        ///< Number of units traded
    double commission;        ///< Commission charged in account currency
    Timestamp timestamp;      ///< Simulated execution time (ms)
    double exchange_rate;     ///< Quote to account currency rate at the fill

    /**
     * @brief Constructs a new Trade instance.
     *
     * @param tid       Trade ID
     * @param oid       Filled order ID
     * @param strategy  Strategy ID
     * @param instr     Instrument symbol
     * @param s         Direction of the fill
     * @param p         Executed price
     * @param q         Quantity traded
     * @param comm      Commission charged
     * @param ts        Timestamp (milliseconds)
     * @param rate      Quote to account currency rate
     */
    Trade(uint64_t tid,
          uint64_t oid,
          const std::string& strategy,
          const std::string& instr,
          core::Side s,
          double p,
          uint32_t q,
          double comm,
          Timestamp ts,
          double rate = 1.0)
        : trade_id(tid),
          order_id(oid),
          strategy_id(strategy),
          instrument(instr),
          side(s),
          price(p),
          quantity(q),
          commission(comm),
          timestamp(ts),
          exchange_rate(rate) {}
};

}

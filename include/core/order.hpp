/**
 * @file order.hpp
 * @brief Defines order types, sides, and the Order data structure for trading.
 */

#pragma once

#include "core/types.hpp"

#include <string>
#include <cstdint>

namespace core {

/**
 * @enum OrderType
 * @brief Specifies whether an order is a market, limit or stop order.
 */
enum class OrderType {
    MARKET,
    LIMIT,
    STOP
};

/**
 * @enum Side
 * @brief Indicates whether the order is a buy or a sell.
 */
enum class Side {
    BUY,
    SELL
};

/**
 * @enum OrderStatus
 * @brief Lifecycle state of a simulated order.
 */
enum class OrderStatus {
    WORKING,
    FILLED,
    CANCELLED
};

std::string toString(OrderType type);
std::string toString(Side side);
std::string toString(OrderStatus status);

/**
 * @struct Order
 * @brief Represents an order in the trading system.
 *
 * Orders are submitted by strategies and resolved by the execution client.
 */
struct Order {
    uint64_t id = 0;                  // Assigned by the execution client
    std::string strategy_id;          // Submitting strategy
    std::string instrument;           // Ticker symbol or instrument ID
    OrderType type = OrderType::MARKET;
    Side side = Side::BUY;
    double price = 0.0;               // Limit/stop price (ignored for market orders)
    uint32_t quantity = 0;            // Total number of units
    Timestamp timestamp = 0;          // Simulated submission time
    OrderStatus status = OrderStatus::WORKING;

    /**
     * @brief Default constructor
     */
    Order() = default;

    /**
     * @brief Constructs an Order.
     *
     * @param custom_id Order ID
     * @param strategy  Submitting strategy ID
     * @param instr     Instrument symbol
     * @param t         Order type (MARKET, LIMIT or STOP)
     * @param s         Side (BUY or SELL)
     * @param p         Limit or stop price
     * @param q         Quantity of units
     * @param ts        Timestamp in milliseconds
     */
    Order(uint64_t custom_id,
          const std::string& strategy,
          const std::string& instr, OrderType t, Side s,
          double p, uint32_t q, Timestamp ts)
        : id(custom_id),
          strategy_id(strategy),
          instrument(instr),
          type(t),
          side(s),
          price(p),
          quantity(q),
          timestamp(ts) {}
};

}

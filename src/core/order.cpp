/**
 * @file order.cpp
 * @brief Implements string conversions for order enums.
 */

#include "core/order.hpp"

namespace core {

std::string toString(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "MARKET";
        case OrderType::LIMIT: return "LIMIT";
        case OrderType::STOP: return "STOP";
    }
    return "UNKNOWN";
}

std::string toString(Side side) {
    return side == Side::BUY ? "BUY" : "SELL";
}

std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::WORKING: return "WORKING";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

}

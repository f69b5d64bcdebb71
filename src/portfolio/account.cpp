/**
 * @file account.cpp
 * @brief Implements the simulated trading account.
 */

#include "portfolio/account.hpp"

namespace portfolio {

void Account::initialize(double starting_balance) {
    starting_balance_ = starting_balance;
    cash_balance_ = starting_balance;
}

}

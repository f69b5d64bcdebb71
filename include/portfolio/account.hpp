/**
 * @file account.hpp
 * @brief Declares the simulated trading account.
 */

#pragma once

#include "core/types.hpp"

namespace portfolio {

/**
 * @class Account
 * @brief Cash ledger of the backtest, denominated in a single currency.
 */
class Account {
public:
    explicit Account(core::Currency currency) : currency_(currency) {}

    /**
     * @brief Sets the starting balance and resets the cash balance to it.
     * @param starting_balance Opening balance in account currency
     */
    void initialize(double starting_balance);

    void credit(double amount) { cash_balance_ += amount; }
    void debit(double amount) { cash_balance_ -= amount; }

    /**
     * @brief Restores the cash balance to the starting balance.
     */
    void reset() { cash_balance_ = starting_balance_; }

    core::Currency currency() const { return currency_; }
    double startingBalance() const { return starting_balance_; }
    double cashBalance() const { return cash_balance_; }

private:
    core::Currency currency_;
    double starting_balance_ = 0.0;
    double cash_balance_ = 0.0;
};

}

#pragma once
#include <cstddef>
#include <map>
#include <utility>

#include "market/types.hpp"

// Balances held for beneficiaries whose direct payout could not be completed.
// Only the listing engine writes it; beneficiaries drain their own entry.
class EscrowLedger {
public:
    void credit(const Address& beneficiary, const Currency& currency, const Amount& amount);

    Amount balance(const Address& beneficiary, const Currency& currency) const;

    // Removes and returns the whole balance (zero if none).
    Amount take(const Address& beneficiary, const Currency& currency);

    std::size_t entries() const { return balances_.size(); }
    bool empty() const { return balances_.empty(); }

private:
    std::map<std::pair<Address, Currency>, Amount> balances_;
};

// Marketplace fees accrued per currency, withdrawn by an administrator.
class FeeLedger {
public:
    void credit(const Currency& currency, const Amount& amount);
    Amount balance(const Currency& currency) const;
    // False if the balance does not cover `amount`.
    bool debit(const Currency& currency, const Amount& amount);

    bool empty() const { return balances_.empty(); }

private:
    std::map<Currency, Amount> balances_;
};

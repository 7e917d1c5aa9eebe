#include "escrow_ledger.hpp"

void EscrowLedger::credit(const Address& beneficiary, const Currency& currency, const Amount& amount)
{
    if (amount == 0) return;
    balances_[{beneficiary, currency}] += amount;
}

Amount EscrowLedger::balance(const Address& beneficiary, const Currency& currency) const
{
    auto it = balances_.find({beneficiary, currency});
    if (it == balances_.end())
        return 0;
    return it->second;
}

Amount EscrowLedger::take(const Address& beneficiary, const Currency& currency)
{
    auto it = balances_.find({beneficiary, currency});
    if (it == balances_.end())
        return 0;
    Amount held = it->second;
    balances_.erase(it);
    return held;
}

void FeeLedger::credit(const Currency& currency, const Amount& amount)
{
    if (amount == 0) return;
    balances_[currency] += amount;
}

Amount FeeLedger::balance(const Currency& currency) const
{
    auto it = balances_.find(currency);
    if (it == balances_.end())
        return 0;
    return it->second;
}

bool FeeLedger::debit(const Currency& currency, const Amount& amount)
{
    auto it = balances_.find(currency);
    if (it == balances_.end() || it->second < amount)
        return false;
    it->second -= amount;
    if (it->second == 0)
        balances_.erase(it);
    return true;
}

#pragma once
#include <vector>

#include "collab/royalty.hpp"
#include "collab/transfer.hpp"
#include "market/escrow_ledger.hpp"
#include "market/types.hpp"

enum class PayoutRole { MARKETPLACE, REFERRER, ROYALTY, RECEIVER, SELLER, REFUND };

inline const char* to_cstr(PayoutRole r){
    switch(r){
        case PayoutRole::MARKETPLACE: return "MARKETPLACE";
        case PayoutRole::REFERRER: return "REFERRER";
        case PayoutRole::ROYALTY: return "ROYALTY";
        case PayoutRole::RECEIVER: return "RECEIVER";
        case PayoutRole::SELLER: return "SELLER";
        case PayoutRole::REFUND: return "REFUND";
    }
    return "?";
}

struct Payout {
    PayoutRole role{PayoutRole::SELLER};
    Address to;        // empty for MARKETPLACE (accrues to the fee ledger)
    Amount amount{0};
    bool escrowed{false}; // direct payout failed, amount credited to escrow
};

struct Settlement {
    ListingId listing_id{0};
    Currency currency;
    Amount gross{0};
    std::vector<Payout> payouts; // in distribution order
    bool executed{false};

    Amount total_to(const Address& who) const {
        Amount sum = 0;
        for (const auto& p : payouts)
            if (p.to == who) sum += p.amount;
        return sum;
    }
};

// Splits sale proceeds in strict order:
//   marketplace fee -> referrer fee -> royalties -> receivers (pro rata) or seller.
// BPS rounding dust stays with the last party in the chain.
// plan() only reads collaborators; execute() moves value, escrowing failed payouts.
class SettlementEngine {
public:
    SettlementEngine(IPaymentTransfer& payments, EscrowLedger& escrow, FeeLedger& fees)
        : payments_(payments), escrow_(escrow), fees_(fees) {}

    Settlement plan(const Listing& listing, const Amount& gross, const Address& referrer,
                    IRoyaltyLookup* royalty) const;

    // Proceeds that bypass the fee chain (auction delivery fees): receivers or seller only.
    Settlement plan_direct(const Listing& listing, const Amount& amount) const;

    void execute(Settlement& settlement);

    // Returns true when paid directly, false when the amount went to escrow.
    bool pay_or_escrow(const Address& to, const Amount& amount, const Currency& currency);

private:
    static void split_remainder(const Listing& listing, const Amount& remainder,
                                std::vector<Payout>& out);

    IPaymentTransfer& payments_;
    EscrowLedger& escrow_;
    FeeLedger& fees_;
};

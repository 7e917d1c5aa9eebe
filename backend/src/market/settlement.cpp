#include "settlement.hpp"

#include <exception>
#include <sstream>

#include "util/market_log.hpp"

void SettlementEngine::split_remainder(const Listing& listing, const Amount& remainder,
                                       std::vector<Payout>& out)
{
    if (remainder == 0)
        return;

    if (listing.receivers.empty()) {
        out.push_back(Payout{PayoutRole::SELLER, listing.seller, remainder});
        return;
    }

    Amount distributed = 0;
    const std::size_t last = listing.receivers.size() - 1;
    for (std::size_t i = 0; i < listing.receivers.size(); ++i) {
        const auto& r = listing.receivers[i];
        // Last receiver absorbs the rounding dust.
        const Amount share = (i == last) ? remainder - distributed : bps_of(remainder, r.bps);
        distributed += share;
        if (share > 0)
            out.push_back(Payout{PayoutRole::RECEIVER, r.receiver, share});
    }
}

Settlement SettlementEngine::plan(const Listing& listing, const Amount& gross,
                                  const Address& referrer, IRoyaltyLookup* royalty) const
{
    Settlement s;
    s.listing_id = listing.id;
    s.currency = listing.details.currency;
    s.gross = gross;

    Amount remaining = gross;

    const Amount marketplace_fee = bps_of(gross, listing.marketplace_bps);
    if (marketplace_fee > 0) {
        s.payouts.push_back(Payout{PayoutRole::MARKETPLACE, Address{}, marketplace_fee});
        remaining -= marketplace_fee;
    }

    if (!referrer.empty() && listing.referrer_bps > 0) {
        const Amount referrer_fee = bps_of(gross, listing.referrer_bps);
        if (referrer_fee > 0) {
            s.payouts.push_back(Payout{PayoutRole::REFERRER, referrer, referrer_fee});
            remaining -= referrer_fee;
        }
    }

    // Lazily minted assets carry no royalty; neither do sales by the creator.
    if (royalty && !listing.token.lazy) {
        const auto creator = royalty->creator_of(listing.token);
        if (!creator || *creator != listing.seller) {
            RoyaltyQuote quote = royalty->get_royalty(listing.token, gross);
            Amount total = 0;
            for (const auto& a : quote.amounts) total += a;

            if (quote.recipients.size() != quote.amounts.size()) {
                std::ostringstream os;
                os << "listing " << listing.id << ": royalty quote has "
                   << quote.recipients.size() << " recipients and "
                   << quote.amounts.size() << " amounts; ignored";
                market_log("settlement", os.str());
            } else if (total > remaining) {
                std::ostringstream os;
                os << "listing " << listing.id << ": royalty total " << total.str()
                   << " exceeds remaining proceeds " << remaining.str() << "; ignored";
                market_log("settlement", os.str());
            } else {
                for (std::size_t i = 0; i < quote.recipients.size(); ++i) {
                    if (quote.amounts[i] == 0) continue;
                    s.payouts.push_back(Payout{PayoutRole::ROYALTY, quote.recipients[i], quote.amounts[i]});
                }
                remaining -= total;
            }
        }
    }

    split_remainder(listing, remaining, s.payouts);
    return s;
}

Settlement SettlementEngine::plan_direct(const Listing& listing, const Amount& amount) const
{
    Settlement s;
    s.listing_id = listing.id;
    s.currency = listing.details.currency;
    s.gross = amount;
    split_remainder(listing, amount, s.payouts);
    return s;
}

void SettlementEngine::execute(Settlement& settlement)
{
    if (settlement.executed)
        return;
    settlement.executed = true;

    for (auto& p : settlement.payouts) {
        if (p.role == PayoutRole::MARKETPLACE) {
            fees_.credit(settlement.currency, p.amount);
            continue;
        }
        p.escrowed = !pay_or_escrow(p.to, p.amount, settlement.currency);
    }
}

bool SettlementEngine::pay_or_escrow(const Address& to, const Amount& amount, const Currency& currency)
{
    if (amount == 0)
        return true;

    bool paid = false;
    std::string reason = "provider reported failure";
    try {
        paid = payments_.pay(to, amount, currency);
    } catch (const std::exception& e) {
        reason = e.what();
    }
    if (paid)
        return true;

    escrow_.credit(to, currency, amount);
    std::ostringstream os;
    os << "payout of " << amount.str() << " to '" << to << "' failed (" << reason
       << "); credited to escrow";
    market_log("settlement", os.str());
    return false;
}

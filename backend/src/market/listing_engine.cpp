#include "listing_engine.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <set>
#include <sstream>

#include "market/listing_validator.hpp"
#include "util/market_log.hpp"

namespace
{
    using Code = MarketErrorCode;

    MarketError reentrant()
    {
        return market_error(Code::Reentrant, "operation re-entered from a collaborator callback");
    }

    MarketError not_found(ListingId id)
    {
        return market_error(Code::ListingNotFound, "listing " + std::to_string(id) + " does not exist");
    }

    MarketError finalized(ListingId id)
    {
        return market_error(Code::ListingFinalized, "listing " + std::to_string(id) + " is finalized");
    }

    std::string describe(const char* what, ListingId id, const Amount& amount)
    {
        std::ostringstream os;
        os << what << " on listing " << id << " for " << amount.str();
        return os.str();
    }
}

ListingEngine::ListingEngine(MarketSettings settings,
                             IAssetTransfer& assets,
                             IPaymentTransfer& payments,
                             const CollaboratorRegistry& registry,
                             Clock clock)
    : settings_(std::move(settings)),
      assets_(assets),
      payments_(payments),
      registry_(registry),
      clock_(std::move(clock)),
      settlement_(payments, escrow_, fees_),
      admin_(settings_, fees_, payments, gate_, clock_)
{
}

std::uint64_t ListingEngine::system_clock_seconds()
{
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

void ListingEngine::set_event_sink(IMarketEventSink* sink)
{
    OperationGate::Scope scope(gate_);
    sink_ = sink;
    admin_.set_event_sink(sink);
}

// -------- helpers (caller is inside the gate) --------

Listing* ListingEngine::find_listing(ListingId id)
{
    auto it = listings_.find(id);
    if (it == listings_.end())
        return nullptr;
    return &it->second;
}

ListingEngine::Snapshot ListingEngine::snapshot(const Listing& listing)
{
    Snapshot s;
    s.listing = listing;
    auto it = offers_.find(listing.id);
    if (it != offers_.end())
        s.offers = it->second;
    return s;
}

void ListingEngine::restore(const Snapshot& snap)
{
    listings_[snap.listing.id] = snap.listing;
    if (snap.offers.empty())
        offers_.erase(snap.listing.id);
    else
        offers_[snap.listing.id] = snap.offers;
}

void ListingEngine::start_if_pending(Listing& l, std::uint64_t now)
{
    if (has_started(l))
        return;
    // end_time holds a duration until the first buyer action
    l.details.start_time = now;
    l.details.end_time = now + l.details.end_time;
}

bool ListingEngine::has_ended(const Listing& l, std::uint64_t now)
{
    return has_started(l) && now >= l.details.end_time;
}

std::uint64_t ListingEngine::remaining_sales(const Listing& l)
{
    if (l.total_sold >= l.details.total_available)
        return 0;
    return (l.details.total_available - l.total_sold) / l.details.total_per_sale;
}

std::optional<MarketError> ListingEngine::verify_buyer(const Listing& listing, const Address& who,
                                                       std::uint64_t count, const Amount& amount,
                                                       const std::string& context_data)
{
    if (listing.details.identity_verifier.empty())
        return std::nullopt;

    IBuyerVerifier* verifier = registry_.find_buyer_verifier(listing.details.identity_verifier);
    if (!verifier)
        return market_error(Code::CollaboratorMissing,
                            "identity verifier '" + listing.details.identity_verifier + "' is not registered");

    bool ok = false;
    try {
        ok = verifier->verify(listing.id, who, listing.token, count, amount,
                              listing.details.currency, context_data);
    } catch (const std::exception& e) {
        market_log("market", std::string("identity verifier threw: ") + e.what());
        ok = false;
    }
    if (!ok)
        return market_error(Code::BuyerNotVerified, "identity verification failed for '" + who + "'");
    return std::nullopt;
}

std::optional<MarketError> ListingEngine::collect_payment(const Address& from, const Amount& amount,
                                                          const Currency& currency)
{
    if (amount == 0)
        return std::nullopt;

    bool ok = false;
    std::string reason = "provider reported failure";
    try {
        ok = payments_.collect(from, amount, currency);
    } catch (const std::exception& e) {
        reason = e.what();
    }
    if (!ok)
        return market_error(Code::PaymentCollectFailed,
                            "could not collect " + amount.str() + " from '" + from + "': " + reason);
    return std::nullopt;
}

bool ListingEngine::move_asset(const Address& from, const Address& to, const TokenReference& token,
                               std::uint64_t quantity)
{
    if (quantity == 0)
        return true;
    try {
        return assets_.transfer(from, to, token, quantity);
    } catch (const std::exception& e) {
        market_log("market", std::string("asset transfer threw: ") + e.what());
        return false;
    }
}

bool ListingEngine::deliver_sale(const Listing& listing, const Address& to, std::uint64_t units,
                                 const Amount& amount, std::uint64_t index)
{
    if (!listing.token.lazy)
        return move_asset(settings_.custody_address, to, listing.token, units);

    ILazyDeliverer* deliverer = registry_.find_lazy_deliverer(listing.token.contract);
    if (!deliverer) {
        market_log("market", "no lazy deliverer registered for '" + listing.token.contract + "'");
        return false;
    }
    try {
        return deliverer->deliver(listing.id, to, listing.token.token_id, units, amount,
                                  listing.details.currency, index);
    } catch (const std::exception& e) {
        market_log("market", std::string("lazy delivery threw: ") + e.what());
        return false;
    }
}

Outcome<Settlement> ListingEngine::plan_settlement(const Listing& listing, const Amount& gross,
                                                   const Address& referrer)
{
    try {
        return settlement_.plan(listing, gross, referrer, settings_.royalty.get());
    } catch (const std::exception& e) {
        return market_error(Code::CollaboratorFailed, std::string("royalty lookup failed: ") + e.what());
    }
}

void ListingEngine::emit(const MarketEvent& ev)
{
    if (!sink_)
        return;
    try {
        sink_->publish(ev);
    } catch (const std::exception& e) {
        market_log("journal", std::string("failed to publish ") + event_name(ev) + ": " + e.what());
    }
}

// -------- create / modify --------

Outcome<ListingId> ListingEngine::create(const Address& seller, const ListingConfig& config,
                                         const std::string& context_data)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    const std::uint64_t now = clock_();

    if (!settings_.enabled)
        return market_error(Code::MarketplaceDisabled, "marketplace is disabled");

    if (!settings_.seller_registry.empty()) {
        ISellerAuthorization* registry = registry_.find_seller_authorization(settings_.seller_registry);
        if (!registry)
            return market_error(Code::CollaboratorMissing,
                                "seller registry '" + settings_.seller_registry + "' is not registered");
        bool ok = false;
        try {
            ok = registry->is_authorized(seller, context_data);
        } catch (const std::exception& e) {
            market_log("market", std::string("seller registry threw: ") + e.what());
        }
        if (!ok)
            return market_error(Code::SellerNotAuthorized, "seller '" + seller + "' is not authorized to list");
    }

    auto built = validate_listing(config, seller, now, settings_.marketplace_fee_bps, settings_.referrer_bps);
    if (auto* err = std::get_if<MarketError>(&built))
        return *err;
    Listing listing = std::get<Listing>(std::move(built));

    // Custody is an inbound transfer: it must succeed before anything is recorded.
    if (!listing.token.lazy) {
        bool ok = false;
        try {
            ok = assets_.custody(seller, listing.token, listing.details.total_available);
        } catch (const std::exception& e) {
            market_log("market", std::string("custody threw: ") + e.what());
        }
        if (!ok)
            return market_error(Code::AssetTransferFailed, "could not take custody of the listed asset");
    }

    listing.id = next_id_++;
    listings_.emplace(listing.id, listing);

    std::ostringstream os;
    os << "listing " << listing.id << " created by '" << seller << "' (" << to_cstr(listing.details.type) << ")";
    market_log("market", os.str());

    emit(ListingCreated{listing.id, seller, listing.details.type, listing.token.contract,
                        listing.token.token_id, listing.details.total_available,
                        listing.details.initial_amount, listing.details.currency, now});
    return listing.id;
}

Outcome<Listing> ListingEngine::modify(const Address& caller, ListingId id, const Amount& initial_amount,
                                       std::uint64_t start_time, std::uint64_t end_time)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    const std::uint64_t now = clock_();

    Listing* l = find_listing(id);
    if (!l) return not_found(id);
    if (l->seller != caller)
        return market_error(Code::NotSeller, "only the seller may modify listing " + std::to_string(id));
    if (l->finalized) return finalized(id);

    const bool any_accepted = [&] {
        auto it = offers_.find(id);
        if (it == offers_.end()) return false;
        return std::any_of(it->second.begin(), it->second.end(),
                           [](const auto& kv) { return kv.second.accepted; });
    }();
    if (l->bid || l->total_sold > 0 || any_accepted)
        return market_error(Code::HasActivity, "listing " + std::to_string(id) + " already has bids or sales");

    const ListingType type = l->details.type;
    if ((type == ListingType::DYNAMIC_PRICE || type == ListingType::OFFERS_ONLY) && initial_amount != 0)
        return market_error(Code::NonZeroInitialAmount, "initial amount must stay zero for this listing type");
    if (auto err = validate_times(type, start_time, end_time, now))
        return *err;

    l->details.initial_amount = initial_amount;
    l->details.start_time = start_time;
    l->details.end_time = end_time;
    return *l;
}

// -------- purchase --------

Outcome<PurchaseReceipt> ListingEngine::purchase(const Address& buyer, ListingId id, std::uint64_t count,
                                                 const Amount& payment, const Address& referrer,
                                                 const std::string& context_data)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    const std::uint64_t now = clock_();

    Listing* l = find_listing(id);
    if (!l) return not_found(id);
    if (l->finalized) return finalized(id);

    const ListingType type = l->details.type;
    if (type != ListingType::FIXED_PRICE && type != ListingType::DYNAMIC_PRICE)
        return market_error(Code::WrongListingType, "purchase is only for fixed or dynamic price listings");
    if (count == 0)
        return market_error(Code::InvalidCount, "purchase count must be at least 1");
    if (has_started(*l) && now < l->details.start_time)
        return market_error(Code::ListingNotStarted, "listing " + std::to_string(id) + " has not started");
    if (has_ended(*l, now))
        return market_error(Code::ListingEnded, "listing " + std::to_string(id) + " has ended");
    if (count > remaining_sales(*l))
        return market_error(Code::SoldOut, "listing " + std::to_string(id) + " does not have enough supply left");

    const std::uint64_t units = count * l->details.total_per_sale;

    Amount price = 0;
    if (type == ListingType::FIXED_PRICE) {
        price = l->details.initial_amount * count;
        if (payment != price)
            return market_error(Code::InvalidPaymentAmount,
                                "payment must equal " + price.str() + ", got " + payment.str());
    } else {
        IPriceOracle* oracle = registry_.find_price_oracle(l->token.contract);
        if (!oracle)
            return market_error(Code::CollaboratorMissing,
                                "no price oracle registered for '" + l->token.contract + "'");
        try {
            price = oracle->quote(l->token.token_id, l->total_sold, count);
        } catch (const std::exception& e) {
            return market_error(Code::CollaboratorFailed, std::string("price oracle failed: ") + e.what());
        }
        if (payment < price)
            return market_error(Code::InvalidPaymentAmount,
                                "payment " + payment.str() + " is below the quoted price " + price.str());
    }

    if (auto err = verify_buyer(*l, buyer, count, price, context_data))
        return *err;

    auto planned = plan_settlement(*l, price, referrer);
    if (is_error(planned)) return error_of(planned);
    Settlement settlement = std::get<Settlement>(std::move(planned));

    if (auto err = collect_payment(buyer, payment, l->details.currency))
        return *err;

    // Commit
    const Snapshot before = snapshot(*l);
    start_if_pending(*l, now);
    const std::uint64_t index = l->total_sold;
    l->total_sold += units;
    if (sold_out(*l))
        l->finalized = true;
    const Listing committed = *l;

    // Interactions
    if (!deliver_sale(committed, buyer, units, price, index)) {
        restore(before);
        settlement_.pay_or_escrow(buyer, payment, committed.details.currency);
        return market_error(Code::AssetTransferFailed,
                            "delivery to '" + buyer + "' failed; purchase reverted and payment returned");
    }

    settlement_.execute(settlement);
    const Amount excess = payment - price;
    if (excess > 0)
        settlement_.pay_or_escrow(buyer, excess, committed.details.currency);

    market_log("market", describe("purchase", id, price));
    emit(PurchaseMade{id, buyer, count, price, referrer, now});
    if (committed.finalized)
        emit(ListingFinalized{id, Address{}, price, now});

    PurchaseReceipt receipt;
    receipt.listing_id = id;
    receipt.count = count;
    receipt.units = units;
    receipt.price = price;
    receipt.refunded = excess;
    receipt.settlement = std::move(settlement);
    receipt.finalized = committed.finalized;
    return receipt;
}

// -------- bid --------

Outcome<BidReceipt> ListingEngine::bid(const Address& bidder, ListingId id, const Amount& amount,
                                       const Address& referrer, const std::string& context_data)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    const std::uint64_t now = clock_();

    Listing* l = find_listing(id);
    if (!l) return not_found(id);
    if (l->finalized) return finalized(id);
    if (l->details.type != ListingType::INDIVIDUAL_AUCTION)
        return market_error(Code::WrongListingType, "bids are only accepted on auctions");
    if (bidder == l->seller)
        return market_error(Code::NotPermitted, "seller cannot bid on own listing");
    if (has_started(*l) && now < l->details.start_time)
        return market_error(Code::ListingNotStarted, "auction " + std::to_string(id) + " has not started");
    if (has_ended(*l, now))
        return market_error(Code::ListingEnded, "auction " + std::to_string(id) + " has ended");

    Amount owed = amount;
    if (!l->bid) {
        if (amount == 0 || amount < l->details.initial_amount)
            return market_error(Code::BidTooLow,
                                "bid must be at least the reserve " + l->details.initial_amount.str());
    } else {
        const Amount& prev = l->bid->amount;
        Amount increment = bps_of(prev, l->details.min_increment_bps);
        if (increment == 0)
            increment = 1; // smallest currency unit
        const Amount minimum = prev + increment;
        if (amount < minimum)
            return market_error(Code::BidTooLow, "bid must be at least " + minimum.str());
        // The current high bidder only tops up the difference.
        if (l->bid->bidder == bidder)
            owed = amount - prev;
    }

    if (auto err = verify_buyer(*l, bidder, 1, amount, context_data))
        return *err;
    if (auto err = collect_payment(bidder, owed, l->details.currency))
        return *err;

    // Commit
    std::optional<Bid> previous = l->bid;
    start_if_pending(*l, now);
    l->offers_disabled = true;
    const std::uint64_t ext = l->details.extension_interval;
    if (ext > 0 && now + ext >= l->details.end_time)
        l->details.end_time = now + ext;

    Bid b;
    b.amount = amount;
    b.bidder = bidder;
    b.timestamp = now;
    b.referrer = referrer;
    l->bid = b;

    BidReceipt receipt;
    receipt.listing_id = id;
    receipt.amount = amount;
    receipt.end_time = l->details.end_time;

    // Interactions
    if (previous && previous->bidder != bidder) {
        receipt.outbid = previous->bidder;
        receipt.outbid_refund = previous->amount;
        settlement_.pay_or_escrow(previous->bidder, previous->amount, l->details.currency);
    }

    market_log("market", describe("bid", id, amount));
    emit(BidPlaced{id, bidder, amount, referrer, receipt.end_time, now});
    return receipt;
}

// -------- offers --------

Outcome<Offer> ListingEngine::offer(const Address& offerer, ListingId id, const Amount& amount,
                                    const Address& referrer, const std::string& context_data)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    const std::uint64_t now = clock_();

    Listing* l = find_listing(id);
    if (!l) return not_found(id);
    if (l->finalized) return finalized(id);

    const ListingType type = l->details.type;
    if (type == ListingType::INDIVIDUAL_AUCTION) {
        if (!l->offers_accepted)
            return market_error(Code::OffersNotAllowed, "auction " + std::to_string(id) + " does not take offers");
        if (l->bid || l->offers_disabled)
            return market_error(Code::OffersDisabled, "offers closed once the auction received a bid");
    } else if (type != ListingType::OFFERS_ONLY) {
        return market_error(Code::WrongListingType, "listing " + std::to_string(id) + " does not take offers");
    }
    if (offerer == l->seller)
        return market_error(Code::NotPermitted, "seller cannot make an offer on own listing");
    if (has_ended(*l, now))
        return market_error(Code::ListingEnded, "listing " + std::to_string(id) + " has ended");
    if (amount == 0)
        return market_error(Code::InvalidPaymentAmount, "offer amount must be positive");

    OfferBook& book = offers_[id];
    auto existing = book.find(offerer);
    if (existing != book.end() && existing->second.accepted)
        return market_error(Code::OfferAccepted, "offer from '" + offerer + "' was already accepted");

    const Amount total = (existing != book.end() ? existing->second.amount : Amount{0}) + amount;

    auto drop_empty_book = [&] {
        if (book.empty())
            offers_.erase(id);
    };
    if (auto err = verify_buyer(*l, offerer, 1, total, context_data)) {
        drop_empty_book();
        return *err;
    }
    if (auto err = collect_payment(offerer, amount, l->details.currency)) {
        drop_empty_book();
        return *err;
    }

    // Commit: increase in place, never duplicate
    Offer& o = book[offerer];
    o.amount = total;
    o.timestamp = now;
    if (!referrer.empty())
        o.referrer = referrer;

    market_log("market", describe("offer", id, total));
    emit(OfferMade{id, offerer, total, o.referrer, now});
    return o;
}

Outcome<AcceptReceipt> ListingEngine::accept(const Address& caller, ListingId id,
                                             const std::vector<Address>& offerers,
                                             const std::vector<Amount>& expected_amounts,
                                             const Amount& max_amount)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    const std::uint64_t now = clock_();

    Listing* l = find_listing(id);
    if (!l) return not_found(id);
    if (l->seller != caller)
        return market_error(Code::NotSeller, "only the seller may accept offers");
    if (l->finalized) return finalized(id);

    const ListingType type = l->details.type;
    if (type == ListingType::INDIVIDUAL_AUCTION) {
        if (!l->offers_accepted)
            return market_error(Code::OffersNotAllowed, "auction " + std::to_string(id) + " does not take offers");
        if (l->bid)
            return market_error(Code::BidExists, "cannot accept offers once the auction has a bid");
    } else if (type != ListingType::OFFERS_ONLY) {
        return market_error(Code::WrongListingType, "listing " + std::to_string(id) + " does not take offers");
    }

    if (offerers.empty() || offerers.size() != expected_amounts.size())
        return market_error(Code::InvalidArguments, "offerers and expected amounts must be non-empty and aligned");
    if (std::set<Address>(offerers.begin(), offerers.end()).size() != offerers.size())
        return market_error(Code::InvalidArguments, "an offerer is named more than once");
    if (offerers.size() > remaining_sales(*l))
        return market_error(Code::SoldOut, "more offers named than sales remaining");

    auto book_it = offers_.find(id);
    Amount aggregate = 0;
    for (std::size_t i = 0; i < offerers.size(); ++i) {
        if (book_it == offers_.end())
            return market_error(Code::OfferNotFound, "no offer from '" + offerers[i] + "'");
        auto it = book_it->second.find(offerers[i]);
        if (it == book_it->second.end())
            return market_error(Code::OfferNotFound, "no offer from '" + offerers[i] + "'");
        if (it->second.accepted)
            return market_error(Code::OfferAccepted, "offer from '" + offerers[i] + "' was already accepted");
        if (it->second.amount != expected_amounts[i])
            return market_error(Code::OfferChanged, "offer from '" + offerers[i] + "' no longer matches " +
                                                        expected_amounts[i].str());
        aggregate += it->second.amount;
    }
    if (aggregate > max_amount)
        return market_error(Code::ExceedsMaxAmount,
                            "accepted offers total " + aggregate.str() + ", above the maximum " + max_amount.str());

    // Every settlement is planned before the first commit, so a failing royalty
    // lookup leaves the whole batch untouched.
    std::vector<Settlement> plans;
    for (const auto& who : offerers) {
        const Offer& o = book_it->second.at(who);
        auto planned = plan_settlement(*l, o.amount, o.referrer);
        if (is_error(planned)) return error_of(planned);
        plans.push_back(std::get<Settlement>(std::move(planned)));
    }

    AcceptReceipt receipt;
    receipt.listing_id = id;

    // Offers are settled one at a time. A failed delivery reverts only that offer
    // and stops; it and the rest stay live.
    for (std::size_t i = 0; i < offerers.size(); ++i) {
        const Address& who = offerers[i];
        Listing& listing = listings_[id];
        Offer& o = offers_[id][who];
        Settlement& settlement = plans[i];

        const Snapshot before = snapshot(listing);
        const std::uint64_t index = listing.total_sold;
        o.accepted = true;
        listing.total_sold += listing.details.total_per_sale;
        if (type == ListingType::INDIVIDUAL_AUCTION || sold_out(listing))
            listing.finalized = true;
        const Listing committed = listing;
        const Amount amount = o.amount;

        if (!deliver_sale(committed, who, committed.details.total_per_sale, amount, index)) {
            restore(before);
            if (receipt.accepted.empty())
                return market_error(Code::AssetTransferFailed,
                                    "delivery to '" + who + "' failed; no offer was accepted");
            receipt.stopped_at = who;
            std::ostringstream os;
            os << "delivery to '" << who << "' failed after " << receipt.accepted.size()
               << " accepted offer(s); that offer and the rest remain live";
            receipt.stop_reason = os.str();
            market_log("market", "listing " + std::to_string(id) + ": " + receipt.stop_reason);
            break;
        }

        settlement_.execute(settlement);
        receipt.accepted.push_back(who);
        receipt.settlements.push_back(std::move(settlement));
        receipt.finalized = committed.finalized;

        market_log("market", describe("accepted offer", id, amount));
        emit(OfferAccepted{id, who, amount, now});
        if (committed.finalized)
            emit(ListingFinalized{id, who, amount, now});
    }
    return receipt;
}

Outcome<RescindReceipt> ListingEngine::rescind(const Address& caller, ListingId id,
                                               const std::vector<Address>& offerers)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    const std::uint64_t now = clock_();

    Listing* l = find_listing(id);
    if (!l) return not_found(id);
    if (offerers.empty())
        return market_error(Code::InvalidArguments, "no offers named");

    auto book_it = offers_.find(id);
    const RescindPolicy& policy = settings_.rescind;
    const bool ended = l->finalized || has_ended(*l, now);

    for (const auto& who : offerers) {
        if (book_it == offers_.end() || book_it->second.count(who) == 0)
            return market_error(Code::OfferNotFound, "no offer from '" + who + "'");
        if (book_it->second.at(who).accepted)
            return market_error(Code::OfferAccepted, "accepted offer from '" + who + "' cannot be rescinded");

        if (who == caller) {
            if (l->finalized)
                continue;
            if (l->details.type == ListingType::OFFERS_ONLY) {
                const std::uint64_t end = l->details.end_time;
                if (!(has_started(*l) && now >= end && now - end >= policy.offers_only_rescind_delay))
                    return market_error(Code::RescindTooEarly,
                                        "offers only listing: rescind after finalization or the grace period past end time");
            } else if (l->bid || l->offers_disabled) {
                if (!policy.auction_offer_rescind_after_bid)
                    return market_error(Code::RescindTooEarly, "auction offers cannot be rescinded once a bid exists");
            }
        } else if (caller == l->seller) {
            if (policy.seller_force_rescind_after_end_only && !ended)
                return market_error(Code::RescindTooEarly, "seller may rescind offers only after the listing ends");
        } else {
            return market_error(Code::NotPermitted, "'" + caller + "' may not rescind the offer of '" + who + "'");
        }
    }

    // Commit: offers are removed, not flagged
    RescindReceipt receipt;
    receipt.listing_id = id;
    for (const auto& who : offerers) {
        auto it = book_it->second.find(who);
        if (it == book_it->second.end())
            continue; // named twice
        receipt.refunds.emplace_back(who, it->second.amount);
        book_it->second.erase(it);
    }
    if (book_it->second.empty())
        offers_.erase(book_it);
    const Currency currency = l->details.currency;

    // Interactions
    for (const auto& [who, amount] : receipt.refunds) {
        settlement_.pay_or_escrow(who, amount, currency);
        emit(OfferRescinded{id, who, caller, amount, now});
    }
    return receipt;
}

// -------- finalize / collect --------

Outcome<FinalizeReceipt> ListingEngine::finalize(const Address& caller, ListingId id)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    const std::uint64_t now = clock_();

    Listing* l = find_listing(id);
    if (!l) return not_found(id);
    if (l->finalized) return finalized(id);
    if (l->details.type != ListingType::INDIVIDUAL_AUCTION)
        return market_error(Code::WrongListingType, "finalize is for auctions; use reclaim for other listings");
    if (!has_ended(*l, now))
        return market_error(Code::ListingNotEnded, "auction " + std::to_string(id) + " has not ended");

    FinalizeReceipt receipt;
    receipt.listing_id = id;

    if (!l->bid) {
        const Snapshot before = snapshot(*l);
        l->finalized = true;
        const Listing committed = *l;
        if (!committed.token.lazy &&
            !move_asset(settings_.custody_address, committed.seller, committed.token, committed.details.total_available)) {
            restore(before);
            return market_error(Code::AssetTransferFailed, "could not return the asset to the seller");
        }
        emit(ListingFinalized{id, Address{}, Amount{0}, now});
        return receipt;
    }

    const Bid winning = *l->bid;
    const Amount delivery_fee = bps_of(winning.amount, l->fees.deliver_bps) + l->fees.deliver_fixed;
    if (delivery_fee > 0 && caller != winning.bidder)
        return market_error(Code::NotPermitted, "auction carries a delivery fee; only the winning bidder may finalize");

    std::optional<Settlement> settlement;
    if (!winning.settled) {
        auto planned = plan_settlement(*l, winning.amount, winning.referrer);
        if (is_error(planned)) return error_of(planned);
        settlement = std::get<Settlement>(std::move(planned));
    }

    if (delivery_fee > 0) {
        if (auto err = collect_payment(winning.bidder, delivery_fee, l->details.currency))
            return *err;
    }

    // Commit
    const Snapshot before = snapshot(*l);
    l->finalized = true;
    l->total_sold = l->details.total_available;
    l->bid->delivered = true;
    l->bid->settled = true;
    const Listing committed = *l;

    // Interactions
    if (!deliver_sale(committed, winning.bidder, committed.details.total_per_sale, winning.amount, 0)) {
        restore(before);
        if (delivery_fee > 0)
            settlement_.pay_or_escrow(winning.bidder, delivery_fee, committed.details.currency);
        return market_error(Code::AssetTransferFailed, "could not deliver the asset to the winning bidder");
    }

    if (settlement)
        settlement_.execute(*settlement);
    if (delivery_fee > 0) {
        Settlement fee_split = settlement_.plan_direct(committed, delivery_fee);
        settlement_.execute(fee_split);
    }

    receipt.winner = winning.bidder;
    receipt.amount = winning.amount;
    receipt.delivery_fee = delivery_fee;
    receipt.settlement = std::move(settlement);

    market_log("market", describe("finalized auction", id, winning.amount));
    emit(ListingFinalized{id, winning.bidder, winning.amount, now});
    return receipt;
}

Outcome<Settlement> ListingEngine::collect(const Address& caller, ListingId id)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    const std::uint64_t now = clock_();

    Listing* l = find_listing(id);
    if (!l) return not_found(id);
    if (l->details.type != ListingType::INDIVIDUAL_AUCTION)
        return market_error(Code::WrongListingType, "collect is for auctions");
    if (l->seller != caller)
        return market_error(Code::NotSeller, "only the seller may collect auction proceeds");
    if (l->finalized) return finalized(id);
    if (l->token.lazy)
        return market_error(Code::WrongListingType, "lazy auctions settle at finalize");
    if (!l->bid)
        return market_error(Code::NoBid, "auction " + std::to_string(id) + " has no bid");
    if (l->bid->settled)
        return market_error(Code::AlreadySettled, "auction " + std::to_string(id) + " was already settled");
    if (!has_ended(*l, now))
        return market_error(Code::ListingNotEnded, "auction " + std::to_string(id) + " has not ended");

    auto planned = plan_settlement(*l, l->bid->amount, l->bid->referrer);
    if (is_error(planned)) return error_of(planned);
    Settlement settlement = std::get<Settlement>(std::move(planned));

    // Commit, then pay
    l->bid->settled = true;
    settlement_.execute(settlement);

    market_log("market", describe("collected proceeds", id, settlement.gross));
    return settlement;
}

// -------- cancel / reclaim --------

Outcome<CancelReceipt> ListingEngine::cancel(const Address& caller, ListingId id, std::uint32_t holdback_bps)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    const std::uint64_t now = clock_();

    Listing* l = find_listing(id);
    if (!l) return not_found(id);
    if (l->finalized) return finalized(id);

    const bool is_admin = settings_.is_admin(caller);
    if (is_admin) {
        if (holdback_bps > kMaxHoldbackBps)
            return market_error(Code::InvalidBps, "holdback may not exceed 1000 BPS");
        if (l->bid && l->bid->settled)
            return market_error(Code::AlreadySettled, "proceeds were already collected; cannot refund the bidder");
    } else if (caller == l->seller) {
        if (holdback_bps != 0)
            return market_error(Code::NotAdmin, "only an administrator may apply a holdback");
        const bool any_accepted = [&] {
            auto it = offers_.find(id);
            if (it == offers_.end()) return false;
            return std::any_of(it->second.begin(), it->second.end(),
                               [](const auto& kv) { return kv.second.accepted; });
        }();
        if (l->bid || l->total_sold > 0 || any_accepted)
            return market_error(Code::HasActivity, "listing " + std::to_string(id) + " has bids or sales");
    } else {
        return market_error(Code::NotPermitted, "only the seller or an administrator may cancel");
    }

    // Commit
    const Snapshot before = snapshot(*l);
    CancelReceipt receipt;
    receipt.listing_id = id;
    std::optional<Bid> refund_to;
    if (l->bid) {
        receipt.holdback = bps_of(l->bid->amount, holdback_bps);
        receipt.bid_refund = l->bid->amount - receipt.holdback;
        l->bid->refunded = true;
        refund_to = l->bid;
    }
    l->finalized = true;
    const Listing committed = *l;
    if (!committed.token.lazy)
        receipt.units_returned = committed.details.total_available - committed.total_sold;

    // Interactions
    if (!move_asset(settings_.custody_address, committed.seller, committed.token, receipt.units_returned)) {
        restore(before);
        return market_error(Code::AssetTransferFailed, "could not return unsold units to the seller");
    }
    if (refund_to) {
        settlement_.pay_or_escrow(refund_to->bidder, receipt.bid_refund, committed.details.currency);
        fees_.credit(committed.details.currency, receipt.holdback);
    }

    std::ostringstream os;
    os << "listing " << id << " cancelled by '" << caller << "'";
    if (holdback_bps > 0)
        os << " with " << holdback_bps << " BPS holdback";
    market_log("market", os.str());
    emit(ListingCancelled{id, caller, holdback_bps, now});
    return receipt;
}

Outcome<std::uint64_t> ListingEngine::reclaim(const Address& caller, ListingId id)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    const std::uint64_t now = clock_();

    Listing* l = find_listing(id);
    if (!l) return not_found(id);
    if (l->seller != caller)
        return market_error(Code::NotSeller, "only the seller may reclaim unsold units");
    if (l->finalized) return finalized(id);
    if (l->details.type == ListingType::INDIVIDUAL_AUCTION)
        return market_error(Code::WrongListingType, "auctions are closed with finalize");
    if (!has_ended(*l, now))
        return market_error(Code::ListingNotEnded, "listing " + std::to_string(id) + " has not ended");

    const Snapshot before = snapshot(*l);
    l->finalized = true;
    const Listing committed = *l;
    const std::uint64_t units = committed.token.lazy ? 0 : committed.details.total_available - committed.total_sold;

    if (!move_asset(settings_.custody_address, committed.seller, committed.token, units)) {
        restore(before);
        return market_error(Code::AssetTransferFailed, "could not return unsold units to the seller");
    }
    emit(ListingFinalized{id, Address{}, Amount{0}, now});
    return units;
}

// -------- escrow --------

Outcome<Amount> ListingEngine::withdraw_escrow(const Address& caller, const Currency& currency)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    const std::uint64_t now = clock_();

    // Zero the entry before paying so a callback cannot drain it twice.
    const Amount held = escrow_.take(caller, currency);
    if (held == 0)
        return market_error(Code::InsufficientBalance, "no escrow balance for '" + caller + "'");

    bool paid = false;
    std::string reason = "provider reported failure";
    try {
        paid = payments_.pay(caller, held, currency);
    } catch (const std::exception& e) {
        reason = e.what();
    }
    if (!paid) {
        escrow_.credit(caller, currency, held);
        return market_error(Code::PaymentFailed, "escrow withdrawal failed: " + reason);
    }

    std::ostringstream os;
    os << "'" << caller << "' withdrew " << held.str() << " from escrow";
    market_log("escrow", os.str());
    emit(EscrowWithdrawn{caller, currency, held, now});
    return held;
}

// -------- queries --------
// Reads are allowed from inside a collaborator callback: state is committed
// before any outbound call, so they observe the new values.

std::optional<Listing> ListingEngine::get_listing(ListingId id)
{
    OperationGate::Scope scope(gate_);
    Listing* l = find_listing(id);
    if (!l) return std::nullopt;
    return *l;
}

std::optional<ListingState> ListingEngine::current_state(ListingId id)
{
    OperationGate::Scope scope(gate_);
    Listing* l = find_listing(id);
    if (!l) return std::nullopt;
    return listing_state(*l, clock_());
}

std::optional<Offer> ListingEngine::get_offer(ListingId id, const Address& offerer)
{
    OperationGate::Scope scope(gate_);
    auto it = offers_.find(id);
    if (it == offers_.end()) return std::nullopt;
    auto oit = it->second.find(offerer);
    if (oit == it->second.end()) return std::nullopt;
    return oit->second;
}

std::vector<std::pair<Address, Offer>> ListingEngine::list_offers(ListingId id)
{
    OperationGate::Scope scope(gate_);
    std::vector<std::pair<Address, Offer>> out;
    auto it = offers_.find(id);
    if (it == offers_.end()) return out;
    out.assign(it->second.begin(), it->second.end());
    return out;
}

Amount ListingEngine::escrow_balance(const Address& beneficiary, const Currency& currency)
{
    OperationGate::Scope scope(gate_);
    return escrow_.balance(beneficiary, currency);
}

Amount ListingEngine::fee_balance(const Currency& currency)
{
    OperationGate::Scope scope(gate_);
    return fees_.balance(currency);
}

bool ListingEngine::escrow_empty()
{
    OperationGate::Scope scope(gate_);
    return escrow_.empty();
}

MarketSettings ListingEngine::settings()
{
    OperationGate::Scope scope(gate_);
    return settings_;
}

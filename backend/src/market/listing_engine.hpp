#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "collab/collaborator_registry.hpp"
#include "collab/transfer.hpp"
#include "events/event_sink.hpp"
#include "market/errors.hpp"
#include "market/escrow_ledger.hpp"
#include "market/market_admin.hpp"
#include "market/market_config.hpp"
#include "market/operation_gate.hpp"
#include "market/settlement.hpp"
#include "market/types.hpp"

struct PurchaseReceipt {
    ListingId listing_id{0};
    std::uint64_t count{0};   // sales
    std::uint64_t units{0};   // count * total_per_sale
    Amount price{0};          // what the sale cost
    Amount refunded{0};       // excess payment returned (dynamic price)
    Settlement settlement;
    bool finalized{false};
};

struct BidReceipt {
    ListingId listing_id{0};
    Amount amount{0};
    std::uint64_t end_time{0};
    Address outbid;           // previous high bidder, "" if none
    Amount outbid_refund{0};
};

struct AcceptReceipt {
    ListingId listing_id{0};
    std::vector<Address> accepted;
    std::vector<Settlement> settlements;
    bool finalized{false};
    Address stopped_at;      // offer whose delivery failed; it and later ones stay live
    std::string stop_reason;
};

struct RescindReceipt {
    ListingId listing_id{0};
    std::vector<std::pair<Address, Amount>> refunds;
};

struct FinalizeReceipt {
    ListingId listing_id{0};
    Address winner;                      // "" when the asset went back to the seller
    Amount amount{0};
    Amount delivery_fee{0};
    std::optional<Settlement> settlement; // absent when collect() already settled
};

struct CancelReceipt {
    ListingId listing_id{0};
    std::uint64_t units_returned{0};
    Amount bid_refund{0};
    Amount holdback{0};
};

// Owns every listing, bid and offer, and drives each listing through
// OPEN -> ACTIVE -> ENDED -> FINALIZED.
//
// Every entry point runs under the operation gate and follows the same order:
//   checks -> inbound payment collection -> state commit -> outbound transfers.
// An asset delivery failure after commit restores the listing snapshot and
// returns collected funds, so the call has no observable effect.
// Payout failures never abort: the amount is credited to the escrow ledger.
class ListingEngine {
public:
    using Clock = std::function<std::uint64_t()>;

    ListingEngine(MarketSettings settings,
                  IAssetTransfer& assets,
                  IPaymentTransfer& payments,
                  const CollaboratorRegistry& registry,
                  Clock clock = system_clock_seconds);

    ListingEngine(const ListingEngine&) = delete;
    ListingEngine& operator=(const ListingEngine&) = delete;

    void set_event_sink(IMarketEventSink* sink);
    MarketAdmin& admin() { return admin_; }

    // Lifecycle
    Outcome<ListingId> create(const Address& seller, const ListingConfig& config,
                              const std::string& context_data = {});

    Outcome<Listing> modify(const Address& caller, ListingId id, const Amount& initial_amount,
                            std::uint64_t start_time, std::uint64_t end_time);

    Outcome<PurchaseReceipt> purchase(const Address& buyer, ListingId id, std::uint64_t count,
                                      const Amount& payment, const Address& referrer = {},
                                      const std::string& context_data = {});

    Outcome<BidReceipt> bid(const Address& bidder, ListingId id, const Amount& amount,
                            const Address& referrer = {}, const std::string& context_data = {});

    Outcome<Offer> offer(const Address& offerer, ListingId id, const Amount& amount,
                         const Address& referrer = {}, const std::string& context_data = {});

    Outcome<AcceptReceipt> accept(const Address& caller, ListingId id,
                                  const std::vector<Address>& offerers,
                                  const std::vector<Amount>& expected_amounts,
                                  const Amount& max_amount);

    Outcome<RescindReceipt> rescind(const Address& caller, ListingId id,
                                    const std::vector<Address>& offerers);

    Outcome<FinalizeReceipt> finalize(const Address& caller, ListingId id);

    Outcome<Settlement> collect(const Address& caller, ListingId id);

    Outcome<CancelReceipt> cancel(const Address& caller, ListingId id, std::uint32_t holdback_bps = 0);

    // Seller recovers unsold units of an expired non-auction listing.
    Outcome<std::uint64_t> reclaim(const Address& caller, ListingId id);

    // Drains the caller's escrow balance for `currency`.
    Outcome<Amount> withdraw_escrow(const Address& caller, const Currency& currency = {});

    // Queries
    std::optional<Listing> get_listing(ListingId id);
    std::optional<ListingState> current_state(ListingId id);
    std::optional<Offer> get_offer(ListingId id, const Address& offerer);
    std::vector<std::pair<Address, Offer>> list_offers(ListingId id);
    Amount escrow_balance(const Address& beneficiary, const Currency& currency = {});
    Amount fee_balance(const Currency& currency = {});
    bool escrow_empty();
    MarketSettings settings();

    static std::uint64_t system_clock_seconds();

private:
    using OfferBook = std::map<Address, Offer>;

    struct Snapshot {
        Listing listing;
        OfferBook offers;
    };

    Listing* find_listing(ListingId id);
    Snapshot snapshot(const Listing& listing);
    void restore(const Snapshot& snap);

    std::optional<MarketError> verify_buyer(const Listing& listing, const Address& who,
                                            std::uint64_t count, const Amount& amount,
                                            const std::string& context_data);
    std::optional<MarketError> collect_payment(const Address& from, const Amount& amount,
                                               const Currency& currency);
    bool move_asset(const Address& from, const Address& to, const TokenReference& token,
                    std::uint64_t quantity);
    bool deliver_sale(const Listing& listing, const Address& to, std::uint64_t units,
                      const Amount& amount, std::uint64_t index);
    // Royalty lookups that throw come back as CollaboratorFailed.
    Outcome<Settlement> plan_settlement(const Listing& listing, const Amount& gross, const Address& referrer);
    void emit(const MarketEvent& ev);

    static void start_if_pending(Listing& l, std::uint64_t now);
    static bool has_ended(const Listing& l, std::uint64_t now);
    static bool sold_out(const Listing& l) { return l.total_sold >= l.details.total_available; }
    static std::uint64_t remaining_sales(const Listing& l);

    MarketSettings settings_;
    IAssetTransfer& assets_;
    IPaymentTransfer& payments_;
    const CollaboratorRegistry& registry_;
    Clock clock_;

    OperationGate gate_;
    EscrowLedger escrow_;
    FeeLedger fees_;
    SettlementEngine settlement_;
    MarketAdmin admin_;
    IMarketEventSink* sink_{nullptr};

    ListingId next_id_{1};
    std::map<ListingId, Listing> listings_;
    std::map<ListingId, OfferBook> offers_;
};

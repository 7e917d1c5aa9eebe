#pragma once
#include <cstdint>
#include <string>
#include <variant>

#include "market/types.hpp"

struct ListingCreated
{
    ListingId listing_id{0};
    Address seller;
    ListingType type{ListingType::INVALID};
    std::string token_contract;
    std::string token_id;
    std::uint64_t total_available{0};
    Amount initial_amount{0};
    Currency currency;
    std::uint64_t ts{0};
};

struct BidPlaced
{
    ListingId listing_id{0};
    Address bidder;
    Amount amount{0};
    Address referrer;
    std::uint64_t end_time{0}; // after any extension
    std::uint64_t ts{0};
};

struct OfferMade
{
    ListingId listing_id{0};
    Address offerer;
    Amount amount{0}; // total live amount after this call
    Address referrer;
    std::uint64_t ts{0};
};

struct OfferAccepted
{
    ListingId listing_id{0};
    Address offerer;
    Amount amount{0};
    std::uint64_t ts{0};
};

struct OfferRescinded
{
    ListingId listing_id{0};
    Address offerer;
    Address rescinded_by;
    Amount amount{0};
    std::uint64_t ts{0};
};

struct PurchaseMade
{
    ListingId listing_id{0};
    Address buyer;
    std::uint64_t count{0};
    Amount amount{0};
    Address referrer;
    std::uint64_t ts{0};
};

struct ListingFinalized
{
    ListingId listing_id{0};
    Address winner; // "" when the asset went back to the seller
    Amount amount{0};
    std::uint64_t ts{0};
};

struct ListingCancelled
{
    ListingId listing_id{0};
    Address cancelled_by;
    std::uint32_t holdback_bps{0};
    std::uint64_t ts{0};
};

struct EscrowWithdrawn
{
    Address beneficiary;
    Currency currency;
    Amount amount{0};
    std::uint64_t ts{0};
};

struct FeesWithdrawn
{
    Address admin;
    Address receiver;
    Currency currency;
    Amount amount{0};
    std::uint64_t ts{0};
};

struct ConfigChanged
{
    Address admin;
    std::string field;
    std::uint64_t version{0};
    std::uint64_t ts{0};
};

using MarketEvent = std::variant<ListingCreated, BidPlaced, OfferMade, OfferAccepted,
                                 OfferRescinded, PurchaseMade, ListingFinalized,
                                 ListingCancelled, EscrowWithdrawn, FeesWithdrawn,
                                 ConfigChanged>;

const char* event_name(const MarketEvent& ev);

// 0 for events not tied to a listing.
ListingId event_listing_id(const MarketEvent& ev);

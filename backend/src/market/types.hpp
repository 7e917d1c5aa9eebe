#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

// Smallest currency unit, wide enough for 18-decimal token amounts.
using Amount = boost::multiprecision::uint256_t;
using Address = std::string;   // "" means no identity (no referrer, zero address)
using Currency = std::string;  // "" means the native currency
using ListingId = std::uint64_t;

constexpr std::uint32_t kBpsDenominator = 10000;
// 9999-12-31T23:59:59Z; bounds end times and durations so time sums cannot wrap.
constexpr std::uint64_t kMaxListingTime = 253402300799;

enum class ListingType : std::uint8_t {
    INVALID = 0,
    INDIVIDUAL_AUCTION = 1,
    FIXED_PRICE = 2,
    DYNAMIC_PRICE = 3,
    OFFERS_ONLY = 4,
};

enum class TokenSpec : std::uint8_t { NONE = 0, SINGLE = 1, MULTI = 2 };

enum class ListingState { OPEN, ACTIVE, ENDED, FINALIZED };

inline const char* to_cstr(ListingType t){
    switch(t){
        case ListingType::INDIVIDUAL_AUCTION: return "INDIVIDUAL_AUCTION";
        case ListingType::FIXED_PRICE: return "FIXED_PRICE";
        case ListingType::DYNAMIC_PRICE: return "DYNAMIC_PRICE";
        case ListingType::OFFERS_ONLY: return "OFFERS_ONLY";
        case ListingType::INVALID: return "INVALID";
    }
    return "?";
}
inline const char* to_cstr(TokenSpec s){
    switch(s){
        case TokenSpec::SINGLE: return "SINGLE";
        case TokenSpec::MULTI: return "MULTI";
        case TokenSpec::NONE: return "NONE";
    }
    return "?";
}
inline const char* to_cstr(ListingState st){
    switch(st){
        case ListingState::OPEN: return "OPEN";
        case ListingState::ACTIVE: return "ACTIVE";
        case ListingState::ENDED: return "ENDED";
        case ListingState::FINALIZED: return "FINALIZED";
    }
    return "?";
}

struct ListingDetails {
    Amount initial_amount{0};           // reserve (auction) or unit price (fixed price)
    ListingType type{ListingType::INVALID};
    std::uint64_t total_available{0};
    std::uint64_t total_per_sale{0};
    std::uint64_t extension_interval{0}; // seconds
    std::uint32_t min_increment_bps{0};
    Currency currency;
    std::string identity_verifier;       // registry name, "" = none
    std::uint64_t start_time{0};         // 0 => starts on first buyer action
    std::uint64_t end_time{0};           // absolute, or a duration while start_time == 0
};

struct TokenReference {
    std::string contract;
    std::string token_id;
    TokenSpec spec{TokenSpec::NONE};
    bool lazy{false};
};

struct RevenueReceiver {
    Address receiver;
    std::uint32_t bps{0};
};

struct DeliveryFees {
    std::uint32_t deliver_bps{0};
    Amount deliver_fixed{0};
};

struct Bid {
    Amount amount{0};
    Address bidder;
    bool delivered{false};
    bool settled{false};
    bool refunded{false};
    std::uint64_t timestamp{0};
    Address referrer;
};

struct Offer {
    Amount amount{0};
    std::uint64_t timestamp{0};
    bool accepted{false};
    Address referrer;
};

struct Listing {
    ListingId id{0};
    Address seller;
    bool finalized{false};
    std::uint64_t total_sold{0}; // units, not sales
    std::uint32_t marketplace_bps{0};
    std::uint32_t referrer_bps{0};
    ListingDetails details;
    TokenReference token;
    std::vector<RevenueReceiver> receivers;
    DeliveryFees fees;
    std::optional<Bid> bid;
    bool offers_accepted{false}; // auction opted in to offers
    bool offers_disabled{false}; // set once the first bid lands
};

// Creation input supplied by the seller.
struct ListingConfig {
    ListingDetails details;
    TokenReference token;
    std::vector<RevenueReceiver> receivers;
    DeliveryFees fees;
    bool accept_offers{false};
    bool enable_referrer{false};
};

inline bool has_started(const Listing& l) { return l.details.start_time != 0; }

inline ListingState listing_state(const Listing& l, std::uint64_t now) {
    if (l.finalized) return ListingState::FINALIZED;
    if (!has_started(l) || now < l.details.start_time) return ListingState::OPEN;
    if (now < l.details.end_time) return ListingState::ACTIVE;
    return ListingState::ENDED;
}

inline Amount bps_of(const Amount& value, std::uint32_t bps) {
    return value * bps / kBpsDenominator;
}

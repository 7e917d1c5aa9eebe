#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>

#include "collab/royalty.hpp"
#include "market/types.hpp"

constexpr std::uint32_t kMaxMarketplaceFeeBps = 1500;
constexpr std::uint32_t kMaxReferrerBps = 1500;
constexpr std::uint32_t kMaxHoldbackBps = 1000;

// When offers may be withdrawn. Configurable because the rules differ between
// marketplaces; the defaults favour getting escrowed funds back to offerers.
struct RescindPolicy {
    // Offers-only listings: offerer may rescind this long after end time (or once finalized).
    std::uint64_t offers_only_rescind_delay{24 * 60 * 60};
    // Auction offers can never be accepted once a bid lands; let offerers leave.
    bool auction_offer_rescind_after_bid{true};
    // Seller may force-rescind other offers only after the listing has ended.
    bool seller_force_rescind_after_end_only{true};
};

// Global, admin-controlled configuration consumed by the engine.
// Every mutation through MarketAdmin bumps `version`.
struct MarketSettings {
    std::uint64_t version{1};
    bool enabled{true};
    std::uint32_t marketplace_fee_bps{0};
    std::uint32_t referrer_bps{0};
    std::string seller_registry;              // registry name, "" = anyone may sell
    std::shared_ptr<IRoyaltyLookup> royalty;  // settable once
    std::unordered_set<Address> admins;
    Address custody_address{"auctionhouse"};  // account holding listed assets and funds
    RescindPolicy rescind;

    bool is_admin(const Address& who) const { return admins.count(who) > 0; }
};

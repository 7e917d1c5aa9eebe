#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "market/errors.hpp"
#include "market/types.hpp"

// Builds a Listing from seller-supplied configuration, applying the per-type rules:
//  - INDIVIDUAL_AUCTION: one unit per listing, not lazy, may opt in to offers
//  - FIXED_PRICE: no extension/increment/delivery fee, not lazy
//  - DYNAMIC_PRICE: zero initial amount, lazy, one unit per sale
//  - OFFERS_ONLY: zero initial amount, starts strictly in the future
// Fee BPS are captured here so later global fee changes do not affect the listing.
// The returned listing has id 0; the engine assigns ids.
Outcome<Listing> validate_listing(const ListingConfig& config,
                                  const Address& seller,
                                  std::uint64_t now,
                                  std::uint32_t marketplace_bps,
                                  std::uint32_t referrer_bps);

// Start/end rules shared by creation and modification.
std::optional<MarketError> validate_times(ListingType type,
                                          std::uint64_t start_time,
                                          std::uint64_t end_time,
                                          std::uint64_t now);

// Empty, or every receiver named with a positive share summing to 10000.
std::optional<MarketError> validate_receivers(const std::vector<RevenueReceiver>& receivers);

#pragma once

#include <cstdint>
#include <string>

#include "market/types.hpp"

// Prices Dynamic Price sales. `already_delivered` is the listing's units sold so far.
class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;
    virtual Amount quote(const std::string& asset_id, std::uint64_t already_delivered,
                         std::uint64_t count) = 0;
};

// Creates the asset at the moment of sale for lazy listings.
class ILazyDeliverer {
public:
    virtual ~ILazyDeliverer() = default;
    virtual bool deliver(ListingId listing_id, const Address& to, const std::string& asset_id,
                         std::uint64_t count, const Amount& amount, const Currency& currency,
                         std::uint64_t index) = 0;
};

#pragma once

#include <optional>
#include <vector>

#include "market/types.hpp"

struct RoyaltyQuote {
    std::vector<Address> recipients;
    std::vector<Amount> amounts;
};

class IRoyaltyLookup {
public:
    virtual ~IRoyaltyLookup() = default;

    virtual RoyaltyQuote get_royalty(const TokenReference& asset, const Amount& sale_value) = 0;

    // Original creator of the asset, when known. Sales by the creator carry no royalty.
    virtual std::optional<Address> creator_of(const TokenReference& asset) {
        (void)asset;
        return std::nullopt;
    }
};

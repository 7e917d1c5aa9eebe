#pragma once

#include <cstdint>
#include <string>

#include "market/types.hpp"

// Seller eligibility, consulted once at listing creation.
class ISellerAuthorization {
public:
    virtual ~ISellerAuthorization() = default;
    virtual bool is_authorized(const Address& seller, const std::string& context_data) = 0;
};

// Buyer identity check, consulted on every purchase, bid and offer of a listing that names one.
class IBuyerVerifier {
public:
    virtual ~IBuyerVerifier() = default;
    virtual bool verify(ListingId listing_id, const Address& identity,
                        const TokenReference& asset, std::uint64_t count,
                        const Amount& amount, const Currency& currency,
                        const std::string& context_data) = 0;
};

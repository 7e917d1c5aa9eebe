#pragma once

#include <cstdint>

#include "market/types.hpp"

// Moves assets between custodians. Both calls report failure by returning false.
class IAssetTransfer {
public:
    virtual ~IAssetTransfer() = default;

    virtual bool transfer(const Address& from, const Address& to,
                          const TokenReference& asset, std::uint64_t quantity) = 0;

    // Pulls `quantity` units from `owner` into marketplace custody at listing creation.
    virtual bool custody(const Address& owner, const TokenReference& asset,
                         std::uint64_t quantity) = 0;
};

// Moves value between accounts.
class IPaymentTransfer {
public:
    virtual ~IPaymentTransfer() = default;

    // Outbound payout from the marketplace to `to`.
    virtual bool pay(const Address& to, const Amount& amount, const Currency& currency) = 0;

    // Inbound pull payment from `from` into the marketplace.
    virtual bool collect(const Address& from, const Amount& amount, const Currency& currency) = 0;
};

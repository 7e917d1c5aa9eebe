#include "listing_validator.hpp"

#include <sstream>
#include <string>

namespace
{
    using Code = MarketErrorCode;

    MarketError fail(Code code, const std::string& msg)
    {
        return market_error(code, msg);
    }

    std::optional<MarketError> check_type_rules(const ListingConfig& c)
    {
        const auto& d = c.details;
        const bool has_delivery_fee = c.fees.deliver_bps > 0 || c.fees.deliver_fixed > 0;

        switch (d.type)
        {
        case ListingType::INDIVIDUAL_AUCTION:
            if (d.total_available != 1 || d.total_per_sale != 1)
                return fail(Code::InvalidTotalAvailable, "auction must list exactly one unit");
            if (c.token.lazy)
                return fail(Code::LazyNotAllowed, "auction token cannot be lazy");
            break;

        case ListingType::FIXED_PRICE:
            if (d.extension_interval != 0)
                return fail(Code::ExtensionNotAllowed, "fixed price listing cannot have an extension interval");
            if (d.min_increment_bps != 0)
                return fail(Code::MinIncrementNotAllowed, "fixed price listing cannot have a min increment");
            if (has_delivery_fee)
                return fail(Code::DeliveryFeeNotAllowed, "fixed price listing cannot have a delivery fee");
            if (c.token.lazy)
                return fail(Code::LazyNotAllowed, "fixed price token cannot be lazy");
            break;

        case ListingType::DYNAMIC_PRICE:
            if (d.initial_amount != 0)
                return fail(Code::NonZeroInitialAmount, "dynamic price listing must have zero initial amount");
            if (!c.token.lazy)
                return fail(Code::LazyRequired, "dynamic price token must be lazy");
            if (d.total_per_sale != 1)
                return fail(Code::InvalidTotalPerSale, "dynamic price listing sells one unit per sale");
            if (d.extension_interval != 0)
                return fail(Code::ExtensionNotAllowed, "dynamic price listing cannot have an extension interval");
            if (d.min_increment_bps != 0)
                return fail(Code::MinIncrementNotAllowed, "dynamic price listing cannot have a min increment");
            if (has_delivery_fee)
                return fail(Code::DeliveryFeeNotAllowed, "dynamic price listing cannot have a delivery fee");
            break;

        case ListingType::OFFERS_ONLY:
            if (d.initial_amount != 0)
                return fail(Code::NonZeroInitialAmount, "offers only listing must have zero initial amount");
            if (d.extension_interval != 0)
                return fail(Code::ExtensionNotAllowed, "offers only listing cannot have an extension interval");
            if (d.min_increment_bps != 0)
                return fail(Code::MinIncrementNotAllowed, "offers only listing cannot have a min increment");
            if (has_delivery_fee)
                return fail(Code::DeliveryFeeNotAllowed, "offers only listing cannot have a delivery fee");
            break;

        case ListingType::INVALID:
        default:
            return fail(Code::InvalidListingType, "unknown listing type");
        }

        if (c.accept_offers && d.type != ListingType::INDIVIDUAL_AUCTION)
            return fail(Code::OffersNotAllowed, "only auctions may opt in to offers");
        return std::nullopt;
    }
}

std::optional<MarketError> validate_times(ListingType type,
                                          std::uint64_t start_time,
                                          std::uint64_t end_time,
                                          std::uint64_t now)
{
    if (end_time == 0)
        return fail(Code::InvalidTimes, "end time (or duration) must be non-zero");
    if (end_time > kMaxListingTime)
        return fail(Code::InvalidTimes, "end time (or duration) is out of range");
    if (start_time != 0 && end_time <= start_time)
        return fail(Code::InvalidTimes, "end time must be after start time");
    if (type == ListingType::OFFERS_ONLY && start_time <= now)
        return fail(Code::StartNotInFuture, "offers only listing must start strictly in the future");
    return std::nullopt;
}

std::optional<MarketError> validate_receivers(const std::vector<RevenueReceiver>& receivers)
{
    if (receivers.empty())
        return std::nullopt;

    std::uint64_t total = 0;
    for (const auto& r : receivers)
    {
        if (r.receiver.empty())
            return fail(Code::InvalidReceivers, "revenue receiver must be named");
        if (r.bps == 0 || r.bps > kBpsDenominator)
            return fail(Code::InvalidReceivers, "revenue receiver share must be in (0, 10000]");
        total += r.bps;
    }
    if (total != kBpsDenominator)
    {
        std::ostringstream os;
        os << "revenue receiver shares sum to " << total << " BPS, expected 10000";
        return fail(Code::InvalidReceivers, os.str());
    }
    return std::nullopt;
}

Outcome<Listing> validate_listing(const ListingConfig& config,
                                  const Address& seller,
                                  std::uint64_t now,
                                  std::uint32_t marketplace_bps,
                                  std::uint32_t referrer_bps)
{
    const auto& d = config.details;

    if (seller.empty())
        return fail(Code::MissingSeller, "seller must be named");
    if (config.token.contract.empty())
        return fail(Code::MissingTokenContract, "token contract must be named");
    if (config.token.spec == TokenSpec::NONE)
        return fail(Code::InvalidTokenSpec, "token spec must be SINGLE or MULTI");
    if (d.total_available == 0)
        return fail(Code::InvalidTotalAvailable, "total available must be positive");
    if (d.total_per_sale == 0 || d.total_per_sale > d.total_available)
        return fail(Code::InvalidTotalPerSale, "total per sale must be in [1, total available]");
    if (config.token.spec == TokenSpec::SINGLE &&
        (d.total_available != 1 || d.total_per_sale != 1))
        return fail(Code::InvalidTokenSpec, "single-unique token lists exactly one unit");
    if (d.min_increment_bps > kBpsDenominator)
        return fail(Code::InvalidBps, "min increment BPS exceeds 10000");
    if (config.fees.deliver_bps > kBpsDenominator)
        return fail(Code::InvalidBps, "delivery fee BPS exceeds 10000");
    if (marketplace_bps > kBpsDenominator || referrer_bps > kBpsDenominator ||
        marketplace_bps + referrer_bps > kBpsDenominator)
        return fail(Code::InvalidBps, "marketplace and referrer BPS exceed 10000");

    if (d.extension_interval > kMaxListingTime)
        return fail(Code::InvalidTimes, "extension interval is out of range");

    if (auto err = check_type_rules(config))
        return *err;
    if (auto err = validate_times(d.type, d.start_time, d.end_time, now))
        return *err;
    if (auto err = validate_receivers(config.receivers))
        return *err;

    Listing l;
    l.seller = seller;
    l.marketplace_bps = marketplace_bps;
    l.referrer_bps = config.enable_referrer ? referrer_bps : 0;
    l.details = d;
    l.token = config.token;
    l.receivers = config.receivers;
    l.fees = config.fees;
    l.offers_accepted = config.accept_offers;
    return l;
}

#include "market_admin.hpp"

#include <exception>
#include <sstream>

#include "util/market_log.hpp"

namespace
{
    MarketError reentrant()
    {
        return market_error(MarketErrorCode::Reentrant, "admin call re-entered during an operation");
    }
}

std::optional<MarketError> MarketAdmin::require_admin(const Address& caller) const
{
    if (!settings_.is_admin(caller))
        return market_error(MarketErrorCode::NotAdmin, "caller '" + caller + "' is not an administrator");
    return std::nullopt;
}

std::uint64_t MarketAdmin::bump(const Address& caller, const char* field)
{
    const std::uint64_t v = ++settings_.version;
    emit(ConfigChanged{caller, field, v, clock_()});
    return v;
}

void MarketAdmin::emit(const MarketEvent& ev)
{
    if (!sink_) return;
    try {
        sink_->publish(ev);
    } catch (const std::exception& e) {
        market_log("journal", std::string("failed to publish ") + event_name(ev) + ": " + e.what());
    }
}

Outcome<std::uint64_t> MarketAdmin::set_fees(const Address& caller, std::uint32_t marketplace_fee_bps,
                                             std::uint32_t referrer_bps)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    if (auto err = require_admin(caller)) return *err;

    if (marketplace_fee_bps > kMaxMarketplaceFeeBps)
        return market_error(MarketErrorCode::InvalidBps, "marketplace fee exceeds 1500 BPS");
    if (referrer_bps > kMaxReferrerBps)
        return market_error(MarketErrorCode::InvalidBps, "referrer fee exceeds 1500 BPS");

    settings_.marketplace_fee_bps = marketplace_fee_bps;
    settings_.referrer_bps = referrer_bps;
    return bump(caller, "fees");
}

Outcome<std::uint64_t> MarketAdmin::set_enabled(const Address& caller, bool enabled)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    if (auto err = require_admin(caller)) return *err;

    settings_.enabled = enabled;
    market_log("admin", enabled ? "marketplace enabled" : "marketplace disabled");
    return bump(caller, "enabled");
}

Outcome<std::uint64_t> MarketAdmin::set_seller_registry(const Address& caller, std::string registry_name)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    if (auto err = require_admin(caller)) return *err;

    settings_.seller_registry = std::move(registry_name);
    return bump(caller, "seller_registry");
}

Outcome<std::uint64_t> MarketAdmin::set_royalty_lookup(const Address& caller, std::shared_ptr<IRoyaltyLookup> royalty)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    if (auto err = require_admin(caller)) return *err;

    if (settings_.royalty)
        return market_error(MarketErrorCode::RoyaltyAlreadySet, "royalty lookup can only be set once");
    if (!royalty)
        return market_error(MarketErrorCode::InvalidArguments, "royalty lookup must not be null");

    settings_.royalty = std::move(royalty);
    return bump(caller, "royalty");
}

Outcome<std::uint64_t> MarketAdmin::set_rescind_policy(const Address& caller, RescindPolicy policy)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    if (auto err = require_admin(caller)) return *err;

    settings_.rescind = policy;
    return bump(caller, "rescind_policy");
}

Outcome<std::uint64_t> MarketAdmin::add_admin(const Address& caller, const Address& admin)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    if (auto err = require_admin(caller)) return *err;
    if (admin.empty())
        return market_error(MarketErrorCode::InvalidArguments, "admin identity must be named");

    settings_.admins.insert(admin);
    return bump(caller, "admins");
}

Outcome<Amount> MarketAdmin::withdraw_fees(const Address& caller, const Currency& currency,
                                           const Amount& amount, const Address& receiver)
{
    OperationGate::Scope scope(gate_);
    if (!scope.entered()) return reentrant();
    if (auto err = require_admin(caller)) return *err;
    if (receiver.empty() || amount == 0)
        return market_error(MarketErrorCode::InvalidArguments, "withdrawal needs a receiver and a positive amount");

    // Debit first; restore if the payout fails.
    if (!fees_.debit(currency, amount))
        return market_error(MarketErrorCode::InsufficientBalance, "withdrawal exceeds accrued marketplace fees");

    bool paid = false;
    std::string reason = "provider reported failure";
    try {
        paid = payments_.pay(receiver, amount, currency);
    } catch (const std::exception& e) {
        reason = e.what();
    }
    if (!paid) {
        fees_.credit(currency, amount);
        return market_error(MarketErrorCode::PaymentFailed, "fee withdrawal payout failed: " + reason);
    }

    std::ostringstream os;
    os << "withdrew " << amount.str() << " in fees to '" << receiver << "'";
    market_log("admin", os.str());
    emit(FeesWithdrawn{caller, receiver, currency, amount, clock_()});
    return amount;
}

std::uint64_t MarketAdmin::version() const
{
    return settings_.version;
}

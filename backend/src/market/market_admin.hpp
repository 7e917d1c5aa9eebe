#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "collab/transfer.hpp"
#include "events/event_sink.hpp"
#include "market/errors.hpp"
#include "market/escrow_ledger.hpp"
#include "market/market_config.hpp"
#include "market/operation_gate.hpp"

// Access-checked mutation of MarketSettings and the fee ledger.
// Shares the engine's gate so configuration never changes mid-operation.
class MarketAdmin {
public:
    MarketAdmin(MarketSettings& settings, FeeLedger& fees, IPaymentTransfer& payments,
                OperationGate& gate, std::function<std::uint64_t()> clock)
        : settings_(settings), fees_(fees), payments_(payments), gate_(gate), clock_(std::move(clock)) {}

    void set_event_sink(IMarketEventSink* sink) { sink_ = sink; }

    Outcome<std::uint64_t> set_fees(const Address& caller, std::uint32_t marketplace_fee_bps,
                                    std::uint32_t referrer_bps);
    Outcome<std::uint64_t> set_enabled(const Address& caller, bool enabled);
    Outcome<std::uint64_t> set_seller_registry(const Address& caller, std::string registry_name);
    Outcome<std::uint64_t> set_royalty_lookup(const Address& caller, std::shared_ptr<IRoyaltyLookup> royalty);
    Outcome<std::uint64_t> set_rescind_policy(const Address& caller, RescindPolicy policy);
    Outcome<std::uint64_t> add_admin(const Address& caller, const Address& admin);

    // Pays accumulated marketplace fees out to `receiver`.
    Outcome<Amount> withdraw_fees(const Address& caller, const Currency& currency,
                                  const Amount& amount, const Address& receiver);

    std::uint64_t version() const;

private:
    std::optional<MarketError> require_admin(const Address& caller) const;
    std::uint64_t bump(const Address& caller, const char* field);
    void emit(const MarketEvent& ev);

    MarketSettings& settings_;
    FeeLedger& fees_;
    IPaymentTransfer& payments_;
    OperationGate& gate_;
    std::function<std::uint64_t()> clock_;
    IMarketEventSink* sink_{nullptr};
};

#include "event_json.hpp"
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include "util/json_encode.hpp"

namespace
{
    void write_body(JsonObjectWriter& w, const ListingCreated& e)
    {
        w.field("listing_id", e.listing_id)
            .field("seller", e.seller)
            .field("type", to_cstr(e.type))
            .field("token_contract", e.token_contract)
            .field("token_id", e.token_id)
            .field("total_available", e.total_available)
            .field("initial_amount", e.initial_amount)
            .field("currency", e.currency);
    }
    void write_body(JsonObjectWriter& w, const BidPlaced& e)
    {
        w.field("listing_id", e.listing_id)
            .field("bidder", e.bidder)
            .field("amount", e.amount)
            .field("referrer", e.referrer)
            .field("end_time", e.end_time);
    }
    void write_body(JsonObjectWriter& w, const OfferMade& e)
    {
        w.field("listing_id", e.listing_id)
            .field("offerer", e.offerer)
            .field("amount", e.amount)
            .field("referrer", e.referrer);
    }
    void write_body(JsonObjectWriter& w, const OfferAccepted& e)
    {
        w.field("listing_id", e.listing_id)
            .field("offerer", e.offerer)
            .field("amount", e.amount);
    }
    void write_body(JsonObjectWriter& w, const OfferRescinded& e)
    {
        w.field("listing_id", e.listing_id)
            .field("offerer", e.offerer)
            .field("rescinded_by", e.rescinded_by)
            .field("amount", e.amount);
    }
    void write_body(JsonObjectWriter& w, const PurchaseMade& e)
    {
        w.field("listing_id", e.listing_id)
            .field("buyer", e.buyer)
            .field("count", e.count)
            .field("amount", e.amount)
            .field("referrer", e.referrer);
    }
    void write_body(JsonObjectWriter& w, const ListingFinalized& e)
    {
        w.field("listing_id", e.listing_id)
            .field("winner", e.winner)
            .field("amount", e.amount);
    }
    void write_body(JsonObjectWriter& w, const ListingCancelled& e)
    {
        w.field("listing_id", e.listing_id)
            .field("cancelled_by", e.cancelled_by)
            .field("holdback_bps", std::uint64_t{e.holdback_bps});
    }
    void write_body(JsonObjectWriter& w, const EscrowWithdrawn& e)
    {
        w.field("beneficiary", e.beneficiary)
            .field("currency", e.currency)
            .field("amount", e.amount);
    }
    void write_body(JsonObjectWriter& w, const FeesWithdrawn& e)
    {
        w.field("admin", e.admin)
            .field("receiver", e.receiver)
            .field("currency", e.currency)
            .field("amount", e.amount);
    }
    void write_body(JsonObjectWriter& w, const ConfigChanged& e)
    {
        w.field("admin", e.admin)
            .field("field", e.field)
            .field("version", e.version);
    }
}

std::string event_to_json(const MarketEvent& ev)
{
    std::ostringstream os;
    JsonObjectWriter w(os);
    w.field("event", event_name(ev));
    std::visit([&w](auto&& e) {
        write_body(w, e);
        w.field("ts", e.ts);
    }, ev);
    w.close();
    return os.str();
}

void JsonLinesEventLog::publish(const MarketEvent& ev)
{
    const std::string line = event_to_json(ev);
    std::lock_guard<std::mutex> lk(mtx_);
    out_ << line << '\n';
    out_.flush();
    if (!out_)
        throw std::runtime_error("JsonLinesEventLog: write failed");
}

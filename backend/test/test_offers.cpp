#include "market_fakes.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>

static const TokenReference kPiece = unique_token("42");

static void test_accept_one_of_three()
{
    Market m;
    const std::uint64_t start = m.clock.now + 10;
    const std::uint64_t end = m.clock.now + 3600;
    const ListingId id = ok(m.list("seller", offers_only_config(start, end)));

    (void)ok(m.engine.offer("o5", id, tenths(5)));
    (void)ok(m.engine.offer("o7", id, tenths(7)));
    (void)ok(m.engine.offer("o6", id, tenths(6)));
    assert(m.engine.list_offers(id).size() == 3);
    assert(m.payments.held() == tenths(18));

    m.clock.now = start + 100;
    auto acc = ok(m.engine.accept("seller", id, {"o7"}, {tenths(7)}, tenths(7)));
    assert(acc.accepted.size() == 1 && acc.accepted[0] == "o7");
    assert(acc.finalized);
    assert(m.assets.units("o7", kPiece) == 1);
    assert(m.payments.received("seller") == tenths(7));

    // the other two stay live
    auto o5 = m.engine.get_offer(id, "o5");
    auto o6 = m.engine.get_offer(id, "o6");
    assert(o5 && !o5->accepted && o5->amount == tenths(5));
    assert(o6 && !o6->accepted && o6->amount == tenths(6));
    assert(m.engine.get_offer(id, "o7")->accepted);

    // after the listing ends each offerer takes their own offer back
    m.clock.now = end + 1;
    auto r5 = ok(m.engine.rescind("o5", id, {"o5"}));
    assert(r5.refunds.size() == 1 && r5.refunds[0].second == tenths(5));
    auto r6 = ok(m.engine.rescind("o6", id, {"o6"}));
    assert(r6.refunds[0].second == tenths(6));
    assert(!m.engine.get_offer(id, "o5"));
    assert(m.payments.received("o5") == tenths(5));
    assert(m.payments.received("o6") == tenths(6));
    assert(m.payments.held() == 0);

    assert(code_of(m.engine.rescind("o7", id, {"o7"})) == MarketErrorCode::OfferAccepted);
    assert(m.events.of_type<OfferRescinded>().size() == 2);
}

static void test_accept_guards()
{
    Market m;
    const ListingId id = ok(m.list("seller", offers_only_config(m.clock.now + 10, m.clock.now + 3600)));
    (void)ok(m.engine.offer("a", id, tenths(5)));
    (void)ok(m.engine.offer("b", id, tenths(6)));

    assert(code_of(m.engine.accept("a", id, {"b"}, {tenths(6)}, kEth)) == MarketErrorCode::NotSeller);
    assert(code_of(m.engine.accept("seller", id, {"b"}, {tenths(5)}, kEth)) == MarketErrorCode::OfferChanged);
    assert(code_of(m.engine.accept("seller", id, {"b"}, {tenths(6)}, tenths(5))) == MarketErrorCode::ExceedsMaxAmount);
    assert(code_of(m.engine.accept("seller", id, {"zed"}, {tenths(6)}, kEth)) == MarketErrorCode::OfferNotFound);
    // one unit listed, two offers named
    assert(code_of(m.engine.accept("seller", id, {"a", "b"}, {tenths(5), tenths(6)}, kEth)) ==
           MarketErrorCode::SoldOut);
    assert(code_of(m.engine.accept("seller", id, {"b"}, {}, kEth)) == MarketErrorCode::InvalidArguments);
    assert(m.events.of_type<OfferAccepted>().empty());
}

static void test_offer_increase_in_place()
{
    Market m;
    const ListingId id = ok(m.list("seller", offers_only_config(m.clock.now + 10, m.clock.now + 3600)));

    (void)ok(m.engine.offer("a", id, tenths(3)));
    m.clock.now += 5;
    auto raised = ok(m.engine.offer("a", id, tenths(2)));
    assert(raised.amount == tenths(5));
    assert(raised.timestamp == m.clock.now);
    assert(m.engine.list_offers(id).size() == 1);
    assert(m.payments.spent("a") == tenths(5));

    assert(code_of(m.engine.offer("seller", id, kEth)) == MarketErrorCode::NotPermitted);
    assert(code_of(m.engine.offer("b", id, 0)) == MarketErrorCode::InvalidPaymentAmount);

    m.clock.now += 3600;
    assert(code_of(m.engine.offer("b", id, kEth)) == MarketErrorCode::ListingEnded);
}

static void test_rescind_timing()
{
    Market m;
    const std::uint64_t end = m.clock.now + 3600;
    const ListingId id = ok(m.list("seller", offers_only_config(m.clock.now + 10, end)));
    (void)ok(m.engine.offer("a", id, tenths(3)));
    (void)ok(m.engine.offer("b", id, tenths(4)));

    assert(code_of(m.engine.rescind("a", id, {"a"})) == MarketErrorCode::RescindTooEarly);
    assert(code_of(m.engine.rescind("seller", id, {"a"})) == MarketErrorCode::RescindTooEarly);
    assert(code_of(m.engine.rescind("mallory", id, {"a"})) == MarketErrorCode::NotPermitted);

    // ended but still inside the 24h grace: only the seller may clear offers
    m.clock.now = end + 10;
    assert(code_of(m.engine.rescind("a", id, {"a"})) == MarketErrorCode::RescindTooEarly);
    auto forced = ok(m.engine.rescind("seller", id, {"b"}));
    assert(forced.refunds.size() == 1);
    assert(m.events.of_type<OfferRescinded>().back().rescinded_by == "seller");

    m.clock.now = end + 24 * 60 * 60;
    (void)ok(m.engine.rescind("a", id, {"a"}));
    assert(m.engine.list_offers(id).empty());
}

static void test_auction_offers()
{
    Market m;
    auto c = auction_config(m.clock.now, m.clock.now + 600, tenths(5));
    const ListingId plain = ok(m.list("seller", c));
    assert(code_of(m.engine.offer("a", plain, tenths(1))) == MarketErrorCode::OffersNotAllowed);

    c.accept_offers = true;
    c.token = unique_token("2");
    const ListingId id = ok(m.list("seller", c));

    (void)ok(m.engine.offer("a", id, tenths(3)));
    // no bid yet: offerer may leave any time
    (void)ok(m.engine.rescind("a", id, {"a"}));
    (void)ok(m.engine.offer("b", id, tenths(4)));

    auto acc = ok(m.engine.accept("seller", id, {"b"}, {tenths(4)}, tenths(4)));
    assert(acc.finalized);
    assert(m.assets.units("b", unique_token("2")) == 1);
    assert(code_of(m.engine.bid("c", id, kEth)) == MarketErrorCode::ListingFinalized);
}

static void test_delivery_failure_keeps_offer_live()
{
    Market m;
    const ListingId id = ok(m.list("seller", offers_only_config(m.clock.now + 10, m.clock.now + 3600)));
    (void)ok(m.engine.offer("a", id, tenths(5)));

    m.assets.fail_transfer = true;
    assert(code_of(m.engine.accept("seller", id, {"a"}, {tenths(5)}, kEth)) == MarketErrorCode::AssetTransferFailed);
    auto o = m.engine.get_offer(id, "a");
    assert(o && !o->accepted);
    assert(!m.engine.get_listing(id)->finalized);
    assert(m.payments.received("seller") == 0);

    m.assets.fail_transfer = false;
    (void)ok(m.engine.accept("seller", id, {"a"}, {tenths(5)}, kEth));
}

static void test_multi_unit_offers_only()
{
    Market m;
    auto c = offers_only_config(m.clock.now + 10, m.clock.now + 3600);
    c.token = TokenReference{"0xedition", "9", TokenSpec::MULTI, false};
    c.details.total_available = 3;
    const ListingId id = ok(m.list("seller", c));

    (void)ok(m.engine.offer("a", id, tenths(1)));
    (void)ok(m.engine.offer("b", id, tenths(2)));
    (void)ok(m.engine.offer("c", id, tenths(3)));

    auto acc = ok(m.engine.accept("seller", id, {"a", "c"}, {tenths(1), tenths(3)}, tenths(4)));
    assert(acc.accepted.size() == 2);
    assert(acc.settlements.size() == 2);
    assert(!acc.finalized);
    assert(m.engine.get_listing(id)->total_sold == 2);
    assert(m.payments.received("seller") == tenths(4));
}

static void test_batch_stops_at_failed_delivery()
{
    Market m;
    auto c = offers_only_config(m.clock.now + 10, m.clock.now + 3600);
    c.token = TokenReference{"0xedition", "9", TokenSpec::MULTI, false};
    c.details.total_available = 2;
    const ListingId id = ok(m.list("seller", c));
    (void)ok(m.engine.offer("a", id, tenths(5)));
    (void)ok(m.engine.offer("b", id, tenths(6)));

    m.assets.refuse_delivery_to.insert("b");
    auto acc = ok(m.engine.accept("seller", id, {"a", "b"}, {tenths(5), tenths(6)}, kEth));
    assert(acc.accepted.size() == 1 && acc.accepted[0] == "a");
    assert(acc.settlements.size() == 1);
    assert(acc.stopped_at == "b");
    assert(!acc.stop_reason.empty());
    assert(!acc.finalized);
    std::cout << "batch stopped: " << acc.stop_reason << "\n";

    assert(m.engine.get_listing(id)->total_sold == 1);
    assert(m.payments.received("seller") == tenths(5));
    auto b = m.engine.get_offer(id, "b");
    assert(b && !b->accepted && b->amount == tenths(6));
    assert(m.events.of_type<OfferAccepted>().size() == 1);

    m.assets.refuse_delivery_to.clear();
    auto rest = ok(m.engine.accept("seller", id, {"b"}, {tenths(6)}, kEth));
    assert(rest.stopped_at.empty());
    assert(rest.finalized);
}

static void test_huge_rescind_delay_does_not_wrap()
{
    Market m;
    RescindPolicy policy;
    policy.offers_only_rescind_delay = UINT64_MAX;
    (void)ok(m.engine.admin().set_rescind_policy("admin", policy));

    const std::uint64_t end = m.clock.now + 3600;
    const ListingId id = ok(m.list("seller", offers_only_config(m.clock.now + 10, end)));
    (void)ok(m.engine.offer("a", id, tenths(3)));

    m.clock.now = end + 365 * 24 * 60 * 60;
    assert(code_of(m.engine.rescind("a", id, {"a"})) == MarketErrorCode::RescindTooEarly);
    (void)ok(m.engine.rescind("seller", id, {"a"}));
}

int main()
{
    set_market_log_stream(nullptr);

    test_accept_one_of_three();
    test_accept_guards();
    test_offer_increase_in_place();
    test_rescind_timing();
    test_auction_offers();
    test_delivery_failure_keeps_offer_live();
    test_multi_unit_offers_only();
    test_batch_stops_at_failed_delivery();
    test_huge_rescind_delay_does_not_wrap();

    std::cout << "\nOK\n";
    return 0;
}

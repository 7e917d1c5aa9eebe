#include "market_fakes.hpp"

#include <cassert>
#include <iostream>
#include <memory>

struct CurveMarket {
    Market m;
    std::shared_ptr<FakeOracle> oracle = std::make_shared<FakeOracle>();
    std::shared_ptr<FakeLazyDeliverer> minter = std::make_shared<FakeLazyDeliverer>();

    CurveMarket() {
        m.registry.register_price_oracle("0xcurve", oracle);
        m.registry.register_lazy_deliverer("0xcurve", minter);
    }
};

static void test_quoted_price_and_excess_refund()
{
    CurveMarket cm;
    Market& m = cm.m;
    const ListingId id = ok(m.list("seller", dynamic_price_config(m.clock.now, m.clock.now + 600, 10)));

    // unit 0 costs 0.1, unit 1 costs 0.11
    auto first = ok(m.engine.purchase("alice", id, 1, tenths(2)));
    assert(first.price == tenths(1));
    assert(first.refunded == tenths(1));
    assert(m.payments.received("alice") == tenths(1));

    assert(code_of(m.engine.purchase("bob", id, 1, tenths(1))) == MarketErrorCode::InvalidPaymentAmount);

    auto second = ok(m.engine.purchase("bob", id, 1, kEth * 11 / 100));
    assert(second.refunded == 0);

    assert(cm.minter->deliveries.size() == 2);
    assert(cm.minter->deliveries[0].index == 0 && cm.minter->deliveries[0].to == "alice");
    assert(cm.minter->deliveries[1].index == 1 && cm.minter->deliveries[1].to == "bob");
    assert(m.payments.received("seller") == tenths(1) + kEth * 11 / 100);
}

static void test_batch_quote()
{
    CurveMarket cm;
    Market& m = cm.m;
    const ListingId id = ok(m.list("seller", dynamic_price_config(m.clock.now, m.clock.now + 600, 3)));

    // 0.1 + 0.11 + 0.12
    auto r = ok(m.engine.purchase("alice", id, 3, kEth));
    assert(r.price == kEth * 33 / 100);
    assert(r.finalized);
    assert(cm.minter->deliveries.size() == 1 && cm.minter->deliveries[0].count == 3);
}

static void test_no_royalty_on_lazy_sale()
{
    CurveMarket cm;
    Market& m = cm.m;
    auto royalty = std::make_shared<FakeRoyalty>();
    royalty->quote.recipients = {"artist"};
    royalty->quote.amounts = {tenths(1) / 10};
    (void)ok(m.engine.admin().set_royalty_lookup("admin", royalty));

    const ListingId id = ok(m.list("seller", dynamic_price_config(m.clock.now, m.clock.now + 600, 10)));
    (void)ok(m.engine.purchase("alice", id, 1, tenths(1)));
    assert(royalty->lookups == 0);
    assert(m.payments.received("artist") == 0);
    assert(m.payments.received("seller") == tenths(1));
}

static void test_collaborator_failures()
{
    CurveMarket cm;
    Market& m = cm.m;
    const ListingId id = ok(m.list("seller", dynamic_price_config(m.clock.now, m.clock.now + 600, 10)));

    cm.oracle->fail = true;
    assert(code_of(m.engine.purchase("alice", id, 1, kEth)) == MarketErrorCode::CollaboratorFailed);
    assert(m.payments.spent("alice") == 0);
    cm.oracle->fail = false;

    cm.minter->fail = true;
    assert(code_of(m.engine.purchase("alice", id, 1, kEth)) == MarketErrorCode::AssetTransferFailed);
    assert(m.payments.received("alice") == kEth);
    assert(m.engine.get_listing(id)->total_sold == 0);
    cm.minter->fail = false;

    // no oracle registered for another contract
    auto other = dynamic_price_config(m.clock.now, m.clock.now + 600, 10);
    other.token.contract = "0xunknown";
    const ListingId id2 = ok(m.list("seller", other));
    assert(code_of(m.engine.purchase("alice", id2, 1, kEth)) == MarketErrorCode::CollaboratorMissing);
}

static void test_buyer_verifier()
{
    struct AllowList : IBuyerVerifier {
        bool verify(ListingId, const Address& who, const TokenReference&, std::uint64_t,
                    const Amount&, const Currency&, const std::string&) override {
            return who == "kyc_done";
        }
    };
    CurveMarket cm;
    Market& m = cm.m;
    m.registry.register_buyer_verifier("kyc", std::make_shared<AllowList>());

    auto c = dynamic_price_config(m.clock.now, m.clock.now + 600, 10);
    c.details.identity_verifier = "kyc";
    const ListingId id = ok(m.list("seller", c));

    auto denied = m.engine.purchase("anon", id, 1, kEth);
    assert(code_of(denied) == MarketErrorCode::BuyerNotVerified);
    assert(m.payments.spent("anon") == 0);
    (void)ok(m.engine.purchase("kyc_done", id, 1, kEth));
}

int main()
{
    set_market_log_stream(nullptr);

    test_quoted_price_and_excess_refund();
    test_batch_quote();
    test_no_royalty_on_lazy_sale();
    test_collaborator_failures();
    test_buyer_verifier();

    std::cout << "\nOK\n";
    return 0;
}

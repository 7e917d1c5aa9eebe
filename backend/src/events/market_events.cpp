#include "market_events.hpp"
#include <type_traits>
#include <variant>

namespace
{
    template <class... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

const char *event_name(const MarketEvent &ev)
{
    return std::visit(overloaded{
                          [](const ListingCreated &) { return "ListingCreated"; },
                          [](const BidPlaced &) { return "BidPlaced"; },
                          [](const OfferMade &) { return "OfferMade"; },
                          [](const OfferAccepted &) { return "OfferAccepted"; },
                          [](const OfferRescinded &) { return "OfferRescinded"; },
                          [](const PurchaseMade &) { return "PurchaseMade"; },
                          [](const ListingFinalized &) { return "ListingFinalized"; },
                          [](const ListingCancelled &) { return "ListingCancelled"; },
                          [](const EscrowWithdrawn &) { return "EscrowWithdrawn"; },
                          [](const FeesWithdrawn &) { return "FeesWithdrawn"; },
                          [](const ConfigChanged &) { return "ConfigChanged"; },
                      },
                      ev);
}

ListingId event_listing_id(const MarketEvent &ev)
{
    return std::visit([](auto &&e) -> ListingId
                      {
                          using E = std::decay_t<decltype(e)>;
                          if constexpr (std::is_same_v<E, EscrowWithdrawn> ||
                                        std::is_same_v<E, FeesWithdrawn> ||
                                        std::is_same_v<E, ConfigChanged>)
                              return 0;
                          else
                              return e.listing_id; },
                      ev);
}

#pragma once
#include "events/market_events.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

class IMarketEventSink
{
public:
    virtual ~IMarketEventSink() = default;

    // Called after an operation has committed. May throw; the engine logs and continues.
    virtual void publish(const MarketEvent &ev) = 0;
};

// In-process log, used by tests and by hosts that poll for events.
class MemoryEventLog final : public IMarketEventSink
{
public:
    void publish(const MarketEvent &ev) override;

    std::vector<MarketEvent> list() const;
    std::size_t size() const;
    void clear();

    template <class E>
    std::vector<E> of_type() const
    {
        std::scoped_lock lk(mtx_);
        std::vector<E> out;
        for (const auto &ev : events_)
        {
            if (const E *e = std::get_if<E>(&ev))
                out.push_back(*e);
        }
        return out;
    }

private:
    mutable std::mutex mtx_;
    std::vector<MarketEvent> events_;
};

// Forwards each event to several sinks; one failing sink does not starve the rest.
class EventFanout final : public IMarketEventSink
{
public:
    void add(std::shared_ptr<IMarketEventSink> sink);
    void publish(const MarketEvent &ev) override;

private:
    std::vector<std::shared_ptr<IMarketEventSink>> sinks_;
};

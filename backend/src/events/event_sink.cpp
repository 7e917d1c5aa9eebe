#include "event_sink.hpp"
#include <exception>
#include <string>

#include "util/market_log.hpp"

void MemoryEventLog::publish(const MarketEvent &ev)
{
    std::scoped_lock lk(mtx_);
    events_.push_back(ev);
}

std::vector<MarketEvent> MemoryEventLog::list() const
{
    std::scoped_lock lk(mtx_);
    return events_;
}

std::size_t MemoryEventLog::size() const
{
    std::scoped_lock lk(mtx_);
    return events_.size();
}

void MemoryEventLog::clear()
{
    std::scoped_lock lk(mtx_);
    events_.clear();
}

void EventFanout::add(std::shared_ptr<IMarketEventSink> sink)
{
    if (sink)
        sinks_.push_back(std::move(sink));
}

void EventFanout::publish(const MarketEvent &ev)
{
    for (auto &sink : sinks_)
    {
        try
        {
            sink->publish(ev);
        }
        catch (const std::exception &e)
        {
            market_log("journal", std::string("sink rejected ") + event_name(ev) + ": " + e.what());
        }
    }
}

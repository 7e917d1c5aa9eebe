#pragma once
#include <mutex>
#include <ostream>
#include <string>

#include "events/event_sink.hpp"

// {"event":"BidPlaced","listing_id":1,...}
std::string event_to_json(const MarketEvent& ev);

// Appends one JSON object per line to a stream (file, pipe, stdout).
class JsonLinesEventLog final : public IMarketEventSink {
public:
    explicit JsonLinesEventLog(std::ostream& out) : out_(out) {}

    void publish(const MarketEvent& ev) override;

private:
    std::mutex mtx_;
    std::ostream& out_;
};

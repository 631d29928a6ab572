#include "utils/EventLog.h"

void EventLog::record(std::uint32_t season, const Voyage& voyage) {
    events_.push_back(VoyageEvent{season, voyage});
    if (voyage.success) {
        ++successes_;
    }
}

void EventLog::clear() {
    events_.clear();
    successes_ = 0;
}

std::vector<VoyageEvent> EventLog::forSeason(std::uint32_t season) const {
    std::vector<VoyageEvent> out;
    for (const auto& ev : events_) {
        if (ev.season == season) {
            out.push_back(ev);
        }
    }
    return out;
}

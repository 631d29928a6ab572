#ifndef EVENT_LOG_H
#define EVENT_LOG_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "kernel/Voyage.h"

struct VoyageEvent {
    std::uint32_t season = 0;   // season the attempt belonged to (1-based)
    Voyage voyage;
};

// Append-only record of every voyage attempt, cleared only on reset
class EventLog {
public:
    void record(std::uint32_t season, const Voyage& voyage);
    void clear();

    const std::vector<VoyageEvent>& events() const { return events_; }
    std::size_t size() const { return events_.size(); }
    std::size_t successes() const { return successes_; }

    // Events of a single season, in attempt order
    std::vector<VoyageEvent> forSeason(std::uint32_t season) const;

private:
    std::vector<VoyageEvent> events_;
    std::size_t successes_ = 0;
};

#endif

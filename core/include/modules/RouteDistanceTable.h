#ifndef ROUTE_DISTANCE_TABLE_H
#define ROUTE_DISTANCE_TABLE_H

#include <map>
#include <string>
#include <utility>

#include "kernel/SimulationConfig.h"

// Directed lookup of sailing difficulty between islands (higher = easier).
// Unlisted pairs, including the reverse of a listed pair, get the default.
class RouteDistanceTable {
public:
    using Key = std::pair<std::string, std::string>;

    RouteDistanceTable() = default;
    explicit RouteDistanceTable(std::map<Key, double> entries,
                                double fallback = TuningConstants::kDefaultDistance);

    // Curated archipelago distances (both directions listed)
    static RouteDistanceTable nusantara();

    double distance(const std::string& from, const std::string& to) const;
    double fallback() const { return fallback_; }
    std::size_t size() const { return entries_.size(); }

private:
    std::map<Key, double> entries_;
    double fallback_ = TuningConstants::kDefaultDistance;
};

#endif

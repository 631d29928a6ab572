#ifndef SIMULATION_STATE_H
#define SIMULATION_STATE_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "kernel/IslandRegistry.h"
#include "kernel/Voyage.h"
#include "modules/Monsoon.h"
#include "utils/EventLog.h"

/**
 * Mutable aggregate of one simulation.
 *
 * Routes, connections and running totals are maintained incrementally by
 * VoyageSimulator and SeasonScheduler; nothing recomputes them, so every
 * mutating call must be serialized by the owner. Reads are const and may
 * overlap with other reads.
 */
class SimulationState {
public:
    using RouteKey = std::pair<std::string, std::string>;  // directed origin -> destination

    SimulationState(IslandRegistry registry, std::uint64_t seed);

    const IslandRegistry& islands() const { return registry_; }
    const MonsoonModel& monsoon() const { return monsoon_; }
    const std::set<RouteKey>& routes() const { return routes_; }
    std::uint64_t tradeTotal() const { return trade_total_; }
    std::uint64_t cultureTotal() const { return culture_total_; }
    const std::vector<SeasonResult>& seasons() const { return seasons_; }
    const EventLog& voyageLog() const { return voyage_log_; }

    // Route recorded in either direction
    bool hasRouteBetween(const std::string& a, const std::string& b) const;

    // Distinct unordered pairs with a route in at least one direction
    std::size_t linkedPairs() const;

private:
    friend class VoyageSimulator;
    friend class SeasonScheduler;
    friend class SimulationController;

    std::mt19937_64& rng() { return rng_; }
    void reseed(std::uint64_t seed) { rng_.seed(seed); }

    // Back to the initial roster state; static island attributes and the RNG stream are kept
    void clear();

    IslandRegistry registry_;
    MonsoonModel monsoon_;
    std::set<RouteKey> routes_;
    std::uint64_t trade_total_ = 0;
    std::uint64_t culture_total_ = 0;
    std::vector<SeasonResult> seasons_;
    EventLog voyage_log_;
    std::mt19937_64 rng_;
};

#endif

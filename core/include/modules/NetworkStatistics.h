#ifndef NETWORK_STATISTICS_H
#define NETWORK_STATISTICS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "kernel/Island.h"
#include "kernel/SimulationState.h"
#include "modules/Monsoon.h"

struct IslandStats {
    std::string id;
    IslandType type = IslandType::Agricultural;
    std::size_t connections = 0;
    double centrality = 0.0;                // connections / (N - 1)
    std::vector<std::string> connectedTo;   // sorted peer ids
    double nav = 0.0;
    std::uint32_t trade = 0;
    double culture = 0.0;
};

// Read-only view of the network at one instant
struct NetworkStatsSnapshot {
    std::vector<IslandStats> islands;       // roster order
    std::uint64_t totalTrade = 0;
    std::uint64_t totalCultural = 0;
    std::size_t routes = 0;                 // directed routes as recorded
    std::size_t linkedPairs = 0;            // unordered pairs with any route
    double connectivity = 0.0;              // linkedPairs / (N(N-1)/2)
    MonsoonState monsoon = MonsoonState::Northeast;
    std::uint64_t cycle = 0;
    std::size_t totalVoyages = 0;
    std::size_t successfulVoyages = 0;
    std::size_t seasons = 0;

    // Throws validation::NotFoundError if id is absent
    const IslandStats& island(const std::string& id) const;

    // Most central first; ties keep roster order
    std::vector<IslandStats> rankedByCentrality() const;
};

class NetworkStatisticsEngine {
public:
    // Pure function of the state; never mutates it
    static NetworkStatsSnapshot computeStats(const SimulationState& state);
};

#endif

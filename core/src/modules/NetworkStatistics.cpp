#include "modules/NetworkStatistics.h"
#include "utils/Validation.h"

#include <algorithm>

const IslandStats& NetworkStatsSnapshot::island(const std::string& id) const {
    auto it = std::find_if(islands.begin(), islands.end(),
                           [&id](const IslandStats& s) { return s.id == id; });
    if (it == islands.end()) {
        throw validation::NotFoundError("Unknown island '" + id + "'");
    }
    return *it;
}

std::vector<IslandStats> NetworkStatsSnapshot::rankedByCentrality() const {
    std::vector<IslandStats> ranked = islands;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const IslandStats& a, const IslandStats& b) {
                         return a.centrality > b.centrality;
                     });
    return ranked;
}

NetworkStatsSnapshot NetworkStatisticsEngine::computeStats(const SimulationState& state) {
    NetworkStatsSnapshot snap;

    const auto& islands = state.islands().islands();
    const std::size_t n = islands.size();
    const double maxPeers = n > 1 ? static_cast<double>(n - 1) : 0.0;
    const double maxPairs = n > 1 ? 0.5 * static_cast<double>(n) * static_cast<double>(n - 1) : 0.0;

    snap.islands.reserve(n);
    for (const auto& island : islands) {
        IslandStats s;
        s.id = island.id;
        s.type = island.type;
        s.connections = island.connections.size();
        s.centrality = maxPeers > 0.0 ? static_cast<double>(s.connections) / maxPeers : 0.0;
        s.connectedTo.assign(island.connections.begin(), island.connections.end());
        s.nav = island.nav;
        s.trade = island.trade;
        s.culture = island.culture;
        snap.islands.push_back(std::move(s));
    }

    snap.totalTrade = state.tradeTotal();
    snap.totalCultural = state.cultureTotal();
    snap.routes = state.routes().size();
    snap.linkedPairs = state.linkedPairs();
    snap.connectivity = maxPairs > 0.0 ? static_cast<double>(snap.linkedPairs) / maxPairs : 0.0;
    snap.monsoon = state.monsoon().state();
    snap.cycle = state.monsoon().cycle();
    snap.totalVoyages = state.voyageLog().size();
    snap.successfulVoyages = state.voyageLog().successes();
    snap.seasons = state.seasons().size();

    return snap;
}

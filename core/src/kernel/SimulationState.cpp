#include "kernel/SimulationState.h"

SimulationState::SimulationState(IslandRegistry registry, std::uint64_t seed)
    : registry_(std::move(registry)), rng_(seed) {}

bool SimulationState::hasRouteBetween(const std::string& a, const std::string& b) const {
    return routes_.count(RouteKey(a, b)) != 0 || routes_.count(RouteKey(b, a)) != 0;
}

std::size_t SimulationState::linkedPairs() const {
    std::size_t pairs = 0;
    for (const auto& route : routes_) {
        const bool reverseRecorded = routes_.count(RouteKey(route.second, route.first)) != 0;
        // Count a two-way pair once, on its lexicographically smaller entry
        if (!reverseRecorded || route.first < route.second) {
            ++pairs;
        }
    }
    return pairs;
}

void SimulationState::clear() {
    registry_.clearConnections();
    monsoon_.reset();
    routes_.clear();
    trade_total_ = 0;
    culture_total_ = 0;
    seasons_.clear();
    voyage_log_.clear();
}

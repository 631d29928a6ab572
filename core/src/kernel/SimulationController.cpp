#include "kernel/SimulationController.h"

#include <iostream>
#include <stdexcept>

SimulationController::SimulationController(const SimulationConfig& cfg)
    : cfg_(cfg),
      state_(IslandRegistry::initialize(cfg.islands), cfg.seed),
      simulator_(state_, RouteDistanceTable::nusantara(), FavorableWinds::nusantara()),
      scheduler_(state_, simulator_, cfg.verbose) {
    if (cfg_.verbose) {
        std::cerr << "[Controller] " << state_.islands().size()
                  << " islands, seed=" << cfg_.seed << "\n";
    }
}

SeasonResult SimulationController::runSeason() {
    return scheduler_.runSeason();
}

std::vector<SeasonResult> SimulationController::runBatch(int n) {
    if (n < 0) {
        throw std::invalid_argument("runBatch requires n >= 0 (got " + std::to_string(n) + ")");
    }
    std::vector<SeasonResult> results;
    for (int i = 0; i < n; ++i) {
        results.push_back(scheduler_.runSeason());
    }
    return results;
}

void SimulationController::reset() {
    state_.clear();
    if (cfg_.verbose) {
        std::cerr << "[Controller] reset\n";
    }
}

void SimulationController::reseed(std::uint64_t seed) {
    cfg_.seed = seed;
    state_.reseed(seed);
}

double SimulationController::computeSuccessProbability(const std::string& origin,
                                                       const std::string& destination) const {
    return simulator_.computeSuccessProbability(origin, destination);
}

Voyage SimulationController::attemptVoyage(const std::string& origin, const std::string& destination) {
    return simulator_.attemptVoyage(origin, destination);
}

NetworkStatsSnapshot SimulationController::getNetworkStats() const {
    return NetworkStatisticsEngine::computeStats(state_);
}

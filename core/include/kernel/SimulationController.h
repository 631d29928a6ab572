#ifndef SIMULATION_CONTROLLER_H
#define SIMULATION_CONTROLLER_H

#include <cstdint>
#include <string>
#include <vector>

#include "kernel/Island.h"
#include "kernel/SimulationConfig.h"
#include "kernel/SimulationState.h"
#include "kernel/Voyage.h"
#include "modules/NetworkStatistics.h"
#include "modules/SeasonScheduler.h"
#include "modules/VoyageSimulator.h"

// ---------- Simulation Engine ----------
// Owns one SimulationState. Instances share nothing, so several simulations
// can live side by side; calls on one instance must not overlap if any of
// them mutates.
class SimulationController {
public:
    explicit SimulationController(const SimulationConfig& cfg = SimulationConfig());

    SimulationController(const SimulationController&) = delete;
    SimulationController& operator=(const SimulationController&) = delete;

    // Lifecycle
    SeasonResult runSeason();
    std::vector<SeasonResult> runBatch(int n);
    void reset();
    void reseed(std::uint64_t seed);

    // Single-pair queries
    double computeSuccessProbability(const std::string& origin, const std::string& destination) const;
    Voyage attemptVoyage(const std::string& origin, const std::string& destination);

    // Access
    NetworkStatsSnapshot getNetworkStats() const;
    const Island& getIsland(const std::string& id) const { return state_.islands().get(id); }
    const SimulationState& state() const { return state_; }
    const std::vector<SeasonResult>& seasons() const { return state_.seasons(); }
    const SimulationConfig& config() const { return cfg_; }

private:
    SimulationConfig cfg_;
    SimulationState state_;
    VoyageSimulator simulator_;
    SeasonScheduler scheduler_;
};

#endif

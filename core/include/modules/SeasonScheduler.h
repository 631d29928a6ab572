#ifndef SEASON_SCHEDULER_H
#define SEASON_SCHEDULER_H

#include <cstddef>
#include <string>
#include <vector>

#include "kernel/SimulationState.h"
#include "kernel/Voyage.h"
#include "modules/VoyageSimulator.h"

// Runs one season: a fixed batch of voyage attempts, then one monsoon advance.
class SeasonScheduler {
public:
    SeasonScheduler(SimulationState& state, VoyageSimulator& simulator, bool verbose = false);

    // Throws validation::InvalidStateError (before any attempt) if fewer than two islands exist
    SeasonResult runSeason();

private:
    std::size_t pickOrigin();
    std::size_t pickDestination(std::size_t origin);

    SimulationState& state_;
    VoyageSimulator& simulator_;
    bool verbose_ = false;

    // Roster positions of port-city and trading islands (static for the state's lifetime)
    std::vector<std::size_t> traders_;
};

#endif

#ifndef VOYAGE_SIMULATOR_H
#define VOYAGE_SIMULATOR_H

#include <string>

#include "kernel/SimulationState.h"
#include "kernel/Voyage.h"
#include "modules/Monsoon.h"
#include "modules/RouteDistanceTable.h"

/**
 * Resolves single voyages against the shared simulation state.
 *
 * Success probability:
 *   p = clamp(nav*0.4 + distance*0.3 + wind*0.3 + bonus, 0.05, 0.95)
 * where wind comes from FavorableWinds for the current monsoon and bonus is
 * 0.2 once a route exists between the pair in either direction.
 *
 * A successful voyage commits the route, the symmetric connection, the
 * trade amount and the cultural exchange together; a failed one commits
 * nothing. This is the only place island connections are created.
 */
class VoyageSimulator {
public:
    VoyageSimulator(SimulationState& state, RouteDistanceTable distances, FavorableWinds winds);

    // Throws validation::NotFoundError for unknown ids, std::invalid_argument if origin == destination
    double computeSuccessProbability(const std::string& origin, const std::string& destination) const;
    Voyage attemptVoyage(const std::string& origin, const std::string& destination);

private:
    SimulationState& state_;
    RouteDistanceTable distances_;
    FavorableWinds winds_;
};

#endif

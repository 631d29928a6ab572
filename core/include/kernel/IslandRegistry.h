#ifndef ISLAND_REGISTRY_H
#define ISLAND_REGISTRY_H

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "kernel/Island.h"

/**
 * Island agents in roster order, indexed by id.
 *
 * Static attributes are fixed after initialize(). Connections are only
 * changed by VoyageSimulator (which links both ends together) and cleared
 * by SimulationState on reset, so symmetry is enforced in one place.
 */
class IslandRegistry {
public:
    IslandRegistry() = default;

    // Builds the registry, applying the type floors exactly once.
    // Throws std::invalid_argument on duplicate/empty ids or out-of-range traits.
    static IslandRegistry initialize(const std::vector<IslandDefinition>& definitions);

    // Throws validation::NotFoundError if id is not registered
    const Island& get(const std::string& id) const;
    const Island& at(std::size_t index) const;

    bool contains(const std::string& id) const { return index_.count(id) != 0; }
    std::size_t indexOf(const std::string& id) const;
    std::size_t size() const { return islands_.size(); }
    const std::vector<Island>& islands() const { return islands_; }

private:
    friend class VoyageSimulator;
    friend class SimulationState;

    void link(std::size_t a, std::size_t b);
    void clearConnections();

    std::vector<Island> islands_;
    std::unordered_map<std::string, std::size_t> index_;  // id -> roster position
};

// The ten-island archipelago roster used by default
std::vector<IslandDefinition> nusantaraRoster();

#endif

#include "kernel/IslandRegistry.h"
#include "kernel/SimulationConfig.h"
#include "utils/Validation.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

// Type bonuses: applied once when the island is created, never re-applied
void applyTypeFloors(Island& island) {
    switch (island.type) {
        case IslandType::PortCity:
            island.nav = std::max(TuningConstants::kPortCityNavFloor, island.nav);
            break;
        case IslandType::Trading:
            island.trade = std::max(TuningConstants::kTradingCapacityFloor, island.trade);
            break;
        case IslandType::Cultural:
            island.culture = std::max(TuningConstants::kCulturalAffinityFloor, island.culture);
            break;
        case IslandType::Agricultural:
            break;
    }
}

} // namespace

IslandRegistry IslandRegistry::initialize(const std::vector<IslandDefinition>& definitions) {
    IslandRegistry registry;
    registry.islands_.reserve(definitions.size());

    for (const auto& def : definitions) {
        if (def.id.empty()) {
            throw std::invalid_argument("Island id must not be empty");
        }
        if (registry.contains(def.id)) {
            throw std::invalid_argument("Duplicate island id '" + def.id + "'");
        }
        validation::checkUnitInterval(def.nav, "nav", def.id);
        validation::checkUnitInterval(def.culture, "culture", def.id);

        Island island;
        island.id = def.id;
        island.type = def.type;
        island.nav = def.nav;
        island.trade = def.trade;
        island.culture = def.culture;
        applyTypeFloors(island);

        registry.index_.emplace(island.id, registry.islands_.size());
        registry.islands_.push_back(std::move(island));
    }

    return registry;
}

const Island& IslandRegistry::get(const std::string& id) const {
    return islands_[indexOf(id)];
}

const Island& IslandRegistry::at(std::size_t index) const {
    validation::checkIndex(index, islands_.size(), "IslandRegistry::at");
    return islands_[index];
}

std::size_t IslandRegistry::indexOf(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw validation::NotFoundError("Unknown island '" + id + "'");
    }
    return it->second;
}

void IslandRegistry::link(std::size_t a, std::size_t b) {
    // Both ends in one call so no caller can observe a half-linked pair
    islands_[a].connections.insert(islands_[b].id);
    islands_[b].connections.insert(islands_[a].id);
}

void IslandRegistry::clearConnections() {
    for (auto& island : islands_) {
        island.connections.clear();
    }
}

std::vector<IslandDefinition> nusantaraRoster() {
    return {
        {"malacca",     IslandType::PortCity,     0.9, 150, 0.8},
        {"jakarta",     IslandType::Trading,      0.7, 200, 0.6},
        {"surabaya",    IslandType::PortCity,     0.8, 120, 0.5},
        {"palembang",   IslandType::Cultural,     0.6,  80, 0.9},
        {"banjarmasin", IslandType::Trading,      0.7, 100, 0.4},
        {"makassar",    IslandType::PortCity,     0.8,  90, 0.7},
        {"ternate",     IslandType::Agricultural, 0.5,  60, 0.8},
        {"brunei",      IslandType::Trading,      0.6, 110, 0.5},
        {"cebu",        IslandType::PortCity,     0.7,  85, 0.6},
        {"manila",      IslandType::Cultural,     0.6,  95, 0.8}
    };
}

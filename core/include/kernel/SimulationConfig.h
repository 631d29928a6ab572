#ifndef SIMULATION_CONFIG_H
#define SIMULATION_CONFIG_H

#include <cstdint>
#include <vector>

#include "kernel/Island.h"
#include "kernel/IslandRegistry.h"

// ---------- Tuning Constants ----------
// These constants define the voyage model. Season results are only comparable
// across runs that share them.
namespace TuningConstants {
    // Type floors (applied once at island creation)
    constexpr double kPortCityNavFloor = 0.7;
    constexpr std::uint32_t kTradingCapacityFloor = 100;
    constexpr double kCulturalAffinityFloor = 0.6;

    // Season batch
    constexpr int kVoyagesPerSeason = 20;
    constexpr double kTraderOriginBias = 0.7;      // chance origin is redrawn among port/trading islands

    // Success probability = nav*wNav + dist*wDist + monsoon*wMonsoon + bonus
    constexpr double kNavWeight = 0.4;
    constexpr double kDistanceWeight = 0.3;
    constexpr double kMonsoonWeight = 0.3;
    constexpr double kNetworkBonus = 0.2;          // an established route in either direction
    constexpr double kMinSuccess = 0.05;
    constexpr double kMaxSuccess = 0.95;

    // Distance difficulty for pairs missing from the table
    constexpr double kDefaultDistance = 0.4;

    // Monsoon wind effect
    constexpr double kCalmFactor = 0.6;
    constexpr double kFavorableFactor = 0.9;
    constexpr double kAgainstWindFactor = 0.3;
    constexpr double kNeutralWindFactor = 0.5;

    // Monsoon cycle length (advance() steps)
    constexpr int kMonsoonPeriod = 6;

    // Trade amount per successful voyage, capped by origin capacity
    constexpr std::uint32_t kMinTradeAmount = 20;
    constexpr std::uint32_t kMaxTradeAmount = 100;
}

// ---------- Configuration ----------
struct SimulationConfig {
    std::uint64_t seed = 42;
    std::vector<IslandDefinition> islands = nusantaraRoster();
    bool verbose = false;               // per-season diagnostics on stderr
};

#endif

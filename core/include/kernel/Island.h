#ifndef ISLAND_H
#define ISLAND_H

#include <cstdint>
#include <set>
#include <string>

enum class IslandType : std::uint8_t {
    PortCity = 0,
    Trading = 1,
    Cultural = 2,
    Agricultural = 3
};

const char* islandTypeName(IslandType type);
bool parseIslandType(const std::string& name, IslandType& out);

// Port cities and trading islands are favored as voyage origins
inline bool isTradeOriented(IslandType type) {
    return type == IslandType::PortCity || type == IslandType::Trading;
}

// ---------- Island Definition (roster input, floors not yet applied) ----------
struct IslandDefinition {
    std::string id;
    IslandType type = IslandType::Agricultural;
    double nav = 0.5;               // navigation skill 0..1
    std::uint32_t trade = 0;        // trade capacity per voyage
    double culture = 0.5;           // culture affinity 0..1
};

// ---------- Island Agent ----------
struct Island {
    // Identity
    std::string id;
    IslandType type = IslandType::Agricultural;

    // Capabilities (type floors applied once at creation)
    double nav = 0.5;
    std::uint32_t trade = 0;
    double culture = 0.5;

    // Network (peer ids, kept symmetric by VoyageSimulator)
    std::set<std::string> connections;
};

#endif

#include "kernel/Island.h"

const char* islandTypeName(IslandType type) {
    switch (type) {
        case IslandType::PortCity:     return "port_city";
        case IslandType::Trading:      return "trading";
        case IslandType::Cultural:     return "cultural";
        case IslandType::Agricultural: return "agricultural";
    }
    return "unknown";
}

bool parseIslandType(const std::string& name, IslandType& out) {
    if (name == "port_city") {
        out = IslandType::PortCity;
    } else if (name == "trading") {
        out = IslandType::Trading;
    } else if (name == "cultural") {
        out = IslandType::Cultural;
    } else if (name == "agricultural") {
        out = IslandType::Agricultural;
    } else {
        return false;
    }
    return true;
}

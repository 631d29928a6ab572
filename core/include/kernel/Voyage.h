#ifndef VOYAGE_H
#define VOYAGE_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "modules/Monsoon.h"

// One resolved voyage attempt
struct Voyage {
    std::string from;
    std::string to;
    bool success = false;
    std::uint32_t trade = 0;        // 0 unless success
    bool cultural = false;          // false unless success
    double probability = 0.0;       // chance the attempt was resolved against
};

// Aggregate of one season batch
struct SeasonResult {
    std::uint32_t season = 0;                      // 1-based index in history
    MonsoonState sailedUnder = MonsoonState::Northeast;  // label during the voyages
    MonsoonState monsoon = MonsoonState::Northeast;      // label after the season's advance
    int total = 0;
    int successful = 0;
    double rate = 0.0;
    std::uint64_t trade = 0;
    int cultural = 0;
    std::size_t routes = 0;                        // cumulative route count at season end
};

#endif

#ifndef SIM_SNAPSHOT_H
#define SIM_SNAPSHOT_H

#include "kernel/Island.h"
#include "kernel/Voyage.h"
#include "modules/NetworkStatistics.h"
#include <string>
#include <vector>
#include <iosfwd>

// JSON export for network statistics
std::string statsToJson(const NetworkStatsSnapshot& stats);
std::string islandToJson(const IslandStats& island);

// JSON export for season results
std::string seasonToJson(const SeasonResult& result);
std::string seasonsToJson(const std::vector<SeasonResult>& history);

// CSV season logging
std::string seasonCsvHeader();
void logSeason(const SeasonResult& result, std::ostream& out);

#endif

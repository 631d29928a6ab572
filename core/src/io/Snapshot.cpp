#include "io/Snapshot.h"
#include <sstream>
#include <iomanip>
#include <string>

namespace {

// Island ids come from the roster and may carry quotes or backslashes
std::string jsonEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    out += hex.str();
                } else {
                    out += c;
                }
        }
    }
    return out;
}

void writeIslandFields(std::ostream& os, const IslandStats& s) {
    os << "\"id\":\"" << jsonEscape(s.id) << "\",";
    os << "\"type\":\"" << islandTypeName(s.type) << "\",";
    os << "\"nav\":" << s.nav << ",";
    os << "\"trade\":" << s.trade << ",";
    os << "\"culture\":" << s.culture << ",";
    os << "\"connections\":" << s.connections << ",";
    os << "\"centrality\":" << s.centrality << ",";
    os << "\"connectedTo\":[";
    for (std::size_t i = 0; i < s.connectedTo.size(); ++i) {
        os << "\"" << jsonEscape(s.connectedTo[i]) << "\"";
        if (i + 1 < s.connectedTo.size()) os << ",";
    }
    os << "]";
}

void writeSeasonFields(std::ostream& os, const SeasonResult& r) {
    os << "\"season\":" << r.season << ",";
    os << "\"sailedUnder\":\"" << monsoonName(r.sailedUnder) << "\",";
    os << "\"monsoon\":\"" << monsoonName(r.monsoon) << "\",";
    os << "\"total\":" << r.total << ",";
    os << "\"successful\":" << r.successful << ",";
    os << "\"rate\":" << r.rate << ",";
    os << "\"trade\":" << r.trade << ",";
    os << "\"cultural\":" << r.cultural << ",";
    os << "\"routes\":" << r.routes;
}

} // namespace

std::string statsToJson(const NetworkStatsSnapshot& stats) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    os << "{";
    os << "\"cycle\":" << stats.cycle << ",";
    os << "\"monsoon\":\"" << monsoonName(stats.monsoon) << "\",";
    os << "\"seasons\":" << stats.seasons << ",";
    os << "\"totals\":{";
    os << "\"trade\":" << stats.totalTrade << ",";
    os << "\"cultural\":" << stats.totalCultural << ",";
    os << "\"voyages\":" << stats.totalVoyages << ",";
    os << "\"successfulVoyages\":" << stats.successfulVoyages;
    os << "},";
    os << "\"routes\":" << stats.routes << ",";
    os << "\"linkedPairs\":" << stats.linkedPairs << ",";
    os << "\"connectivity\":" << stats.connectivity << ",";

    os << "\"islands\":[";
    for (std::size_t i = 0; i < stats.islands.size(); ++i) {
        os << "{";
        writeIslandFields(os, stats.islands[i]);
        os << "}";
        if (i + 1 < stats.islands.size()) os << ",";
    }
    os << "]";
    os << "}";

    return os.str();
}

std::string islandToJson(const IslandStats& island) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);
    os << "{";
    writeIslandFields(os, island);
    os << "}";
    return os.str();
}

std::string seasonToJson(const SeasonResult& result) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);
    os << "{";
    writeSeasonFields(os, result);
    os << "}";
    return os.str();
}

std::string seasonsToJson(const std::vector<SeasonResult>& history) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);
    os << "[";
    for (std::size_t i = 0; i < history.size(); ++i) {
        os << "{";
        writeSeasonFields(os, history[i]);
        os << "}";
        if (i + 1 < history.size()) os << ",";
    }
    os << "]";
    return os.str();
}

std::string seasonCsvHeader() {
    return "season,sailed_under,monsoon,total,successful,rate,trade,cultural,routes";
}

void logSeason(const SeasonResult& result, std::ostream& out) {
    out << result.season << ","
        << monsoonName(result.sailedUnder) << ","
        << monsoonName(result.monsoon) << ","
        << result.total << ","
        << result.successful << ","
        << result.rate << ","
        << result.trade << ","
        << result.cultural << ","
        << result.routes << "\n";
}

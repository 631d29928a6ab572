#include "CommandShell.h"
#include "io/Snapshot.h"
#include "utils/Validation.h"
#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

bool parseSeed(const std::string& text, std::uint64_t& out) {
    try {
        std::size_t used = 0;
        out = std::stoull(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool parseCount(const std::string& text, int& out) {
    try {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

CommandShell::CommandShell(SimulationController& sim, std::ostream& out, std::ostream& err)
    : sim_(sim), out_(out), err_(err) {}

void CommandShell::printHelp(std::ostream& os) {
    os << "Simulation Commands:\n"
       << "  season             # run one season (20 voyages, then monsoon advances)\n"
       << "  batch [N]          # run N seasons (default 8)\n"
       << "  run N FILE         # run N seasons, appending CSV rows to FILE\n"
       << "  stats              # print network statistics JSON\n"
       << "  hubs [K]           # print the K most central islands (default 5)\n"
       << "  island ID          # print details for island ID\n"
       << "  voyage A B         # print success probability for A -> B\n"
       << "  history            # print season history as CSV\n"
       << "  reset [seed]       # clear routes, connections, totals and history\n"
       << "  help               # show this list\n"
       << "  quit               # exit\n"
       << "\nOptions: --seed=<n> (or NUSANTARA_SEED env var), --verbose\n";
}

bool CommandShell::execute(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    if (!(iss >> cmd)) return true;

    try {
        if (cmd == "season") {
            out_ << seasonToJson(sim_.runSeason()) << "\n";
            out_.flush();
        } else if (cmd == "batch") {
            runSeasons(iss);
        } else if (cmd == "run") {
            writeSeasonsCsv(iss);
        } else if (cmd == "stats") {
            out_ << statsToJson(sim_.getNetworkStats()) << "\n";
            out_.flush();
        } else if (cmd == "hubs") {
            printHubs(iss);
        } else if (cmd == "island") {
            printIsland(iss);
        } else if (cmd == "voyage") {
            printVoyage(iss);
        } else if (cmd == "history") {
            printHistory();
        } else if (cmd == "reset") {
            resetSimulation(iss);
        } else if (cmd == "quit") {
            return false;
        } else if (cmd == "help") {
            printHelp(err_);
        } else {
            err_ << "Unknown command: " << cmd << "\n";
            printHelp(err_);
        }
    } catch (const validation::NotFoundError& e) {
        err_ << "Not found: " << e.what() << "\n";
    } catch (const validation::InvalidStateError& e) {
        err_ << "Invalid state: " << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
        err_ << "Invalid argument: " << e.what() << "\n";
    } catch (const std::exception& e) {
        err_ << "Error: " << e.what() << "\n";
    }
    return true;
}

void CommandShell::runSeasons(std::istream& args) {
    int n = 8;
    std::string countText;
    if (args >> countText && !parseCount(countText, n)) {
        err_ << "Usage: batch [N]\n";
        return;
    }
    auto results = sim_.runBatch(n);
    out_ << seasonsToJson(results) << "\n";
    out_.flush();
}

void CommandShell::writeSeasonsCsv(std::istream& args) {
    std::string countText, path;
    int seasons = 0;
    if (!(args >> countText >> path) || !parseCount(countText, seasons) || seasons < 0) {
        err_ << "Usage: run N FILE\n";
        return;
    }

    // An empty file left by an earlier failed run still gets the header
    std::error_code ec;
    const auto existingSize = std::filesystem::file_size(path, ec);
    const bool needsHeader = ec || existingSize == 0;

    std::ofstream csv(path, std::ios::app);
    if (!csv.is_open()) {
        err_ << "Error: Could not open '" << path << "' for writing\n";
        return;
    }
    auto results = sim_.runBatch(seasons);
    if (needsHeader) {
        csv << seasonCsvHeader() << "\n";
    }
    for (const auto& result : results) {
        logSeason(result, csv);
    }
    err_ << "[CLI] Wrote " << seasons << " seasons to " << path << "\n";
}

void CommandShell::printHubs(std::istream& args) {
    int k = 5;
    std::string countText;
    if (args >> countText && !parseCount(countText, k)) {
        err_ << "Usage: hubs [K]\n";
        return;
    }
    auto ranked = sim_.getNetworkStats().rankedByCentrality();
    const std::size_t shown = std::min(ranked.size(), static_cast<std::size_t>(std::max(k, 0)));
    out_ << std::fixed << std::setprecision(1);
    for (std::size_t i = 0; i < shown; ++i) {
        out_ << std::setw(2) << (i + 1) << ". " << std::left << std::setw(12)
             << ranked[i].id << std::right << " "
             << ranked[i].centrality * 100.0 << "% central, "
             << ranked[i].connections << " connections\n";
    }
    out_.flush();
}

void CommandShell::printIsland(std::istream& args) {
    std::string id;
    if (!(args >> id)) {
        err_ << "Usage: island ID\n";
        return;
    }
    out_ << islandToJson(sim_.getNetworkStats().island(id)) << "\n";
    out_.flush();
}

void CommandShell::printVoyage(std::istream& args) {
    std::string from, to;
    if (!(args >> from >> to)) {
        err_ << "Usage: voyage A B\n";
        return;
    }
    out_ << std::fixed << std::setprecision(4)
         << from << " -> " << to << " under "
         << monsoonName(sim_.state().monsoon().state()) << ": "
         << sim_.computeSuccessProbability(from, to) << "\n";
    out_.flush();
}

void CommandShell::printHistory() {
    out_ << seasonCsvHeader() << "\n";
    for (const auto& result : sim_.seasons()) {
        logSeason(result, out_);
    }
    out_.flush();
}

void CommandShell::resetSimulation(std::istream& args) {
    std::string seedText;
    if (args >> seedText) {
        std::uint64_t seed = 0;
        if (!parseSeed(seedText, seed)) {
            err_ << "Invalid seed: " << seedText << "\n";
            return;
        }
        sim_.reseed(seed);
    }
    sim_.reset();
    out_ << "Reset: " << sim_.state().islands().size() << " islands (seed="
         << sim_.config().seed << ")\n";
    out_.flush();
}

#ifndef COMMAND_SHELL_H
#define COMMAND_SHELL_H

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

#include "kernel/SimulationController.h"

// ---------- Command Shell ----------
// Line-oriented command interpreter over one SimulationController. Results go
// to `out`; help, usage and error messages go to `err`. A failing command is
// reported and never ends the session.
class CommandShell {
public:
    CommandShell(SimulationController& sim, std::ostream& out, std::ostream& err);

    // Runs one command line. Returns false once the line asks to quit.
    bool execute(const std::string& line);

    static void printHelp(std::ostream& os);

private:
    void runSeasons(std::istream& args);
    void writeSeasonsCsv(std::istream& args);
    void printHubs(std::istream& args);
    void printIsland(std::istream& args);
    void printVoyage(std::istream& args);
    void printHistory();
    void resetSimulation(std::istream& args);

    SimulationController& sim_;
    std::ostream& out_;
    std::ostream& err_;
};

bool parseSeed(const std::string& text, std::uint64_t& out);

// Strict decimal int: the whole token must parse and fit in an int
bool parseCount(const std::string& text, int& out);

#endif

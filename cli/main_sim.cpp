#include "CommandShell.h"
#include "kernel/SimulationController.h"
#include <iostream>
#include <fstream>
#include <string>
#include <cstdlib>

int main(int argc, char** argv) {
    SimulationConfig cfg;

    if (const char* envSeed = std::getenv("NUSANTARA_SEED")) {
        if (!parseSeed(envSeed, cfg.seed)) {
            std::cerr << "[CLI] Ignoring invalid NUSANTARA_SEED '" << envSeed << "'\n";
        }
    }

    const char* scriptArg = nullptr;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--seed=", 0) == 0) {
            if (!parseSeed(arg.substr(7), cfg.seed)) {
                std::cerr << "Invalid seed: " << arg.substr(7) << "\n";
                return 1;
            }
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            CommandShell::printHelp(std::cerr);
            return 0;
        } else if (arg.size() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        } else {
            scriptArg = argv[i];
            break;
        }
    }

    SimulationController sim(cfg);
    CommandShell shell(sim, std::cout, std::cerr);

    std::istream* input = &std::cin;
    std::ifstream scriptFile;

    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        std::cerr << "[CLI] Running commands from script file: " << scriptArg << "\n";
    } else {
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        CommandShell::printHelp(std::cerr);
    }

    std::string line;
    while (std::getline(*input, line)) {
        if (!shell.execute(line)) break;
    }

    return 0;
}

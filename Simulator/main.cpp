// Simulator/main.cpp
#include "ArgParser.h"
#include "Simulator.h"
#include "ErrorLogger.h"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

using namespace CitadelCommon;

namespace {

// Last stop for anything that escaped main(): record it, then abort.
[[noreturn]] void onTerminate() {
    std::string what = "unknown exception";
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& ex) {
            what = ex.what();
        } catch (...) {
            what = "non-standard exception";
        }
    }
    ErrorLogger::instance().log("Terminated: " + what);
    std::cerr << "citadel: terminated: " << what << std::endl;
    std::abort();
}

std::string describeMode(const Config& cfg) {
    if (cfg.modeMatch) {
        return "match " + cfg.agent1 + " vs " + cfg.agent2 + " on " + cfg.game_map;
    }
    return "competition over " + cfg.game_maps_folder + " with agents from " + cfg.agents_folder;
}

} // namespace

int main(int argc, char* argv[]) {
    ErrorLogger::instance().init();
    std::set_terminate(onTerminate);

    Config cfg;
    if (!parseArguments(argc, argv, cfg)) {
        ErrorLogger::instance().log("Failed to parse command line arguments");
        return 1;
    }
    ErrorLogger::instance().logSection(describeMode(cfg));

    try {
        Simulator simulator(cfg);
        const int result = simulator.run();

        std::cout << "\nGames played: " << simulator.getTotalGamesPlayed()
                  << "\nAgents loaded: " << simulator.getSuccessfullyLoadedAgents() << "\n";
        return result;
    } catch (const std::exception& ex) {
        ErrorLogger::instance().log(std::string("Fatal error: ") + ex.what());
        std::cerr << "citadel: " << ex.what() << "\n";
        return 1;
    }
}

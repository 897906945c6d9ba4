#include "ArgParser.h"
#include "ErrorLogger.h"
#include <iostream>
#include <filesystem>
#include <stdexcept>
using namespace CitadelCommon;
namespace fs = std::filesystem;

void printUsage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  Match mode:\n"
              << "    " << prog << " --match \\\n"
              << "      game_map=<file> \\\n"
              << "      agent1=<so> \\\n"
              << "      agent2=<so> \\\n"
              << "      [replay=<file>] [--verbose]\n\n"
              << "  Competition mode:\n"
              << "    " << prog << " --competition \\\n"
              << "      game_maps_folder=<dir> \\\n"
              << "      agents_folder=<dir> \\\n"
              << "      [num_threads=<N>] [--verbose]\n\n"
              << "  Balancing (either mode):\n"
              << "      [max_turns=<N>] [time_pool=<sec>] [time_increment=<sec>] [starting_balance=<coins>]\n";
}

bool parseArguments(int argc, char* argv[], Config& cfg) {
    std::vector<std::string> unsupported;
    parseArgumentsList(argc, argv, cfg, unsupported);

    if (!validateArguments(cfg, unsupported, argv[0])) {
        return false;
    }

    cfg.game.verbose = cfg.verbose;
    return validatePaths(cfg);
}

void parseArgumentsList(int argc, char* argv[], Config& cfg, std::vector<std::string>& unsupported) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool accepted = false;
        try {
            accepted = processArgument(arg, cfg);
        } catch (const std::logic_error&) {
            // std::stoi / std::stod reject non-numeric values
            accepted = false;
        }
        if (!accepted) {
            unsupported.push_back(arg);
        }
    }
}

bool processArgument(const std::string& arg, Config& cfg) {
    if      (arg == "--match")                  { cfg.modeMatch = true; return true; }
    else if (arg == "--competition")            { cfg.modeCompetition = true; return true; }
    else if (arg == "--verbose")                { cfg.verbose = true; return true; }
    else if (arg.rfind("num_threads=", 0) == 0) { cfg.numThreads = std::stoi(stripKey(arg, "num_threads=")); return cfg.numThreads > 0; }
    else if (arg.rfind("game_map=", 0) == 0)    { cfg.game_map = stripKey(arg, "game_map="); return true; }
    else if (arg.rfind("agent1=", 0) == 0)      { cfg.agent1 = stripKey(arg, "agent1="); return true; }
    else if (arg.rfind("agent2=", 0) == 0)      { cfg.agent2 = stripKey(arg, "agent2="); return true; }
    else if (arg.rfind("replay=", 0) == 0)      { cfg.replay = stripKey(arg, "replay="); return true; }
    else if (arg.rfind("game_maps_folder=",0)==0) { cfg.game_maps_folder = stripKey(arg, "game_maps_folder="); return true; }
    else if (arg.rfind("agents_folder=",0) == 0)  { cfg.agents_folder = stripKey(arg, "agents_folder="); return true; }

    return processBalancingArgument(arg, cfg);
}

bool processBalancingArgument(const std::string& arg, Config& cfg) {
    if (arg.rfind("max_turns=", 0) == 0) {
        const long long v = std::stoll(stripKey(arg, "max_turns="));
        if (v < 0) return false;
        cfg.game.maxTurns = static_cast<std::size_t>(v);
        return true;
    }
    if (arg.rfind("time_pool=", 0) == 0) {
        cfg.game.initialTimePool = std::stod(stripKey(arg, "time_pool="));
        return cfg.game.initialTimePool > 0;
    }
    if (arg.rfind("time_increment=", 0) == 0) {
        cfg.game.timeIncrement = std::stod(stripKey(arg, "time_increment="));
        return cfg.game.timeIncrement >= 0;
    }
    if (arg.rfind("starting_balance=", 0) == 0) {
        cfg.game.startingBalance = std::stod(stripKey(arg, "starting_balance="));
        return cfg.game.startingBalance >= 0;
    }
    return false;
}

bool validateArguments(const Config& cfg, const std::vector<std::string>& unsupported, const char* prog) {
    return checkUnsupportedArgs(unsupported, prog) &&
           checkModeSelection(cfg, prog) &&
           checkRequiredArgs(cfg, prog);
}

bool checkUnsupportedArgs(const std::vector<std::string>& unsupported, const char* prog) {
    if (!unsupported.empty()) {
        std::cerr << "Error: unsupported arguments:";
        for (const auto& u : unsupported) std::cerr << " " << u;
        std::cerr << "\n\n";
        printUsage(prog);
        return false;
    }
    return true;
}

bool checkModeSelection(const Config& cfg, const char* prog) {
    if (cfg.modeMatch == cfg.modeCompetition) {
        std::cerr << "Error: must specify exactly one of --match or --competition\n\n";
        printUsage(prog);
        return false;
    }
    return true;
}

bool checkRequiredArgs(const Config& cfg, const char* prog) {
    std::vector<std::string> missing;
    collectMissingArgs(cfg, missing);

    if (!missing.empty()) {
        std::cerr << "Error: missing arguments:";
        for (const auto& m : missing) std::cerr << " " << m;
        std::cerr << "\n\n";
        printUsage(prog);
        return false;
    }
    return true;
}

void collectMissingArgs(const Config& cfg, std::vector<std::string>& missing) {
    if (cfg.modeMatch) {
        if (cfg.game_map.empty())          missing.push_back("game_map");
        if (cfg.agent1.empty())            missing.push_back("agent1");
        if (cfg.agent2.empty())            missing.push_back("agent2");
    } else {
        if (cfg.game_maps_folder.empty())  missing.push_back("game_maps_folder");
        if (cfg.agents_folder.empty())     missing.push_back("agents_folder");
    }
}

bool validatePaths(const Config& cfg) {
    if (cfg.modeMatch) {
        return validateMatchPaths(cfg);
    } else {
        return validateCompetitionPaths(cfg);
    }
}

bool validateMatchPaths(const Config& cfg) {
    return mustBeFile(cfg.game_map, "game_map") &&
           mustBeFile(cfg.agent1, "agent1") &&
           mustBeFile(cfg.agent2, "agent2");
}

bool validateCompetitionPaths(const Config& cfg) {
    return mustBeDir(cfg.game_maps_folder, "game_maps_folder") &&
           mustBeDir(cfg.agents_folder, "agents_folder") &&
           checkSoFiles(cfg.agents_folder, "agents_folder");
}

bool mustBeDir(const std::string& path, const char* name) {
    if (!fs::is_directory(path)) {
        std::string errorMsg = "Error: " + std::string(name) + " not a directory: " + path;
        std::cerr << errorMsg << "\n";
        ErrorLogger::instance().log(errorMsg);
        return false;
    }
    return true;
}

bool checkSoFiles(const std::string& dirPath, const char* name) {
    for (const auto& e : fs::directory_iterator(dirPath)) {
        if (e.path().extension() == ".so") {
            return true;
        }
    }
    std::string errorMsg = "Error: " + std::string(name) + " contains no .so files";
    std::cerr << errorMsg << "\n";
    ErrorLogger::instance().log(errorMsg);
    return false;
}

bool mustBeFile(const std::string& path, const char* name) {
    if (!fs::is_regular_file(path)) {
        std::string errorMsg = "Error: " + std::string(name) + " not a file: " + path;
        std::cerr << errorMsg << "\n";
        ErrorLogger::instance().log(errorMsg);
        return false;
    }
    return true;
}

std::string stripKey(const std::string& arg, const std::string& key) {
    return arg.substr(key.size());
}

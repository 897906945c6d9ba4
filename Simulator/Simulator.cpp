#include "Simulator.h"
#include "ArgParser.h"
#include "ThreadPool.h"
#include "MapLoader.h"
#include "GameManager.h"
#include "DebugLog.h"
#include "ErrorLogger.h"

#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <algorithm>
#include <dlfcn.h>
#include <stdexcept>

using namespace CitadelCommon;
using Citadel::GameResult;
namespace fs = std::filesystem;

MatchEntry::MatchEntry(std::string m, std::string x, std::string y, GameResult r)
    : mapFile(std::move(m)), a1(std::move(x)), a2(std::move(y)), res(std::move(r)) {}

Simulator::Simulator(const Config& config)
    : config_(config) {
    INFO_PRINT("SIMULATOR", "constructor", "Initializing Simulator in " +
        std::string(config_.modeMatch ? "match" : "competition") + " mode");

    threadPool_ = std::make_unique<ThreadPool>(config_.numThreads, config_.verbose);
}

Simulator::~Simulator() {
    DEBUG_PRINT("SIMULATOR", "destructor", "Cleaning up Simulator", config_.verbose);
    cleanup();
}

int Simulator::run() {
    INFO_PRINT("SIMULATOR", "run", "Starting simulation execution");

    int result = config_.modeMatch ? runMatch() : runCompetition();

    INFO_PRINT("SIMULATOR", "run", "Simulation completed with exit code " + std::to_string(result));
    return result;
}

// ——————————————————————————————————————————————————————
// Match mode
// ——————————————————————————————————————————————————————
int Simulator::runMatch() {
    INFO_PRINT("SIMULATOR", "runMatch", "Starting match mode");

    Citadel::WorldMap map;
    try {
        map = MapLoader::loadFromFile(config_.game_map);
    } catch (const std::exception& ex) {
        std::string errorMsg = "Error loading map: " + std::string(ex.what());
        ERROR_PRINT("SIMULATOR", "runMatch", errorMsg);
        ErrorLogger::instance().log(errorMsg);
        return 1;
    }

    auto& reg = AgentRegistrar::get();
    if (!loadMatchAgents(reg)) {
        std::string errorMsg = "Failed to load required agents";
        ERROR_PRINT("SIMULATOR", "runMatch", errorMsg);
        ErrorLogger::instance().log(errorMsg);
        return 1;
    }

    // Both arguments may name the same plugin; it is then loaded once.
    const size_t blue = 0;
    const size_t red  = loadedAgents_ > 1 ? 1 : 0;
    const std::string replayPath = config_.replay.empty() ? defaultReplayPath() : config_.replay;

    try {
        GameResult gr = playGame(map, config_.game_map, blue, red, replayPath);
        ++totalGamesPlayed_;
        std::cout << "winner=" << Citadel::winnerName(gr.winner)
                  << " reason=" << Citadel::reasonToString(gr.reason)
                  << " rounds=" << gr.rounds << "\n";
        results_.emplace_back(config_.game_map, stripSoExtension(validAgentPaths_[blue]),
                              stripSoExtension(validAgentPaths_[red]), std::move(gr));
    } catch (const std::exception& ex) {
        ERROR_PRINT("SIMULATOR", "runMatch", std::string("Match aborted: ") + ex.what());
        return 1;
    }
    return 0;
}

bool Simulator::loadMatchAgents(AgentRegistrar& reg) {
    DEBUG_PRINT("PLUGINLOADER", "loadMatchAgents", "Loading 2 agent plugins for match mode", config_.verbose);

    if (!loadSingleAgent(reg, config_.agent1, true)) return false;

    std::error_code ec;
    if (fs::equivalent(config_.agent1, config_.agent2, ec)) {
        DEBUG_PRINT("PLUGINLOADER", "loadMatchAgents", "agent2 is agent1, reusing it", config_.verbose);
        return true;
    }
    return loadSingleAgent(reg, config_.agent2, true);
}

// ——————————————————————————————————————————————————————
// Competition mode
// ——————————————————————————————————————————————————————
int Simulator::runCompetition() {
    INFO_PRINT("SIMULATOR", "runCompetition", "Starting competition mode");

    std::vector<LoadedMap> maps = preloadMaps();
    if (maps.empty()) {
        std::string errorMsg = "No valid maps found in game_maps_folder";
        ERROR_PRINT("SIMULATOR", "runCompetition", errorMsg);
        ErrorLogger::instance().log(errorMsg);
        return 1;
    }

    auto& reg = AgentRegistrar::get();
    if (!loadCompetitionAgents(reg)) {
        std::string errorMsg = "Need at least 2 agents, found " + std::to_string(loadedAgents_);
        ERROR_PRINT("SIMULATOR", "runCompetition", errorMsg);
        ErrorLogger::instance().log(errorMsg);
        return 1;
    }
    INFO_PRINT("SIMULATOR", "runCompetition", "Successfully loaded " + std::to_string(loadedAgents_) + " agent(s)");

    enqueueCompetitionTasks(maps);
    finalizeTaskExecution();
    writeCompetitionFile(results_);

    for (const auto& e : results_) {
        DEBUG_PRINT("RESULTS", "runCompetition", "Map=" + baseName(e.mapFile) + " A1=" + e.a1 + " A2=" + e.a2 +
            " => winner=" + Citadel::winnerName(e.res.winner) +
            " reason=" + Citadel::reasonToString(e.res.reason) +
            " rounds=" + std::to_string(e.res.rounds), config_.verbose);
    }
    return 0;
}

bool Simulator::loadCompetitionAgents(AgentRegistrar& reg) {
    DEBUG_PRINT("PLUGINLOADER", "loadCompetitionAgents",
        "Loading agent plugins from '" + config_.agents_folder + "'", config_.verbose);

    std::vector<std::string> paths;
    for (auto& e : fs::directory_iterator(config_.agents_folder)) {
        if (e.path().extension() == ".so") paths.push_back(e.path().string());
    }
    std::sort(paths.begin(), paths.end());
    for (const auto& path : paths) {
        loadSingleAgent(reg, path, false);   // a broken plugin only drops out of the table
    }
    return loadedAgents_ >= 2;
}

std::vector<LoadedMap> Simulator::preloadMaps() const {
    std::vector<std::string> files;
    for (auto& e : fs::directory_iterator(config_.game_maps_folder)) {
        if (e.is_regular_file()) files.push_back(e.path().string());
    }
    std::sort(files.begin(), files.end());

    std::vector<LoadedMap> maps;
    for (const auto& path : files) {
        try {
            maps.push_back(LoadedMap{ path, MapLoader::loadFromFile(path) });
        } catch (const std::exception& ex) {
            WARN_PRINT("SIMULATOR", "preloadMaps", "Skipping map: " + std::string(ex.what()));
            ErrorLogger::instance().log("Skipping map " + path + ": " + ex.what());
        }
    }
    return maps;
}

void Simulator::enqueueCompetitionTasks(const std::vector<LoadedMap>& maps) {
    const size_t totalGames = maps.size() * loadedAgents_ * (loadedAgents_ - 1);
    INFO_PRINT("THREADPOOL", "enqueueCompetitionTasks",
        "Starting execution of " + std::to_string(totalGames) + " total games with " +
        std::to_string(config_.numThreads) + " threads");

    for (const auto& lm : maps) {
        for (size_t i = 0; i < loadedAgents_; ++i) {
            for (size_t j = 0; j < loadedAgents_; ++j) {
                if (i == j) continue;
                threadPool_->enqueue([this, &lm, i, j] {
                    executeCompetitionGame(lm, i, j);
                });
            }
        }
    }
}

void Simulator::executeCompetitionGame(const LoadedMap& lm, size_t i, size_t j) {
    const std::string a1 = stripSoExtension(validAgentPaths_[i]);
    const std::string a2 = stripSoExtension(validAgentPaths_[j]);
    try {
        GameResult gr = playGame(lm.map, lm.path, i, j, "");
        std::lock_guard<std::mutex> lock(resultsMutex_);
        results_.emplace_back(lm.path, a1, a2, std::move(gr));
        totalGamesPlayed_++;
    } catch (const std::exception& ex) {
        ErrorLogger::instance().logMatchError(lm.path, a1, a2, ex.what());
    } catch (...) {
        ErrorLogger::instance().logMatchError(lm.path, a1, a2, "non-standard exception");
    }
}

void Simulator::finalizeTaskExecution() {
    INFO_PRINT("THREADPOOL", "finalizeTaskExecution", "All tasks enqueued, waiting for completion");
    threadPool_->shutdown();
}

GameResult Simulator::playGame(const Citadel::WorldMap& map, const std::string& mapFile,
                               size_t blueIndex, size_t redIndex,
                               const std::string& replayPath) const {
    const auto& reg = AgentRegistrar::get();
    Citadel::GameManager gm(config_.game);
    return gm.run(map, mapFile,
                  reg.at(blueIndex).factory, stripSoExtension(validAgentPaths_[blueIndex]),
                  reg.at(redIndex).factory,  stripSoExtension(validAgentPaths_[redIndex]),
                  replayPath);
}

// ——————————————————————————————————————————————————————
// Agent plugin loading
// ——————————————————————————————————————————————————————
bool Simulator::loadSingleAgent(AgentRegistrar& reg, const std::string& path, bool failOnError) {
    std::string name = stripSoExtension(path);
    DEBUG_PRINT("PLUGINLOADER", "loadSingleAgent", "Loading agent: " + path, config_.verbose);

    if (!createAgentEntry(reg, name)) {
        return false;
    }

    void* handle = loadAgentLibrary(reg, path, name, failOnError);
    if (!handle) {
        return false;
    }

    if (!validateAgentRegistration(reg, name, handle, failOnError)) {
        return false;
    }

    finalizeAgentLoad(handle, path, name);
    return true;
}

bool Simulator::createAgentEntry(AgentRegistrar& reg, const std::string& name) {
    if (name.empty()) {
        std::string errorMsg = "Agent plugin has an empty name";
        ERROR_PRINT("PLUGINLOADER", "createAgentEntry", errorMsg);
        ErrorLogger::instance().log(errorMsg);
        return false;
    }
    reg.createAgentEntry(name);
    return true;
}

void* Simulator::loadAgentLibrary(AgentRegistrar& reg, const std::string& path,
                                  const std::string& name, bool failOnError) {
    void* handle = dlopen(path.c_str(), RTLD_NOW);

    if (!handle) {
        const char* dlerr = dlerror();
        std::string errorMsg = "dlopen failed for agent '" + name + "': " + std::string(dlerr ? dlerr : "unknown");

        if (failOnError) {
            ERROR_PRINT("PLUGINLOADER", "loadAgentLibrary", errorMsg);
        } else {
            WARN_PRINT("PLUGINLOADER", "loadAgentLibrary", errorMsg);
        }
        ErrorLogger::instance().log(errorMsg);
        reg.removeLast();
    }

    return handle;
}

bool Simulator::validateAgentRegistration(AgentRegistrar& reg, const std::string& name,
                                          void* handle, bool failOnError) {
    try {
        reg.validateLastRegistration();
        return true;
    } catch (const AgentRegistrar::BadRegistrationException& e) {
        std::string errorMsg = "Registration validation failed for agent '" + name + "'" +
            (e.hasFactory ? "" : ": no REGISTER_CITADEL_AGENT factory") +
            (e.factoryCount > 1 ? ": " + std::to_string(e.factoryCount) + " agents registered by one library" : "") +
            (e.hasName ? "" : ": missing name");
        handleValidationError(errorMsg, reg, handle, failOnError);
        return false;
    }
}

void Simulator::handleValidationError(const std::string& errorMsg, AgentRegistrar& reg,
                                      void* handle, bool failOnError) {
    if (failOnError) {
        ERROR_PRINT("PLUGINLOADER", "validateAgentRegistration", errorMsg);
    } else {
        WARN_PRINT("PLUGINLOADER", "validateAgentRegistration", errorMsg);
    }
    ErrorLogger::instance().log(errorMsg);
    reg.removeLast();
    dlclose(handle);
}

void Simulator::finalizeAgentLoad(void* handle, const std::string& path, const std::string& name) {
    DEBUG_PRINT("PLUGINLOADER", "finalizeAgentLoad",
        "Agent '" + name + "' loaded and validated successfully", config_.verbose);
    agentHandles_.push_back(handle);
    validAgentPaths_.push_back(path);
    loadedAgents_++;
}

// ——————————————————————————————————————————————————————
// Standings
// ——————————————————————————————————————————————————————
std::map<std::string, int> Simulator::calculateScores(const std::vector<MatchEntry>& results) {
    std::map<std::string, int> scores;
    for (const auto& entry : results) {
        scores.try_emplace(entry.a1, 0);
        scores.try_emplace(entry.a2, 0);

        if (!entry.res.winner) {
            scores[entry.a1] += 1;
            scores[entry.a2] += 1;
        } else if (*entry.res.winner == Team::BLUE) {
            scores[entry.a1] += 3;
        } else {
            scores[entry.a2] += 3;
        }
    }
    return scores;
}

std::vector<std::pair<std::string, int>> Simulator::sortScoresByDescending(
    const std::map<std::string, int>& scores) {
    std::vector<std::pair<std::string, int>> sorted(scores.begin(), scores.end());
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const auto& L, const auto& R) { return L.second > R.second; });
    return sorted;
}

bool Simulator::writeCompetitionFile(const std::vector<MatchEntry>& results) const {
    INFO_PRINT("FILEWRITER", "writeCompetitionFile", "Writing competition results file");

    auto sorted = sortScoresByDescending(calculateScores(results));
    if (writeToFile(buildOutputPath(), sorted)) return true;

    writeContent(std::cout, sorted);
    return false;
}

fs::path Simulator::buildOutputPath() const {
    return fs::path(config_.agents_folder) / ("competition_" + currentTimestamp() + ".txt");
}

bool Simulator::writeToFile(const fs::path& outPath,
                            const std::vector<std::pair<std::string, int>>& sorted) const {
    std::ofstream ofs(outPath);
    if (!ofs.is_open()) {
        std::string warnMsg = "Cannot create file " + outPath.string() + ", falling back to stdout";
        WARN_PRINT("FILEWRITER", "writeCompetitionFile", warnMsg);
        ErrorLogger::instance().log(warnMsg);
        return false;
    }

    INFO_PRINT("FILEWRITER", "writeCompetitionFile", "Writing to file: " + outPath.string());
    writeContent(ofs, sorted);
    return true;
}

void Simulator::writeContent(std::ostream& os,
                             const std::vector<std::pair<std::string, int>>& sorted) const {
    os << "game_maps_folder=" << config_.game_maps_folder << "\n";
    os << "agents_folder=" << config_.agents_folder << "\n\n";
    for (const auto& p : sorted) {
        os << p.first << " " << p.second << "\n";
    }
}

std::string Simulator::defaultReplayPath() const {
    return "replay_" + baseName(config_.game_map) + "_" + stripSoExtension(config_.agent1) +
           "_vs_" + stripSoExtension(config_.agent2) + "_" + currentTimestamp() + ".json";
}

// ——————————————————————————————————————————————————————
// Utility
// ——————————————————————————————————————————————————————
std::string Simulator::baseName(const std::string& path) const {
    std::string name = path;
    size_t last_slash = name.find_last_of("/\\");
    if (last_slash != std::string::npos) name = name.substr(last_slash + 1);
    size_t last_dot = name.find_last_of('.');
    if (last_dot != std::string::npos) name = name.substr(0, last_dot);
    return name;
}

std::string Simulator::stripSoExtension(const std::string& path) const {
    auto fname = fs::path(path).filename().string();
    if (auto pos = fname.rfind(".so"); pos != std::string::npos) {
        return fname.substr(0, pos);
    }
    return fname;
}

std::string Simulator::currentTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return ss.str();
}

// Plugin handles stay open: a thread abandoned after a timeout may still be
// running code from its library.
void Simulator::cleanup() {
    DEBUG_PRINT("SIMULATOR", "cleanup", "Clearing agent registrar", config_.verbose);
    if (threadPool_) threadPool_->shutdown();
    AgentRegistrar::get().clear();
    agentHandles_.clear();
}

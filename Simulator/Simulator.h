#pragma once

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <mutex>
#include <filesystem>
namespace fs = std::filesystem;

#include "ArgParser.h"
#include "AgentRegistrar.h"
#include "GameResult.h"
#include "WorldMap.h"

class ThreadPool;

// One finished game: agent1 played BLUE, agent2 played RED.
struct MatchEntry {
    std::string        mapFile;
    std::string        a1, a2;
    Citadel::GameResult res;

    MatchEntry(std::string m, std::string x, std::string y, Citadel::GameResult r);
};

struct LoadedMap {
    std::string       path;
    Citadel::WorldMap map;
};

class Simulator {
public:
    explicit Simulator(const Config& config);
    ~Simulator();

    int run();

    int runMatch();
    int runCompetition();

    const Config& getConfig() const { return config_; }

    size_t getTotalGamesPlayed() const { return totalGamesPlayed_; }
    size_t getSuccessfullyLoadedAgents() const { return loadedAgents_; }

    // Scoring: 3 for a win, 1 each for a draw.
    static std::map<std::string, int> calculateScores(const std::vector<MatchEntry>& results);
    static std::vector<std::pair<std::string, int>> sortScoresByDescending(const std::map<std::string, int>& scores);

private:
    // Agent plugin loading
    bool loadMatchAgents(AgentRegistrar& reg);
    bool loadCompetitionAgents(AgentRegistrar& reg);
    bool loadSingleAgent(AgentRegistrar& reg, const std::string& path, bool failOnError);
    bool createAgentEntry(AgentRegistrar& reg, const std::string& name);
    void* loadAgentLibrary(AgentRegistrar& reg, const std::string& path, const std::string& name, bool failOnError);
    bool validateAgentRegistration(AgentRegistrar& reg, const std::string& name, void* handle, bool failOnError);
    void handleValidationError(const std::string& errorMsg, AgentRegistrar& reg, void* handle, bool failOnError);
    void finalizeAgentLoad(void* handle, const std::string& path, const std::string& name);

    // Competition dispatch
    std::vector<LoadedMap> preloadMaps() const;
    void enqueueCompetitionTasks(const std::vector<LoadedMap>& maps);
    void executeCompetitionGame(const LoadedMap& lm, size_t i, size_t j);
    void finalizeTaskExecution();

    Citadel::GameResult playGame(const Citadel::WorldMap& map, const std::string& mapFile,
                                 size_t blueIndex, size_t redIndex,
                                 const std::string& replayPath) const;

    // Output
    bool writeCompetitionFile(const std::vector<MatchEntry>& results) const;
    fs::path buildOutputPath() const;
    bool writeToFile(const fs::path& outPath, const std::vector<std::pair<std::string, int>>& sorted) const;
    void writeContent(std::ostream& os, const std::vector<std::pair<std::string, int>>& sorted) const;
    std::string defaultReplayPath() const;

    // Utility
    std::string baseName(const std::string& path) const;
    std::string stripSoExtension(const std::string& path) const;
    std::string currentTimestamp() const;
    void cleanup();

    Config config_;
    std::unique_ptr<ThreadPool> threadPool_;

    size_t totalGamesPlayed_ = 0;
    size_t loadedAgents_ = 0;

    std::vector<void*>       agentHandles_;
    std::vector<std::string> validAgentPaths_;

    mutable std::mutex      resultsMutex_;
    std::vector<MatchEntry> results_;
};

#pragma once

#include <Agent.h>
#include "GameConfig.h"
#include "GameResult.h"
#include "GameWorld.h"
#include "ReplayRecorder.h"
#include "TurnScheduler.h"
#include "WorldMap.h"

#include <fstream>
#include <memory>
#include <string>

namespace Citadel {

/// Runs one match end to end and hands back the result with its replay.
class GameManager {
public:
    explicit GameManager(GameConfig config);
    ~GameManager() = default;

    /// Throws std::invalid_argument when the map cannot host both castles
    /// (after recording the error in the ErrorLogger). An empty replayPath
    /// skips writing the replay file.
    GameResult run(const WorldMap& map,
                   const std::string& mapName,
                   const AgentFactory& blueFactory,
                   const std::string& blueName,
                   const AgentFactory& redFactory,
                   const std::string& redName,
                   const std::string& replayPath = "");

private:
    void prepareLog(const std::string& mapName, const std::string& blueName, const std::string& redName);
    void initializeGame(const WorldMap& map,
                        const std::string& mapName,
                        const AgentFactory& blueFactory,
                        const std::string& blueName,
                        const AgentFactory& redFactory,
                        const std::string& redName);
    std::shared_ptr<Agent> buildAgent(const AgentFactory& factory, Team team,
                                      const std::string& name, const MapSnapshot& map);
    void gameLoop();
    GameResult finalize();
    GameResult finalizeInitFailure();
    void writeReplay(const std::string& replayPath);
    void closeLog(const std::string& finalLine);

    GameConfig                       config_;
    bool                             verbose_;
    std::shared_ptr<GameWorld>       world_;
    std::unique_ptr<ReplayRecorder>  replay_;
    std::unique_ptr<TurnScheduler>   scheduler_;
    std::shared_ptr<Agent>           blueAgent_;
    std::shared_ptr<Agent>           redAgent_;
    std::ofstream                    log_file_;
};

} // namespace Citadel

#include "GameManager.h"

#include "DebugLog.h"
#include "ErrorLogger.h"

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace Citadel;

namespace {

// ---------- small utils ----------
std::string baseName(const std::string& path) {
    std::string name = path;
    size_t last_slash = name.find_last_of("/\\");
    if (last_slash != std::string::npos) name = name.substr(last_slash + 1);
    size_t last_dot = name.find_last_of('.');
    if (last_dot != std::string::npos) name = name.substr(0, last_dot);
    return name;
}

std::string nowStamp() {
    auto t = std::time(nullptr);
    std::tm tm;
    localtime_r(&t, &tm);
    std::ostringstream ts;
    ts << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return ts.str();
}

std::string buildLogFilename(const std::string& map,
                             const std::string& blue,
                             const std::string& red) {
    std::ostringstream fn;
    fn << "log_" << baseName(map) << "_" << baseName(blue)
       << "_vs_" << baseName(red) << "_" << nowStamp() << ".txt";
    return fn.str();
}

std::string summarizeGameResult(const GameResult& gr) {
    std::ostringstream os;
    os << "GameResult { "
       << "winner=" << winnerName(gr.winner)
       << ", reason=" << reasonToString(gr.reason)
       << ", rounds=" << gr.rounds
       << ", snapshots=" << (gr.replay.contains("replay") ? gr.replay["replay"].size() : 0)
       << " }";
    return os.str();
}

} // namespace

GameManager::GameManager(GameConfig config)
  : config_(config), verbose_(config.verbose)
{}

GameResult GameManager::run(const WorldMap& map,
                            const std::string& mapName,
                            const AgentFactory& blueFactory,
                            const std::string& blueName,
                            const AgentFactory& redFactory,
                            const std::string& redName,
                            const std::string& replayPath) {
    INFO_PRINT("GAMEMANAGER", "run", "Starting " + blueName + " vs " + redName + " on " + baseName(mapName));

    try {
        initializeGame(map, mapName, blueFactory, blueName, redFactory, redName);
    } catch (const std::invalid_argument& e) {
        ERROR_PRINT("GAMEMANAGER", "run", std::string("Match not run: ") + e.what());
        CitadelCommon::ErrorLogger::instance().logMatchError(mapName, blueName, redName, e.what());
        throw;
    }

    prepareLog(mapName, blueName, redName);

    GameResult result;
    if (!blueAgent_ || !redAgent_) {
        result = finalizeInitFailure();
    } else {
        gameLoop();
        result = finalize();
    }

    writeReplay(replayPath);
    result.replay = replay_->document();
    DEBUG_PRINT("GAMEMANAGER", "run", summarizeGameResult(result), verbose_);
    return result;
}

void GameManager::prepareLog(const std::string& mapName,
                             const std::string& blueName,
                             const std::string& redName) {
    if (!verbose_) return;
    const std::string log_filename = buildLogFilename(mapName, blueName, redName);
    log_file_.open(log_filename);
    if (!log_file_.is_open()) {
        ERROR_PRINT("LOGMANAGER", "prepareLog", "Failed to open log file: " + log_filename);
    }
}

std::shared_ptr<Agent> GameManager::buildAgent(const AgentFactory& factory, Team team,
                                               const std::string& name, const MapSnapshot& map) {
    std::string failure;
    try {
        if (!factory) {
            failure = "no factory";
        } else if (auto agent = factory(team, map)) {
            return std::shared_ptr<Agent>(std::move(agent));
        } else {
            failure = "factory returned null";
        }
    } catch (const std::exception& e) {
        failure = std::string("constructor threw: ") + e.what();
    } catch (...) {
        failure = "constructor threw a non-standard exception";
    }

    WARN_PRINT("GAMEMANAGER", "buildAgent",
        std::string(teamName(team)) + " agent " + name + " failed to initialize: " + failure);
    CitadelCommon::ErrorLogger::instance().logAgentFault(name, teamName(team), 0, "init failed: " + failure);
    return nullptr;
}

void GameManager::initializeGame(const WorldMap& map,
                                 const std::string& mapName,
                                 const AgentFactory& blueFactory,
                                 const std::string& blueName,
                                 const AgentFactory& redFactory,
                                 const std::string& redName) {
    INFO_PRINT("GAMEMANAGER", "initializeGame", "Initializing game on " + baseName(mapName));

    world_  = std::make_shared<GameWorld>(config_, map);
    replay_ = std::make_unique<ReplayRecorder>(map);

    const MapSnapshot snapshot = map.snapshot();
    blueAgent_ = buildAgent(blueFactory, Team::BLUE, blueName, snapshot);
    redAgent_  = buildAgent(redFactory,  Team::RED,  redName,  snapshot);

    if (blueAgent_ && redAgent_) {
        scheduler_ = std::make_unique<TurnScheduler>(world_, blueAgent_, blueName, redAgent_, redName, *replay_);
    }
    DEBUG_PRINT("GAMEMANAGER", "initializeGame", "World ready", verbose_);
}

void GameManager::gameLoop() {
    INFO_PRINT("GAMEMANAGER", "gameLoop", "Entering game loop");
    while (!scheduler_->isGameOver()) {
        std::string summary = scheduler_->advanceOneTurn();
        if (verbose_ && log_file_.is_open()) {
            log_file_ << summary << "\n";
            log_file_.flush();
        }
    }
    INFO_PRINT("GAMEMANAGER", "gameLoop", "Game loop completed");
}

GameResult GameManager::finalize() {
    DEBUG_PRINT("GAMEMANAGER", "finalize", "Finalizing game result", verbose_);

    GameResult gr;
    const auto& verdict = scheduler_->getVerdict();
    if (!verdict) {
        throw std::logic_error("GameManager::finalize: game loop ended without a verdict");
    }
    gr.winner = verdict->winner;
    gr.reason = verdict->reason;
    gr.rounds = scheduler_->getCurrentTurn();

    closeLog(scheduler_->getResultString());
    return gr;
}

GameResult GameManager::finalizeInitFailure() {
    GameResult gr;
    gr.reason = GameResult::INIT_FAILURE;
    gr.rounds = 0;
    if (blueAgent_)      gr.winner = Team::BLUE;
    else if (redAgent_)  gr.winner = Team::RED;

    replay_->annotateWinner(gr.winner);

    std::string finalLine;
    if (!gr.winner) finalLine = "Draw, both agents failed to initialize";
    else            finalLine = std::string(teamName(*gr.winner)) + " won, the other agent failed to initialize";
    INFO_PRINT("GAMEMANAGER", "finalizeInitFailure", finalLine);

    closeLog(finalLine);
    return gr;
}

void GameManager::writeReplay(const std::string& replayPath) {
    if (replayPath.empty()) return;
    try {
        replay_->writeToFile(replayPath);
        INFO_PRINT("GAMEMANAGER", "writeReplay", "Replay written to " + replayPath);
    } catch (const std::runtime_error& e) {
        ERROR_PRINT("GAMEMANAGER", "writeReplay", e.what());
        CitadelCommon::ErrorLogger::instance().log(std::string("Replay not written: ") + e.what());
    }
}

void GameManager::closeLog(const std::string& finalLine) {
    if (!verbose_ || !log_file_.is_open()) return;
    if (!finalLine.empty()) log_file_ << finalLine << "\n";
    log_file_.flush();
    log_file_.close();
}

// TurnScheduler.cpp
#include "TurnScheduler.h"

#include "AgentInvoker.h"
#include "DebugLog.h"
#include "ErrorLogger.h"
#include "TeamGateway.h"

#include <iomanip>
#include <mutex>
#include <sstream>

namespace Citadel {

const char* phaseName(TurnPhase phase) {
    switch (phase) {
        case TurnPhase::UPKEEP:            return "UPKEEP";
        case TurnPhase::ACT_FIRST:         return "ACT_FIRST";
        case TurnPhase::ACT_SECOND:        return "ACT_SECOND";
        case TurnPhase::TERMINATION_CHECK: return "TERMINATION_CHECK";
        case TurnPhase::SNAPSHOT:          return "SNAPSHOT";
        case TurnPhase::GAME_OVER:         return "GAME_OVER";
    }
    return "UNKNOWN";
}

TurnScheduler::TurnScheduler(std::shared_ptr<GameWorld> world,
                             std::shared_ptr<Agent> blueAgent,
                             std::string blueName,
                             std::shared_ptr<Agent> redAgent,
                             std::string redName,
                             ReplayRecorder& replay)
  : world_(std::move(world))
  , agents_{ std::move(blueAgent), std::move(redAgent) }
  , names_{ std::move(blueName), std::move(redName) }
  , replay_(replay)
  , verbose_(world_->config().verbose)
{}

std::string TurnScheduler::getResultString() const {
    if (!verdict_) return "";
    std::ostringstream os;
    os << teamName(verdict_->winner) << " (" << names_[teamIndex(verdict_->winner)] << ") won by "
       << reasonToString(verdict_->reason) << " after " << world_->getTurn() << " turns";
    return os.str();
}

std::string TurnScheduler::advanceOneTurn() {
    if (isGameOver()) return "";

    phase_ = TurnPhase::UPKEEP;
    runUpkeep();
    DEBUG_PRINT("GAMELOOP", "advanceOneTurn", "Starting turn " + std::to_string(world_->getTurn()), verbose_);

    std::ostringstream line;
    line << "Turn " << world_->getTurn() << ":";

    phase_ = TurnPhase::ACT_FIRST;
    line << " " << runAgent(Team::BLUE);
    phase_ = TurnPhase::ACT_SECOND;
    line << " " << runAgent(Team::RED);

    phase_ = TurnPhase::TERMINATION_CHECK;
    {
        std::lock_guard<std::mutex> lock(world_->mutex);
        line << std::fixed << std::setprecision(2)
             << " | balance B=" << world_->ledger().getBalance(Team::BLUE)
             << " R=" << world_->ledger().getBalance(Team::RED)
             << " | castle B=" << world_->homeBaseHealth(Team::BLUE)
             << " R=" << world_->homeBaseHealth(Team::RED);
    }
    if (checkTermination()) {
        line << " | " << getResultString();
        return line.str();
    }

    phase_ = TurnPhase::SNAPSHOT;
    takeSnapshot();
    return line.str();
}

void TurnScheduler::runUpkeep() {
    std::lock_guard<std::mutex> lock(world_->mutex);
    const GameConfig& cfg = world_->config();

    world_->advanceTurnCounter();
    world_->registry().resetTurnAllowances();
    for (Team t : kAllTeams) {
        const double income = cfg.passiveIncome + cfg.farmIncome * world_->registry().farmCount(t);
        world_->ledger().credit(t, income);
        world_->setTimeRemaining(t, world_->getTimeRemaining(t) + cfg.timeIncrement);
    }
}

std::string TurnScheduler::runAgent(Team team) {
    const std::size_t idx = teamIndex(team);
    double budget;
    {
        std::lock_guard<std::mutex> lock(world_->mutex);
        budget = world_->getTimeRemaining(team);
    }

    auto gateway = std::make_shared<TeamGateway>(world_, team);
    const InvocationOutcome outcome = invokeWithBudget(agents_[idx], gateway, budget);

    std::lock_guard<std::mutex> lock(world_->mutex);
    std::ostringstream os;
    os << teamName(team);
    if (outcome.completed) {
        world_->setTimeRemaining(team, budget - outcome.elapsedSeconds);
        os << " ok(" << std::fixed << std::setprecision(3) << outcome.elapsedSeconds << "s)";
        return os.str();
    }

    world_->setTimeRemaining(team, 0.0);
    forfeited_[idx] = true;

    const std::string reason = outcome.timedOut
        ? "exceeded time pool of " + std::to_string(budget) + "s"
        : "threw: " + outcome.fault;
    WARN_PRINT("SCHEDULER", "runAgent",
        std::string(teamName(team)) + " (" + names_[idx] + ") forfeits turn " +
        std::to_string(world_->getTurn()) + " in " + phaseName(phase_) + ": " + reason);
    CitadelCommon::ErrorLogger::instance().logAgentFault(
        names_[idx], teamName(team), world_->getTurn(), reason);

    os << (outcome.timedOut ? " TIMEOUT" : " FAULT");
    return os.str();
}

bool TurnScheduler::checkTermination() {
    const bool blueOut = forfeited_[teamIndex(Team::BLUE)];
    const bool redOut  = forfeited_[teamIndex(Team::RED)];

    std::optional<Verdict> verdict;
    {
        std::lock_guard<std::mutex> lock(world_->mutex);
        const bool basesStanding = world_->isHomeBaseStanding(Team::BLUE) &&
                                   world_->isHomeBaseStanding(Team::RED);
        const std::size_t limit = world_->config().maxTurns;

        if (blueOut && redOut) {
            verdict = WinDeterminer::decide(*world_);
        } else if (!basesStanding) {
            verdict = WinDeterminer::decide(*world_);
        } else if (blueOut || redOut) {
            verdict = Verdict{ blueOut ? Team::RED : Team::BLUE, GameResult::FORFEIT };
        } else if (limit > 0 && world_->getTurn() >= limit) {
            DEBUG_PRINT("SCHEDULER", "checkTermination",
                "Turn limit " + std::to_string(limit) + " reached", verbose_);
            verdict = WinDeterminer::decide(*world_);
        }
    }

    if (!verdict) return false;
    finish(*verdict);
    return true;
}

void TurnScheduler::takeSnapshot() {
    std::lock_guard<std::mutex> lock(world_->mutex);
    replay_.recordTurn(*world_);
}

void TurnScheduler::finish(const Verdict& verdict) {
    takeSnapshot();
    replay_.annotateWinner(verdict.winner);
    verdict_ = verdict;
    phase_ = TurnPhase::GAME_OVER;
    INFO_PRINT("SCHEDULER", "finish", getResultString());
}

} // namespace Citadel

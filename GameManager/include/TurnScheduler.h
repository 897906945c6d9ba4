// TurnScheduler.h
#pragma once

#include <Agent.h>
#include "GameWorld.h"
#include "ReplayRecorder.h"
#include "WinDeterminer.h"

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace Citadel {

enum class TurnPhase {
    UPKEEP,
    ACT_FIRST,
    ACT_SECOND,
    TERMINATION_CHECK,
    SNAPSHOT,
    GAME_OVER
};

const char* phaseName(TurnPhase phase);

/// Drives one game: upkeep, BLUE, RED, termination check, snapshot, repeat.
class TurnScheduler {
public:
    TurnScheduler(std::shared_ptr<GameWorld> world,
                  std::shared_ptr<Agent> blueAgent,
                  std::string blueName,
                  std::shared_ptr<Agent> redAgent,
                  std::string redName,
                  ReplayRecorder& replay);

    // Query loop status
    bool        isGameOver() const { return phase_ == TurnPhase::GAME_OVER; }
    TurnPhase   getPhase() const { return phase_; }
    std::size_t getCurrentTurn() const { return world_->getTurn(); }
    bool        hasForfeited(Team team) const { return forfeited_[teamIndex(team)]; }

    /// Set once the game is over.
    const std::optional<Verdict>& getVerdict() const { return verdict_; }
    std::string getResultString() const;

    /// Runs one full turn and returns a one-line summary of it.
    std::string advanceOneTurn();

private:
    void runUpkeep();
    std::string runAgent(Team team);
    bool checkTermination();
    void takeSnapshot();
    void finish(const Verdict& verdict);

    std::shared_ptr<GameWorld>            world_;
    std::array<std::shared_ptr<Agent>, 2> agents_;
    std::array<std::string, 2>            names_;
    ReplayRecorder&                       replay_;
    bool                                  verbose_;

    TurnPhase              phase_ = TurnPhase::UPKEEP;
    std::array<bool, 2>    forfeited_{ false, false };
    std::optional<Verdict> verdict_;
};

} // namespace Citadel

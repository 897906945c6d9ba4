#include "WinDeterminer.h"

using namespace Citadel;

double WinDeterminer::economicValue(const GameWorld& world, Team team) {
    return world.ledger().getBalance(team) + world.registry().archetypeValue(team);
}

Verdict WinDeterminer::decide(const GameWorld& world) {
    const bool blueStanding = world.isHomeBaseStanding(Team::BLUE);
    const bool redStanding  = world.isHomeBaseStanding(Team::RED);

    if (blueStanding != redStanding) {
        return { blueStanding ? Team::BLUE : Team::RED, GameResult::HOME_BASE_DESTROYED };
    }

    const int blueHealth = world.homeBaseHealth(Team::BLUE);
    const int redHealth  = world.homeBaseHealth(Team::RED);
    if (blueHealth != redHealth) {
        return { blueHealth > redHealth ? Team::BLUE : Team::RED, GameResult::HOME_BASE_HEALTH };
    }

    const double blueValue = economicValue(world, Team::BLUE);
    const double redValue  = economicValue(world, Team::RED);
    if (blueValue != redValue) {
        return { blueValue > redValue ? Team::BLUE : Team::RED, GameResult::ECONOMIC_VALUE };
    }

    return { Team::RED, GameResult::SECOND_MOVER };
}

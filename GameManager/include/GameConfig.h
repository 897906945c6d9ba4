// GameConfig.h
#pragma once

#include <cstddef>

namespace Citadel {

/// Balancing constants for one game. Defaults match the stock ruleset.
struct GameConfig {
    // Economy
    double startingBalance      = 10.0;
    double passiveIncome        = 1.0;
    double farmIncome           = 1.0;

    // Time pools (seconds)
    double initialTimePool      = 10.0;
    double timeIncrement        = 0.01;

    // Selling
    double sellHealthFraction   = 0.75;
    double unitSellDiscount     = 0.5;
    double buildingSellDiscount = 0.5;

    // Exploration rewards
    double exploreGoldFraction  = 0.5;
    double exploreHealthFactor  = 1.5;
    int    exploreAttackBonus   = 2;
    int    exploreDefenseBonus  = 2;

    // 0 disables the turn limit.
    std::size_t maxTurns        = 1000;

    bool verbose                = false;
};

} // namespace Citadel

#pragma once

#include "GameResult.h"
#include "GameWorld.h"

namespace Citadel {

struct Verdict {
    Team               winner;
    GameResult::Reason reason;
};

/*
  Tie-break cascade, first rule that separates the sides wins:
    1. exactly one home base gone      -> the standing side
    2. home-base health (gone = 0)     -> higher
    3. balance + archetype value       -> higher
    4. otherwise                       -> RED, which moved second
*/
class WinDeterminer {
public:
    static Verdict decide(const GameWorld& world);

    static double economicValue(const GameWorld& world, Team team);
};

} // namespace Citadel

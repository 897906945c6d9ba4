#include "AgentRegistration.h"
#include "RushAgent.h"
#include "DebugLog.h"

#include <limits>
#include <string>

using namespace CitadelBots;
REGISTER_CITADEL_AGENT(RushAgent);

namespace {
constexpr bool kRushVerbose = false;
}

// ——— CTOR ——————————————————————————————————————————————————————————————
RushAgent::RushAgent(Team team, const MapSnapshot& map)
  : team_(team),
    target_(team == Team::BLUE ? map.redCastle : map.blueCastle)
{
    DEBUG_PRINT("RUSH", "constructor", std::string("Playing ") + teamName(team_) +
        ", target (" + std::to_string(target_.first) + "," + std::to_string(target_.second) + ")",
        kRushVerbose);
}

// ——— playTurn ——————————————————————————————————————————————————————————
void RushAgent::playTurn(ActionGateway& gateway) {
    spawnFromHome(gateway);

    for (const auto& unit : gateway.getUnits(team_)) {
        actWithUnit(gateway, unit);
    }
}

void RushAgent::spawnFromHome(ActionGateway& gateway) {
    const EntityId home = gateway.getHomeBaseId(team_);
    if (gateway.canSpawnUnit(UnitKind::KNIGHT, home)) {
        gateway.spawnUnit(UnitKind::KNIGHT, home);
    }
}

void RushAgent::actWithUnit(ActionGateway& gateway, const UnitInfo& unit) {
    if (attackSomething(gateway, unit)) return;
    stepTowardTarget(gateway, unit);
    // Moving may have brought the castle into range.
    if (auto moved = gateway.getUnit(unit.id)) {
        attackSomething(gateway, *moved);
    }
}

// Castle first, then the nearest enemy unit that is in range.
bool RushAgent::attackSomething(ActionGateway& gateway, const UnitInfo& unit) {
    const Team enemy = gateway.getEnemyTeam();
    const EntityId castle = gateway.getHomeBaseId(enemy);
    if (gateway.canUnitAttackBuilding(unit.id, castle)) {
        return gateway.unitAttackBuilding(unit.id, castle);
    }

    for (const auto& foe : gateway.senseUnitsWithinRadius(enemy, unit.x, unit.y, unit.attackRange)) {
        if (gateway.canUnitAttackUnit(unit.id, foe.id)) {
            return gateway.unitAttackUnit(unit.id, foe.id);
        }
    }
    return false;
}

void RushAgent::stepTowardTarget(ActionGateway& gateway, const UnitInfo& unit) {
    int bestDist = chebyshevDistance(unit.x, unit.y, target_.first, target_.second);
    Direction best = Direction::STAY;

    for (Direction d : gateway.unitPossibleMoveDirections(unit.id)) {
        auto [dx, dy] = directionDelta(d);
        int dist = chebyshevDistance(unit.x + dx, unit.y + dy, target_.first, target_.second);
        if (dist < bestDist) {
            bestDist = dist;
            best = d;
        }
    }

    if (best != Direction::STAY) {
        DEBUG_PRINT("RUSH", "stepTowardTarget", "Unit " + std::to_string(unit.id) +
            " moves " + directionName(best), kRushVerbose);
        gateway.moveUnitInDirection(unit.id, best);
    }
}

#pragma once

#include "Agent.h"
#include "ActionGateway.h"
#include "GameTypes.h"

#include <utility>

namespace CitadelBots {

// Sample agent: keeps spawning knights and sends every unit at the enemy castle.
class RushAgent : public Agent {
public:
    RushAgent(Team team, const MapSnapshot& map);
    void playTurn(ActionGateway& gateway) override;

private:
    void spawnFromHome(ActionGateway& gateway);
    void actWithUnit(ActionGateway& gateway, const UnitInfo& unit);
    bool attackSomething(ActionGateway& gateway, const UnitInfo& unit);
    void stepTowardTarget(ActionGateway& gateway, const UnitInfo& unit);

    Team                team_;
    std::pair<int, int> target_;
};

}

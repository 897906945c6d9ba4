#pragma once

#include "EntityRegistry.h"

#include <vector>

namespace Citadel {

/// What one resolved attack did. Used for logging and tests.
struct AttackReport {
    std::vector<EntityId> unitsHit;
    std::vector<EntityId> buildingsHit;
    std::vector<EntityId> killed;
    bool                  attackerDied = false;
};

/*
  Every attack is a splash centred on a cell: each enemy within the
  attacker's damage range (Chebyshev) of that cell takes the attacker's
  damage. Unit attackers then eat the defense of every enemy unit that
  survived the hit, in hit order, until one of those blows kills them.
  Building attackers only hit units and never take retaliation.
*/
class CombatResolver {
public:
    CombatResolver(EntityRegistry& registry, bool verbose);

    bool canUnitAttackPoint(EntityId attackerId, int x, int y) const;
    bool canBuildingAttackPoint(EntityId attackerId, int x, int y) const;

    /// False when refused; the world is then untouched.
    bool unitAttackPoint(EntityId attackerId, int x, int y, AttackReport* report = nullptr);
    bool buildingAttackPoint(EntityId attackerId, int x, int y, AttackReport* report = nullptr);

private:
    std::vector<EntityId> enemyUnitsAround(Team attacker, int x, int y, int radius) const;
    std::vector<EntityId> enemyBuildingsAround(Team attacker, int x, int y, int radius) const;

    EntityRegistry& registry_;
    bool            verbose_;
};

} // namespace Citadel

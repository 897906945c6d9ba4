#include "CombatResolver.h"

#include "DebugLog.h"

#include <string>

namespace Citadel {

CombatResolver::CombatResolver(EntityRegistry& registry, bool verbose)
    : registry_(registry), verbose_(verbose)
{}

std::vector<EntityId> CombatResolver::enemyUnitsAround(Team attacker, int x, int y, int radius) const {
    std::vector<EntityId> hits;
    for (const auto& [id, u] : registry_.units(oppositeTeam(attacker))) {
        if (withinChebyshev(u.getX(), u.getY(), x, y, radius)) hits.push_back(id);
    }
    return hits;
}

std::vector<EntityId> CombatResolver::enemyBuildingsAround(Team attacker, int x, int y, int radius) const {
    std::vector<EntityId> hits;
    for (const auto& [id, b] : registry_.buildings(oppositeTeam(attacker))) {
        if (withinChebyshev(b.getX(), b.getY(), x, y, radius)) hits.push_back(id);
    }
    return hits;
}

bool CombatResolver::canUnitAttackPoint(EntityId attackerId, int x, int y) const {
    const Unit* a = registry_.findUnit(attackerId);
    if (!a || !a->hasActions()) return false;
    return withinChebyshev(a->getX(), a->getY(), x, y, a->getAttackRange());
}

bool CombatResolver::canBuildingAttackPoint(EntityId attackerId, int x, int y) const {
    const Building* a = registry_.findBuilding(attackerId);
    if (!a || !a->hasActions()) return false;
    return withinChebyshev(a->getX(), a->getY(), x, y, a->getAttackRange());
}

bool CombatResolver::unitAttackPoint(EntityId attackerId, int x, int y, AttackReport* report) {
    if (!canUnitAttackPoint(attackerId, x, y)) return false;

    Unit* attacker = registry_.findUnit(attackerId);
    const Team side   = attacker->getTeam();
    const int  damage = attacker->getDamage();
    const int  radius = attacker->getDamageRange();

    const auto unitTargets     = enemyUnitsAround(side, x, y, radius);
    const auto buildingTargets = enemyBuildingsAround(side, x, y, radius);

    attacker->consumeAction();

    AttackReport local;
    AttackReport& r = report ? *report : local;
    r.unitsHit     = unitTargets;
    r.buildingsHit = buildingTargets;

    std::vector<EntityId> survivors;
    for (EntityId id : unitTargets) {
        if (registry_.damage(id, damage)) r.killed.push_back(id);
        else survivors.push_back(id);
    }
    for (EntityId id : buildingTargets) {
        if (registry_.damage(id, damage)) r.killed.push_back(id);
    }

    for (EntityId id : survivors) {
        const Unit* defender = registry_.findUnit(id);
        if (!defender) continue;
        if (registry_.damage(attackerId, defender->getDefense())) {
            r.attackerDied = true;
            break;
        }
    }

    DEBUG_PRINT("COMBAT", "unitAttackPoint",
        "unit " + std::to_string(attackerId) + " -> (" + std::to_string(x) + "," + std::to_string(y) +
        ") hit " + std::to_string(r.unitsHit.size() + r.buildingsHit.size()) +
        ", killed " + std::to_string(r.killed.size()) +
        (r.attackerDied ? ", attacker died" : ""), verbose_);
    return true;
}

bool CombatResolver::buildingAttackPoint(EntityId attackerId, int x, int y, AttackReport* report) {
    if (!canBuildingAttackPoint(attackerId, x, y)) return false;

    Building* attacker = registry_.findBuilding(attackerId);
    const int damage   = attacker->getDamage();
    const auto targets = enemyUnitsAround(attacker->getTeam(), x, y, attacker->getDamageRange());

    attacker->consumeAction();

    AttackReport local;
    AttackReport& r = report ? *report : local;
    r.unitsHit = targets;
    for (EntityId id : targets) {
        if (registry_.damage(id, damage)) r.killed.push_back(id);
    }

    DEBUG_PRINT("COMBAT", "buildingAttackPoint",
        "building " + std::to_string(attackerId) + " hit " + std::to_string(r.unitsHit.size()) +
        " units, killed " + std::to_string(r.killed.size()), verbose_);
    return true;
}

} // namespace Citadel

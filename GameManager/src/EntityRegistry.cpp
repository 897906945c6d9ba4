#include "EntityRegistry.h"

#include <stdexcept>
#include <string>

namespace Citadel {

EntityRegistry::EntityRegistry(const WorldMap& map,
                               OccupancyIndex& occupancy,
                               EconomyLedger& ledger,
                               const GameConfig& config)
    : map_(map), occupancy_(occupancy), ledger_(ledger), config_(config)
{}

std::optional<EntityId> EntityRegistry::placeUnit(Team team, UnitKind kind, int x, int y) {
    if (!occupancy_.canPlaceUnit(map_, kind, x, y)) return std::nullopt;

    const EntityId id = nextId_++;
    units_[teamIndex(team)].emplace(id, Unit(id, team, kind, x, y));
    occupancy_.occupyUnit(x, y);
    return id;
}

std::optional<EntityId> EntityRegistry::placeBuilding(Team team, BuildingKind kind, int x, int y) {
    if (!occupancy_.canPlaceBuilding(map_, kind, x, y)) return std::nullopt;

    const EntityId id = nextId_++;
    buildings_[teamIndex(team)].emplace(id, Building(id, team, kind, x, y));
    occupancy_.occupyBuilding(x, y);
    return id;
}

bool EntityRegistry::damage(EntityId id, int amount) {
    if (amount < 0) {
        throw std::invalid_argument("EntityRegistry::damage: negative amount " + std::to_string(amount));
    }
    if (Unit* u = findUnit(id)) {
        if (u->takeDamage(amount) > 0) return false;
        remove(id);
        return true;
    }
    if (Building* b = findBuilding(id)) {
        if (b->takeDamage(amount) > 0) return false;
        remove(id);
        return true;
    }
    throw std::invalid_argument("EntityRegistry::damage: unknown id " + std::to_string(id));
}

bool EntityRegistry::moveUnit(EntityId id, int x, int y, int cost) {
    Unit* u = findUnit(id);
    if (!u) return false;
    occupancy_.releaseUnit(u->getX(), u->getY());
    u->moveTo(x, y, cost);
    occupancy_.occupyUnit(x, y);
    return true;
}

bool EntityRegistry::remove(EntityId id) {
    for (Team t : kAllTeams) {
        auto& us = units_[teamIndex(t)];
        if (auto it = us.find(id); it != us.end()) {
            occupancy_.releaseUnit(it->second.getX(), it->second.getY());
            us.erase(it);
            return true;
        }
        auto& bs = buildings_[teamIndex(t)];
        if (auto it = bs.find(id); it != bs.end()) {
            occupancy_.releaseBuilding(it->second.getX(), it->second.getY());
            bs.erase(it);
            return true;
        }
    }
    return false;
}

bool EntityRegistry::canSell(Team team, EntityId id) const {
    const double fraction = config_.sellHealthFraction;
    const auto& us = units_[teamIndex(team)];
    if (auto it = us.find(id); it != us.end()) {
        return it->second.getHealth() >= fraction * it->second.archetype().health;
    }
    const auto& bs = buildings_[teamIndex(team)];
    if (auto it = bs.find(id); it != bs.end()) {
        return it->second.getHealth() >= fraction * it->second.archetype().health;
    }
    return false;
}

bool EntityRegistry::sell(Team team, EntityId id) {
    if (!canSell(team, id)) return false;

    double refund = 0.0;
    if (const Unit* u = findUnit(id)) {
        refund = config_.unitSellDiscount * u->archetype().cost;
    } else if (const Building* b = findBuilding(id)) {
        refund = config_.buildingSellDiscount * b->archetype().cost;
    }
    // Only the home base has a negative cost and it is never offered for sale.
    if (refund > 0) ledger_.credit(team, refund);
    return remove(id);
}

Unit* EntityRegistry::findUnit(EntityId id) {
    for (auto& us : units_) {
        if (auto it = us.find(id); it != us.end()) return &it->second;
    }
    return nullptr;
}

const Unit* EntityRegistry::findUnit(EntityId id) const {
    for (const auto& us : units_) {
        if (auto it = us.find(id); it != us.end()) return &it->second;
    }
    return nullptr;
}

Building* EntityRegistry::findBuilding(EntityId id) {
    for (auto& bs : buildings_) {
        if (auto it = bs.find(id); it != bs.end()) return &it->second;
    }
    return nullptr;
}

const Building* EntityRegistry::findBuilding(EntityId id) const {
    for (const auto& bs : buildings_) {
        if (auto it = bs.find(id); it != bs.end()) return &it->second;
    }
    return nullptr;
}

std::optional<Team> EntityRegistry::teamOf(EntityId id) const {
    if (const Unit* u = findUnit(id)) return u->getTeam();
    if (const Building* b = findBuilding(id)) return b->getTeam();
    return std::nullopt;
}

void EntityRegistry::resetTurnAllowances() {
    for (auto& us : units_) {
        for (auto& [id, u] : us) u.resetTurnAllowance();
    }
    for (auto& bs : buildings_) {
        for (auto& [id, b] : bs) b.resetTurnAllowance();
    }
}

int EntityRegistry::farmCount(Team team) const {
    int n = 0;
    for (const auto& [id, b] : buildings_[teamIndex(team)]) {
        if (isFarm(b.getKind())) ++n;
    }
    return n;
}

double EntityRegistry::archetypeValue(Team team) const {
    double total = 0.0;
    for (const auto& [id, u] : units_[teamIndex(team)])     total += u.archetype().cost;
    for (const auto& [id, b] : buildings_[teamIndex(team)]) total += b.archetype().cost;
    return total;
}

} // namespace Citadel

// include/EntityRegistry.h
#pragma once

#include "EconomyLedger.h"
#include "Entity.h"
#include "GameConfig.h"
#include "OccupancyIndex.h"
#include "WorldMap.h"

#include <array>
#include <map>
#include <optional>
#include <vector>

namespace Citadel {

/*
  Owns every live unit and building, keyed per team by id. Units and
  buildings draw from one id counter, so an id names exactly one entity for
  the whole game and is never handed out twice.

  Every insertion, move and removal goes through here so the OccupancyIndex
  always mirrors the entity positions.
*/
class EntityRegistry {
public:
    EntityRegistry(const WorldMap& map,
                   OccupancyIndex& occupancy,
                   EconomyLedger& ledger,
                   const GameConfig& config);

    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;

    // ---- creation (nullopt when the cell is refused) ----
    std::optional<EntityId> placeUnit(Team team, UnitKind kind, int x, int y);
    std::optional<EntityId> placeBuilding(Team team, BuildingKind kind, int x, int y);

    // ---- mutation ----
    /// Throws std::invalid_argument for a negative amount or unknown id.
    /// Returns true when the entity died and was removed.
    bool damage(EntityId id, int amount);
    bool moveUnit(EntityId id, int x, int y, int cost);

    // ---- removal ----
    /// Unconditional, no refund.
    bool remove(EntityId id);
    /// Health at or above the sell fraction of the archetype maximum.
    bool canSell(Team team, EntityId id) const;
    /// Refunds the discounted archetype cost, then removes.
    bool sell(Team team, EntityId id);

    // ---- lookups ----
    Unit*           findUnit(EntityId id);
    const Unit*     findUnit(EntityId id) const;
    Building*       findBuilding(EntityId id);
    const Building* findBuilding(EntityId id) const;
    std::optional<Team> teamOf(EntityId id) const;
    bool contains(EntityId id) const { return teamOf(id).has_value(); }

    const std::map<EntityId, Unit>&     units(Team team)     const { return units_[teamIndex(team)]; }
    const std::map<EntityId, Building>& buildings(Team team) const { return buildings_[teamIndex(team)]; }

    // ---- turn bookkeeping ----
    void resetTurnAllowances();
    int  farmCount(Team team) const;
    /// Sum of archetype costs over every living unit and building of `team`.
    double archetypeValue(Team team) const;

    EntityId peekNextId() const { return nextId_; }

private:
    const WorldMap&   map_;
    OccupancyIndex&   occupancy_;
    EconomyLedger&    ledger_;
    const GameConfig& config_;

    EntityId nextId_ = 0;
    std::array<std::map<EntityId, Unit>, 2>     units_;
    std::array<std::map<EntityId, Building>, 2> buildings_;
};

} // namespace Citadel

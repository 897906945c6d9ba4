#pragma once

#include "Archetypes.h"
#include "GameTypes.h"

#include <optional>
#include <vector>

/**
 * The only door an agent has into the world. One instance is bound to one
 * team for one turn. Every mutator has a can<Action>() twin which reports
 * whether the mutator would succeed right now; a mutator that is refused
 * returns false and leaves the world untouched.
 *
 * Everything returned is a copy.
 */
class ActionGateway {
public:
    virtual ~ActionGateway() {}

    // ---- game facts ----
    virtual Team        getTeam() const = 0;
    virtual Team        getEnemyTeam() const = 0;
    virtual std::size_t getTurn() const = 0;
    virtual double      getBalance(Team team) const = 0;
    virtual double      getTimeRemaining() const = 0;
    virtual MapSnapshot getMap() const = 0;
    virtual EntityId    getHomeBaseId(Team team) const = 0;

    // ---- sensing ----
    virtual std::vector<EntityId>     getUnitIds(Team team) const = 0;
    virtual std::vector<EntityId>     getBuildingIds(Team team) const = 0;
    virtual std::vector<UnitInfo>     getUnits(Team team) const = 0;
    virtual std::vector<BuildingInfo> getBuildings(Team team) const = 0;
    virtual std::optional<UnitInfo>     getUnit(EntityId id) const = 0;
    virtual std::optional<BuildingInfo> getBuilding(EntityId id) const = 0;
    virtual std::optional<Team>         getTeamOf(EntityId id) const = 0;

    /// Units / buildings of `team` whose Chebyshev distance to (x,y) is <= radius.
    virtual std::vector<UnitInfo>     senseUnitsWithinRadius(Team team, int x, int y, int radius) const = 0;
    virtual std::vector<BuildingInfo> senseBuildingsWithinRadius(Team team, int x, int y, int radius) const = 0;

    /// [x][y] grids: true where the cell is free of units / buildings.
    virtual std::vector<std::vector<bool>> getUnitPlaceableMap() const = 0;
    virtual std::vector<std::vector<bool>> getBuildingPlaceableMap() const = 0;

    virtual std::vector<Direction> unitPossibleMoveDirections(EntityId unitId) const = 0;

    // ---- creation ----
    virtual bool canSpawnUnit(UnitKind kind, EntityId buildingId) const = 0;
    virtual bool spawnUnit(UnitKind kind, EntityId buildingId) = 0;

    virtual bool canBuildBuilding(BuildingKind kind, int x, int y) const = 0;
    virtual bool buildBuilding(BuildingKind kind, int x, int y) = 0;

    // ---- removal ----
    virtual bool canSellUnit(EntityId unitId) const = 0;
    virtual bool sellUnit(EntityId unitId) = 0;
    virtual bool canSellBuilding(EntityId buildingId) const = 0;
    virtual bool sellBuilding(EntityId buildingId) = 0;
    virtual bool canDisbandUnit(EntityId unitId) const = 0;
    virtual bool disbandUnit(EntityId unitId) = 0;
    virtual bool canDestroyBuilding(EntityId buildingId) const = 0;
    virtual bool destroyBuilding(EntityId buildingId) = 0;

    // ---- movement ----
    virtual bool canMoveUnitInDirection(EntityId unitId, Direction direction) const = 0;
    virtual bool moveUnitInDirection(EntityId unitId, Direction direction) = 0;

    // ---- combat ----
    virtual bool canUnitAttackUnit(EntityId attackerId, EntityId targetUnitId) const = 0;
    virtual bool unitAttackUnit(EntityId attackerId, EntityId targetUnitId) = 0;
    virtual bool canUnitAttackBuilding(EntityId attackerId, EntityId targetBuildingId) const = 0;
    virtual bool unitAttackBuilding(EntityId attackerId, EntityId targetBuildingId) = 0;
    virtual bool canUnitAttackLocation(EntityId attackerId, int x, int y) const = 0;
    virtual bool unitAttackLocation(EntityId attackerId, int x, int y) = 0;
    virtual bool canBuildingAttackUnit(EntityId buildingId, EntityId targetUnitId) const = 0;
    virtual bool buildingAttackUnit(EntityId buildingId, EntityId targetUnitId) = 0;
    virtual bool canBuildingAttackLocation(EntityId buildingId, int x, int y) const = 0;
    virtual bool buildingAttackLocation(EntityId buildingId, int x, int y) = 0;

    // ---- support ----
    virtual bool canHealUnit(EntityId healerId, EntityId targetUnitId) const = 0;
    virtual bool healUnit(EntityId healerId, EntityId targetUnitId) = 0;

    virtual bool canBuildBridge(EntityId engineerId) const = 0;
    virtual bool buildBridge(EntityId engineerId) = 0;

    /// Explorer standing on an explorer building. The targeted variants also
    /// need a living ally other than the explorer.
    virtual bool canExplore(EntityId explorerId, EntityId buildingId) const = 0;
    virtual bool canExploreWithTarget(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) const = 0;
    virtual bool exploreForGold(EntityId explorerId, EntityId buildingId) = 0;
    virtual bool exploreForHealth(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) = 0;
    virtual bool exploreForAttack(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) = 0;
    virtual bool exploreForDefense(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) = 0;
};

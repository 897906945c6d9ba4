// TeamGateway.h
#pragma once

#include <ActionGateway.h>
#include "GameWorld.h"

#include <memory>
#include <mutex>

namespace Citadel {

/*
  ActionGateway bound to one team for one agent invocation.

  Each call takes the world mutex, so a call is atomic with respect to the
  scheduler and to an abandoned agent thread. revoke() closes the gateway
  under that same lock; every call after it is refused (mutators return
  false, queries return empty results).
*/
class TeamGateway : public ActionGateway {
public:
    TeamGateway(std::shared_ptr<GameWorld> world, Team team);
    ~TeamGateway() override = default;

    void revoke();
    bool isOpen() const;

    // ---- game facts ----
    Team        getTeam() const override { return team_; }
    Team        getEnemyTeam() const override { return oppositeTeam(team_); }
    std::size_t getTurn() const override;
    double      getBalance(Team team) const override;
    double      getTimeRemaining() const override;
    MapSnapshot getMap() const override;
    EntityId    getHomeBaseId(Team team) const override;

    // ---- sensing ----
    std::vector<EntityId>     getUnitIds(Team team) const override;
    std::vector<EntityId>     getBuildingIds(Team team) const override;
    std::vector<UnitInfo>     getUnits(Team team) const override;
    std::vector<BuildingInfo> getBuildings(Team team) const override;
    std::optional<UnitInfo>     getUnit(EntityId id) const override;
    std::optional<BuildingInfo> getBuilding(EntityId id) const override;
    std::optional<Team>         getTeamOf(EntityId id) const override;
    std::vector<UnitInfo>     senseUnitsWithinRadius(Team team, int x, int y, int radius) const override;
    std::vector<BuildingInfo> senseBuildingsWithinRadius(Team team, int x, int y, int radius) const override;
    std::vector<std::vector<bool>> getUnitPlaceableMap() const override;
    std::vector<std::vector<bool>> getBuildingPlaceableMap() const override;
    std::vector<Direction> unitPossibleMoveDirections(EntityId unitId) const override;

    // ---- creation ----
    bool canSpawnUnit(UnitKind kind, EntityId buildingId) const override;
    bool spawnUnit(UnitKind kind, EntityId buildingId) override;
    bool canBuildBuilding(BuildingKind kind, int x, int y) const override;
    bool buildBuilding(BuildingKind kind, int x, int y) override;

    // ---- removal ----
    bool canSellUnit(EntityId unitId) const override;
    bool sellUnit(EntityId unitId) override;
    bool canSellBuilding(EntityId buildingId) const override;
    bool sellBuilding(EntityId buildingId) override;
    bool canDisbandUnit(EntityId unitId) const override;
    bool disbandUnit(EntityId unitId) override;
    bool canDestroyBuilding(EntityId buildingId) const override;
    bool destroyBuilding(EntityId buildingId) override;

    // ---- movement ----
    bool canMoveUnitInDirection(EntityId unitId, Direction direction) const override;
    bool moveUnitInDirection(EntityId unitId, Direction direction) override;

    // ---- combat ----
    bool canUnitAttackUnit(EntityId attackerId, EntityId targetUnitId) const override;
    bool unitAttackUnit(EntityId attackerId, EntityId targetUnitId) override;
    bool canUnitAttackBuilding(EntityId attackerId, EntityId targetBuildingId) const override;
    bool unitAttackBuilding(EntityId attackerId, EntityId targetBuildingId) override;
    bool canUnitAttackLocation(EntityId attackerId, int x, int y) const override;
    bool unitAttackLocation(EntityId attackerId, int x, int y) override;
    bool canBuildingAttackUnit(EntityId buildingId, EntityId targetUnitId) const override;
    bool buildingAttackUnit(EntityId buildingId, EntityId targetUnitId) override;
    bool canBuildingAttackLocation(EntityId buildingId, int x, int y) const override;
    bool buildingAttackLocation(EntityId buildingId, int x, int y) override;

    // ---- support ----
    bool canHealUnit(EntityId healerId, EntityId targetUnitId) const override;
    bool healUnit(EntityId healerId, EntityId targetUnitId) override;
    bool canBuildBridge(EntityId engineerId) const override;
    bool buildBridge(EntityId engineerId) override;
    bool canExplore(EntityId explorerId, EntityId buildingId) const override;
    bool canExploreWithTarget(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) const override;
    bool exploreForGold(EntityId explorerId, EntityId buildingId) override;
    bool exploreForHealth(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) override;
    bool exploreForAttack(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) override;
    bool exploreForDefense(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) override;

private:
    // Checks below assume the world mutex is held.
    const Unit*     ownUnit(EntityId id) const;
    const Building* ownBuilding(EntityId id) const;
    const Unit*     enemyUnit(EntityId id) const;
    const Building* enemyBuilding(EntityId id) const;

    bool checkSpawn(UnitKind kind, EntityId buildingId) const;
    bool checkBuild(BuildingKind kind, int x, int y) const;
    bool checkSellUnit(EntityId unitId) const;
    bool checkSellBuilding(EntityId buildingId) const;
    bool checkDestroyBuilding(EntityId buildingId) const;
    bool checkMove(EntityId unitId, Direction direction) const;
    bool checkUnitAttackUnit(EntityId attackerId, EntityId targetUnitId) const;
    bool checkUnitAttackBuilding(EntityId attackerId, EntityId targetBuildingId) const;
    bool checkUnitAttackLocation(EntityId attackerId, int x, int y) const;
    bool checkBuildingAttackUnit(EntityId buildingId, EntityId targetUnitId) const;
    bool checkBuildingAttackLocation(EntityId buildingId, int x, int y) const;
    bool checkHeal(EntityId healerId, EntityId targetUnitId) const;
    bool checkBridge(EntityId engineerId) const;
    bool checkExplore(EntityId explorerId, EntityId buildingId) const;
    bool checkExploreTarget(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) const;

    /// Disbands the explorer and returns the target to buff, or nullptr.
    Unit* beginTargetedExplore(EntityId explorerId, EntityId buildingId, EntityId targetUnitId,
                               const char* function);

    bool refuse(const char* function, const std::string& why) const;

    std::unique_lock<std::mutex> acquire() const { return std::unique_lock<std::mutex>(world_->mutex); }

    std::shared_ptr<GameWorld> world_;
    Team                       team_;
    bool                       open_ = true;
    bool                       verbose_;
};

} // namespace Citadel

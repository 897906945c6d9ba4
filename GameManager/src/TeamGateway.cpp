#include "TeamGateway.h"

#include "DebugLog.h"

#include <cmath>
#include <string>

namespace Citadel {

namespace {
std::string cell(int x, int y) {
    return "(" + std::to_string(x) + "," + std::to_string(y) + ")";
}
} // namespace

TeamGateway::TeamGateway(std::shared_ptr<GameWorld> world, Team team)
    : world_(std::move(world)), team_(team), verbose_(world_->config().verbose)
{}

void TeamGateway::revoke() {
    auto lock = acquire();
    open_ = false;
}

bool TeamGateway::isOpen() const {
    auto lock = acquire();
    return open_;
}

bool TeamGateway::refuse(const char* function, const std::string& why) const {
    DEBUG_PRINT("GATEWAY", function, std::string(teamName(team_)) + " refused: " + why, verbose_);
    return false;
}

// ——————————————————————————————————————————————————————
// Ownership helpers
// ——————————————————————————————————————————————————————
const Unit* TeamGateway::ownUnit(EntityId id) const {
    const auto& us = world_->registry().units(team_);
    auto it = us.find(id);
    return it == us.end() ? nullptr : &it->second;
}

const Building* TeamGateway::ownBuilding(EntityId id) const {
    const auto& bs = world_->registry().buildings(team_);
    auto it = bs.find(id);
    return it == bs.end() ? nullptr : &it->second;
}

const Unit* TeamGateway::enemyUnit(EntityId id) const {
    const auto& us = world_->registry().units(oppositeTeam(team_));
    auto it = us.find(id);
    return it == us.end() ? nullptr : &it->second;
}

const Building* TeamGateway::enemyBuilding(EntityId id) const {
    const auto& bs = world_->registry().buildings(oppositeTeam(team_));
    auto it = bs.find(id);
    return it == bs.end() ? nullptr : &it->second;
}

// ——————————————————————————————————————————————————————
// Game facts
// ——————————————————————————————————————————————————————
std::size_t TeamGateway::getTurn() const {
    auto lock = acquire();
    return world_->getTurn();
}

double TeamGateway::getBalance(Team team) const {
    auto lock = acquire();
    return (open_ && isValidTeam(team)) ? world_->ledger().getBalance(team) : 0.0;
}

double TeamGateway::getTimeRemaining() const {
    auto lock = acquire();
    return open_ ? world_->getTimeRemaining(team_) : 0.0;
}

MapSnapshot TeamGateway::getMap() const {
    auto lock = acquire();
    return world_->map().snapshot();
}

EntityId TeamGateway::getHomeBaseId(Team team) const {
    auto lock = acquire();
    return isValidTeam(team) ? world_->getHomeBaseId(team) : -1;
}

// ——————————————————————————————————————————————————————
// Sensing
// ——————————————————————————————————————————————————————
std::vector<EntityId> TeamGateway::getUnitIds(Team team) const {
    auto lock = acquire();
    std::vector<EntityId> ids;
    if (!open_ || !isValidTeam(team)) return ids;
    for (const auto& [id, u] : world_->registry().units(team)) ids.push_back(id);
    return ids;
}

std::vector<EntityId> TeamGateway::getBuildingIds(Team team) const {
    auto lock = acquire();
    std::vector<EntityId> ids;
    if (!open_ || !isValidTeam(team)) return ids;
    for (const auto& [id, b] : world_->registry().buildings(team)) ids.push_back(id);
    return ids;
}

std::vector<UnitInfo> TeamGateway::getUnits(Team team) const {
    auto lock = acquire();
    std::vector<UnitInfo> out;
    if (!open_ || !isValidTeam(team)) return out;
    for (const auto& [id, u] : world_->registry().units(team)) out.push_back(u.info());
    return out;
}

std::vector<BuildingInfo> TeamGateway::getBuildings(Team team) const {
    auto lock = acquire();
    std::vector<BuildingInfo> out;
    if (!open_ || !isValidTeam(team)) return out;
    for (const auto& [id, b] : world_->registry().buildings(team)) out.push_back(b.info());
    return out;
}

std::optional<UnitInfo> TeamGateway::getUnit(EntityId id) const {
    auto lock = acquire();
    if (!open_) return std::nullopt;
    const Unit* u = world_->registry().findUnit(id);
    if (!u) return std::nullopt;
    return u->info();
}

std::optional<BuildingInfo> TeamGateway::getBuilding(EntityId id) const {
    auto lock = acquire();
    if (!open_) return std::nullopt;
    const Building* b = world_->registry().findBuilding(id);
    if (!b) return std::nullopt;
    return b->info();
}

std::optional<Team> TeamGateway::getTeamOf(EntityId id) const {
    auto lock = acquire();
    if (!open_) return std::nullopt;
    return world_->registry().teamOf(id);
}

std::vector<UnitInfo> TeamGateway::senseUnitsWithinRadius(Team team, int x, int y, int radius) const {
    auto lock = acquire();
    std::vector<UnitInfo> out;
    if (!open_ || !isValidTeam(team)) return out;
    for (const auto& [id, u] : world_->registry().units(team)) {
        if (withinChebyshev(u.getX(), u.getY(), x, y, radius)) out.push_back(u.info());
    }
    return out;
}

std::vector<BuildingInfo> TeamGateway::senseBuildingsWithinRadius(Team team, int x, int y, int radius) const {
    auto lock = acquire();
    std::vector<BuildingInfo> out;
    if (!open_ || !isValidTeam(team)) return out;
    for (const auto& [id, b] : world_->registry().buildings(team)) {
        if (withinChebyshev(b.getX(), b.getY(), x, y, radius)) out.push_back(b.info());
    }
    return out;
}

std::vector<std::vector<bool>> TeamGateway::getUnitPlaceableMap() const {
    auto lock = acquire();
    if (!open_) return {};
    return world_->occupancy().unitFreeGrid();
}

std::vector<std::vector<bool>> TeamGateway::getBuildingPlaceableMap() const {
    auto lock = acquire();
    if (!open_) return {};
    return world_->occupancy().buildingFreeGrid();
}

std::vector<Direction> TeamGateway::unitPossibleMoveDirections(EntityId unitId) const {
    auto lock = acquire();
    std::vector<Direction> dirs;
    if (!open_) return dirs;
    for (Direction d : kAllDirections) {
        if (checkMove(unitId, d)) dirs.push_back(d);
    }
    return dirs;
}

// ——————————————————————————————————————————————————————
// Creation
// ——————————————————————————————————————————————————————
bool TeamGateway::checkSpawn(UnitKind kind, EntityId buildingId) const {
    const UnitArchetype* a = findUnitArchetype(kind);
    const Building* b = ownBuilding(buildingId);
    if (!a || !b || !b->archetype().spawnCapable) return false;

    if (!a->canSpawnFrom(b->getKind())) return false;
    if (!world_->occupancy().canPlaceUnit(world_->map(), kind, b->getX(), b->getY())) return false;
    return world_->ledger().canAfford(team_, a->cost);
}

bool TeamGateway::canSpawnUnit(UnitKind kind, EntityId buildingId) const {
    auto lock = acquire();
    return open_ && checkSpawn(kind, buildingId);
}

bool TeamGateway::spawnUnit(UnitKind kind, EntityId buildingId) {
    auto lock = acquire();
    if (!open_ || !checkSpawn(kind, buildingId)) {
        return refuse("spawnUnit", std::string(unitKindName(kind)) + " from building " + std::to_string(buildingId));
    }
    const Building* b = ownBuilding(buildingId);
    auto id = world_->registry().placeUnit(team_, kind, b->getX(), b->getY());
    if (!id) return refuse("spawnUnit", "cell taken at " + cell(b->getX(), b->getY()));
    world_->ledger().debit(team_, unitArchetype(kind).cost);

    DEBUG_PRINT("GATEWAY", "spawnUnit", std::string(teamName(team_)) + " spawned " + unitKindName(kind) +
        " #" + std::to_string(*id) + " at " + cell(b->getX(), b->getY()), verbose_);
    return true;
}

bool TeamGateway::checkBuild(BuildingKind kind, int x, int y) const {
    const BuildingArchetype* a = findBuildingArchetype(kind);
    if (!a || kind == BuildingKind::MAIN_CASTLE) return false;
    if (!world_->occupancy().canPlaceBuilding(world_->map(), kind, x, y)) return false;
    return world_->ledger().canAfford(team_, a->cost);
}

bool TeamGateway::canBuildBuilding(BuildingKind kind, int x, int y) const {
    auto lock = acquire();
    return open_ && checkBuild(kind, x, y);
}

bool TeamGateway::buildBuilding(BuildingKind kind, int x, int y) {
    auto lock = acquire();
    if (!open_ || !checkBuild(kind, x, y)) {
        return refuse("buildBuilding", std::string(buildingKindName(kind)) + " at " + cell(x, y));
    }
    auto id = world_->registry().placeBuilding(team_, kind, x, y);
    if (!id) return refuse("buildBuilding", "cell taken at " + cell(x, y));
    world_->ledger().debit(team_, buildingArchetype(kind).cost);
    return true;
}

// ——————————————————————————————————————————————————————
// Removal
// ——————————————————————————————————————————————————————
bool TeamGateway::checkSellUnit(EntityId unitId) const {
    return ownUnit(unitId) && world_->registry().canSell(team_, unitId);
}

bool TeamGateway::checkSellBuilding(EntityId buildingId) const {
    if (!ownBuilding(buildingId) || buildingId == world_->getHomeBaseId(team_)) return false;
    return world_->registry().canSell(team_, buildingId);
}

bool TeamGateway::checkDestroyBuilding(EntityId buildingId) const {
    return ownBuilding(buildingId) && buildingId != world_->getHomeBaseId(team_);
}

bool TeamGateway::canSellUnit(EntityId unitId) const {
    auto lock = acquire();
    return open_ && checkSellUnit(unitId);
}

bool TeamGateway::sellUnit(EntityId unitId) {
    auto lock = acquire();
    if (!open_ || !checkSellUnit(unitId)) return refuse("sellUnit", "unit " + std::to_string(unitId));
    return world_->registry().sell(team_, unitId);
}

bool TeamGateway::canSellBuilding(EntityId buildingId) const {
    auto lock = acquire();
    return open_ && checkSellBuilding(buildingId);
}

bool TeamGateway::sellBuilding(EntityId buildingId) {
    auto lock = acquire();
    if (!open_ || !checkSellBuilding(buildingId)) {
        return refuse("sellBuilding", "building " + std::to_string(buildingId));
    }
    return world_->registry().sell(team_, buildingId);
}

bool TeamGateway::canDisbandUnit(EntityId unitId) const {
    auto lock = acquire();
    return open_ && ownUnit(unitId) != nullptr;
}

bool TeamGateway::disbandUnit(EntityId unitId) {
    auto lock = acquire();
    if (!open_ || !ownUnit(unitId)) return refuse("disbandUnit", "unit " + std::to_string(unitId));
    return world_->registry().remove(unitId);
}

bool TeamGateway::canDestroyBuilding(EntityId buildingId) const {
    auto lock = acquire();
    return open_ && checkDestroyBuilding(buildingId);
}

bool TeamGateway::destroyBuilding(EntityId buildingId) {
    auto lock = acquire();
    if (!open_ || !checkDestroyBuilding(buildingId)) {
        return refuse("destroyBuilding", "building " + std::to_string(buildingId));
    }
    return world_->registry().remove(buildingId);
}

// ——————————————————————————————————————————————————————
// Movement
// ——————————————————————————————————————————————————————
bool TeamGateway::checkMove(EntityId unitId, Direction direction) const {
    const Unit* u = ownUnit(unitId);
    if (!u || !isValidDirection(direction)) return false;

    const auto [dx, dy] = directionDelta(direction);
    const int nx = u->getX() + dx;
    const int ny = u->getY() + dy;
    const WorldMap& map = world_->map();
    if (!map.inBounds(nx, ny)) return false;

    const Terrain dest = map.getTerrain(nx, ny);
    if (!u->archetype().canWalkOn(dest)) return false;
    if (direction != Direction::STAY && !world_->occupancy().isUnitFree(nx, ny)) return false;
    return u->getMovementRemaining() >= movementCost(dest);
}

bool TeamGateway::canMoveUnitInDirection(EntityId unitId, Direction direction) const {
    auto lock = acquire();
    return open_ && checkMove(unitId, direction);
}

bool TeamGateway::moveUnitInDirection(EntityId unitId, Direction direction) {
    auto lock = acquire();
    if (!open_ || !checkMove(unitId, direction)) {
        return refuse("moveUnitInDirection", "unit " + std::to_string(unitId) + " " + directionName(direction));
    }
    const Unit* u = ownUnit(unitId);
    const auto [dx, dy] = directionDelta(direction);
    const int nx = u->getX() + dx;
    const int ny = u->getY() + dy;
    return world_->registry().moveUnit(unitId, nx, ny, movementCost(world_->map().getTerrain(nx, ny)));
}

// ——————————————————————————————————————————————————————
// Combat
// ——————————————————————————————————————————————————————
bool TeamGateway::checkUnitAttackUnit(EntityId attackerId, EntityId targetUnitId) const {
    const Unit* a = ownUnit(attackerId);
    const Unit* t = enemyUnit(targetUnitId);
    if (!a || !t) return false;
    return world_->combat().canUnitAttackPoint(attackerId, t->getX(), t->getY());
}

bool TeamGateway::checkUnitAttackBuilding(EntityId attackerId, EntityId targetBuildingId) const {
    const Unit*     a = ownUnit(attackerId);
    const Building* t = enemyBuilding(targetBuildingId);
    if (!a || !t) return false;
    return world_->combat().canUnitAttackPoint(attackerId, t->getX(), t->getY());
}

bool TeamGateway::checkUnitAttackLocation(EntityId attackerId, int x, int y) const {
    if (!ownUnit(attackerId) || !world_->map().inBounds(x, y)) return false;
    return world_->combat().canUnitAttackPoint(attackerId, x, y);
}

bool TeamGateway::checkBuildingAttackUnit(EntityId buildingId, EntityId targetUnitId) const {
    const Building* a = ownBuilding(buildingId);
    const Unit*     t = enemyUnit(targetUnitId);
    if (!a || !t) return false;
    return world_->combat().canBuildingAttackPoint(buildingId, t->getX(), t->getY());
}

bool TeamGateway::checkBuildingAttackLocation(EntityId buildingId, int x, int y) const {
    if (!ownBuilding(buildingId) || !world_->map().inBounds(x, y)) return false;
    return world_->combat().canBuildingAttackPoint(buildingId, x, y);
}

bool TeamGateway::canUnitAttackUnit(EntityId attackerId, EntityId targetUnitId) const {
    auto lock = acquire();
    return open_ && checkUnitAttackUnit(attackerId, targetUnitId);
}

bool TeamGateway::unitAttackUnit(EntityId attackerId, EntityId targetUnitId) {
    auto lock = acquire();
    if (!open_ || !checkUnitAttackUnit(attackerId, targetUnitId)) {
        return refuse("unitAttackUnit", std::to_string(attackerId) + " -> unit " + std::to_string(targetUnitId));
    }
    const Unit* t = enemyUnit(targetUnitId);
    return world_->combat().unitAttackPoint(attackerId, t->getX(), t->getY());
}

bool TeamGateway::canUnitAttackBuilding(EntityId attackerId, EntityId targetBuildingId) const {
    auto lock = acquire();
    return open_ && checkUnitAttackBuilding(attackerId, targetBuildingId);
}

bool TeamGateway::unitAttackBuilding(EntityId attackerId, EntityId targetBuildingId) {
    auto lock = acquire();
    if (!open_ || !checkUnitAttackBuilding(attackerId, targetBuildingId)) {
        return refuse("unitAttackBuilding",
                      std::to_string(attackerId) + " -> building " + std::to_string(targetBuildingId));
    }
    const Building* t = enemyBuilding(targetBuildingId);
    return world_->combat().unitAttackPoint(attackerId, t->getX(), t->getY());
}

bool TeamGateway::canUnitAttackLocation(EntityId attackerId, int x, int y) const {
    auto lock = acquire();
    return open_ && checkUnitAttackLocation(attackerId, x, y);
}

bool TeamGateway::unitAttackLocation(EntityId attackerId, int x, int y) {
    auto lock = acquire();
    if (!open_ || !checkUnitAttackLocation(attackerId, x, y)) {
        return refuse("unitAttackLocation", std::to_string(attackerId) + " -> " + cell(x, y));
    }
    return world_->combat().unitAttackPoint(attackerId, x, y);
}

bool TeamGateway::canBuildingAttackUnit(EntityId buildingId, EntityId targetUnitId) const {
    auto lock = acquire();
    return open_ && checkBuildingAttackUnit(buildingId, targetUnitId);
}

bool TeamGateway::buildingAttackUnit(EntityId buildingId, EntityId targetUnitId) {
    auto lock = acquire();
    if (!open_ || !checkBuildingAttackUnit(buildingId, targetUnitId)) {
        return refuse("buildingAttackUnit", std::to_string(buildingId) + " -> unit " + std::to_string(targetUnitId));
    }
    const Unit* t = enemyUnit(targetUnitId);
    return world_->combat().buildingAttackPoint(buildingId, t->getX(), t->getY());
}

bool TeamGateway::canBuildingAttackLocation(EntityId buildingId, int x, int y) const {
    auto lock = acquire();
    return open_ && checkBuildingAttackLocation(buildingId, x, y);
}

bool TeamGateway::buildingAttackLocation(EntityId buildingId, int x, int y) {
    auto lock = acquire();
    if (!open_ || !checkBuildingAttackLocation(buildingId, x, y)) {
        return refuse("buildingAttackLocation", std::to_string(buildingId) + " -> " + cell(x, y));
    }
    return world_->combat().buildingAttackPoint(buildingId, x, y);
}

// ——————————————————————————————————————————————————————
// Healing, bridges, exploration
// ——————————————————————————————————————————————————————
bool TeamGateway::checkHeal(EntityId healerId, EntityId targetUnitId) const {
    const Unit* h = ownUnit(healerId);
    const Unit* t = ownUnit(targetUnitId);
    if (!h || !t) return false;
    if (!h->archetype().isHealer() || !h->hasActions()) return false;
    return withinChebyshev(h->getX(), h->getY(), t->getX(), t->getY(), h->getAttackRange());
}

bool TeamGateway::canHealUnit(EntityId healerId, EntityId targetUnitId) const {
    auto lock = acquire();
    return open_ && checkHeal(healerId, targetUnitId);
}

bool TeamGateway::healUnit(EntityId healerId, EntityId targetUnitId) {
    auto lock = acquire();
    if (!open_ || !checkHeal(healerId, targetUnitId)) {
        return refuse("healUnit", std::to_string(healerId) + " -> " + std::to_string(targetUnitId));
    }
    Unit* healer = world_->registry().findUnit(healerId);
    Unit* target = world_->registry().findUnit(targetUnitId);
    healer->consumeAction();
    target->heal(healer->archetype().healAmount);
    return true;
}

bool TeamGateway::checkBridge(EntityId engineerId) const {
    const Unit* u = ownUnit(engineerId);
    if (!u || u->getKind() != UnitKind::ENGINEER) return false;
    return world_->map().getTerrain(u->getX(), u->getY()) == Terrain::WATER;
}

bool TeamGateway::canBuildBridge(EntityId engineerId) const {
    auto lock = acquire();
    return open_ && checkBridge(engineerId);
}

bool TeamGateway::buildBridge(EntityId engineerId) {
    auto lock = acquire();
    if (!open_ || !checkBridge(engineerId)) return refuse("buildBridge", "engineer " + std::to_string(engineerId));

    const Unit* u = ownUnit(engineerId);
    const int x = u->getX();
    const int y = u->getY();
    world_->map().convertToBridge(x, y);
    world_->registry().remove(engineerId);
    DEBUG_PRINT("GATEWAY", "buildBridge", std::string(teamName(team_)) + " bridged " + cell(x, y), verbose_);
    return true;
}

bool TeamGateway::checkExplore(EntityId explorerId, EntityId buildingId) const {
    const Unit* e = ownUnit(explorerId);
    if (!e || e->getKind() != UnitKind::EXPLORER) return false;
    const Building* b = world_->registry().findBuilding(buildingId);
    if (!b || b->getKind() != BuildingKind::EXPLORER_BUILDING) return false;
    return e->getX() == b->getX() && e->getY() == b->getY();
}

bool TeamGateway::checkExploreTarget(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) const {
    return targetUnitId != explorerId && checkExplore(explorerId, buildingId) && ownUnit(targetUnitId);
}

bool TeamGateway::canExplore(EntityId explorerId, EntityId buildingId) const {
    auto lock = acquire();
    return open_ && checkExplore(explorerId, buildingId);
}

bool TeamGateway::canExploreWithTarget(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) const {
    auto lock = acquire();
    return open_ && checkExploreTarget(explorerId, buildingId, targetUnitId);
}

bool TeamGateway::exploreForGold(EntityId explorerId, EntityId buildingId) {
    auto lock = acquire();
    if (!open_ || !checkExplore(explorerId, buildingId)) {
        return refuse("exploreForGold", "explorer " + std::to_string(explorerId));
    }
    world_->registry().remove(explorerId);
    const double balance = world_->ledger().getBalance(team_);
    const double reward  = std::floor(balance * world_->config().exploreGoldFraction);
    if (reward > 0) world_->ledger().credit(team_, reward);
    return true;
}

Unit* TeamGateway::beginTargetedExplore(EntityId explorerId, EntityId buildingId, EntityId targetUnitId,
                                        const char* function) {
    if (!open_ || !checkExploreTarget(explorerId, buildingId, targetUnitId)) {
        refuse(function, "explorer " + std::to_string(explorerId) + " target " + std::to_string(targetUnitId));
        return nullptr;
    }
    world_->registry().remove(explorerId);
    return world_->registry().findUnit(targetUnitId);
}

bool TeamGateway::exploreForHealth(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) {
    auto lock = acquire();
    Unit* target = beginTargetedExplore(explorerId, buildingId, targetUnitId, "exploreForHealth");
    if (!target) return false;
    const double boosted = world_->config().exploreHealthFactor * target->archetype().health;
    target->setHealth(static_cast<int>(std::ceil(boosted)));
    return true;
}

bool TeamGateway::exploreForAttack(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) {
    auto lock = acquire();
    Unit* target = beginTargetedExplore(explorerId, buildingId, targetUnitId, "exploreForAttack");
    if (!target) return false;
    target->addDamage(world_->config().exploreAttackBonus);
    return true;
}

bool TeamGateway::exploreForDefense(EntityId explorerId, EntityId buildingId, EntityId targetUnitId) {
    auto lock = acquire();
    Unit* target = beginTargetedExplore(explorerId, buildingId, targetUnitId, "exploreForDefense");
    if (!target) return false;
    target->addDefense(world_->config().exploreDefenseBonus);
    return true;
}

} // namespace Citadel

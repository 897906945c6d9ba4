// tests/test_combat.cpp

#include <doctest/doctest.h>

#include "CombatResolver.h"
#include "TestSupport.h"

using namespace Citadel;
using citadel_test::grassMap;
using citadel_test::makeWorld;
using citadel_test::readyUnit;

TEST_CASE("Attacking an empty cell spends the action and nothing else")
{
    auto world = makeWorld(grassMap());
    const EntityId k = readyUnit(*world, Team::BLUE, UnitKind::KNIGHT, 1, 1);

    AttackReport r;
    CHECK(world->combat().unitAttackPoint(k, 2, 2, &r));
    CHECK(r.unitsHit.empty());
    CHECK(r.buildingsHit.empty());
    CHECK_FALSE(r.attackerDied);

    const Unit* knight = world->registry().findUnit(k);
    CHECK(knight->getActionsRemaining() == 0);
    CHECK(knight->getHealth() == 10);
    CHECK_FALSE(world->combat().unitAttackPoint(k, 2, 2));
}

TEST_CASE("Attacks are limited by range and by actions")
{
    auto world = makeWorld(grassMap());
    auto fresh = world->registry().placeUnit(Team::BLUE, UnitKind::KNIGHT, 1, 1);
    REQUIRE(fresh);
    CHECK_FALSE(world->combat().canUnitAttackPoint(*fresh, 2, 2));

    world->registry().resetTurnAllowances();
    CHECK(world->combat().canUnitAttackPoint(*fresh, 2, 2));
    CHECK_FALSE(world->combat().canUnitAttackPoint(*fresh, 3, 3));
}

TEST_CASE("Surviving defenders strike back with their defense")
{
    auto world = makeWorld(grassMap());
    const EntityId k = readyUnit(*world, Team::BLUE, UnitKind::KNIGHT, 1, 1);
    const EntityId w = readyUnit(*world, Team::RED, UnitKind::WARRIOR, 2, 2);

    AttackReport r;
    REQUIRE(world->combat().unitAttackPoint(k, 2, 2, &r));
    CHECK(r.unitsHit == std::vector<EntityId>{ w });
    CHECK(r.killed.empty());
    CHECK(world->registry().findUnit(w)->getHealth() == 9);
    CHECK(world->registry().findUnit(k)->getHealth() == 8);
}

TEST_CASE("Killed targets do not retaliate")
{
    auto world = makeWorld(grassMap());
    const EntityId k = readyUnit(*world, Team::BLUE, UnitKind::KNIGHT, 1, 1);
    const EntityId s = readyUnit(*world, Team::RED, UnitKind::SWORDSMAN, 2, 2);
    world->registry().damage(s, 9);

    AttackReport r;
    REQUIRE(world->combat().unitAttackPoint(k, 2, 2, &r));
    CHECK(r.killed == std::vector<EntityId>{ s });
    CHECK_FALSE(world->registry().contains(s));
    CHECK(world->occupancy().isUnitFree(2, 2));
    CHECK(world->registry().findUnit(k)->getHealth() == 10);
}

TEST_CASE("Splash retaliation stops once the attacker dies")
{
    auto world = makeWorld(grassMap());
    // Healers splash with radius 1 for zero damage.
    const EntityId h = readyUnit(*world, Team::BLUE, UnitKind::LAND_HEALER_1, 2, 1);
    readyUnit(*world, Team::RED, UnitKind::SWORDSMAN, 1, 3);
    readyUnit(*world, Team::RED, UnitKind::SWORDSMAN, 2, 3);
    readyUnit(*world, Team::RED, UnitKind::SWORDSMAN, 3, 3);
    readyUnit(*world, Team::RED, UnitKind::SWORDSMAN, 2, 2);

    AttackReport r;
    REQUIRE(world->combat().unitAttackPoint(h, 2, 3, &r));
    CHECK(r.unitsHit.size() == 4);
    CHECK(r.killed.empty());
    CHECK(r.attackerDied);
    CHECK_FALSE(world->registry().contains(h));
    for (const auto& [id, u] : world->registry().units(Team::RED)) {
        CHECK(u.getHealth() == 10);
    }
}

TEST_CASE("Units splash enemy buildings but never friendly ones")
{
    auto world = makeWorld(grassMap());
    const EntityId k = readyUnit(*world, Team::RED, UnitKind::KNIGHT, 1, 1);
    const EntityId blueCastle = world->getHomeBaseId(Team::BLUE);

    AttackReport r;
    REQUIRE(world->combat().unitAttackPoint(k, 0, 0, &r));
    CHECK(r.buildingsHit == std::vector<EntityId>{ blueCastle });
    CHECK(world->homeBaseHealth(Team::BLUE) == 29);
    CHECK(world->homeBaseHealth(Team::RED) == 30);
}

TEST_CASE("Building attacks hit units only and draw no retaliation")
{
    auto world = makeWorld(grassMap());
    const EntityId castle = world->getHomeBaseId(Team::BLUE);
    readyUnit(*world, Team::RED, UnitKind::SWORDSMAN, 1, 1);
    world->registry().placeBuilding(Team::RED, BuildingKind::FARM_1, 1, 0);
    world->registry().resetTurnAllowances();

    AttackReport r;
    REQUIRE(world->combat().buildingAttackPoint(castle, 0, 0, &r));
    CHECK(r.unitsHit.size() == 1);
    CHECK(r.buildingsHit.empty());
    CHECK(world->homeBaseHealth(Team::BLUE) == 30);
    CHECK_FALSE(world->combat().canBuildingAttackPoint(castle, 0, 0));
}

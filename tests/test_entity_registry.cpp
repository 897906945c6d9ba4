// tests/test_entity_registry.cpp
//
// Entity ownership, shared id space, damage/removal and the sell rules.

#include <doctest/doctest.h>

#include "EconomyLedger.h"
#include "TestSupport.h"

#include <set>
#include <stdexcept>

using namespace Citadel;
using citadel_test::grassMap;
using citadel_test::makeWorld;

TEST_CASE("Castles are placed first and ids are never reused")
{
    auto world = makeWorld(grassMap());
    auto& reg = world->registry();

    CHECK(world->getHomeBaseId(Team::BLUE) == 0);
    CHECK(world->getHomeBaseId(Team::RED) == 1);

    std::set<EntityId> seen{ 0, 1 };
    auto knight = reg.placeUnit(Team::BLUE, UnitKind::KNIGHT, 1, 1);
    auto farm   = reg.placeBuilding(Team::RED, BuildingKind::FARM_1, 3, 3);
    REQUIRE(knight);
    REQUIRE(farm);
    CHECK(seen.insert(*knight).second);
    CHECK(seen.insert(*farm).second);

    CHECK(reg.remove(*knight));
    auto again = reg.placeUnit(Team::BLUE, UnitKind::KNIGHT, 1, 1);
    REQUIRE(again);
    CHECK(seen.insert(*again).second);
    CHECK(reg.peekNextId() == *again + 1);
}

TEST_CASE("Placement follows occupancy and team lookups follow ownership")
{
    auto world = makeWorld(grassMap());
    auto& reg = world->registry();

    auto a = reg.placeUnit(Team::RED, UnitKind::WARRIOR, 2, 2);
    REQUIRE(a);
    CHECK_FALSE(reg.placeUnit(Team::BLUE, UnitKind::KNIGHT, 2, 2).has_value());
    CHECK_FALSE(reg.placeBuilding(Team::BLUE, BuildingKind::FARM_1, 0, 0).has_value());
    CHECK_FALSE(reg.placeUnit(Team::BLUE, UnitKind::SAILOR, 1, 1).has_value());

    CHECK(reg.teamOf(*a) == Team::RED);
    CHECK_FALSE(reg.teamOf(999).has_value());
    CHECK(reg.units(Team::RED).size() == 1);
    CHECK(reg.units(Team::BLUE).empty());
    CHECK_FALSE(world->occupancy().isUnitFree(2, 2));
}

TEST_CASE("damage removes entities at zero health and rejects bad input")
{
    auto world = makeWorld(grassMap());
    auto& reg = world->registry();
    auto k = reg.placeUnit(Team::BLUE, UnitKind::KNIGHT, 1, 1);
    REQUIRE(k);

    CHECK_FALSE(reg.damage(*k, 9));
    CHECK(reg.findUnit(*k)->getHealth() == 1);
    CHECK_FALSE(reg.damage(*k, 0));
    CHECK(reg.damage(*k, 1));
    CHECK_FALSE(reg.contains(*k));
    CHECK(world->occupancy().isUnitFree(1, 1));

    CHECK_THROWS_AS(reg.damage(world->getHomeBaseId(Team::RED), -1), std::invalid_argument);
    CHECK_THROWS_AS(reg.damage(12345, 1), std::invalid_argument);
}

TEST_CASE("Selling needs three quarters of max health and refunds half the cost")
{
    auto world = makeWorld(grassMap());
    auto& reg = world->registry();
    const double start = world->ledger().getBalance(Team::BLUE);

    auto healthy = reg.placeUnit(Team::BLUE, UnitKind::SWORDSMAN, 1, 1);
    auto hurt    = reg.placeUnit(Team::BLUE, UnitKind::SWORDSMAN, 2, 1);
    REQUIRE(healthy);
    REQUIRE(hurt);
    reg.damage(*healthy, 2);   // 8/10
    reg.damage(*hurt, 3);      // 7/10

    CHECK(reg.canSell(Team::BLUE, *healthy));
    CHECK_FALSE(reg.canSell(Team::BLUE, *hurt));
    CHECK_FALSE(reg.canSell(Team::RED, *healthy));

    CHECK(reg.sell(Team::BLUE, *healthy));
    CHECK(world->ledger().getBalance(Team::BLUE) == doctest::Approx(start + 2.0));
    CHECK_FALSE(reg.contains(*healthy));

    CHECK_FALSE(reg.sell(Team::BLUE, *hurt));
    CHECK(reg.contains(*hurt));
}

TEST_CASE("Exactly three quarters of max health is enough to sell")
{
    auto world = makeWorld(grassMap());
    auto& reg = world->registry();
    const double start = world->ledger().getBalance(Team::BLUE);

    auto atLine  = reg.placeBuilding(Team::BLUE, BuildingKind::FARM_3, 1, 0);
    auto belowIt = reg.placeBuilding(Team::BLUE, BuildingKind::FARM_3, 2, 0);
    REQUIRE(atLine);
    REQUIRE(belowIt);
    reg.damage(*atLine, 5);    // 15/20
    reg.damage(*belowIt, 6);   // 14/20

    CHECK(reg.canSell(Team::BLUE, *atLine));
    CHECK_FALSE(reg.canSell(Team::BLUE, *belowIt));
    CHECK(reg.sell(Team::BLUE, *atLine));
    CHECK(world->ledger().getBalance(Team::BLUE) == doctest::Approx(start + 3.5));
    CHECK(world->occupancy().isBuildingFree(1, 0));
    CHECK_FALSE(reg.sell(Team::BLUE, *belowIt));
}

TEST_CASE("Farms and archetype value are counted per team")
{
    auto world = makeWorld(grassMap());
    auto& reg = world->registry();
    reg.placeBuilding(Team::BLUE, BuildingKind::FARM_1, 1, 0);
    reg.placeBuilding(Team::BLUE, BuildingKind::FARM_3, 2, 0);
    reg.placeUnit(Team::BLUE, UnitKind::CATAPULT, 1, 1);

    CHECK(reg.farmCount(Team::BLUE) == 2);
    CHECK(reg.farmCount(Team::RED) == 0);
    // castle -1, farms 3 + 7, catapult 4
    CHECK(reg.archetypeValue(Team::BLUE) == doctest::Approx(13.0));
    CHECK(reg.archetypeValue(Team::RED) == doctest::Approx(-1.0));
}

TEST_CASE("EconomyLedger never goes negative")
{
    EconomyLedger ledger(5.0);
    CHECK(ledger.canAfford(Team::RED, 5.0));
    CHECK_FALSE(ledger.debit(Team::RED, 6.0));
    CHECK(ledger.getBalance(Team::RED) == doctest::Approx(5.0));
    CHECK(ledger.debit(Team::RED, 5.0));
    CHECK(ledger.getBalance(Team::RED) == doctest::Approx(0.0));
    CHECK(ledger.getBalance(Team::BLUE) == doctest::Approx(5.0));

    CHECK_THROWS_AS(ledger.debit(Team::BLUE, -1.0), std::invalid_argument);
    CHECK_THROWS_AS(ledger.credit(Team::BLUE, -1.0), std::invalid_argument);
}

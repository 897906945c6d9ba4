// tests/test_world_map.cpp
//
// Terrain grid, occupancy grids and the map file parser.

#include <doctest/doctest.h>

#include "MapLoader.h"
#include "OccupancyIndex.h"
#include "TestSupport.h"

#include <stdexcept>

using namespace Citadel;
using citadel_test::uniformMap;

TEST_CASE("WorldMap rejects malformed grids and base placements")
{
    CHECK_THROWS_AS(WorldMap({}, { 0, 0 }, { 1, 0 }), std::invalid_argument);

    std::vector<std::vector<Terrain>> ragged{ { Terrain::GRASS, Terrain::GRASS }, { Terrain::GRASS } };
    CHECK_THROWS_AS(WorldMap(ragged, { 0, 0 }, { 1, 0 }), std::invalid_argument);

    CHECK_THROWS_AS(uniformMap(3, 3, Terrain::GRASS, { 0, 0 }, { 3, 0 }), std::invalid_argument);
    CHECK_THROWS_AS(uniformMap(3, 3, Terrain::GRASS, { 1, 1 }, { 1, 1 }), std::invalid_argument);
}

TEST_CASE("WorldMap answers ERROR outside the grid and bridges only water")
{
    auto map = uniformMap(2, 3, Terrain::WATER, { 0, 0 }, { 1, 2 });
    CHECK(map.getWidth() == 2);
    CHECK(map.getHeight() == 3);
    CHECK(map.getTerrain(-1, 0) == Terrain::ERROR);
    CHECK(map.getTerrain(0, 3) == Terrain::ERROR);

    CHECK(map.convertToBridge(1, 1));
    CHECK(map.getTerrain(1, 1) == Terrain::BRIDGE);
    CHECK_FALSE(map.convertToBridge(1, 1));

    const MapSnapshot snap = map.snapshot();
    CHECK(snap.at(1, 1) == Terrain::BRIDGE);
    CHECK(snap.redCastle == std::make_pair(1, 2));
}

TEST_CASE("OccupancyIndex keeps unit and building layers apart")
{
    auto map = uniformMap(3, 3, Terrain::GRASS, { 0, 0 }, { 2, 2 });
    OccupancyIndex occ(3, 3);

    occ.occupyBuilding(1, 1);
    CHECK_FALSE(occ.isBuildingFree(1, 1));
    CHECK(occ.isUnitFree(1, 1));
    CHECK(occ.canPlaceUnit(map, UnitKind::KNIGHT, 1, 1));
    CHECK_FALSE(occ.canPlaceBuilding(map, BuildingKind::FARM_1, 1, 1));

    occ.occupyUnit(1, 1);
    CHECK_FALSE(occ.canPlaceUnit(map, UnitKind::KNIGHT, 1, 1));
    occ.releaseUnit(1, 1);
    CHECK(occ.isUnitFree(1, 1));

    CHECK_FALSE(occ.isUnitFree(5, 5));
    CHECK_THROWS_AS(occ.occupyUnit(3, 0), std::out_of_range);
}

TEST_CASE("OccupancyIndex consults the archetype terrain lists")
{
    std::vector<std::vector<Terrain>> tiles{
        { Terrain::GRASS, Terrain::WATER },
        { Terrain::MOUNTAIN, Terrain::GRASS },
    };
    WorldMap map(tiles, { 0, 0 }, { 1, 1 });
    OccupancyIndex occ(2, 2);

    CHECK_FALSE(occ.canPlaceUnit(map, UnitKind::KNIGHT, 0, 1));
    CHECK(occ.canPlaceUnit(map, UnitKind::SAILOR, 0, 1));
    CHECK(occ.canPlaceUnit(map, UnitKind::EXPLORER, 1, 0));
    CHECK_FALSE(occ.canPlaceBuilding(map, BuildingKind::FARM_1, 1, 0));
    CHECK(occ.canPlaceBuilding(map, BuildingKind::PORT, 0, 1));
}

TEST_CASE("MapLoader reads columns and turns castle markers into grass")
{
    const auto map = MapLoader::parse(
        "[['BLUE CASTLE', 'SAND'],\n"
        " [\"WATER\", 'MOUNTAIN'],\n"
        " ['GRASS', 'RED CASTLE',],]");

    CHECK(map.getWidth() == 3);
    CHECK(map.getHeight() == 2);
    CHECK(map.getHomeBase(Team::BLUE) == std::make_pair(0, 0));
    CHECK(map.getHomeBase(Team::RED) == std::make_pair(2, 1));
    CHECK(map.getTerrain(0, 0) == Terrain::GRASS);
    CHECK(map.getTerrain(0, 1) == Terrain::SAND);
    CHECK(map.getTerrain(1, 0) == Terrain::WATER);
    CHECK(map.getTerrain(2, 1) == Terrain::GRASS);
}

TEST_CASE("MapLoader rejects unknown terrain and bad markers")
{
    CHECK_THROWS_AS(MapLoader::parse("[['BLUE CASTLE', 'LAVA'], ['RED CASTLE', 'GRASS']]"),
                    std::invalid_argument);
    CHECK_THROWS_AS(MapLoader::parse("[['BLUE CASTLE'], ['GRASS']]"), std::invalid_argument);
    CHECK_THROWS_AS(MapLoader::parse("[['BLUE CASTLE'], ['BLUE CASTLE'], ['RED CASTLE']]"),
                    std::invalid_argument);
    CHECK_THROWS_AS(MapLoader::parse("[['BLUE CASTLE'], ['RED CASTLE']"), std::invalid_argument);
    CHECK_THROWS_AS(MapLoader::loadFromFile("/nonexistent/citadel/map.txt"), std::runtime_error);
}

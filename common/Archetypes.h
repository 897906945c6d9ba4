#pragma once

#include "GameTypes.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

/*
  Immutable stat templates for every unit and building kind.
  Lookups go through unitArchetype()/buildingArchetype(), which search the
  static tables by key.
*/

struct BuildingArchetype {
    BuildingKind         kind;
    const char*          name;
    int                  health;
    int                  cost;
    int                  attackRange;
    int                  damageRange;
    int                  cooldown;
    int                  damage;
    int                  defense;
    int                  actionsPerTurn;
    bool                 spawnCapable;
    std::vector<Terrain> placeableTiles;

    bool canBePlacedOn(Terrain t) const {
        return std::find(placeableTiles.begin(), placeableTiles.end(), t) != placeableTiles.end();
    }
};

struct UnitArchetype {
    UnitKind                  kind;
    const char*               name;
    int                       health;
    int                       cost;
    int                       attackRange;
    int                       cooldown;
    int                       damage;
    int                       defense;
    int                       actionsPerTurn;
    int                       moveRange;
    int                       damageRange;
    int                       healAmount;
    std::vector<BuildingKind> spawnableFrom;   // empty: any building
    std::vector<Terrain>      walkableTiles;

    bool canWalkOn(Terrain t) const {
        return std::find(walkableTiles.begin(), walkableTiles.end(), t) != walkableTiles.end();
    }
    bool canSpawnFrom(BuildingKind b) const {
        return spawnableFrom.empty() ||
               std::find(spawnableFrom.begin(), spawnableFrom.end(), b) != spawnableFrom.end();
    }
    bool isHealer() const { return healAmount > 0; }
};

namespace ArchetypeTables {

inline const std::vector<Terrain>& landTiles() {
    static const std::vector<Terrain> t{ Terrain::GRASS, Terrain::SAND };
    return t;
}
inline const std::vector<Terrain>& walkableLand() {
    static const std::vector<Terrain> t{ Terrain::GRASS, Terrain::SAND, Terrain::BRIDGE };
    return t;
}
inline const std::vector<Terrain>& waterways() {
    static const std::vector<Terrain> t{ Terrain::WATER, Terrain::BRIDGE };
    return t;
}

inline const std::vector<BuildingArchetype>& buildings() {
    //  kind, name, health, cost, attackRange, damageRange, cooldown, damage, defense, actions, spawns, tiles
    static const std::vector<BuildingArchetype> table{
        { BuildingKind::MAIN_CASTLE,       "MAIN_CASTLE",       30, -1, 0, 1, 0, 0, 0, 1, true,  landTiles() },
        { BuildingKind::PORT,              "PORT",              20, 10, 0, 1, 0, 0, 0, 1, true,  waterways() },
        { BuildingKind::EXPLORER_BUILDING, "EXPLORER_BUILDING", 20, 30, 0, 0, 1, 0, 0, 0, false, landTiles() },
        { BuildingKind::FARM_1,            "FARM_1",            10,  3, 0, 1, 0, 0, 0, 1, true,  landTiles() },
        { BuildingKind::FARM_2,            "FARM_2",            15,  5, 0, 1, 0, 0, 0, 1, true,  landTiles() },
        { BuildingKind::FARM_3,            "FARM_3",            20,  7, 0, 1, 0, 0, 0, 1, true,  landTiles() },
    };
    return table;
}

inline const std::vector<UnitArchetype>& units() {
    using B = BuildingKind;
    using T = Terrain;
    static const std::vector<B> anywhere{};
    static const std::vector<B> portOnly{ B::PORT };
    static const std::vector<B> castleOnly{ B::MAIN_CASTLE };
    static const std::vector<T> explorerTiles{ T::GRASS, T::SAND, T::BRIDGE, T::MOUNTAIN, T::WATER };
    static const std::vector<T> engineerTiles{ T::GRASS, T::SAND, T::BRIDGE, T::WATER };

    //  kind, name, health, cost, attackRange, cooldown, damage, defense, actions, move, damageRange, heal, from, walkable
    static const std::vector<UnitArchetype> table{
        { UnitKind::KNIGHT,         "KNIGHT",         10,  1,  1, 1, 1, 1, 1, 1, 0, 0, anywhere,   walkableLand() },
        { UnitKind::WARRIOR,        "WARRIOR",        10,  2,  1, 1, 2, 2, 1, 1, 0, 0, anywhere,   walkableLand() },
        { UnitKind::SWORDSMAN,      "SWORDSMAN",      10,  4,  1, 1, 3, 3, 1, 1, 0, 0, anywhere,   walkableLand() },
        { UnitKind::DEFENDER,       "DEFENDER",       15,  3,  1, 1, 1, 2, 1, 1, 0, 0, anywhere,   walkableLand() },
        { UnitKind::CATAPULT,       "CATAPULT",       10,  4, 10, 1, 1, 2, 1, 1, 0, 0, anywhere,   walkableLand() },
        { UnitKind::SAILOR,         "SAILOR",         10,  1,  1, 1, 1, 1, 1, 1, 0, 0, portOnly,   waterways() },
        { UnitKind::RAIDER,         "RAIDER",         10,  2,  1, 1, 2, 2, 1, 1, 0, 0, portOnly,   waterways() },
        { UnitKind::CAPTAIN,        "CAPTAIN",        10,  4,  1, 1, 3, 3, 1, 1, 0, 0, portOnly,   waterways() },
        { UnitKind::GALLEY,         "GALLEY",         10,  1,  1, 1, 1, 1, 1, 1, 0, 0, portOnly,   waterways() },
        { UnitKind::EXPLORER,       "EXPLORER",        1, 10,  0, 1, 0, 0, 1, 2, 0, 0, castleOnly, explorerTiles },
        { UnitKind::ENGINEER,       "ENGINEER",        5,  2,  0, 0, 0, 0, 1, 1, 0, 0, anywhere,   engineerTiles },
        { UnitKind::LAND_HEALER_1,  "LAND_HEALER_1",  10,  3,  2, 1, 0, 1, 1, 2, 1, 5, anywhere,   walkableLand() },
        { UnitKind::WATER_HEALER_1, "WATER_HEALER_1", 10,  3,  2, 1, 0, 1, 1, 2, 1, 5, portOnly,   waterways() },
        { UnitKind::LAND_HEALER_2,  "LAND_HEALER_2",  10,  4,  2, 1, 0, 1, 1, 2, 1, 6, anywhere,   walkableLand() },
        { UnitKind::WATER_HEALER_2, "WATER_HEALER_2", 10,  4,  2, 1, 0, 1, 1, 2, 1, 6, portOnly,   waterways() },
        { UnitKind::LAND_HEALER_3,  "LAND_HEALER_3",  10,  5,  2, 1, 0, 1, 1, 2, 1, 7, anywhere,   walkableLand() },
        { UnitKind::WATER_HEALER_3, "WATER_HEALER_3", 10,  5,  2, 1, 0, 1, 1, 2, 1, 7, portOnly,   waterways() },
    };
    return table;
}

} // namespace ArchetypeTables

/// nullptr when the kind is not in the table.
inline const UnitArchetype* findUnitArchetype(UnitKind kind) {
    const auto& table = ArchetypeTables::units();
    auto it = std::find_if(table.begin(), table.end(),
                           [kind](const UnitArchetype& a) { return a.kind == kind; });
    return it == table.end() ? nullptr : &*it;
}

inline const BuildingArchetype* findBuildingArchetype(BuildingKind kind) {
    const auto& table = ArchetypeTables::buildings();
    auto it = std::find_if(table.begin(), table.end(),
                           [kind](const BuildingArchetype& a) { return a.kind == kind; });
    return it == table.end() ? nullptr : &*it;
}

inline const UnitArchetype& unitArchetype(UnitKind kind) {
    const UnitArchetype* a = findUnitArchetype(kind);
    if (!a) throw std::invalid_argument("unknown unit kind");
    return *a;
}

inline const BuildingArchetype& buildingArchetype(BuildingKind kind) {
    const BuildingArchetype* a = findBuildingArchetype(kind);
    if (!a) throw std::invalid_argument("unknown building kind");
    return *a;
}

inline const char* unitKindName(UnitKind kind) {
    const UnitArchetype* a = findUnitArchetype(kind);
    return a ? a->name : "UNKNOWN_UNIT";
}

inline const char* buildingKindName(BuildingKind kind) {
    const BuildingArchetype* a = findBuildingArchetype(kind);
    return a ? a->name : "UNKNOWN_BUILDING";
}

inline bool isFarm(BuildingKind kind) {
    return kind == BuildingKind::FARM_1 || kind == BuildingKind::FARM_2 || kind == BuildingKind::FARM_3;
}

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/*
  Value types shared between the engine and agent plugins.
  Everything here is plain data: agents only ever receive copies.
*/

enum class Team {
    BLUE = 0,   // moves first
    RED  = 1    // moves second
};

inline bool isValidTeam(Team t) { return t == Team::BLUE || t == Team::RED; }
inline Team oppositeTeam(Team t) { return t == Team::BLUE ? Team::RED : Team::BLUE; }

/// Index into per-team arrays. Throws std::invalid_argument for a value outside BLUE/RED.
inline std::size_t teamIndex(Team t) {
    if (!isValidTeam(t)) throw std::invalid_argument("team out of range");
    return static_cast<std::size_t>(t);
}
inline const char* teamName(Team t) { return t == Team::BLUE ? "BLUE" : "RED"; }

constexpr std::array<Team, 2> kAllTeams = { Team::BLUE, Team::RED };

/// Tile kinds. Each carries a per-step movement cost.
enum class Terrain {
    ERROR,
    MOUNTAIN,
    GRASS,
    SAND,
    WATER,
    BRIDGE
};

inline int movementCost(Terrain t) {
    switch (t) {
        case Terrain::ERROR:    return 0;
        case Terrain::MOUNTAIN: return 2;
        case Terrain::GRASS:    return 1;
        case Terrain::SAND:     return 2;
        case Terrain::WATER:    return 1;
        case Terrain::BRIDGE:   return 1;
    }
    return 0;
}

inline const char* terrainName(Terrain t) {
    switch (t) {
        case Terrain::ERROR:    return "ERROR";
        case Terrain::MOUNTAIN: return "MOUNTAIN";
        case Terrain::GRASS:    return "GRASS";
        case Terrain::SAND:     return "SAND";
        case Terrain::WATER:    return "WATER";
        case Terrain::BRIDGE:   return "BRIDGE";
    }
    return "ERROR";
}

/// King moves plus STAY. UP is +y.
enum class Direction {
    UP,
    DOWN,
    LEFT,
    RIGHT,
    UP_LEFT,
    UP_RIGHT,
    DOWN_LEFT,
    DOWN_RIGHT,
    STAY
};

constexpr std::array<Direction, 9> kAllDirections = {
    Direction::UP, Direction::DOWN, Direction::LEFT, Direction::RIGHT,
    Direction::UP_LEFT, Direction::UP_RIGHT, Direction::DOWN_LEFT, Direction::DOWN_RIGHT,
    Direction::STAY
};

inline bool isValidDirection(Direction d) {
    return std::find(kAllDirections.begin(), kAllDirections.end(), d) != kAllDirections.end();
}

inline std::pair<int, int> directionDelta(Direction d) {
    switch (d) {
        case Direction::UP:         return {  0,  1 };
        case Direction::DOWN:       return {  0, -1 };
        case Direction::LEFT:       return { -1,  0 };
        case Direction::RIGHT:      return {  1,  0 };
        case Direction::UP_LEFT:    return { -1,  1 };
        case Direction::UP_RIGHT:   return {  1,  1 };
        case Direction::DOWN_LEFT:  return { -1, -1 };
        case Direction::DOWN_RIGHT: return {  1, -1 };
        case Direction::STAY:       return {  0,  0 };
    }
    return { 0, 0 };
}

inline const char* directionName(Direction d) {
    switch (d) {
        case Direction::UP:         return "UP";
        case Direction::DOWN:       return "DOWN";
        case Direction::LEFT:       return "LEFT";
        case Direction::RIGHT:      return "RIGHT";
        case Direction::UP_LEFT:    return "UP_LEFT";
        case Direction::UP_RIGHT:   return "UP_RIGHT";
        case Direction::DOWN_LEFT:  return "DOWN_LEFT";
        case Direction::DOWN_RIGHT: return "DOWN_RIGHT";
        case Direction::STAY:       return "STAY";
    }
    return "STAY";
}

/// Chessboard distance: max(|dx|, |dy|).
inline int chebyshevDistance(int x1, int y1, int x2, int y2) {
    return std::max(std::abs(x1 - x2), std::abs(y1 - y2));
}

inline bool withinChebyshev(int x1, int y1, int x2, int y2, int radius) {
    return chebyshevDistance(x1, y1, x2, y2) <= radius;
}

using EntityId = int;

enum class UnitKind {
    KNIGHT,
    WARRIOR,
    SWORDSMAN,
    DEFENDER,
    CATAPULT,
    SAILOR,
    RAIDER,
    CAPTAIN,
    GALLEY,
    EXPLORER,
    ENGINEER,
    LAND_HEALER_1,
    WATER_HEALER_1,
    LAND_HEALER_2,
    WATER_HEALER_2,
    LAND_HEALER_3,
    WATER_HEALER_3
};

enum class BuildingKind {
    MAIN_CASTLE,
    PORT,
    EXPLORER_BUILDING,
    FARM_1,
    FARM_2,
    FARM_3
};

/// Copy of a live unit as handed to agents and to the replay.
struct UnitInfo {
    EntityId id = -1;
    Team     team = Team::BLUE;
    UnitKind kind = UnitKind::KNIGHT;
    int      x = 0, y = 0;
    int      health = 0;
    int      damage = 0;
    int      defense = 0;
    int      attackRange = 0;
    int      damageRange = 0;
    int      actionsRemaining = 0;
    int      movementRemaining = 0;
    int      level = 1;
};

/// Copy of a live building. Buildings never move.
struct BuildingInfo {
    EntityId     id = -1;
    Team         team = Team::BLUE;
    BuildingKind kind = BuildingKind::MAIN_CASTLE;
    int          x = 0, y = 0;
    int          health = 0;
    int          damage = 0;
    int          defense = 0;
    int          attackRange = 0;
    int          damageRange = 0;
    int          actionsRemaining = 0;
    int          level = 1;
};

/// Terrain copy handed to agent factories and returned by ActionGateway::getMap().
struct MapSnapshot {
    int width = 0;
    int height = 0;
    std::vector<std::vector<Terrain>> tiles;   // tiles[x][y]
    std::pair<int, int> blueCastle{ -1, -1 };
    std::pair<int, int> redCastle{ -1, -1 };

    bool inBounds(int x, int y) const { return 0 <= x && x < width && 0 <= y && y < height; }
    Terrain at(int x, int y) const { return inBounds(x, y) ? tiles[x][y] : Terrain::ERROR; }
};

#include "OccupancyIndex.h"

#include <stdexcept>
#include <string>

namespace Citadel {

OccupancyIndex::OccupancyIndex(int width, int height)
    : width_(width), height_(height),
      unitFree_(width, std::vector<bool>(height, true)),
      buildingFree_(width, std::vector<bool>(height, true))
{}

bool OccupancyIndex::isUnitFree(int x, int y) const {
    return contains(x, y) && unitFree_[x][y];
}

bool OccupancyIndex::isBuildingFree(int x, int y) const {
    return contains(x, y) && buildingFree_[x][y];
}

void OccupancyIndex::setCell(std::vector<std::vector<bool>>& grid, int x, int y, bool value) {
    if (!contains(x, y)) {
        throw std::out_of_range("OccupancyIndex: cell (" + std::to_string(x) + "," +
                                std::to_string(y) + ") outside the grid");
    }
    grid[x][y] = value;
}

bool OccupancyIndex::canPlaceUnit(const WorldMap& map, UnitKind kind, int x, int y) const {
    if (!map.inBounds(x, y) || !isUnitFree(x, y)) return false;
    return unitArchetype(kind).canWalkOn(map.getTerrain(x, y));
}

bool OccupancyIndex::canPlaceBuilding(const WorldMap& map, BuildingKind kind, int x, int y) const {
    if (!map.inBounds(x, y) || !isBuildingFree(x, y)) return false;
    return buildingArchetype(kind).canBePlacedOn(map.getTerrain(x, y));
}

} // namespace Citadel

// include/OccupancyIndex.h
#pragma once

#include <Archetypes.h>
#include "WorldMap.h"

#include <vector>

namespace Citadel {

/*
  Two [x][y] boolean grids: "no unit here" and "no building here".
  EntityRegistry is the only writer; it keeps both grids in lockstep
  with the positions of the entities it owns.
*/
class OccupancyIndex {
public:
    OccupancyIndex() = default;
    OccupancyIndex(int width, int height);

    bool isUnitFree(int x, int y) const;
    bool isBuildingFree(int x, int y) const;

    void occupyUnit(int x, int y)       { setCell(unitFree_, x, y, false); }
    void releaseUnit(int x, int y)      { setCell(unitFree_, x, y, true); }
    void occupyBuilding(int x, int y)   { setCell(buildingFree_, x, y, false); }
    void releaseBuilding(int x, int y)  { setCell(buildingFree_, x, y, true); }

    /// In bounds, no unit there, and the terrain is walkable for `kind`.
    bool canPlaceUnit(const WorldMap& map, UnitKind kind, int x, int y) const;
    /// In bounds, no building there, and the terrain accepts `kind`.
    bool canPlaceBuilding(const WorldMap& map, BuildingKind kind, int x, int y) const;

    const std::vector<std::vector<bool>>& unitFreeGrid()     const { return unitFree_; }
    const std::vector<std::vector<bool>>& buildingFreeGrid() const { return buildingFree_; }

private:
    bool contains(int x, int y) const { return 0 <= x && x < width_ && 0 <= y && y < height_; }
    void setCell(std::vector<std::vector<bool>>& grid, int x, int y, bool value);

    int width_ = 0, height_ = 0;
    std::vector<std::vector<bool>> unitFree_;
    std::vector<std::vector<bool>> buildingFree_;
};

} // namespace Citadel

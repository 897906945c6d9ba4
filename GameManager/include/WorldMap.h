// include/WorldMap.h
#pragma once

#include <GameTypes.h>

#include <array>
#include <utility>
#include <vector>

namespace Citadel {

/// Terrain grid indexed [x][y] plus the two home-base cells fixed at load.
class WorldMap {
public:
    WorldMap() = default;

    /// Throws std::invalid_argument on an empty or ragged grid, or when a
    /// home base is out of bounds or both bases share a cell.
    WorldMap(std::vector<std::vector<Terrain>> tiles,
             std::pair<int, int> blueBase,
             std::pair<int, int> redBase);

    int  getWidth()  const { return width_; }
    int  getHeight() const { return height_; }
    bool inBounds(int x, int y) const;

    /// ERROR for out-of-bounds cells.
    Terrain getTerrain(int x, int y) const;

    std::pair<int, int> getHomeBase(Team team) const { return homeBases_[teamIndex(team)]; }

    /// WATER becomes BRIDGE. Any other tile is left alone and false is returned.
    bool convertToBridge(int x, int y);

    const std::vector<std::vector<Terrain>>& getTiles() const { return tiles_; }

    MapSnapshot snapshot() const;

private:
    int width_ = 0, height_ = 0;
    std::vector<std::vector<Terrain>> tiles_;
    std::array<std::pair<int, int>, 2> homeBases_{ std::pair<int, int>{ -1, -1 },
                                                   std::pair<int, int>{ -1, -1 } };
};

} // namespace Citadel

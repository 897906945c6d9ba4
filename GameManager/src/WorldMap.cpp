#include "WorldMap.h"

#include <stdexcept>
#include <string>

namespace Citadel {

namespace {
std::string cellString(std::pair<int, int> c) {
    return "(" + std::to_string(c.first) + "," + std::to_string(c.second) + ")";
}
} // namespace

WorldMap::WorldMap(std::vector<std::vector<Terrain>> tiles,
                   std::pair<int, int> blueBase,
                   std::pair<int, int> redBase)
    : tiles_(std::move(tiles))
{
    if (tiles_.empty() || tiles_.front().empty()) {
        throw std::invalid_argument("WorldMap: map has no tiles");
    }
    width_  = static_cast<int>(tiles_.size());
    height_ = static_cast<int>(tiles_.front().size());
    for (const auto& column : tiles_) {
        if (static_cast<int>(column.size()) != height_) {
            throw std::invalid_argument("WorldMap: columns have different lengths");
        }
    }

    if (!inBounds(blueBase.first, blueBase.second)) {
        throw std::invalid_argument("WorldMap: BLUE home base out of bounds " + cellString(blueBase));
    }
    if (!inBounds(redBase.first, redBase.second)) {
        throw std::invalid_argument("WorldMap: RED home base out of bounds " + cellString(redBase));
    }
    if (blueBase == redBase) {
        throw std::invalid_argument("WorldMap: both home bases at " + cellString(blueBase));
    }
    homeBases_[teamIndex(Team::BLUE)] = blueBase;
    homeBases_[teamIndex(Team::RED)]  = redBase;
}

bool WorldMap::inBounds(int x, int y) const {
    return 0 <= x && x < width_ && 0 <= y && y < height_;
}

Terrain WorldMap::getTerrain(int x, int y) const {
    if (!inBounds(x, y)) return Terrain::ERROR;
    return tiles_[x][y];
}

bool WorldMap::convertToBridge(int x, int y) {
    if (getTerrain(x, y) != Terrain::WATER) return false;
    tiles_[x][y] = Terrain::BRIDGE;
    return true;
}

MapSnapshot WorldMap::snapshot() const {
    MapSnapshot s;
    s.width      = width_;
    s.height     = height_;
    s.tiles      = tiles_;
    s.blueCastle = getHomeBase(Team::BLUE);
    s.redCastle  = getHomeBase(Team::RED);
    return s;
}

} // namespace Citadel

#include "GameWorld.h"

#include <stdexcept>
#include <string>

using namespace Citadel;

GameWorld::GameWorld(const GameConfig& config, WorldMap map)
    : config_(config),
      map_(std::move(map)),
      occupancy_(map_.getWidth(), map_.getHeight()),
      ledger_(config_.startingBalance),
      registry_(map_, occupancy_, ledger_, config_),
      combat_(registry_, config_.verbose),
      timePools_{ config_.initialTimePool, config_.initialTimePool }
{
    for (Team t : kAllTeams) {
        const auto [x, y] = map_.getHomeBase(t);
        auto id = registry_.placeBuilding(t, BuildingKind::MAIN_CASTLE, x, y);
        if (!id) {
            throw std::invalid_argument(std::string("GameWorld: ") + teamName(t) +
                " castle cannot stand on " + terrainName(map_.getTerrain(x, y)) +
                " at (" + std::to_string(x) + "," + std::to_string(y) + ")");
        }
        homeBaseIds_[teamIndex(t)] = *id;
    }
}

bool GameWorld::isHomeBaseStanding(Team team) const {
    return registry_.buildings(team).count(getHomeBaseId(team)) > 0;
}

int GameWorld::homeBaseHealth(Team team) const {
    const Building* b = registry_.findBuilding(getHomeBaseId(team));
    return b ? b->getHealth() : 0;
}

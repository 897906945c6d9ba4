// include/GameWorld.h
#pragma once

#include "CombatResolver.h"
#include "EconomyLedger.h"
#include "EntityRegistry.h"
#include "GameConfig.h"
#include "OccupancyIndex.h"
#include "WorldMap.h"

#include <array>
#include <cstddef>
#include <mutex>

namespace Citadel {

/*
  All mutable state of one game. Components hold references into each
  other, so a GameWorld is neither copied nor moved; it lives behind a
  shared_ptr that the scheduler and any in-flight agent thread share.

  `mutex` serialises every gateway call against the scheduler.
*/
class GameWorld {
public:
    /// Places both home-base castles. Throws std::invalid_argument when a
    /// castle cannot stand on its cell.
    GameWorld(const GameConfig& config, WorldMap map);

    GameWorld(const GameWorld&) = delete;
    GameWorld& operator=(const GameWorld&) = delete;

    const GameConfig& config() const { return config_; }

    WorldMap&             map()       { return map_; }
    const WorldMap&       map() const { return map_; }
    OccupancyIndex&       occupancy()       { return occupancy_; }
    const OccupancyIndex& occupancy() const { return occupancy_; }
    EconomyLedger&        ledger()       { return ledger_; }
    const EconomyLedger&  ledger() const { return ledger_; }
    EntityRegistry&       registry()       { return registry_; }
    const EntityRegistry& registry() const { return registry_; }
    CombatResolver&       combat() { return combat_; }

    std::size_t getTurn() const { return turn_; }
    void        advanceTurnCounter() { ++turn_; }

    EntityId getHomeBaseId(Team team) const { return homeBaseIds_[teamIndex(team)]; }
    bool     isHomeBaseStanding(Team team) const;
    /// 0 once destroyed.
    int      homeBaseHealth(Team team) const;

    double getTimeRemaining(Team team) const { return timePools_[teamIndex(team)]; }
    void   setTimeRemaining(Team team, double seconds) { timePools_[teamIndex(team)] = seconds; }

    std::mutex mutex;

private:
    GameConfig     config_;
    WorldMap       map_;
    OccupancyIndex occupancy_;
    EconomyLedger  ledger_;
    EntityRegistry registry_;
    CombatResolver combat_;

    std::size_t             turn_ = 0;
    std::array<EntityId, 2> homeBaseIds_{ -1, -1 };
    std::array<double, 2>   timePools_;
};

} // namespace Citadel

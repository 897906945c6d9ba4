// tests/TestSupport.h
//
// Small builders shared by the engine tests: uniform maps, worlds and
// agents whose playTurn is a lambda.
#pragma once

#include <doctest/doctest.h>

#include "Agent.h"
#include "GameConfig.h"
#include "GameWorld.h"
#include "WorldMap.h"

#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace citadel_test {

inline Citadel::WorldMap uniformMap(int width, int height, Terrain terrain,
                                    std::pair<int, int> blue, std::pair<int, int> red)
{
    std::vector<std::vector<Terrain>> tiles(width, std::vector<Terrain>(height, terrain));
    return Citadel::WorldMap(std::move(tiles), blue, red);
}

// 5x5 grass, BLUE castle at (0,0), RED castle at (4,4).
inline Citadel::WorldMap grassMap()
{
    return uniformMap(5, 5, Terrain::GRASS, { 0, 0 }, { 4, 4 });
}

inline std::shared_ptr<Citadel::GameWorld> makeWorld(const Citadel::WorldMap& map,
                                                     Citadel::GameConfig config = {})
{
    return std::make_shared<Citadel::GameWorld>(config, map);
}

// Places a unit and gives it a fresh turn allowance.
inline EntityId readyUnit(Citadel::GameWorld& world, Team team, UnitKind kind, int x, int y)
{
    auto id = world.registry().placeUnit(team, kind, x, y);
    REQUIRE(id.has_value());
    world.registry().resetTurnAllowances();
    return *id;
}

class ScriptedAgent : public Agent {
public:
    using Script = std::function<void(ActionGateway&)>;

    explicit ScriptedAgent(Script script) : script_(std::move(script)) {}

    void playTurn(ActionGateway& gateway) override { script_(gateway); }

private:
    Script script_;
};

inline AgentFactory scripted(ScriptedAgent::Script script)
{
    return [script](Team, const MapSnapshot&) {
        return std::make_unique<ScriptedAgent>(script);
    };
}

inline AgentFactory idle()
{
    return scripted([](ActionGateway&) {});
}

} // namespace citadel_test

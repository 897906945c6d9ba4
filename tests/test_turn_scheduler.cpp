// tests/test_turn_scheduler.cpp
//
// Turn loop: upkeep, forfeits, time budgets and termination.

#include <doctest/doctest.h>

#include "ReplayRecorder.h"
#include "TestSupport.h"
#include "TurnScheduler.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace Citadel;
using citadel_test::ScriptedAgent;
using citadel_test::grassMap;
using citadel_test::makeWorld;

namespace {

std::shared_ptr<Agent> agent(ScriptedAgent::Script script)
{
    return std::make_shared<ScriptedAgent>(std::move(script));
}

std::shared_ptr<Agent> idleAgent()
{
    return agent([](ActionGateway&) {});
}

} // namespace

TEST_CASE("Upkeep pays income, refills time and resets allowances")
{
    auto world = makeWorld(grassMap());
    world->registry().placeBuilding(Team::BLUE, BuildingKind::FARM_1, 1, 0);
    auto knight = world->registry().placeUnit(Team::RED, UnitKind::KNIGHT, 3, 3);
    REQUIRE(knight);

    std::size_t seenTurn = 0;
    int seenActions = -1;
    auto red = agent([&](ActionGateway& gw) {
        seenTurn = gw.getTurn();
        seenActions = gw.getUnit(*knight)->actionsRemaining;
    });

    ReplayRecorder replay(world->map());
    TurnScheduler scheduler(world, idleAgent(), "idle", red, "watcher", replay);
    scheduler.advanceOneTurn();

    CHECK_FALSE(scheduler.isGameOver());
    CHECK(scheduler.getPhase() == TurnPhase::SNAPSHOT);
    CHECK(std::string(phaseName(scheduler.getPhase())) == "SNAPSHOT");
    CHECK(scheduler.getCurrentTurn() == 1);
    CHECK(seenTurn == 1);
    CHECK(seenActions == 1);
    CHECK(world->ledger().getBalance(Team::BLUE) == doctest::Approx(12.0));
    CHECK(world->ledger().getBalance(Team::RED) == doctest::Approx(11.0));
    CHECK(world->getTimeRemaining(Team::RED) <= 10.01);
    CHECK(world->getTimeRemaining(Team::RED) > 9.0);
    CHECK(replay.size() == 1);
}

TEST_CASE("A throwing agent forfeits and the other side wins")
{
    auto world = makeWorld(grassMap());
    auto blue = agent([](ActionGateway&) { throw std::runtime_error("boom"); });

    ReplayRecorder replay(world->map());
    TurnScheduler scheduler(world, blue, "thrower", idleAgent(), "idle", replay);
    scheduler.advanceOneTurn();

    REQUIRE(scheduler.isGameOver());
    CHECK(scheduler.hasForfeited(Team::BLUE));
    CHECK_FALSE(scheduler.hasForfeited(Team::RED));
    CHECK(scheduler.getVerdict()->winner == Team::RED);
    CHECK(scheduler.getVerdict()->reason == GameResult::FORFEIT);
    CHECK(world->getTimeRemaining(Team::BLUE) == doctest::Approx(0.0));
    CHECK(replay.size() == 1);
    CHECK(replay.document().at("winner_color").get<std::string>() == "RED");
    CHECK(scheduler.advanceOneTurn().empty());
}

TEST_CASE("Both agents forfeiting falls back to the cascade")
{
    auto world = makeWorld(grassMap());
    auto thrower = [] { return agent([](ActionGateway&) { throw std::logic_error("nope"); }); };

    ReplayRecorder replay(world->map());
    TurnScheduler scheduler(world, thrower(), "a", thrower(), "b", replay);
    scheduler.advanceOneTurn();

    REQUIRE(scheduler.isGameOver());
    CHECK(scheduler.getVerdict()->winner == Team::RED);
    CHECK(scheduler.getVerdict()->reason == GameResult::SECOND_MOVER);
}

TEST_CASE("An agent that overruns its pool is cut off from the world")
{
    GameConfig cfg;
    cfg.initialTimePool = 0.2;
    auto world = makeWorld(grassMap(), cfg);

    // 0 = still sleeping, 1 = late spawn refused, 2 = late spawn accepted
    auto lateSpawn = std::make_shared<std::atomic<int>>(0);
    auto slow = agent([lateSpawn](ActionGateway& gw) {
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        const bool ok = gw.spawnUnit(UnitKind::KNIGHT, gw.getHomeBaseId(gw.getTeam()));
        lateSpawn->store(ok ? 2 : 1);
    });

    ReplayRecorder replay(world->map());
    TurnScheduler scheduler(world, idleAgent(), "idle", slow, "sleeper", replay);
    scheduler.advanceOneTurn();

    REQUIRE(scheduler.isGameOver());
    CHECK(scheduler.hasForfeited(Team::RED));
    CHECK(scheduler.getVerdict()->winner == Team::BLUE);
    CHECK(scheduler.getVerdict()->reason == GameResult::FORFEIT);
    CHECK(world->getTimeRemaining(Team::RED) == doctest::Approx(0.0));

    for (int i = 0; i < 100 && lateSpawn->load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    CHECK(lateSpawn->load() == 1);
    std::lock_guard<std::mutex> lock(world->mutex);
    CHECK(world->registry().units(Team::RED).empty());
    CHECK(world->ledger().getBalance(Team::RED) == doctest::Approx(11.0));
}

TEST_CASE("The turn limit ends the game through the cascade")
{
    GameConfig cfg;
    cfg.maxTurns = 3;
    auto world = makeWorld(grassMap(), cfg);

    ReplayRecorder replay(world->map());
    TurnScheduler scheduler(world, idleAgent(), "a", idleAgent(), "b", replay);
    int turns = 0;
    while (!scheduler.isGameOver()) {
        CHECK_FALSE(scheduler.advanceOneTurn().empty());
        ++turns;
    }

    CHECK(turns == 3);
    CHECK(scheduler.getPhase() == TurnPhase::GAME_OVER);
    CHECK(scheduler.getVerdict()->winner == Team::RED);
    CHECK(replay.size() == 3);
    CHECK(replay.document().at("replay").at(2).at("winner_color").get<std::string>() == "RED");
}

TEST_CASE("Destroying the enemy castle ends the game that turn")
{
    auto world = makeWorld(grassMap());
    const EntityId redCastle = world->getHomeBaseId(Team::RED);
    world->registry().damage(redCastle, 29);
    auto k = world->registry().placeUnit(Team::BLUE, UnitKind::KNIGHT, 3, 3);
    REQUIRE(k);

    auto blue = agent([&](ActionGateway& gw) { gw.unitAttackBuilding(*k, redCastle); });
    ReplayRecorder replay(world->map());
    TurnScheduler scheduler(world, blue, "striker", idleAgent(), "idle", replay);
    scheduler.advanceOneTurn();

    REQUIRE(scheduler.isGameOver());
    CHECK(scheduler.getVerdict()->winner == Team::BLUE);
    CHECK(scheduler.getVerdict()->reason == GameResult::HOME_BASE_DESTROYED);
    CHECK(scheduler.getResultString().find("BLUE (striker)") == 0);
}

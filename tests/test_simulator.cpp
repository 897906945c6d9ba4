// tests/test_simulator.cpp
//
// Host-side pieces: command line, plugin registrar and competition scoring.

#include <doctest/doctest.h>

#include "AgentRegistrar.h"
#include "AgentRegistration.h"
#include "ArgParser.h"
#include "Simulator.h"
#include "TestSupport.h"
#include "ThreadPool.h"

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

using Citadel::GameResult;

namespace {

MatchEntry finished(const std::string& a1, const std::string& a2, std::optional<Team> winner)
{
    GameResult r;
    r.winner = winner;
    r.reason = winner ? GameResult::HOME_BASE_DESTROYED : GameResult::INIT_FAILURE;
    return MatchEntry("maps/m.txt", a1, a2, r);
}

struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;

    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& s : storage) ptrs.push_back(s.data());
    }
    int argc() const { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }
};

} // namespace

TEST_CASE("Scores give three per win and one each for a draw")
{
    const std::vector<MatchEntry> results{
        finished("alpha", "beta", Team::BLUE),
        finished("beta", "alpha", Team::BLUE),
        finished("alpha", "gamma", Team::RED),
        finished("gamma", "beta", std::nullopt),
    };

    const auto scores = Simulator::calculateScores(results);
    CHECK(scores.at("alpha") == 3);
    CHECK(scores.at("beta") == 4);
    CHECK(scores.at("gamma") == 4);

    const auto sorted = Simulator::sortScoresByDescending(scores);
    REQUIRE(sorted.size() == 3);
    CHECK(sorted[0].second == 4);
    CHECK(sorted[1].second == 4);
    CHECK(sorted[2].first == "alpha");
    // equal scores keep name order
    CHECK(sorted[0].first == "beta");
}

TEST_CASE("Balancing overrides are parsed into the game config")
{
    Config cfg;
    Argv args({ "citadel", "--match", "--verbose", "max_turns=50", "time_pool=2.5",
                "time_increment=0", "starting_balance=25", "num_threads=4", "replay=out.json" });
    std::vector<std::string> unsupported;
    parseArgumentsList(args.argc(), args.argv(), cfg, unsupported);

    CHECK(unsupported.empty());
    CHECK(cfg.modeMatch);
    CHECK(cfg.verbose);
    CHECK(cfg.numThreads == 4);
    CHECK(cfg.replay == "out.json");
    CHECK(cfg.game.maxTurns == 50);
    CHECK(cfg.game.initialTimePool == doctest::Approx(2.5));
    CHECK(cfg.game.timeIncrement == doctest::Approx(0.0));
    CHECK(cfg.game.startingBalance == doctest::Approx(25.0));
}

TEST_CASE("Bad values and unknown keys are reported as unsupported")
{
    Config cfg;
    Argv args({ "citadel", "max_turns=-1", "time_pool=0", "num_threads=abc", "speed=9", "agent1=a.so" });
    std::vector<std::string> unsupported;
    parseArgumentsList(args.argc(), args.argv(), cfg, unsupported);

    CHECK(unsupported == std::vector<std::string>{ "max_turns=-1", "time_pool=0", "num_threads=abc", "speed=9" });
    CHECK(cfg.agent1 == "a.so");
    CHECK(stripKey("game_map=maps/x.txt", "game_map=") == "maps/x.txt");
}

TEST_CASE("A mode and its paths are required")
{
    Config neither;
    CHECK_FALSE(checkModeSelection(neither, "citadel"));

    Config both;
    both.modeMatch = both.modeCompetition = true;
    CHECK_FALSE(checkModeSelection(both, "citadel"));

    Config match;
    match.modeMatch = true;
    match.game_map = "map.txt";
    std::vector<std::string> missing;
    collectMissingArgs(match, missing);
    CHECK(missing == std::vector<std::string>{ "agent1", "agent2" });
}

TEST_CASE("AgentRegistrar accepts a plugin only once its factory registered")
{
    auto& reg = AgentRegistrar::get();
    reg.clear();

    reg.createAgentEntry("silent");
    CHECK_THROWS_AS(reg.validateLastRegistration(), AgentRegistrar::BadRegistrationException);
    reg.removeLast();
    CHECK(reg.count() == 0);

    reg.createAgentEntry("scripted");
    AgentRegistration registration(citadel_test::idle());
    CHECK_NOTHROW(reg.validateLastRegistration());
    REQUIRE(reg.count() == 1);
    CHECK(reg.at(0).name() == "scripted");
    CHECK(static_cast<bool>(reg.at(0).create(Team::RED, MapSnapshot{})));

    reg.clear();
}

TEST_CASE("A library registering two agents is rejected")
{
    auto& reg = AgentRegistrar::get();
    reg.clear();
    CHECK_THROWS_AS(reg.validateLastRegistration(), AgentRegistrar::BadRegistrationException);

    reg.createAgentEntry("twins");
    AgentRegistration first(citadel_test::idle());
    AgentRegistration second(citadel_test::idle());
    try {
        reg.validateLastRegistration();
        FAIL("two registrations were accepted");
    } catch (const AgentRegistrar::BadRegistrationException& e) {
        CHECK(e.name == "twins");
        CHECK(e.hasFactory);
        CHECK(e.factoryCount == 2);
    }
    reg.removeLast();
    CHECK(reg.count() == 0);
}

TEST_CASE("ThreadPool runs every queued task even when some throw")
{
    std::atomic<int> ran{ 0 };
    ThreadPool pool(3, false);
    REQUIRE(pool.size() == 3);

    for (int i = 0; i < 20; ++i) {
        pool.enqueue([&ran, i] {
            ++ran;
            if (i % 5 == 0) throw std::runtime_error("game failed");
            if (i % 7 == 0) throw i;
        });
    }
    pool.shutdown();

    CHECK(ran == 20);
    CHECK(pool.completedTasks() == 20);

    pool.enqueue([&ran] { ++ran; });   // refused once stopped
    pool.shutdown();
    CHECK(ran == 20);
}

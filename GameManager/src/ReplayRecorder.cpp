#include "ReplayRecorder.h"

#include <GameResult.h>

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace Citadel {

namespace {

json unitToJson(const Unit& u) {
    return json{
        { "id",                      u.getId() },
        { "team",                    teamName(u.getTeam()) },
        { "type",                    unitKindName(u.getKind()) },
        { "x",                       u.getX() },
        { "y",                       u.getY() },
        { "turn_actions_remaining",  u.getActionsRemaining() },
        { "turn_movement_remaining", u.getMovementRemaining() },
        { "attack_range",            u.getAttackRange() },
        { "health",                  u.getHealth() },
        { "damage",                  u.getDamage() },
        { "defense",                 u.getDefense() },
        { "damage_range",            u.getDamageRange() },
        { "level",                   u.getLevel() }
    };
}

json buildingToJson(const Building& b) {
    return json{
        { "id",                     b.getId() },
        { "team",                   teamName(b.getTeam()) },
        { "type",                   buildingKindName(b.getKind()) },
        { "x",                      b.getX() },
        { "y",                      b.getY() },
        { "turn_actions_remaining", b.getActionsRemaining() },
        { "attack_range",           b.getAttackRange() },
        { "health",                 b.getHealth() },
        { "damage",                 b.getDamage() },
        { "defense",                b.getDefense() },
        { "damage_range",           b.getDamageRange() },
        { "level",                  b.getLevel() }
    };
}

} // namespace

ReplayRecorder::ReplayRecorder(const WorldMap& map) {
    document_["ID"]           = makeUuid4();
    document_["map"]          = serializeMap(map);
    document_["winner_color"] = "None";
    document_["replay"]       = json::array();
}

std::string ReplayRecorder::makeUuid4() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned int> byte(0, 255);

    unsigned char bytes[16];
    for (auto& b : bytes) b = static_cast<unsigned char>(byte(gen));
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);   // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);   // RFC 4122 variant

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) os << '-';
        os << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return os.str();
}

json ReplayRecorder::serializeMap(const WorldMap& map) {
    json tiles = json::array();
    for (const auto& column : map.getTiles()) {
        json col = json::array();
        for (Terrain t : column) col.push_back(terrainName(t));
        tiles.push_back(std::move(col));
    }
    return json{
        { "width",  map.getWidth() },
        { "height", map.getHeight() },
        { "tiles",  std::move(tiles) }
    };
}

json ReplayRecorder::serializeState(const GameWorld& world) {
    json state;
    json balance, buildings, units, time;
    for (Team t : kAllTeams) {
        const char* name = teamName(t);
        balance[name] = world.ledger().getBalance(t);
        time[name]    = world.getTimeRemaining(t);

        json bs = json::array();
        for (const auto& [id, b] : world.registry().buildings(t)) bs.push_back(buildingToJson(b));
        buildings[name] = std::move(bs);

        json us = json::array();
        for (const auto& [id, u] : world.registry().units(t)) us.push_back(unitToJson(u));
        units[name] = std::move(us);
    }
    state["balance"]             = std::move(balance);
    state["turn"]                = world.getTurn();
    state["buildings"]           = std::move(buildings);
    state["units"]               = std::move(units);
    state["red_main_castle_id"]  = world.getHomeBaseId(Team::RED);
    state["blue_main_castle_id"] = world.getHomeBaseId(Team::BLUE);
    state["time_remaining"]      = std::move(time);
    return state;
}

void ReplayRecorder::recordTurn(const GameWorld& world) {
    document_["replay"].push_back(json{
        { "turn_number", world.getTurn() },
        { "game_state",  serializeState(world) }
    });
}

bool ReplayRecorder::annotateWinner(std::optional<Team> winner) {
    if (annotated_) return false;
    annotated_ = true;

    const std::string color = winnerName(winner);
    document_["winner_color"] = color;
    auto& turns = document_["replay"];
    if (!turns.empty()) turns.back()["winner_color"] = color;
    return true;
}

void ReplayRecorder::writeToFile(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("ReplayRecorder: cannot open " + path);
    }
    out << document_.dump(4) << "\n";
    if (!out) {
        throw std::runtime_error("ReplayRecorder: write to " + path + " failed");
    }
}

} // namespace Citadel

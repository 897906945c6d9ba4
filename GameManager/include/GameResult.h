#pragma once

#include <GameTypes.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>

namespace Citadel {

struct GameResult {
    enum Reason {
        HOME_BASE_DESTROYED,   // exactly one base fell
        HOME_BASE_HEALTH,      // higher base health
        ECONOMIC_VALUE,        // balance + archetype costs
        SECOND_MOVER,          // exact tie, RED takes it
        FORFEIT,               // the other side threw or ran out of time
        INIT_FAILURE           // an agent could not be constructed
    };

    std::optional<Team> winner;   // nullopt only when both agents failed to initialize
    Reason              reason = HOME_BASE_DESTROYED;
    std::size_t         rounds = 0;
    nlohmann::json      replay;
};

inline const char* reasonToString(GameResult::Reason r) {
    switch (r) {
        case GameResult::HOME_BASE_DESTROYED: return "HOME_BASE_DESTROYED";
        case GameResult::HOME_BASE_HEALTH:    return "HOME_BASE_HEALTH";
        case GameResult::ECONOMIC_VALUE:      return "ECONOMIC_VALUE";
        case GameResult::SECOND_MOVER:        return "SECOND_MOVER";
        case GameResult::FORFEIT:             return "FORFEIT";
        case GameResult::INIT_FAILURE:        return "INIT_FAILURE";
    }
    return "UNKNOWN";
}

inline const char* winnerName(const std::optional<Team>& winner) {
    return winner ? teamName(*winner) : "None";
}

} // namespace Citadel

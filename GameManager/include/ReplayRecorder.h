// include/ReplayRecorder.h
#pragma once

#include "GameWorld.h"
#include "WorldMap.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace Citadel {

/*
  Append-only list of per-turn world snapshots, kept as the replay JSON
  document:
    { "ID": uuid4, "map": {...}, "winner_color": ..., "replay": [ {turn_number, game_state}, ... ] }

  Entries are never edited after they are appended, except that the last
  one is stamped with "winner_color" exactly once when the game ends.
*/
class ReplayRecorder {
public:
    explicit ReplayRecorder(const WorldMap& map);

    void recordTurn(const GameWorld& world);

    /// Returns false if the replay was already annotated.
    bool annotateWinner(std::optional<Team> winner);
    bool isAnnotated() const { return annotated_; }

    std::size_t size() const { return document_.at("replay").size(); }
    const nlohmann::json& document() const { return document_; }

    /// Throws std::runtime_error if the file cannot be written.
    void writeToFile(const std::string& path) const;

    static nlohmann::json serializeMap(const WorldMap& map);
    static nlohmann::json serializeState(const GameWorld& world);
    static std::string    makeUuid4();

private:
    nlohmann::json document_;
    bool           annotated_ = false;
};

} // namespace Citadel

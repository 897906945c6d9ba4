#pragma once

#include "WorldMap.h"

#include <cstddef>
#include <string>
#include <vector>

/*
  Reads a map file: one bracketed list of columns, each a bracketed list of
  quoted terrain names, e.g.  [['GRASS', 'BLUE CASTLE'], ['WATER', 'RED CASTLE']]
  The outer index is x and the inner index is y. Exactly one 'BLUE CASTLE'
  and one 'RED CASTLE' must appear; both cells become GRASS.
*/
class MapLoader {
public:
    /// Throws std::runtime_error if the file cannot be read and
    /// std::invalid_argument if its contents are malformed.
    static Citadel::WorldMap loadFromFile(const std::string& path);
    static Citadel::WorldMap parse(const std::string& text);

    /// Throws std::invalid_argument for unknown names.
    static Terrain terrainFromName(const std::string& name);

private:
    explicit MapLoader(const std::string& text) : text_(text) {}

    std::vector<std::vector<std::string>> parseColumns();
    std::vector<std::string> parseColumn();
    std::string parseQuoted();
    void skipWhitespace();
    bool consume(char c);
    void expect(char c);
    [[noreturn]] void fail(const std::string& what) const;

    const std::string& text_;
    std::size_t        pos_ = 0;
};

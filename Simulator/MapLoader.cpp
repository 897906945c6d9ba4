#include "MapLoader.h"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

using Citadel::WorldMap;

namespace {
const std::string BLUE_MARKER = "BLUE CASTLE";
const std::string RED_MARKER  = "RED CASTLE";
}

Terrain MapLoader::terrainFromName(const std::string& name) {
    if (name == "GRASS")    return Terrain::GRASS;
    if (name == "MOUNTAIN") return Terrain::MOUNTAIN;
    if (name == "SAND")     return Terrain::SAND;
    if (name == "WATER")    return Terrain::WATER;
    if (name == "BRIDGE")   return Terrain::BRIDGE;
    if (name == "ERROR")    return Terrain::ERROR;
    throw std::invalid_argument("MapLoader: unknown terrain '" + name + "'");
}

WorldMap MapLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("MapLoader: cannot open map file " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    try {
        return parse(buf.str());
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(path + ": " + e.what());
    }
}

WorldMap MapLoader::parse(const std::string& text) {
    MapLoader parser(text);
    auto columns = parser.parseColumns();
    parser.skipWhitespace();
    if (parser.pos_ != text.size()) parser.fail("trailing characters after map");
    if (columns.empty()) throw std::invalid_argument("MapLoader: map is empty");

    std::pair<int, int> blue{ -1, -1 }, red{ -1, -1 };
    std::vector<std::vector<Terrain>> tiles(columns.size());
    for (std::size_t x = 0; x < columns.size(); ++x) {
        for (std::size_t y = 0; y < columns[x].size(); ++y) {
            const std::string& name = columns[x][y];
            const std::pair<int, int> here{ static_cast<int>(x), static_cast<int>(y) };
            if (name == BLUE_MARKER || name == RED_MARKER) {
                auto& slot = (name == BLUE_MARKER) ? blue : red;
                if (slot.first >= 0) throw std::invalid_argument("MapLoader: more than one " + name);
                slot = here;
                tiles[x].push_back(Terrain::GRASS);
            } else {
                tiles[x].push_back(terrainFromName(name));
            }
        }
    }
    if (blue.first < 0) throw std::invalid_argument("MapLoader: no " + BLUE_MARKER + " marker");
    if (red.first < 0)  throw std::invalid_argument("MapLoader: no " + RED_MARKER + " marker");

    return WorldMap(std::move(tiles), blue, red);
}

std::vector<std::vector<std::string>> MapLoader::parseColumns() {
    std::vector<std::vector<std::string>> columns;
    expect('[');
    while (true) {
        skipWhitespace();
        if (consume(']')) break;
        columns.push_back(parseColumn());
        skipWhitespace();
        if (consume(']')) break;
        expect(',');
    }
    return columns;
}

std::vector<std::string> MapLoader::parseColumn() {
    std::vector<std::string> cells;
    expect('[');
    while (true) {
        skipWhitespace();
        if (consume(']')) break;
        cells.push_back(parseQuoted());
        skipWhitespace();
        if (consume(']')) break;
        expect(',');
    }
    return cells;
}

std::string MapLoader::parseQuoted() {
    skipWhitespace();
    if (pos_ >= text_.size() || (text_[pos_] != '\'' && text_[pos_] != '"')) {
        fail("expected a quoted terrain name");
    }
    const char quote = text_[pos_++];
    const std::size_t end = text_.find(quote, pos_);
    if (end == std::string::npos) fail("unterminated string");
    std::string value = text_.substr(pos_, end - pos_);
    pos_ = end + 1;
    return value;
}

void MapLoader::skipWhitespace() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
}

bool MapLoader::consume(char c) {
    skipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == c) {
        ++pos_;
        return true;
    }
    return false;
}

void MapLoader::expect(char c) {
    if (!consume(c)) fail(std::string("expected '") + c + "'");
}

void MapLoader::fail(const std::string& what) const {
    throw std::invalid_argument("MapLoader: " + what + " at offset " + std::to_string(pos_));
}

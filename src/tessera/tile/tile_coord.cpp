#include <tessera/tile/tile_coord.hpp>
#include <tessera/tile/tile_grid.hpp>
#include <tessera/util/exception.hpp>

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <ostream>

using namespace tessera;

std::ostream& tessera::operator<<(std::ostream& os, const TileCoordinate& coord) {
    return os << coord.z << "/" << coord.x << "/" << coord.y;
}

namespace {

// Parses one integer component that ends at `delimiter` (or the end of the
// string when delimiter is 0) and advances `pos` past it.
bool parseComponent(const std::string& str, std::size_t& pos, char delimiter, int32_t& out) {
    const char* begin = str.c_str() + pos;
    char* end = nullptr;
    errno = 0;
    const long value = std::strtol(begin, &end, 10);
    if (end == begin || errno == ERANGE ||
        value < std::numeric_limits<int32_t>::min() ||
        value > std::numeric_limits<int32_t>::max()) {
        return false;
    }
    if (*end != delimiter) {
        return false;
    }
    out = static_cast<int32_t>(value);
    pos = static_cast<std::size_t>(end - str.c_str()) + (delimiter ? 1 : 0);
    return true;
}

TileCoordinate parse(const std::string& str, char delimiter, const std::string& original) {
    TileCoordinate coord;
    std::size_t pos = 0;
    if (!parseComponent(str, pos, delimiter, coord.z) ||
        !parseComponent(str, pos, delimiter, coord.x) ||
        !parseComponent(str, pos, 0, coord.y)) {
        throw util::TileKeyException("invalid tile key: \"" + original + "\"");
    }
    return coord;
}

}

std::string tile_coord::getKeyZXY(int32_t z, int32_t x, int32_t y) {
    return std::to_string(z) + "/" + std::to_string(x) + "/" + std::to_string(y);
}

std::string tile_coord::getKey(const TileCoordinate& coord) {
    return getKeyZXY(coord.z, coord.x, coord.y);
}

TileCoordinate tile_coord::fromKey(const std::string& key) {
    return parse(key, '/', key);
}

std::string tile_coord::getCacheKeyForTileKey(const std::string& tileKey) {
    const std::size_t slash = tileKey.rfind('/');
    const std::string suffix = slash == std::string::npos ? tileKey : tileKey.substr(slash + 1);
    return getKey(parse(suffix, ',', tileKey));
}

int64_t tile_coord::hash(const TileCoordinate& coord) {
    // x * 2^z without the overflow of a 32-bit shift.
    const int64_t factor = coord.z >= 0 && coord.z < 63 ? (int64_t(1) << coord.z) : 0;
    return int64_t(coord.x) * factor + coord.y;
}

bool tile_coord::withinExtentAndZ(const TileCoordinate& coord, const TileGrid& grid) {
    if (grid.getMinZoom() > coord.z || coord.z > grid.getMaxZoom()) {
        return false;
    }
    const auto range = grid.getFullTileRange(coord.z);
    if (!range) {
        return true;
    }
    return range->containsXY(coord.x, coord.y);
}

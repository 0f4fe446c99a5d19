#ifndef TESSERA_TILE_TILE_COORD
#define TESSERA_TILE_TILE_COORD

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

namespace tessera {

class TileGrid;

// Position of a tile in a tile grid. Tile coordinates increase left to
// right and downwards from the grid origin; x and y may be negative.
class TileCoordinate {
public:
    inline TileCoordinate(int32_t z_ = 0, int32_t x_ = 0, int32_t y_ = 0)
        : z(z_), x(x_), y(y_) {}

    inline bool operator==(const TileCoordinate& rhs) const {
        return z == rhs.z && x == rhs.x && y == rhs.y;
    }

    inline bool operator!=(const TileCoordinate& rhs) const {
        return !operator==(rhs);
    }

    inline bool operator<(const TileCoordinate& rhs) const {
        if (z != rhs.z) return z < rhs.z;
        if (x != rhs.x) return x < rhs.x;
        return y < rhs.y;
    }

    int32_t z;
    int32_t x;
    int32_t y;
};

std::ostream& operator<<(std::ostream&, const TileCoordinate&);

namespace tile_coord {

// "z/x/y"
std::string getKeyZXY(int32_t z, int32_t x, int32_t y);
std::string getKey(const TileCoordinate&);

// Inverse of getKey(). Throws util::TileKeyException for anything that is
// not three slash separated integers.
TileCoordinate fromKey(const std::string& key);

// Tile keys have the form "<source key>/<z>,<x>,<y>" (see Tile::getKey()).
std::string getCacheKeyForTileKey(const std::string& tileKey);

int64_t hash(const TileCoordinate&);

bool withinExtentAndZ(const TileCoordinate&, const TileGrid&);

} // namespace tile_coord
} // namespace tessera

namespace std {

template <>
struct hash<tessera::TileCoordinate> {
    std::size_t operator()(const tessera::TileCoordinate& coord) const {
        return std::hash<int64_t>()(tessera::tile_coord::hash(coord));
    }
};

}

#endif

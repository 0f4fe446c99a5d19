#ifndef TESSERA_TILE_TILE_RANGE
#define TESSERA_TILE_TILE_RANGE

#include <tessera/tile/tile_coord.hpp>
#include <tessera/util/geo.hpp>

#include <cstdint>
#include <iosfwd>

namespace tessera {

// A contiguous block of tiles. Both bounds are inclusive.
class TileRange {
public:
    TileRange(int32_t minX = 0, int32_t maxX = -1, int32_t minY = 0, int32_t maxY = -1);

    bool contains(const TileCoordinate&) const;
    bool containsTileRange(const TileRange&) const;
    bool containsXY(int32_t x, int32_t y) const;

    // Touching edges count.
    bool intersects(const TileRange&) const;

    void extend(const TileRange&);

    int32_t getWidth() const;
    int32_t getHeight() const;
    Size getSize() const;

    bool operator==(const TileRange&) const;
    bool operator!=(const TileRange& rhs) const { return !operator==(rhs); }

    int32_t minX;
    int32_t maxX;
    int32_t minY;
    int32_t maxY;
};

std::ostream& operator<<(std::ostream&, const TileRange&);

// Rewrites `range` in place and returns it.
TileRange& createOrUpdate(int32_t minX, int32_t maxX, int32_t minY, int32_t maxY, TileRange& range);

}

#endif

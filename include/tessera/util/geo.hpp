#ifndef TESSERA_UTIL_GEO
#define TESSERA_UTIL_GEO

#include <array>
#include <cstdint>

namespace tessera {

// A map-unit position [x, y].
using Coordinate = std::array<double, 2>;

// [minX, minY, maxX, maxY] in map units.
using Extent = std::array<double, 4>;

// [width, height] in pixels (or tiles, for grid sizes).
using Size = std::array<int32_t, 2>;

enum class Corner : uint8_t {
    BottomLeft,
    BottomRight,
    TopLeft,
    TopRight,
};

}

#endif

#ifndef TESSERA_UTIL_CONSTANTS
#define TESSERA_UTIL_CONSTANTS

#include <cstddef>
#include <cstdint>

namespace tessera {

namespace util {

extern const int32_t DEFAULT_TILE_SIZE;
extern const int32_t DEFAULT_MAX_ZOOM;

// Number of decimal digits considered when snapping fractional tile
// coordinates to integers.
extern const int DECIMALS;

// Opacity transition of freshly loaded tiles, in milliseconds.
extern const double DEFAULT_TRANSITION;

extern const std::size_t DEFAULT_CACHE_SIZE;

extern const double PI;
extern const double EARTH_RADIUS_M;
extern const double EPSG3857_HALF_SIZE;

}

}

#endif

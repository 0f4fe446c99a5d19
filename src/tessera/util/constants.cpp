#include <tessera/util/constants.hpp>

const int32_t tessera::util::DEFAULT_TILE_SIZE = 256;
const int32_t tessera::util::DEFAULT_MAX_ZOOM = 42;
const int tessera::util::DECIMALS = 5;
const double tessera::util::DEFAULT_TRANSITION = 250;
const std::size_t tessera::util::DEFAULT_CACHE_SIZE = 2048;

const double tessera::util::PI = 3.14159265358979323846;
const double tessera::util::EARTH_RADIUS_M = 6370997;
const double tessera::util::EPSG3857_HALF_SIZE = 20037508.342789244;

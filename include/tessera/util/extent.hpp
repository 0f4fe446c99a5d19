#ifndef TESSERA_UTIL_EXTENT
#define TESSERA_UTIL_EXTENT

#include <tessera/util/geo.hpp>

namespace tessera {
namespace extent {

// An extent that contains nothing; extending it with a coordinate yields a
// point extent.
Extent createEmpty();

bool isEmpty(const Extent&);

double getWidth(const Extent&);
double getHeight(const Extent&);

Coordinate getCenter(const Extent&);
Coordinate getTopLeft(const Extent&);
Coordinate getCorner(const Extent&, Corner);

bool containsXY(const Extent&, double x, double y);
bool containsCoordinate(const Extent&, const Coordinate&);

// Touching edges count as an intersection.
bool intersects(const Extent&, const Extent&);

// Returns an empty extent when the two do not intersect.
Extent getIntersection(const Extent&, const Extent&);

// Grows (or, for a negative value, shrinks) the extent on every side.
Extent buffer(const Extent&, double value);

void extendCoordinate(Extent&, const Coordinate&);

} // namespace extent
} // namespace tessera

#endif

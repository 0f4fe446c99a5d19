#include <tessera/util/extent.hpp>

#include <algorithm>
#include <limits>

namespace tessera {
namespace extent {

Extent createEmpty() {
    const double inf = std::numeric_limits<double>::infinity();
    return {{ inf, inf, -inf, -inf }};
}

bool isEmpty(const Extent& extent) {
    return extent[2] < extent[0] || extent[3] < extent[1];
}

double getWidth(const Extent& extent) {
    return extent[2] - extent[0];
}

double getHeight(const Extent& extent) {
    return extent[3] - extent[1];
}

Coordinate getCenter(const Extent& extent) {
    return {{ (extent[0] + extent[2]) / 2, (extent[1] + extent[3]) / 2 }};
}

Coordinate getTopLeft(const Extent& extent) {
    return {{ extent[0], extent[3] }};
}

Coordinate getCorner(const Extent& extent, Corner corner) {
    switch (corner) {
    case Corner::BottomLeft:  return {{ extent[0], extent[1] }};
    case Corner::BottomRight: return {{ extent[2], extent[1] }};
    case Corner::TopLeft:     return {{ extent[0], extent[3] }};
    case Corner::TopRight:    return {{ extent[2], extent[3] }};
    }
    return getTopLeft(extent);
}

bool containsXY(const Extent& extent, double x, double y) {
    return extent[0] <= x && x <= extent[2] && extent[1] <= y && y <= extent[3];
}

bool containsCoordinate(const Extent& extent, const Coordinate& coordinate) {
    return containsXY(extent, coordinate[0], coordinate[1]);
}

bool intersects(const Extent& a, const Extent& b) {
    return a[0] <= b[2] && a[2] >= b[0] && a[1] <= b[3] && a[3] >= b[1];
}

Extent getIntersection(const Extent& a, const Extent& b) {
    if (!intersects(a, b)) {
        return createEmpty();
    }
    return {{
        std::max(a[0], b[0]),
        std::max(a[1], b[1]),
        std::min(a[2], b[2]),
        std::min(a[3], b[3]),
    }};
}

Extent buffer(const Extent& extent, double value) {
    return {{ extent[0] - value, extent[1] - value, extent[2] + value, extent[3] + value }};
}

void extendCoordinate(Extent& extent, const Coordinate& coordinate) {
    extent[0] = std::min(extent[0], coordinate[0]);
    extent[1] = std::min(extent[1], coordinate[1]);
    extent[2] = std::max(extent[2], coordinate[0]);
    extent[3] = std::max(extent[3], coordinate[1]);
}

} // namespace extent
} // namespace tessera

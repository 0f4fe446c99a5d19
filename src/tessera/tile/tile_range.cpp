#include <tessera/tile/tile_range.hpp>

#include <ostream>

using namespace tessera;

TileRange::TileRange(int32_t minX_, int32_t maxX_, int32_t minY_, int32_t maxY_)
    : minX(minX_), maxX(maxX_), minY(minY_), maxY(maxY_) {
}

bool TileRange::contains(const TileCoordinate& coord) const {
    return containsXY(coord.x, coord.y);
}

bool TileRange::containsTileRange(const TileRange& other) const {
    return minX <= other.minX && other.maxX <= maxX &&
           minY <= other.minY && other.maxY <= maxY;
}

bool TileRange::containsXY(int32_t x, int32_t y) const {
    return minX <= x && x <= maxX && minY <= y && y <= maxY;
}

bool TileRange::intersects(const TileRange& other) const {
    return minX <= other.maxX && maxX >= other.minX &&
           minY <= other.maxY && maxY >= other.minY;
}

void TileRange::extend(const TileRange& other) {
    if (other.minX < minX) minX = other.minX;
    if (other.maxX > maxX) maxX = other.maxX;
    if (other.minY < minY) minY = other.minY;
    if (other.maxY > maxY) maxY = other.maxY;
}

int32_t TileRange::getWidth() const {
    return maxX - minX + 1;
}

int32_t TileRange::getHeight() const {
    return maxY - minY + 1;
}

Size TileRange::getSize() const {
    return {{ getWidth(), getHeight() }};
}

bool TileRange::operator==(const TileRange& rhs) const {
    return minX == rhs.minX && minY == rhs.minY && maxX == rhs.maxX && maxY == rhs.maxY;
}

std::ostream& tessera::operator<<(std::ostream& os, const TileRange& range) {
    return os << "[" << range.minX << ".." << range.maxX << ", "
              << range.minY << ".." << range.maxY << "]";
}

TileRange& tessera::createOrUpdate(int32_t minX, int32_t maxX, int32_t minY, int32_t maxY, TileRange& range) {
    range.minX = minX;
    range.maxX = maxX;
    range.minY = minY;
    range.maxY = maxY;
    return range;
}

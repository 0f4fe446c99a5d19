#include <tessera/geo/projection.hpp>
#include <tessera/util/constants.hpp>

namespace tessera {

boost::optional<double> metersPerUnit(Units units) {
    switch (units) {
    case Units::Degrees: return (2 * util::PI * util::EARTH_RADIUS_M) / 360;
    case Units::Feet:    return 0.3048;
    case Units::Meters:  return 1.0;
    case Units::UsFeet:  return 1200.0 / 3937;
    case Units::Radians: return util::EARTH_RADIUS_M;
    case Units::Pixels:
    case Units::TilePixels:
        break;
    }
    return boost::none;
}

Projection::Projection(std::string code_,
                       Units units_,
                       boost::optional<Extent> extent_,
                       bool global_,
                       boost::optional<double> metersPerUnitOverride)
    : code(std::move(code_)),
      units(units_),
      extent(std::move(extent_)),
      global(global_),
      metersPerUnit_(std::move(metersPerUnitOverride)) {
}

boost::optional<double> Projection::getMetersPerUnit() const {
    if (metersPerUnit_) {
        return metersPerUnit_;
    }
    return metersPerUnit(units);
}

const Projection& Projection::EPSG3857() {
    static const Projection projection(
        "EPSG:3857", Units::Meters,
        Extent {{ -util::EPSG3857_HALF_SIZE, -util::EPSG3857_HALF_SIZE,
                   util::EPSG3857_HALF_SIZE,  util::EPSG3857_HALF_SIZE }},
        true);
    return projection;
}

const Projection& Projection::EPSG4326() {
    static const Projection projection(
        "EPSG:4326", Units::Degrees,
        Extent {{ -180, -90, 180, 90 }},
        true);
    return projection;
}

}

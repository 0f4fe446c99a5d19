#ifndef TESSERA_GEO_PROJECTION
#define TESSERA_GEO_PROJECTION

#include <tessera/util/geo.hpp>

#include <boost/optional.hpp>

#include <string>

namespace tessera {

enum class Units : uint8_t {
    Degrees,
    Feet,
    Meters,
    Pixels,
    TilePixels,
    UsFeet,
    Radians,
};

// Meters per unit, or none for units without a ground distance.
boost::optional<double> metersPerUnit(Units);

// Describes a projection's code, units and validity extent. Coordinate
// transforms are not this class' concern; the tile core only needs to know
// the extent and whether the x axis wraps around the globe.
class Projection {
public:
    Projection(std::string code,
               Units units,
               boost::optional<Extent> extent = boost::none,
               bool global = false,
               boost::optional<double> metersPerUnit = boost::none);

    static const Projection& EPSG3857();
    static const Projection& EPSG4326();

    const std::string& getCode() const { return code; }
    Units getUnits() const { return units; }
    const boost::optional<Extent>& getExtent() const { return extent; }

    // A global projection covers the whole world horizontally, so tiles
    // outside its extent can be wrapped back into it.
    bool isGlobal() const { return global; }

    boost::optional<double> getMetersPerUnit() const;

    bool operator==(const Projection& rhs) const { return code == rhs.code; }
    bool operator!=(const Projection& rhs) const { return code != rhs.code; }

private:
    std::string code;
    Units units;
    boost::optional<Extent> extent;
    bool global;
    boost::optional<double> metersPerUnit_;
};

}

#endif

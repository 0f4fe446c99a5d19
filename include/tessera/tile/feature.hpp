#ifndef TESSERA_TILE_FEATURE
#define TESSERA_TILE_FEATURE

#include <tessera/util/geo.hpp>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tessera {

enum class FeatureType : uint8_t {
    Unknown = 0,
    Point = 1,
    LineString = 2,
    Polygon = 3,
};

using FeatureValue = boost::variant<bool, int64_t, double, std::string>;
using GeometryRing = std::vector<Coordinate>;

// A decoded feature as handed over by a format parser. Geometry is in the
// projection of the tile that holds it.
class Feature {
public:
    Feature(FeatureType, std::vector<GeometryRing>);

    FeatureType type;
    std::vector<GeometryRing> geometry;
    boost::optional<std::string> id;
    std::unordered_map<std::string, FeatureValue> properties;

    boost::optional<FeatureValue> getValue(const std::string& key) const;

    // Bounding box of all rings; empty for a feature without coordinates.
    Extent getExtent() const;
};

using Features = std::vector<std::shared_ptr<const Feature>>;

}

#endif

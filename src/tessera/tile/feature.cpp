#include <tessera/tile/feature.hpp>
#include <tessera/util/extent.hpp>

using namespace tessera;

Feature::Feature(FeatureType type_, std::vector<GeometryRing> geometry_)
    : type(type_), geometry(std::move(geometry_)) {
}

boost::optional<FeatureValue> Feature::getValue(const std::string& key) const {
    auto it = properties.find(key);
    if (it == properties.end()) {
        return boost::none;
    }
    return it->second;
}

Extent Feature::getExtent() const {
    Extent result = extent::createEmpty();
    for (const auto& ring : geometry) {
        for (const auto& coordinate : ring) {
            extent::extendCoordinate(result, coordinate);
        }
    }
    return result;
}

#ifndef TESSERA_SOURCE_TILE_URL_FUNCTION
#define TESSERA_SOURCE_TILE_URL_FUNCTION

#include <tessera/tile/tile_coord.hpp>

#include <boost/optional.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tessera {

class Projection;
class TileGrid;

// Url of the tile at a coordinate, or none when the source has no tile there.
using TileUrlFunction = std::function<boost::optional<std::string>(
    const TileCoordinate&, double pixelRatio, const Projection&)>;

namespace tile_url_function {

// Substitutes {z}, {x}, {y} and {-y}. {-y} counts rows from the bottom and
// throws util::TileGridException on grids without a full tile range.
TileUrlFunction createFromTemplate(const std::string& tmpl, std::shared_ptr<const TileGrid>);

// Spreads tiles over the templates by coordinate hash.
TileUrlFunction createFromTemplates(const std::vector<std::string>& templates,
                                    std::shared_ptr<const TileGrid>);

TileUrlFunction createFromTileUrlFunctions(std::vector<TileUrlFunction>);

boost::optional<std::string> nullTileUrlFunction(const TileCoordinate&, double pixelRatio, const Projection&);

// Expands the first {a-c} letter range or {1-4} number range of a url.
std::vector<std::string> expandUrl(const std::string& url);

} // namespace tile_url_function
} // namespace tessera

#endif

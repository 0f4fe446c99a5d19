#include <tessera/source/tile_url_function.hpp>
#include <tessera/tile/tile_grid.hpp>
#include <tessera/util/exception.hpp>
#include <tessera/util/math.hpp>

#include <regex>

using namespace tessera;

namespace {

void replaceAll(std::string& str, const std::string& token, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = str.find(token, pos)) != std::string::npos) {
        str.replace(pos, token.size(), value);
        pos += value.size();
    }
}

}

TileUrlFunction tile_url_function::createFromTemplate(const std::string& tmpl,
                                                      std::shared_ptr<const TileGrid> grid) {
    return [tmpl, grid](const TileCoordinate& coord, double, const Projection&) -> boost::optional<std::string> {
        std::string url = tmpl;
        replaceAll(url, "{z}", std::to_string(coord.z));
        replaceAll(url, "{x}", std::to_string(coord.x));
        replaceAll(url, "{y}", std::to_string(coord.y));
        if (url.find("{-y}") != std::string::npos) {
            boost::optional<TileRange> range;
            if (grid) {
                range = grid->getFullTileRange(coord.z);
            }
            if (!range) {
                throw util::TileGridException("The {-y} placeholder requires a tile grid with extent");
            }
            replaceAll(url, "{-y}", std::to_string(range->getHeight() - coord.y - 1));
        }
        return url;
    };
}

TileUrlFunction tile_url_function::createFromTemplates(const std::vector<std::string>& templates,
                                                       std::shared_ptr<const TileGrid> grid) {
    std::vector<TileUrlFunction> functions;
    functions.reserve(templates.size());
    for (const auto& tmpl : templates) {
        functions.push_back(createFromTemplate(tmpl, grid));
    }
    return createFromTileUrlFunctions(std::move(functions));
}

TileUrlFunction tile_url_function::createFromTileUrlFunctions(std::vector<TileUrlFunction> functions) {
    if (functions.empty()) {
        return &nullTileUrlFunction;
    }
    if (functions.size() == 1) {
        return functions.front();
    }
    return [functions](const TileCoordinate& coord, double pixelRatio, const Projection& projection) {
        const auto index = static_cast<std::size_t>(
            util::modulo(static_cast<double>(tile_coord::hash(coord)), static_cast<double>(functions.size())));
        return functions[index](coord, pixelRatio, projection);
    };
}

boost::optional<std::string> tile_url_function::nullTileUrlFunction(const TileCoordinate&, double, const Projection&) {
    return boost::none;
}

std::vector<std::string> tile_url_function::expandUrl(const std::string& url) {
    std::vector<std::string> urls;
    std::smatch match;

    static const std::regex letters("\\{([a-z])-([a-z])\\}");
    if (std::regex_search(url, match, letters)) {
        const char start = match.str(1)[0];
        const char stop = match.str(2)[0];
        for (char c = start; c <= stop; ++c) {
            urls.push_back(match.prefix().str() + c + match.suffix().str());
        }
        return urls;
    }

    static const std::regex numbers("\\{(\\d+)-(\\d+)\\}");
    if (std::regex_search(url, match, numbers)) {
        const long stop = std::stol(match.str(2));
        for (long i = std::stol(match.str(1)); i <= stop; ++i) {
            urls.push_back(match.prefix().str() + std::to_string(i) + match.suffix().str());
        }
        return urls;
    }

    urls.push_back(url);
    return urls;
}

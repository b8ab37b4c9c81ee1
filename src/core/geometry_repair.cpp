#include "core/geometry_repair.hpp"
#include "core/geometry_conversion.hpp"
#include <cmath>
#include <memory>
#include <type_traits>
#include <ogr_geometry.h>

namespace geosplit {
namespace core {

namespace {

// Drop repeated vertices, then close rings and fix orientation
template <typename G>
void normalize(G& geometry) {
    if constexpr (!std::is_same_v<G, Point> && !std::is_same_v<G, MultiPoint>) {
        bg::unique(geometry);
    }
    bg::correct(geometry);
}

bool hasAcceptableShape(const Geometry& input, const Geometry& repaired) {
    return !isEmptyGeometry(repaired) &&
           topologicalDimension(repaired) == topologicalDimension(input) &&
           GeometryRepair::isValid(repaired);
}

} // namespace

bool GeometryRepair::isValid(const Geometry& geometry, std::string* reason) {
    return std::visit([reason](const auto& g) -> bool {
        using T = std::decay_t<decltype(g)>;
        if constexpr (std::is_same_v<T, Point>) {
            bool finite = std::isfinite(bg::get<0>(g)) && std::isfinite(bg::get<1>(g));
            if (!finite && reason) {
                *reason = "Point has non-finite coordinates";
            }
            return finite;
        } else {
            std::string message;
            bool valid = bg::is_valid(g, message);
            if (reason) {
                *reason = message;
            }
            return valid;
        }
    }, geometry);
}

Geometry GeometryRepair::makeValid(const Geometry& geometry) {
    if (isValid(geometry) || std::holds_alternative<Point>(geometry)) {
        return geometry;
    }

    Geometry corrected = std::visit([](auto g) -> Geometry {
        normalize(g);
        return g;
    }, geometry);

    if (isValid(corrected)) {
        return corrected;
    }

    std::unique_ptr<OGRGeometry> ogr_geometry = geometryToOgr(corrected);
    std::unique_ptr<OGRGeometry> fixed(ogr_geometry->MakeValid());
    if (!fixed) {
        // Repair unavailable (GDAL built without GEOS) or failed
        return corrected;
    }

    Geometry repaired = ogrToGeometry(*fixed);
    return std::visit([](auto g) -> Geometry {
        normalize(g);
        return g;
    }, repaired);
}

bool GeometryRepair::isAcceptable(const Geometry& geometry) {
    return hasAcceptableShape(geometry, makeValid(geometry));
}

std::optional<Geometry> GeometryRepair::repair(const Geometry& geometry) {
    Geometry repaired = makeValid(geometry);
    if (!hasAcceptableShape(geometry, repaired)) {
        return std::nullopt;
    }
    return repaired;
}

} // namespace core
} // namespace geosplit

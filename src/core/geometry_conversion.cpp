#include "core/geometry_conversion.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <type_traits>

namespace geosplit {
namespace core {

namespace {

template <typename T>
constexpr bool kIsPointType = std::is_same_v<T, Point>;

LineString curveToLineString(const OGRSimpleCurve& curve) {
    LineString linestring;
    int num_points = curve.getNumPoints();
    linestring.reserve(static_cast<size_t>(num_points));
    for (int i = 0; i < num_points; ++i) {
        linestring.push_back(Point(curve.getX(i), curve.getY(i)));
    }
    return linestring;
}

LinearRing curveToRing(const OGRSimpleCurve& curve) {
    LinearRing ring;
    int num_points = curve.getNumPoints();
    ring.reserve(static_cast<size_t>(num_points));
    for (int i = 0; i < num_points; ++i) {
        ring.push_back(Point(curve.getX(i), curve.getY(i)));
    }
    return ring;
}

Polygon ogrToPolygon(const OGRPolygon& ogr_polygon) {
    Polygon polygon;
    const OGRLinearRing* exterior = ogr_polygon.getExteriorRing();
    if (!exterior || exterior->IsEmpty()) {
        return polygon;
    }

    polygon.outer() = curveToRing(*exterior);
    for (int i = 0; i < ogr_polygon.getNumInteriorRings(); ++i) {
        const OGRLinearRing* interior = ogr_polygon.getInteriorRing(i);
        if (interior && !interior->IsEmpty()) {
            polygon.inners().push_back(curveToRing(*interior));
        }
    }

    // Close rings and apply Boost orientation (clockwise exterior)
    bg::correct(polygon);
    return polygon;
}

// Collects the parts of arbitrary collections, grouped by dimension
struct PartCollector {
    MultiPoint points;
    MultiLineString lines;
    MultiPolygon polygons;

    void add(const OGRGeometry& geometry) {
        if (geometry.IsEmpty()) {
            return;
        }

        switch (wkbFlatten(geometry.getGeometryType())) {
            case wkbPoint: {
                const OGRPoint* point = geometry.toPoint();
                points.push_back(Point(point->getX(), point->getY()));
                break;
            }
            case wkbLineString:
            case wkbLinearRing:
                lines.push_back(curveToLineString(*geometry.toSimpleCurve()));
                break;
            case wkbPolygon:
                polygons.push_back(ogrToPolygon(*geometry.toPolygon()));
                break;
            case wkbMultiPoint:
            case wkbMultiLineString:
            case wkbMultiPolygon:
            case wkbGeometryCollection: {
                const OGRGeometryCollection* collection = geometry.toGeometryCollection();
                for (int i = 0; i < collection->getNumGeometries(); ++i) {
                    add(*collection->getGeometryRef(i));
                }
                break;
            }
            default: {
                // Curves, surfaces and other non-linear types
                std::unique_ptr<OGRGeometry> linear(geometry.getLinearGeometry());
                if (!linear) {
                    throw std::runtime_error(std::string("Unsupported geometry type: ") + geometry.getGeometryName());
                }
                add(*linear);
                break;
            }
        }
    }

    Geometry build(int fallback_dimension) const {
        if (!polygons.empty()) {
            if (polygons.size() == 1) {
                return polygons.front();
            }
            return polygons;
        }
        if (!lines.empty()) {
            if (lines.size() == 1) {
                return lines.front();
            }
            return lines;
        }
        if (!points.empty()) {
            if (points.size() == 1) {
                return points.front();
            }
            return points;
        }

        // Empty input: keep its nominal dimension
        switch (fallback_dimension) {
            case 2:
                return MultiPolygon();
            case 1:
                return MultiLineString();
            default:
                return MultiPoint();
        }
    }
};

template <typename Range>
void appendPoints(OGRSimpleCurve& curve, const Range& points) {
    for (const auto& point : points) {
        curve.addPoint(bg::get<0>(point), bg::get<1>(point));
    }
}

std::unique_ptr<OGRPolygon> polygonToOgr(const Polygon& polygon) {
    auto ogr_polygon = std::make_unique<OGRPolygon>();
    if (polygon.outer().empty()) {
        return ogr_polygon;
    }

    OGRLinearRing exterior;
    appendPoints(exterior, polygon.outer());
    exterior.closeRings();
    ogr_polygon->addRing(&exterior);

    for (const auto& inner : polygon.inners()) {
        OGRLinearRing interior;
        appendPoints(interior, inner);
        interior.closeRings();
        ogr_polygon->addRing(&interior);
    }
    return ogr_polygon;
}

nlohmann::json coordinate(const Point& point) {
    return nlohmann::json::array({bg::get<0>(point), bg::get<1>(point)});
}

template <typename Range>
nlohmann::json coordinateArray(const Range& points) {
    nlohmann::json coordinates = nlohmann::json::array();
    for (const auto& point : points) {
        coordinates.push_back(coordinate(point));
    }
    return coordinates;
}

nlohmann::json polygonCoordinates(const Polygon& polygon) {
    nlohmann::json rings = nlohmann::json::array();
    if (polygon.outer().empty()) {
        return rings;
    }

    // GeoJSON (RFC 7946) wants counter-clockwise exterior rings
    LinearRing outer = polygon.outer();
    std::reverse(outer.begin(), outer.end());
    rings.push_back(coordinateArray(outer));
    for (const auto& inner : polygon.inners()) {
        LinearRing hole = inner;
        std::reverse(hole.begin(), hole.end());
        rings.push_back(coordinateArray(hole));
    }
    return rings;
}

} // namespace

Geometry ogrToGeometry(const OGRGeometry& geometry) {
    OGRwkbGeometryType type = wkbFlatten(geometry.getGeometryType());

    if (!geometry.IsEmpty()) {
        switch (type) {
            case wkbPoint: {
                const OGRPoint* point = geometry.toPoint();
                return Point(point->getX(), point->getY());
            }
            case wkbLineString:
                return curveToLineString(*geometry.toSimpleCurve());
            case wkbPolygon:
                return ogrToPolygon(*geometry.toPolygon());
            case wkbMultiPoint: {
                MultiPoint multi_point;
                const OGRMultiPoint* collection = geometry.toMultiPoint();
                for (int i = 0; i < collection->getNumGeometries(); ++i) {
                    const OGRPoint* point = collection->getGeometryRef(i);
                    if (!point->IsEmpty()) {
                        multi_point.push_back(Point(point->getX(), point->getY()));
                    }
                }
                return multi_point;
            }
            case wkbMultiLineString: {
                MultiLineString multi_linestring;
                const OGRMultiLineString* collection = geometry.toMultiLineString();
                for (int i = 0; i < collection->getNumGeometries(); ++i) {
                    multi_linestring.push_back(curveToLineString(*collection->getGeometryRef(i)));
                }
                return multi_linestring;
            }
            case wkbMultiPolygon: {
                MultiPolygon multi_polygon;
                const OGRMultiPolygon* collection = geometry.toMultiPolygon();
                for (int i = 0; i < collection->getNumGeometries(); ++i) {
                    multi_polygon.push_back(ogrToPolygon(*collection->getGeometryRef(i)));
                }
                return multi_polygon;
            }
            default:
                break;
        }
    }

    PartCollector collector;
    collector.add(geometry);
    return collector.build(geometry.getDimension());
}

std::unique_ptr<OGRGeometry> geometryToOgr(const Geometry& geometry) {
    return std::visit([](const auto& g) -> std::unique_ptr<OGRGeometry> {
        using T = std::decay_t<decltype(g)>;
        if constexpr (std::is_same_v<T, Point>) {
            return std::make_unique<OGRPoint>(bg::get<0>(g), bg::get<1>(g));
        } else if constexpr (std::is_same_v<T, MultiPoint>) {
            auto multi_point = std::make_unique<OGRMultiPoint>();
            for (const auto& point : g) {
                OGRPoint ogr_point(bg::get<0>(point), bg::get<1>(point));
                multi_point->addGeometry(&ogr_point);
            }
            return multi_point;
        } else if constexpr (std::is_same_v<T, LineString>) {
            auto linestring = std::make_unique<OGRLineString>();
            appendPoints(*linestring, g);
            return linestring;
        } else if constexpr (std::is_same_v<T, MultiLineString>) {
            auto multi_linestring = std::make_unique<OGRMultiLineString>();
            for (const auto& part : g) {
                OGRLineString linestring;
                appendPoints(linestring, part);
                multi_linestring->addGeometry(&linestring);
            }
            return multi_linestring;
        } else if constexpr (std::is_same_v<T, Polygon>) {
            return polygonToOgr(g);
        } else {
            auto multi_polygon = std::make_unique<OGRMultiPolygon>();
            for (const auto& part : g) {
                multi_polygon->addGeometryDirectly(polygonToOgr(part).release());
            }
            return multi_polygon;
        }
    }, geometry);
}

nlohmann::json geometryToGeoJSON(const Geometry& geometry) {
    nlohmann::json result;
    result["type"] = geometryTypeName(geometry);

    result["coordinates"] = std::visit([](const auto& g) -> nlohmann::json {
        using T = std::decay_t<decltype(g)>;
        if constexpr (kIsPointType<T>) {
            return coordinate(g);
        } else if constexpr (std::is_same_v<T, MultiPoint> || std::is_same_v<T, LineString>) {
            return coordinateArray(g);
        } else if constexpr (std::is_same_v<T, MultiLineString>) {
            nlohmann::json lines = nlohmann::json::array();
            for (const auto& line : g) {
                lines.push_back(coordinateArray(line));
            }
            return lines;
        } else if constexpr (std::is_same_v<T, Polygon>) {
            return polygonCoordinates(g);
        } else {
            nlohmann::json polygons = nlohmann::json::array();
            for (const auto& polygon : g) {
                polygons.push_back(polygonCoordinates(polygon));
            }
            return polygons;
        }
    }, geometry);

    return result;
}

std::string geometryTypeName(const Geometry& geometry) {
    static const char* const kNames[] = {
        "Point", "MultiPoint", "LineString", "MultiLineString", "Polygon", "MultiPolygon"
    };
    return kNames[geometry.index()];
}

int topologicalDimension(const Geometry& geometry) {
    return std::visit([](const auto& g) -> int {
        using T = std::decay_t<decltype(g)>;
        return static_cast<int>(bg::topological_dimension<T>::value);
    }, geometry);
}

bool isEmptyGeometry(const Geometry& geometry) {
    return std::visit([](const auto& g) -> bool {
        using T = std::decay_t<decltype(g)>;
        if constexpr (kIsPointType<T>) {
            return std::isnan(bg::get<0>(g)) || std::isnan(bg::get<1>(g));
        } else {
            return bg::is_empty(g);
        }
    }, geometry);
}

size_t vertexCount(const Geometry& geometry) {
    return std::visit([](const auto& g) -> size_t {
        return bg::num_points(g);
    }, geometry);
}

} // namespace core
} // namespace geosplit

#ifndef GEOSPLIT_COMMON_HPP
#define GEOSPLIT_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>
#include <vector>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_point.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <nlohmann/json.hpp>

namespace geosplit {
namespace core {

// Boost Geometry namespace alias
namespace bg = boost::geometry;

// 2D geometry types for emitted records
using Point = bg::model::point<double, 2, bg::cs::cartesian>;
using MultiPoint = bg::model::multi_point<Point>;
using LineString = bg::model::linestring<Point>;
using MultiLineString = bg::model::multi_linestring<LineString>;
using LinearRing = bg::model::ring<Point>;
using Polygon = bg::model::polygon<Point>;
using MultiPolygon = bg::model::multi_polygon<Polygon>;
using Box = bg::model::box<Point>;

// Any geometry a record can carry
using Geometry = std::variant<Point, MultiPoint, LineString, MultiLineString, Polygon, MultiPolygon>;

// Sentinel end offset for feeds whose length is not known yet
constexpr int64_t kUnboundedOffset = std::numeric_limits<int64_t>::max();

/**
 * Half-open span [start, end) of addressable work units (block, feature or page indices)
 */
struct OffsetRange {
    int64_t start;
    int64_t end;

    OffsetRange() : start(0), end(0) {}
    OffsetRange(int64_t range_start, int64_t range_end) : start(range_start), end(range_end) {}

    bool isUnbounded() const { return end == kUnboundedOffset; }
    bool empty() const { return end <= start; }
    int64_t size() const { return isUnbounded() ? kUnboundedOffset : end - start; }

    bool operator==(const OffsetRange& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const OffsetRange& other) const { return !(*this == other); }

    std::string toString() const {
        return "[" + std::to_string(start) + ", " + (isUnbounded() ? std::string("unbounded") : std::to_string(end)) + ")";
    }
};

// Kind of physical data layout behind a source
enum class SourceKind {
    RASTER,          // Raster file read block by block
    RASTER_POLYGON,  // Raster file polygonized block by block
    SHAPEFILE,
    GEODATABASE,
    GEOJSON,
    ESRI_SERVICE
};

std::string sourceKindToString(SourceKind kind);
SourceKind sourceKindFromString(const std::string& name);

/**
 * Immutable description of what a source reads
 */
struct SourceDescriptor {
    std::string uri;        // File path/URI or feature service URL
    SourceKind kind;
    std::string locator;    // Format-specific locator (layer, gdb member or service URL), may be empty

    SourceDescriptor(const std::string& source_uri, SourceKind source_kind, const std::string& source_locator = "")
        : uri(source_uri), kind(source_kind), locator(source_locator) {}
};

/**
 * Extent of one raster block in source pixel space
 */
struct RasterWindow {
    int band_index;   // 1-based band number
    int pixel_x;      // Column of the upper-left pixel
    int pixel_y;      // Row of the upper-left pixel
    int width;
    int height;

    RasterWindow(int band, int x, int y, int w, int h)
        : band_index(band), pixel_x(x), pixel_y(y), width(w), height(h) {}

    int64_t pixelCount() const { return static_cast<int64_t>(width) * height; }

    bool operator==(const RasterWindow& other) const {
        return band_index == other.band_index && pixel_x == other.pixel_x && pixel_y == other.pixel_y &&
               width == other.width && height == other.height;
    }
};

/**
 * Unit emitted to downstream processing: scalar attributes plus a geometry in the target CRS
 */
struct GeoRecord {
    nlohmann::json attributes;  // Object of field name to scalar value
    Geometry geometry;

    GeoRecord(nlohmann::json attrs, Geometry geom)
        : attributes(std::move(attrs)), geometry(std::move(geom)) {}
};

} // namespace core
} // namespace geosplit

#endif // GEOSPLIT_COMMON_HPP

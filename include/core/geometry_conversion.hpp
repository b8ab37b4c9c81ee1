#ifndef GEOSPLIT_GEOMETRY_CONVERSION_HPP
#define GEOSPLIT_GEOMETRY_CONVERSION_HPP

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include <ogr_geometry.h>
#include "core/common.hpp"

namespace geosplit {
namespace core {

/**
 * Convert an OGR geometry into the Boost Geometry model.
 * Rings are corrected to Boost orientation. Curves are linearised. Collections
 * keep only the parts of the highest dimension present.
 * @param geometry OGR geometry
 * @return Converted geometry
 */
Geometry ogrToGeometry(const OGRGeometry& geometry);

/**
 * Convert a Boost Geometry model geometry into a newly allocated OGR geometry
 * @param geometry Geometry to convert
 * @return OGR geometry owned by the caller
 */
std::unique_ptr<OGRGeometry> geometryToOgr(const Geometry& geometry);

/**
 * Convert a geometry into a GeoJSON geometry object
 * @param geometry Geometry to convert
 * @return GeoJSON geometry
 */
nlohmann::json geometryToGeoJSON(const Geometry& geometry);

/**
 * OGC type name of a geometry ("Point", "MultiPolygon", ...)
 */
std::string geometryTypeName(const Geometry& geometry);

/**
 * Topological dimension: 0 for points, 1 for lines, 2 for polygons
 */
int topologicalDimension(const Geometry& geometry);

/**
 * True if the geometry has no coordinates
 */
bool isEmptyGeometry(const Geometry& geometry);

/**
 * Number of vertices in the geometry
 */
size_t vertexCount(const Geometry& geometry);

} // namespace core
} // namespace geosplit

#endif // GEOSPLIT_GEOMETRY_CONVERSION_HPP

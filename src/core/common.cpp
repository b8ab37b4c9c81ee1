#include "core/common.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>

namespace geosplit {
namespace core {

std::string sourceKindToString(SourceKind kind) {
    switch (kind) {
        case SourceKind::RASTER:
            return "raster";
        case SourceKind::RASTER_POLYGON:
            return "raster-polygon";
        case SourceKind::SHAPEFILE:
            return "shapefile";
        case SourceKind::GEODATABASE:
            return "geodatabase";
        case SourceKind::GEOJSON:
            return "geojson";
        case SourceKind::ESRI_SERVICE:
            return "esri-service";
    }
    return "unknown";
}

SourceKind sourceKindFromString(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);
    std::replace(lowered.begin(), lowered.end(), '_', '-');

    if (lowered == "raster" || lowered == "raster-block") {
        return SourceKind::RASTER;
    }
    if (lowered == "raster-polygon") {
        return SourceKind::RASTER_POLYGON;
    }
    if (lowered == "shapefile" || lowered == "shp") {
        return SourceKind::SHAPEFILE;
    }
    if (lowered == "geodatabase" || lowered == "gdb") {
        return SourceKind::GEODATABASE;
    }
    if (lowered == "geojson") {
        return SourceKind::GEOJSON;
    }
    if (lowered == "esri-service" || lowered == "esri") {
        return SourceKind::ESRI_SERVICE;
    }
    throw ConfigurationError("Unknown source kind '" + name + "'");
}

} // namespace core
} // namespace geosplit

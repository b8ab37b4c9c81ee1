#include "source/shapefile_source.hpp"
#include "io/gdal_utils.hpp"
#include <cpl_string.h>

namespace geosplit {
namespace source {

ShapefileSource::ShapefileSource(const core::SourceDescriptor& descriptor, const SourceOptions& options)
    : VectorFileSource(descriptor, options, io::GDALUtils::toGdalPath(descriptor.uri), {"ESRI Shapefile"}) {
}

std::optional<int64_t> ShapefileSource::storageBytes() const {
    const std::string path = io::GDALUtils::toGdalPath(descriptor_.uri, false);
    if (path.size() < 4 || !EQUAL(path.c_str() + path.size() - 4, ".shp")) {
        return VectorFileSource::storageBytes();
    }

    // Geometry and attributes live in .shp and .dbf
    std::optional<int64_t> shp = io::GDALUtils::storageSize(path);
    if (!shp) {
        return std::nullopt;
    }
    std::optional<int64_t> dbf = io::GDALUtils::storageSize(path.substr(0, path.size() - 4) + ".dbf");
    return *shp + dbf.value_or(0);
}

GeoJSONSource::GeoJSONSource(const core::SourceDescriptor& descriptor, const SourceOptions& options)
    : VectorFileSource(descriptor, options, io::GDALUtils::toGdalPath(descriptor.uri), {"GeoJSON"}) {
}

} // namespace source
} // namespace geosplit

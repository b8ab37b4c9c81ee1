#ifndef GEOSPLIT_SHAPEFILE_SOURCE_HPP
#define GEOSPLIT_SHAPEFILE_SOURCE_HPP

#include "source/vector_source.hpp"

namespace geosplit {
namespace source {

/**
 * Shapefile source: a .shp file, a directory of shapefiles or a .zip of them
 */
class ShapefileSource : public VectorFileSource {
public:
    ShapefileSource(const core::SourceDescriptor& descriptor, const SourceOptions& options);

protected:
    std::optional<int64_t> storageBytes() const override;
};

/**
 * GeoJSON source: one FeatureCollection
 */
class GeoJSONSource : public VectorFileSource {
public:
    GeoJSONSource(const core::SourceDescriptor& descriptor, const SourceOptions& options);
};

} // namespace source
} // namespace geosplit

#endif // GEOSPLIT_SHAPEFILE_SOURCE_HPP

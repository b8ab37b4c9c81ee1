#ifndef GEOSPLIT_RASTER_POLYGON_SOURCE_HPP
#define GEOSPLIT_RASTER_POLYGON_SOURCE_HPP

#include <vector>
#include "source/raster_source.hpp"

namespace geosplit {
namespace source {

/**
 * Raster source emitting one polygon per 4-connected region of equal value
 * inside each block: {value, block}. Regions that continue across a block edge
 * are emitted once per block and are not merged.
 */
class RasterPolygonSource : public RasterSource {
public:
    RasterPolygonSource(const core::SourceDescriptor& descriptor, const SourceOptions& options);

    std::unique_ptr<RangeReader> createReader(const core::OffsetRange& range) override;
};

class RasterPolygonReader : public RasterRangeReader {
public:
    RasterPolygonReader(const RasterSource& source, const core::OffsetRange& range);

protected:
    bool fillPending() override;

private:
    /**
     * Polygonize the block in block_values_ and queue its records
     * @return false if GDAL failed to polygonize the block
     */
    bool polygonizeBlock();
};

} // namespace source
} // namespace geosplit

#endif // GEOSPLIT_RASTER_POLYGON_SOURCE_HPP

#ifndef GEOSPLIT_RASTER_BLOCK_SOURCE_HPP
#define GEOSPLIT_RASTER_BLOCK_SOURCE_HPP

#include "source/raster_source.hpp"

namespace geosplit {
namespace source {

/**
 * Raster source emitting one point record per pixel: {value, pixel_x, pixel_y}
 * at the pixel center in the target CRS. Nodata pixels are skipped unless
 * include_nodata is set.
 */
class RasterBlockSource : public RasterSource {
public:
    RasterBlockSource(const core::SourceDescriptor& descriptor, const SourceOptions& options);

    std::unique_ptr<RangeReader> createReader(const core::OffsetRange& range) override;
};

class RasterBlockReader : public RasterRangeReader {
public:
    RasterBlockReader(const RasterSource& source, const core::OffsetRange& range);

protected:
    bool fillPending() override;

private:
    size_t pixel_cursor_;   // Next pixel of the current block
};

} // namespace source
} // namespace geosplit

#endif // GEOSPLIT_RASTER_BLOCK_SOURCE_HPP

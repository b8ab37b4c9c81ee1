#ifndef GEOSPLIT_RASTER_SOURCE_HPP
#define GEOSPLIT_RASTER_SOURCE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <gdal_priv.h>
#include "io/raster_tile_index.hpp"
#include "source/geo_source.hpp"

namespace geosplit {
namespace source {

/**
 * Raster source addressed by block index in [0, blockCount)
 */
class RasterSource : public GeoSource {
public:
    /**
     * Open the raster and read its block layout
     * @throws core::RangeFailure if the raster cannot be opened
     * @throws core::ConfigurationError if band_number is out of range
     */
    RasterSource(const core::SourceDescriptor& descriptor, const SourceOptions& options);

    std::optional<int64_t> estimateSize() override;
    std::vector<core::OffsetRange> getInitialRanges(int64_t desired_bundle_bytes) override;

    const io::RasterTileIndex& tileIndex() const { return *tile_index_; }
    const std::string& gdalPath() const { return gdal_path_; }

protected:
    std::string gdal_path_;
    std::unique_ptr<io::RasterTileIndex> tile_index_;
};

/**
 * Reader base shared by the raster sources: claims blocks in order and reads
 * each claimed window of the band as doubles
 */
class RasterRangeReader : public BufferedRangeReader {
public:
    RasterRangeReader(const RasterSource& source, const core::OffsetRange& range);

protected:
    void open() override;
    void release() override;

    /**
     * Claim the next block and read it into block_values_
     * @return false once the claim fails; unreadable blocks are skipped
     */
    bool claimNextBlock();

    /**
     * Read a window of the band
     * @return false if GDAL reported an error; the block is logged and counted
     */
    bool readWindow(const core::RasterWindow& window, std::vector<double>& values);

    std::string gdal_path_;
    io::RasterTileIndex tile_index_;
    SourceOptions options_;
    GDALDatasetUniquePtr dataset_;
    io::CoordinateTransformer transformer_;

    int64_t next_block_;                                // Next block index to claim
    std::optional<core::RasterWindow> block_window_;   // Window of the last block read
    int64_t block_index_;
    std::vector<double> block_values_;
};

} // namespace source
} // namespace geosplit

#endif // GEOSPLIT_RASTER_SOURCE_HPP

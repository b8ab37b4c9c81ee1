#include "source/raster_source.hpp"
#include "core/errors.hpp"
#include "io/gdal_utils.hpp"
#include <iostream>

namespace geosplit {
namespace source {

RasterSource::RasterSource(const core::SourceDescriptor& descriptor, const SourceOptions& options)
    : GeoSource(descriptor, options),
      gdal_path_(io::GDALUtils::toGdalPath(descriptor.uri)) {

    GDALDatasetUniquePtr dataset = io::GDALUtils::openDataset(gdal_path_, GDAL_OF_RASTER);
    if (!dataset) {
        throw core::RangeFailure("Failed to open raster: " + descriptor.uri + " (" +
                                 io::GDALUtils::lastErrorMessage() + ")");
    }

    tile_index_ = std::make_unique<io::RasterTileIndex>(*dataset, options.band_number);

    std::cout << "Raster " << descriptor.uri << ": " << tile_index_->width() << "x" << tile_index_->height()
              << ", " << tile_index_->bandCount() << " band(s), blocks of " << tile_index_->blockWidth() << "x"
              << tile_index_->blockHeight() << " (" << tile_index_->blockCount() << " blocks)" << std::endl;
}

std::optional<int64_t> RasterSource::estimateSize() {
    return tile_index_->blockCount() * tile_index_->bytesPerBlock();
}

std::vector<core::OffsetRange> RasterSource::getInitialRanges(int64_t desired_bundle_bytes) {
    const int64_t blocks = tile_index_->blockCount();
    const int64_t bundles = core::bundleCountFor(blocks, *estimateSize(), desired_bundle_bytes);
    return core::splitEvenly(core::OffsetRange(0, blocks), bundles);
}

RasterRangeReader::RasterRangeReader(const RasterSource& source, const core::OffsetRange& range)
    : BufferedRangeReader(range, source.metrics(), source.name()),
      gdal_path_(source.gdalPath()),
      tile_index_(source.tileIndex()),
      options_(source.options()),
      next_block_(range.start),
      block_index_(-1) {
}

void RasterRangeReader::open() {
    transformer_ = io::CoordinateTransformer::resolve(options_.crsSpec(), tile_index_.crsWkt(), options_.out_epsg,
                                                      options_.skip_reproject, label_);

    dataset_ = io::GDALUtils::openDataset(gdal_path_, GDAL_OF_RASTER);
    if (!dataset_) {
        throw core::RangeFailure("Failed to open raster: " + gdal_path_ + " (" +
                                 io::GDALUtils::lastErrorMessage() + ")");
    }
}

void RasterRangeReader::release() {
    dataset_.reset();
    block_values_.clear();
    block_values_.shrink_to_fit();
}

bool RasterRangeReader::claimNextBlock() {
    while (true) {
        const int64_t block = next_block_;
        if (!tracker_.tryClaim(block)) {
            return false;
        }
        next_block_++;

        if (block >= tile_index_.blockCount()) {
            // Range reaches past the last block
            return false;
        }

        core::RasterWindow window = tile_index_.windowForBlock(block);
        if (readWindow(window, block_values_)) {
            block_window_ = window;
            block_index_ = block;
            return true;
        }
        metrics_->skipped_blocks++;
    }
}

bool RasterRangeReader::readWindow(const core::RasterWindow& window, std::vector<double>& values) {
    values.assign(static_cast<size_t>(window.pixelCount()), 0.0);

    GDALRasterBand* band = dataset_->GetRasterBand(window.band_index);
    CPLErr err = band->RasterIO(GF_Read, window.pixel_x, window.pixel_y, window.width, window.height,
                                values.data(), window.width, window.height, GDT_Float64, 0, 0, nullptr);
    if (err != CE_None) {
        std::cerr << "Warning: Failed to read block at pixel (" << window.pixel_x << ", " << window.pixel_y
                  << ") of " << label_ << ": " << io::GDALUtils::lastErrorMessage() << ", block skipped"
                  << std::endl;
        values.clear();
        return false;
    }
    return true;
}

} // namespace source
} // namespace geosplit

#include "source/raster_block_source.hpp"

namespace geosplit {
namespace source {

RasterBlockSource::RasterBlockSource(const core::SourceDescriptor& descriptor, const SourceOptions& options)
    : RasterSource(descriptor, options) {
}

std::unique_ptr<RangeReader> RasterBlockSource::createReader(const core::OffsetRange& range) {
    return std::make_unique<RasterBlockReader>(*this, range);
}

RasterBlockReader::RasterBlockReader(const RasterSource& source, const core::OffsetRange& range)
    : RasterRangeReader(source, range), pixel_cursor_(0) {
}

bool RasterBlockReader::fillPending() {
    // Pixels are emitted one at a time so a block is never expanded into records at once
    while (pixel_cursor_ < block_values_.size()) {
        const size_t index = pixel_cursor_++;
        const double value = block_values_[index];
        if (!options_.include_nodata && tile_index_.isNoData(value)) {
            continue;
        }

        const int col = block_window_->pixel_x + static_cast<int>(index % block_window_->width);
        const int row = block_window_->pixel_y + static_cast<int>(index / block_window_->width);
        const core::Point center = tile_index_.pixelCenter(col, row);

        nlohmann::json attributes = {
            {"value", value},
            {"pixel_x", col},
            {"pixel_y", row}
        };
        emit(std::move(attributes), core::Geometry(center), transformer_);
        return true;
    }

    if (!claimNextBlock()) {
        return false;
    }
    pixel_cursor_ = 0;
    return true;
}

} // namespace source
} // namespace geosplit

#include "io/raster_tile_index.hpp"
#include "core/errors.hpp"
#include <cpl_conv.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace geosplit {
namespace io {

RasterTileIndex::RasterTileIndex(GDALDataset& dataset, int band_number)
    : width_(dataset.GetRasterXSize()),
      height_(dataset.GetRasterYSize()),
      block_width_(0),
      block_height_(0),
      band_count_(dataset.GetRasterCount()),
      band_number_(band_number),
      data_type_(GDT_Unknown),
      geo_transform_{0.0, 1.0, 0.0, 0.0, 0.0, 1.0} {

    if (band_number < 1 || band_number > band_count_) {
        throw core::ConfigurationError("band_number " + std::to_string(band_number) +
                                       " is out of range: the raster has " + std::to_string(band_count_) +
                                       " band(s)");
    }

    GDALRasterBand* band = dataset.GetRasterBand(band_number);
    band->GetBlockSize(&block_width_, &block_height_);
    if (block_width_ <= 0 || block_height_ <= 0) {
        // Some drivers report no native blocking; fall back to scanlines
        block_width_ = width_;
        block_height_ = 1;
    }
    data_type_ = band->GetRasterDataType();

    int has_nodata = FALSE;
    double nodata = band->GetNoDataValue(&has_nodata);
    if (has_nodata) {
        // Pixels of a Float32 band only ever equal the float-rounded sentinel
        const bool float_range = std::fabs(nodata) <= std::numeric_limits<float>::max();
        nodata_ = data_type_ == GDT_Float32 && float_range ? static_cast<double>(static_cast<float>(nodata)) : nodata;
    }

    if (dataset.GetGeoTransform(geo_transform_.data()) != CE_None) {
        std::cerr << "Warning: Raster has no geotransform, using pixel coordinates" << std::endl;
        geo_transform_ = {0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
    }

    const OGRSpatialReference* srs = dataset.GetSpatialRef();
    if (srs) {
        char* wkt = nullptr;
        if (srs->exportToWkt(&wkt) == OGRERR_NONE && wkt) {
            crs_wkt_ = wkt;
        }
        CPLFree(wkt);
    }
}

int RasterTileIndex::blocksPerRow() const {
    return (width_ + block_width_ - 1) / block_width_;
}

int RasterTileIndex::blocksPerColumn() const {
    return (height_ + block_height_ - 1) / block_height_;
}

int64_t RasterTileIndex::blockCount() const {
    return static_cast<int64_t>(blocksPerRow()) * blocksPerColumn();
}

core::RasterWindow RasterTileIndex::windowForBlock(int64_t block_index) const {
    if (block_index < 0 || block_index >= blockCount()) {
        throw std::out_of_range("Block index " + std::to_string(block_index) + " outside [0, " +
                                std::to_string(blockCount()) + ")");
    }

    int block_col = static_cast<int>(block_index % blocksPerRow());
    int block_row = static_cast<int>(block_index / blocksPerRow());
    int x = block_col * block_width_;
    int y = block_row * block_height_;

    // Clip edge blocks
    int w = std::min(block_width_, width_ - x);
    int h = std::min(block_height_, height_ - y);
    return core::RasterWindow(band_number_, x, y, w, h);
}

core::Point RasterTileIndex::pixelCenter(int col, int row) const {
    const double px = col + 0.5;
    const double py = row + 0.5;
    const GeoTransform& gt = geo_transform_;
    return core::Point(gt[0] + px * gt[1] + py * gt[2],
                       gt[3] + px * gt[4] + py * gt[5]);
}

GeoTransform RasterTileIndex::windowGeoTransform(const core::RasterWindow& window) const {
    const GeoTransform& gt = geo_transform_;
    GeoTransform shifted = gt;
    shifted[0] = gt[0] + window.pixel_x * gt[1] + window.pixel_y * gt[2];
    shifted[3] = gt[3] + window.pixel_x * gt[4] + window.pixel_y * gt[5];
    return shifted;
}

bool RasterTileIndex::isNoData(double value) const {
    if (!nodata_.has_value()) {
        return false;
    }
    if (std::isnan(*nodata_)) {
        return std::isnan(value);
    }
    return value == *nodata_;
}

int64_t RasterTileIndex::bytesPerBlock() const {
    int bytes = GDALGetDataTypeSizeBytes(data_type_);
    return static_cast<int64_t>(block_width_) * block_height_ * std::max(bytes, 1);
}

} // namespace io
} // namespace geosplit

#ifndef GEOSPLIT_RASTER_TILE_INDEX_HPP
#define GEOSPLIT_RASTER_TILE_INDEX_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <gdal_priv.h>
#include "core/common.hpp"

namespace geosplit {
namespace io {

// GDAL affine geotransform: x = gt[0] + col*gt[1] + row*gt[2], y = gt[3] + col*gt[4] + row*gt[5]
using GeoTransform = std::array<double, 6>;

/**
 * Block grid of one raster band.
 * Metadata is read once from the dataset; everything after construction is pure.
 */
class RasterTileIndex {
public:
    /**
     * Read the raster metadata
     * @param dataset Open raster dataset
     * @param band_number 1-based band number
     * @throws core::ConfigurationError if the band does not exist
     */
    RasterTileIndex(GDALDataset& dataset, int band_number);

    int width() const { return width_; }
    int height() const { return height_; }
    int blockWidth() const { return block_width_; }
    int blockHeight() const { return block_height_; }
    int bandCount() const { return band_count_; }
    int bandNumber() const { return band_number_; }
    GDALDataType dataType() const { return data_type_; }
    const std::optional<double>& noDataValue() const { return nodata_; }
    const GeoTransform& geoTransform() const { return geo_transform_; }
    const std::string& crsWkt() const { return crs_wkt_; }

    int blocksPerRow() const;
    int blocksPerColumn() const;

    /**
     * Total number of blocks: ceil(width/blockWidth) * ceil(height/blockHeight)
     */
    int64_t blockCount() const;

    /**
     * Pixel window of a block, row-major, clipped at the right and bottom edges
     * @param block_index Block index in [0, blockCount)
     * @return Window
     * @throws std::out_of_range if the index is outside the grid
     */
    core::RasterWindow windowForBlock(int64_t block_index) const;

    /**
     * Georeferenced coordinate of the center of a pixel in the source CRS
     * @param col Pixel column
     * @param row Pixel row
     */
    core::Point pixelCenter(int col, int row) const;

    /**
     * Geotransform of a window whose origin is the window's upper-left pixel
     */
    GeoTransform windowGeoTransform(const core::RasterWindow& window) const;

    /**
     * True if a value is the band's nodata value
     */
    bool isNoData(double value) const;

    /**
     * Estimated uncompressed size of one full block in bytes
     */
    int64_t bytesPerBlock() const;

private:
    int width_;
    int height_;
    int block_width_;
    int block_height_;
    int band_count_;
    int band_number_;
    GDALDataType data_type_;
    std::optional<double> nodata_;
    GeoTransform geo_transform_;
    std::string crs_wkt_;
};

} // namespace io
} // namespace geosplit

#endif // GEOSPLIT_RASTER_TILE_INDEX_HPP

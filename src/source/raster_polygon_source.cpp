#include "source/raster_polygon_source.hpp"
#include "core/errors.hpp"
#include "core/geometry_conversion.hpp"
#include "io/gdal_utils.hpp"
#include <gdal_alg.h>
#include <ogrsf_frmts.h>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>

namespace geosplit {
namespace source {

namespace {

const int32_t kNaNClass = 0;

/**
 * Number the distinct values of a block so regions can be traced on an Int32 band
 * @param values block pixels
 * @param class_values receives the value of each class id; id 0 is NaN
 * @return class id of each pixel
 */
std::vector<int32_t> classifyValues(const std::vector<double>& values, std::vector<double>& class_values) {
    std::map<double, int32_t> class_ids;
    class_values.assign(1, std::numeric_limits<double>::quiet_NaN());

    std::vector<int32_t> classes(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        const double value = values[i];
        if (std::isnan(value)) {
            classes[i] = kNaNClass;
            continue;
        }
        auto found = class_ids.find(value);
        if (found == class_ids.end()) {
            found = class_ids.emplace(value, static_cast<int32_t>(class_values.size())).first;
            class_values.push_back(value);
        }
        classes[i] = found->second;
    }
    return classes;
}

} // namespace

RasterPolygonSource::RasterPolygonSource(const core::SourceDescriptor& descriptor, const SourceOptions& options)
    : RasterSource(descriptor, options) {
    if (!io::GDALUtils::isDriverAvailable("MEM") || !io::GDALUtils::vectorMemoryDriver()) {
        throw core::ConfigurationError("Polygonizing rasters needs the GDAL MEM and Memory drivers");
    }
}

std::unique_ptr<RangeReader> RasterPolygonSource::createReader(const core::OffsetRange& range) {
    return std::make_unique<RasterPolygonReader>(*this, range);
}

RasterPolygonReader::RasterPolygonReader(const RasterSource& source, const core::OffsetRange& range)
    : RasterRangeReader(source, range) {
}

bool RasterPolygonReader::fillPending() {
    if (!claimNextBlock()) {
        return false;
    }

    if (!polygonizeBlock()) {
        metrics_->skipped_blocks++;
    }
    return true;
}

bool RasterPolygonReader::polygonizeBlock() {
    const core::RasterWindow& window = *block_window_;
    const bool integer_band = GDALDataTypeIsInteger(tile_index_.dataType()) != 0;

    // Regions are traced on class ids so every band type keeps its exact values
    std::vector<double> class_values;
    std::vector<int32_t> classes = classifyValues(block_values_, class_values);

    GDALDriver* mem_driver = GetGDALDriverManager()->GetDriverByName("MEM");
    GDALDatasetUniquePtr block_dataset(mem_driver->Create("", window.width, window.height, 1, GDT_Int32, nullptr));
    if (!block_dataset) {
        std::cerr << "Warning: Failed to create in-memory block for " << label_ << std::endl;
        return false;
    }

    // Polygons come out in source coordinates of the block
    io::GeoTransform geo_transform = tile_index_.windowGeoTransform(window);
    block_dataset->SetGeoTransform(geo_transform.data());

    GDALRasterBand* block_band = block_dataset->GetRasterBand(1);
    if (block_band->RasterIO(GF_Write, 0, 0, window.width, window.height, classes.data(),
                             window.width, window.height, GDT_Int32, 0, 0, nullptr) != CE_None) {
        std::cerr << "Warning: Failed to copy block " << block_index_ << " of " << label_ << std::endl;
        return false;
    }

    // Valid-pixel mask: nonzero pixels are polygonized
    GDALDatasetUniquePtr mask_dataset;
    GDALRasterBand* mask_band = nullptr;
    if (!options_.include_nodata && tile_index_.noDataValue().has_value()) {
        std::vector<GByte> mask(block_values_.size());
        for (size_t i = 0; i < block_values_.size(); ++i) {
            mask[i] = tile_index_.isNoData(block_values_[i]) ? 0 : 1;
        }

        mask_dataset.reset(mem_driver->Create("", window.width, window.height, 1, GDT_Byte, nullptr));
        if (!mask_dataset) {
            std::cerr << "Warning: Failed to create in-memory mask for " << label_ << std::endl;
            return false;
        }
        mask_band = mask_dataset->GetRasterBand(1);
        if (mask_band->RasterIO(GF_Write, 0, 0, window.width, window.height, mask.data(),
                                window.width, window.height, GDT_Byte, 0, 0, nullptr) != CE_None) {
            std::cerr << "Warning: Failed to write mask of block " << block_index_ << " of " << label_ << std::endl;
            return false;
        }
    }

    GDALDatasetUniquePtr polygons(io::GDALUtils::vectorMemoryDriver()->Create("", 0, 0, 0, GDT_Unknown, nullptr));
    if (!polygons) {
        std::cerr << "Warning: Failed to create in-memory layer for " << label_ << std::endl;
        return false;
    }
    OGRLayer* layer = polygons->CreateLayer("polygons", nullptr, wkbPolygon, nullptr);
    OGRFieldDefn value_field("class", OFTInteger);
    if (!layer || layer->CreateField(&value_field) != OGRERR_NONE) {
        std::cerr << "Warning: Failed to create in-memory layer for " << label_ << std::endl;
        return false;
    }

    GDALRasterBandH mask_handle = mask_band ? GDALRasterBand::ToHandle(mask_band) : nullptr;
    CPLErr err = GDALPolygonize(GDALRasterBand::ToHandle(block_band), mask_handle, OGRLayer::ToHandle(layer), 0,
                                nullptr, nullptr, nullptr);
    if (err != CE_None) {
        std::cerr << "Warning: Failed to polygonize block " << block_index_ << " of " << label_ << ": "
                  << io::GDALUtils::lastErrorMessage() << std::endl;
        return false;
    }

    layer->ResetReading();
    OGRFeatureUniquePtr feature;
    while ((feature = OGRFeatureUniquePtr(layer->GetNextFeature())) != nullptr) {
        const OGRGeometry* geometry = feature->GetGeometryRef();
        if (!geometry || geometry->IsEmpty()) {
            continue;
        }

        const int class_id = feature->GetFieldAsInteger(0);
        if (class_id < 0 || static_cast<size_t>(class_id) >= class_values.size()) {
            continue;
        }
        const double value = class_values[class_id];

        nlohmann::json attributes;
        if (integer_band) {
            attributes["value"] = static_cast<int64_t>(value);
        } else {
            attributes["value"] = value;
        }
        attributes["block"] = block_index_;

        emit(std::move(attributes), core::ogrToGeometry(*geometry), transformer_);
    }

    return true;
}

} // namespace source
} // namespace geosplit

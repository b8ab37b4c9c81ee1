#ifndef GEOSPLIT_TEST_HELPERS_HPP
#define GEOSPLIT_TEST_HELPERS_HPP

#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <ogr_spatialref.h>
#include <cpl_conv.h>
#include <cpl_vsi.h>
#include "core/common.hpp"
#include "io/gdal_utils.hpp"
#include "source/geo_source.hpp"

namespace geosplit {
namespace test_support {

inline std::string wktForEPSG(int epsg) {
    OGRSpatialReference srs;
    srs.importFromEPSG(epsg);
    char* wkt = nullptr;
    srs.exportToWkt(&wkt);
    std::string result = wkt ? wkt : "";
    CPLFree(wkt);
    return result;
}

/**
 * Write a tiled single-band GeoTIFF
 * @param values Row-major pixel values, width * height entries
 * @param compression GTiff COMPRESS option, empty for none
 */
inline void writeGeoTiff(const std::string& path, int width, int height, int block_size,
                         const std::vector<double>& values, double nodata, int epsg,
                         GDALDataType type = GDT_Float64, double origin_x = 500000.0,
                         double origin_y = 4000000.0, double pixel_size = 10.0,
                         const std::string& compression = "") {
    io::GDALUtils::registerDrivers();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");

    const std::string block = std::to_string(block_size);
    CPLStringList options;
    options.SetNameValue("TILED", "YES");
    options.SetNameValue("BLOCKXSIZE", block.c_str());
    options.SetNameValue("BLOCKYSIZE", block.c_str());
    if (!compression.empty()) {
        options.SetNameValue("COMPRESS", compression.c_str());
    }

    GDALDatasetUniquePtr dataset(driver->Create(path.c_str(), width, height, 1, type, options.List()));
    ASSERT_NE(dataset, nullptr);
    double geo_transform[6] = {origin_x, pixel_size, 0.0, origin_y, 0.0, -pixel_size};
    dataset->SetGeoTransform(geo_transform);
    if (epsg > 0) {
        dataset->SetProjection(wktForEPSG(epsg).c_str());
    }

    GDALRasterBand* band = dataset->GetRasterBand(1);
    band->SetNoDataValue(nodata);
    EXPECT_EQ(band->RasterIO(GF_Write, 0, 0, width, height, const_cast<double*>(values.data()),
                             width, height, GDT_Float64, 0, 0, nullptr), CE_None);
}

inline void writeGeoTiff(const std::string& path, int width, int height, int block_size,
                         const std::vector<float>& values, double nodata, int epsg,
                         GDALDataType type = GDT_Float32, double origin_x = 500000.0,
                         double origin_y = 4000000.0, double pixel_size = 10.0,
                         const std::string& compression = "") {
    writeGeoTiff(path, width, height, block_size, std::vector<double>(values.begin(), values.end()), nodata,
                 epsg, type, origin_x, origin_y, pixel_size, compression);
}

/**
 * Overwrite the stored bytes of one GeoTIFF block so it can no longer be decoded
 * @param block_x Block column
 * @param block_y Block row
 */
inline void corruptGeoTiffBlock(const std::string& path, int block_x, int block_y) {
    vsi_l_offset offset = 0;
    size_t size = 0;
    {
        GDALDatasetUniquePtr dataset(GDALDataset::Open(path.c_str(), GDAL_OF_RASTER));
        ASSERT_NE(dataset, nullptr);
        const std::string suffix = std::to_string(block_x) + "_" + std::to_string(block_y);
        const char* offset_item = dataset->GetRasterBand(1)->GetMetadataItem(("BLOCK_OFFSET_" + suffix).c_str(), "TIFF");
        const char* size_item = dataset->GetRasterBand(1)->GetMetadataItem(("BLOCK_SIZE_" + suffix).c_str(), "TIFF");
        ASSERT_NE(offset_item, nullptr);
        ASSERT_NE(size_item, nullptr);
        offset = static_cast<vsi_l_offset>(std::stoull(offset_item));
        size = static_cast<size_t>(std::stoull(size_item));
    }
    ASSERT_GT(size, 0u);

    std::vector<GByte> garbage(size, 0xFF);
    VSILFILE* file = VSIFOpenL(path.c_str(), "r+b");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(VSIFSeekL(file, offset, SEEK_SET), 0);
    EXPECT_EQ(VSIFWriteL(garbage.data(), 1, size, file), size);
    VSIFCloseL(file);
}

/**
 * Write a point shapefile whose features have an integer "id" field equal to their index
 * @param epsg CRS written to the .prj, or 0 for no .prj
 */
inline void writePointShapefile(const std::string& path, int count, int epsg,
                                double origin_x = 500000.0, double origin_y = 4000000.0) {
    io::GDALUtils::registerDrivers();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("ESRI Shapefile");
    GDALDatasetUniquePtr dataset(driver->Create(path.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    ASSERT_NE(dataset, nullptr);

    OGRSpatialReference* srs = nullptr;
    if (epsg > 0) {
        srs = new OGRSpatialReference();
        srs->importFromEPSG(epsg);
    }
    OGRLayer* layer = dataset->CreateLayer("points", srs, wkbPoint, nullptr);
    if (srs) {
        srs->Release();
    }

    OGRFieldDefn id_field("id", OFTInteger);
    layer->CreateField(&id_field);
    OGRFieldDefn name_field("name", OFTString);
    layer->CreateField(&name_field);

    for (int i = 0; i < count; ++i) {
        OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
        feature->SetField("id", i);
        feature->SetField("name", ("feature " + std::to_string(i)).c_str());
        OGRPoint point(origin_x + i * 100.0, origin_y + i * 100.0);
        feature->SetGeometry(&point);
        EXPECT_EQ(layer->CreateFeature(feature.get()), OGRERR_NONE);
    }
}

inline void writeTextFile(const std::string& path, const std::string& content) {
    VSILFILE* file = VSIFOpenL(path.c_str(), "wb");
    VSIFWriteL(content.data(), 1, content.size(), file);
    VSIFCloseL(file);
}

inline void removeTree(const std::string& path) {
    VSIRmdirRecursive(path.c_str());
    VSIUnlink(path.c_str());
}

/**
 * Read a range to completion
 */
inline std::vector<core::GeoRecord> readAll(source::RangeReader& reader) {
    std::vector<core::GeoRecord> records;
    for (bool available = reader.start(); available; available = reader.advance()) {
        records.push_back(reader.getCurrent());
    }
    reader.close();
    return records;
}

inline std::vector<core::GeoRecord> readRange(source::GeoSource& geo_source, const core::OffsetRange& range) {
    std::unique_ptr<source::RangeReader> reader = geo_source.createReader(range);
    return readAll(*reader);
}

} // namespace test_support
} // namespace geosplit

#endif // GEOSPLIT_TEST_HELPERS_HPP

#include <gtest/gtest.h>
#include <cmath>
#include <map>
#include <set>
#include <tuple>
#include "core/errors.hpp"
#include "source/raster_source.hpp"
#include "source/source_factory.hpp"
#include "test_helpers.hpp"

using namespace geosplit;
using geosplit::test_support::readRange;

namespace {

constexpr double kNoData = -9999.0;

using PixelKey = std::tuple<int, int, double>;

std::set<PixelKey> pixelKeys(const std::vector<core::GeoRecord>& records) {
    std::set<PixelKey> keys;
    for (const auto& record : records) {
        keys.emplace(record.attributes["pixel_x"].get<int>(), record.attributes["pixel_y"].get<int>(),
                     record.attributes["value"].get<double>());
    }
    return keys;
}

class RasterSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        io::GDALUtils::registerDrivers();
    }

    void TearDown() override {
        test_support::removeTree(dir_);
    }

    std::unique_ptr<source::GeoSource> open(const std::string& path, core::SourceKind kind,
                                            const source::SourceOptions& options = source::SourceOptions()) {
        return source::createSource(core::SourceDescriptor(path, kind), options);
    }

    const std::string dir_ = "/vsimem/raster_source_test";
};

} // namespace

TEST_F(RasterSourceTest, NodataBlocksYieldNoRecords) {
    // 2x2 grid of 16x16 blocks; only the top-left corner of block 0 has data
    std::vector<float> values(32 * 32, static_cast<float>(kNoData));
    values[0] = 1.0f;
    values[1] = 1.0f;
    values[32] = 2.0f;
    const std::string path = dir_ + "/corner.tif";
    test_support::writeGeoTiff(path, 32, 32, 16, values, kNoData, 32633);

    auto geo_source = open(path, core::SourceKind::RASTER);
    auto* raster = dynamic_cast<source::RasterSource*>(geo_source.get());
    ASSERT_NE(raster, nullptr);
    EXPECT_EQ(raster->tileIndex().blockCount(), 4);

    auto block0 = readRange(*geo_source, core::OffsetRange(0, 1));
    ASSERT_EQ(block0.size(), 3u);
    EXPECT_EQ(block0[0].attributes["value"].get<double>(), 1.0);
    EXPECT_EQ(block0[2].attributes["value"].get<double>(), 2.0);
    EXPECT_EQ(block0[2].attributes["pixel_x"].get<int>(), 0);
    EXPECT_EQ(block0[2].attributes["pixel_y"].get<int>(), 1);

    EXPECT_TRUE(readRange(*geo_source, core::OffsetRange(1, 4)).empty());
    EXPECT_EQ(geo_source->metrics()->records_emitted.load(), 3u);
}

TEST_F(RasterSourceTest, IncludeNodataEmitsEveryPixel) {
    std::vector<float> values(32 * 32, static_cast<float>(kNoData));
    const std::string path = dir_ + "/empty.tif";
    test_support::writeGeoTiff(path, 32, 32, 16, values, kNoData, 32633);

    source::SourceOptions options;
    options.include_nodata = true;
    auto geo_source = open(path, core::SourceKind::RASTER, options);
    EXPECT_EQ(readRange(*geo_source, core::OffsetRange(0, 1)).size(), 256u);
}

TEST_F(RasterSourceTest, PixelCentersAreReprojected) {
    std::vector<float> values(32 * 32, 7.0f);
    const std::string path = dir_ + "/utm.tif";
    test_support::writeGeoTiff(path, 32, 32, 16, values, kNoData, 32633);

    auto geo_source = open(path, core::SourceKind::RASTER);
    auto records = readRange(*geo_source, core::OffsetRange(0, 1));
    ASSERT_FALSE(records.empty());

    // Easting 500005 sits next to the central meridian of UTM zone 33 (15 degrees east)
    const auto& point = std::get<core::Point>(records[0].geometry);
    EXPECT_NEAR(core::bg::get<0>(point), 15.0, 1e-3);
    EXPECT_GT(core::bg::get<1>(point), 36.0);
    EXPECT_LT(core::bg::get<1>(point), 36.3);
}

TEST_F(RasterSourceTest, EdgeBlocksAreClipped) {
    std::vector<float> values(48 * 40, 1.0f);
    const std::string path = dir_ + "/edges.tif";
    test_support::writeGeoTiff(path, 48, 40, 16, values, kNoData, 32633);

    auto geo_source = open(path, core::SourceKind::RASTER);
    const io::RasterTileIndex& index = dynamic_cast<source::RasterSource&>(*geo_source).tileIndex();
    EXPECT_EQ(index.blocksPerRow(), 3);
    EXPECT_EQ(index.blocksPerColumn(), 3);
    EXPECT_EQ(index.windowForBlock(8), core::RasterWindow(1, 32, 32, 16, 8));
    EXPECT_THROW(index.windowForBlock(9), std::out_of_range);
}

TEST_F(RasterSourceTest, InitialSplitsCoverEveryPixelOnce) {
    std::vector<float> values(48 * 40);
    for (size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<float>(i);
    }
    const std::string path = dir_ + "/split.tif";
    test_support::writeGeoTiff(path, 48, 40, 16, values, kNoData, 32633);

    auto geo_source = open(path, core::SourceKind::RASTER);
    auto full = readRange(*geo_source, core::OffsetRange(0, 9));
    ASSERT_EQ(full.size(), values.size());

    const int64_t block_bytes = 16 * 16 * 4;
    for (int64_t desired : {block_bytes, 2 * block_bytes, 4 * block_bytes}) {
        auto ranges = geo_source->getInitialRanges(desired);
        ASSERT_GT(ranges.size(), 1u);
        EXPECT_EQ(ranges.front().start, 0);
        EXPECT_EQ(ranges.back().end, 9);

        std::vector<core::GeoRecord> combined;
        for (const auto& range : ranges) {
            auto part = readRange(*geo_source, range);
            combined.insert(combined.end(), part.begin(), part.end());
        }
        EXPECT_EQ(combined.size(), full.size());
        EXPECT_EQ(pixelKeys(combined), pixelKeys(full));
    }
}

TEST_F(RasterSourceTest, DynamicSplitDuringRead) {
    std::vector<float> values(48 * 40);
    for (size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<float>(i % 97);
    }
    const std::string path = dir_ + "/dynamic.tif";
    test_support::writeGeoTiff(path, 48, 40, 16, values, kNoData, 32633);

    auto geo_source = open(path, core::SourceKind::RASTER);
    auto full = readRange(*geo_source, core::OffsetRange(0, 9));

    auto reader = geo_source->createReader(core::OffsetRange(0, 9));
    std::vector<core::GeoRecord> primary;
    ASSERT_TRUE(reader->start());
    primary.push_back(reader->getCurrent());

    auto residual = reader->trySplit(0.5);
    ASSERT_TRUE(residual.has_value());
    EXPECT_EQ(*residual, core::OffsetRange(5, 9));
    EXPECT_EQ(reader->range(), core::OffsetRange(0, 5));

    while (reader->advance()) {
        primary.push_back(reader->getCurrent());
    }
    EXPECT_DOUBLE_EQ(reader->getProgress(), 1.0);
    reader->close();

    auto secondary = readRange(*geo_source, *residual);
    primary.insert(primary.end(), secondary.begin(), secondary.end());
    EXPECT_EQ(primary.size(), full.size());
    EXPECT_EQ(pixelKeys(primary), pixelKeys(full));
}

TEST_F(RasterSourceTest, MissingCrsNeedsOverride) {
    std::vector<float> values(32 * 32, 3.0f);
    const std::string path = dir_ + "/nocrs.tif";
    test_support::writeGeoTiff(path, 32, 32, 16, values, kNoData, 0);

    auto geo_source = open(path, core::SourceKind::RASTER);
    auto reader = geo_source->createReader(core::OffsetRange(0, 1));
    EXPECT_THROW(reader->start(), core::CRSUndeterminedError);

    source::SourceOptions options;
    options.in_epsg = 32633;
    auto overridden = open(path, core::SourceKind::RASTER, options);
    EXPECT_EQ(readRange(*overridden, core::OffsetRange(0, 1)).size(), 256u);
}

TEST_F(RasterSourceTest, BandOutOfRangeIsConfigurationError) {
    std::vector<float> values(32 * 32, 3.0f);
    const std::string path = dir_ + "/band.tif";
    test_support::writeGeoTiff(path, 32, 32, 16, values, kNoData, 32633);

    source::SourceOptions options;
    options.band_number = 2;
    EXPECT_THROW(open(path, core::SourceKind::RASTER, options), core::ConfigurationError);
}

TEST_F(RasterSourceTest, MissingFileIsRangeFailure) {
    EXPECT_THROW(open(dir_ + "/missing.tif", core::SourceKind::RASTER), core::RangeFailure);
}

TEST_F(RasterSourceTest, PolygonsStayInsideTheirBlock) {
    // Block 0: left half 1, right half 2; bottom row of blocks: a single region of 5
    std::vector<float> values(32 * 32, static_cast<float>(kNoData));
    for (int row = 0; row < 32; ++row) {
        for (int col = 0; col < 32; ++col) {
            float& value = values[static_cast<size_t>(row * 32 + col)];
            if (row < 16 && col < 16) {
                value = col < 8 ? 1.0f : 2.0f;
            } else if (row >= 16) {
                value = 5.0f;
            }
        }
    }
    const std::string path = dir_ + "/classes.tif";
    test_support::writeGeoTiff(path, 32, 32, 16, values, kNoData, 32633, GDT_Int32);

    source::SourceOptions options;
    options.skip_reproject = true;
    auto geo_source = open(path, core::SourceKind::RASTER_POLYGON, options);

    auto block0 = readRange(*geo_source, core::OffsetRange(0, 1));
    ASSERT_EQ(block0.size(), 2u);
    std::map<int, double> areas;
    for (const auto& record : block0) {
        EXPECT_EQ(record.attributes["block"].get<int64_t>(), 0);
        areas[record.attributes["value"].get<int>()] = std::abs(core::bg::area(std::get<core::Polygon>(record.geometry)));
    }
    // 8x16 pixels of 10 m
    EXPECT_NEAR(areas[1], 12800.0, 1e-6);
    EXPECT_NEAR(areas[2], 12800.0, 1e-6);

    EXPECT_TRUE(readRange(*geo_source, core::OffsetRange(1, 2)).empty());

    auto bottom = readRange(*geo_source, core::OffsetRange(2, 4));
    ASSERT_EQ(bottom.size(), 2u);
    EXPECT_EQ(bottom[0].attributes["value"].get<int>(), 5);
    EXPECT_EQ(bottom[0].attributes["block"].get<int64_t>(), 2);
    EXPECT_EQ(bottom[1].attributes["block"].get<int64_t>(), 3);
}

TEST_F(RasterSourceTest, Float32NodataMatchesRoundedSentinel) {
    // 0.1 is not representable in Float32; stored pixels hold 0.1f
    std::vector<float> values(32 * 32, 0.1f);
    values[0] = 5.0f;
    values[17] = 5.0f;
    const std::string path = dir_ + "/fraction_nodata.tif";
    test_support::writeGeoTiff(path, 32, 32, 16, values, 0.1, 32633);

    auto geo_source = open(path, core::SourceKind::RASTER);
    auto records = readRange(*geo_source, core::OffsetRange(0, 4));
    ASSERT_EQ(records.size(), 2u);
    for (const auto& record : records) {
        EXPECT_EQ(record.attributes["value"].get<double>(), 5.0);
    }
}

TEST_F(RasterSourceTest, PolygonValuesKeepFullPrecision) {
    // Adjacent values that collapse to one Float32 value
    std::vector<double> values(16 * 16);
    for (int row = 0; row < 16; ++row) {
        for (int col = 0; col < 16; ++col) {
            values[static_cast<size_t>(row * 16 + col)] = col < 8 ? 16777216.0 : 16777217.0;
        }
    }
    const std::string path = dir_ + "/wide_values.tif";
    test_support::writeGeoTiff(path, 16, 16, 16, values, 0.0, 32633, GDT_UInt32);

    source::SourceOptions options;
    options.skip_reproject = true;
    auto geo_source = open(path, core::SourceKind::RASTER_POLYGON, options);

    auto records = readRange(*geo_source, core::OffsetRange(0, 1));
    ASSERT_EQ(records.size(), 2u);
    std::set<int64_t> found;
    for (const auto& record : records) {
        found.insert(record.attributes["value"].get<int64_t>());
        EXPECT_NEAR(std::abs(core::bg::area(std::get<core::Polygon>(record.geometry))), 12800.0, 1e-6);
    }
    EXPECT_EQ(found, (std::set<int64_t>{16777216, 16777217}));
}

TEST_F(RasterSourceTest, RangePastLastBlockStopsAtEnd) {
    std::vector<float> values(32 * 32, 3.0f);
    const std::string path = dir_ + "/full.tif";
    test_support::writeGeoTiff(path, 32, 32, 16, values, kNoData, 32633);

    auto geo_source = open(path, core::SourceKind::RASTER);
    auto exact = readRange(*geo_source, core::OffsetRange(0, 4));
    std::vector<core::GeoRecord> oversized;
    ASSERT_NO_THROW(oversized = readRange(*geo_source, core::OffsetRange(0, 10)));
    EXPECT_EQ(oversized.size(), exact.size());
    EXPECT_EQ(pixelKeys(oversized), pixelKeys(exact));
    EXPECT_TRUE(readRange(*geo_source, core::OffsetRange(4, 10)).empty());
    EXPECT_EQ(geo_source->metrics()->failed_ranges.load(), 0u);
}

TEST_F(RasterSourceTest, CorruptBlockIsSkipped) {
    std::vector<float> values(32 * 32, 7.0f);
    const std::string path = dir_ + "/corrupt.tif";
    test_support::writeGeoTiff(path, 32, 32, 16, values, kNoData, 32633, GDT_Float32, 500000.0, 4000000.0,
                               10.0, "DEFLATE");
    test_support::corruptGeoTiffBlock(path, 1, 0);

    auto geo_source = open(path, core::SourceKind::RASTER);
    auto records = readRange(*geo_source, core::OffsetRange(0, 4));
    EXPECT_EQ(records.size(), 3u * 256u);
    for (const auto& record : records) {
        EXPECT_EQ(record.attributes["value"].get<double>(), 7.0);
        EXPECT_FALSE(record.attributes["pixel_x"].get<int>() >= 16 && record.attributes["pixel_y"].get<int>() < 16);
    }
    EXPECT_EQ(geo_source->metrics()->skipped_blocks.load(), 1u);
    EXPECT_EQ(geo_source->metrics()->failed_ranges.load(), 0u);
}

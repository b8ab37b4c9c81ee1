#include <gtest/gtest.h>
#include <set>
#include "core/errors.hpp"
#include "source/shapefile_source.hpp"
#include "source/source_factory.hpp"
#include "test_helpers.hpp"

using namespace geosplit;
using geosplit::test_support::readRange;

namespace {

std::multiset<int> recordIds(const std::vector<core::GeoRecord>& records) {
    std::multiset<int> ids;
    for (const auto& record : records) {
        ids.insert(record.attributes["id"].get<int>());
    }
    return ids;
}

class VectorSourceTest : public ::testing::Test {
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

    const std::string dir_ = "/vsimem/vector_source_test";
};

} // namespace

TEST_F(VectorSourceTest, SplitsShapefileByFeatureIndex) {
    const std::string path = dir_ + "/points.shp";
    test_support::writePointShapefile(path, 10, 32633);

    auto geo_source = open(path, core::SourceKind::SHAPEFILE);
    auto* vector = dynamic_cast<source::VectorFileSource*>(geo_source.get());
    ASSERT_NE(vector, nullptr);
    EXPECT_EQ(vector->featureCount(), 10);
    EXPECT_EQ(vector->layerName(), "points");

    std::optional<int64_t> estimate = geo_source->estimateSize();
    ASSERT_TRUE(estimate.has_value());
    ASSERT_GT(*estimate, 10);

    // Roughly four features' worth of bytes per bundle
    auto ranges = geo_source->getInitialRanges(4 * (*estimate / 10));
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0], core::OffsetRange(0, 4));
    EXPECT_EQ(ranges[1], core::OffsetRange(4, 7));
    EXPECT_EQ(ranges[2], core::OffsetRange(7, 10));

    std::vector<core::GeoRecord> combined;
    for (const auto& range : ranges) {
        auto part = readRange(*geo_source, range);
        EXPECT_EQ(part.size(), static_cast<size_t>(range.end - range.start));
        combined.insert(combined.end(), part.begin(), part.end());
    }
    ASSERT_EQ(combined.size(), 10u);
    EXPECT_EQ(recordIds(combined), std::multiset<int>({0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
    EXPECT_EQ(combined[3].attributes["name"].get<std::string>(), "feature 3");
    EXPECT_EQ(geo_source->metrics()->records_emitted.load(), 10u);
}

TEST_F(VectorSourceTest, SingleRangeWithoutBundleSize) {
    const std::string path = dir_ + "/single.shp";
    test_support::writePointShapefile(path, 5, 32633);

    auto geo_source = open(path, core::SourceKind::SHAPEFILE);
    auto ranges = geo_source->getInitialRanges(0);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], core::OffsetRange(0, 5));
}

TEST_F(VectorSourceTest, ReadsFromTheMiddleOfTheLayer) {
    const std::string path = dir_ + "/middle.shp";
    test_support::writePointShapefile(path, 10, 32633);

    auto geo_source = open(path, core::SourceKind::SHAPEFILE);
    auto records = readRange(*geo_source, core::OffsetRange(6, 9));
    EXPECT_EQ(recordIds(records), std::multiset<int>({6, 7, 8}));
}

TEST_F(VectorSourceTest, MissingProjectionNeedsOverride) {
    const std::string path = dir_ + "/noprj.shp";
    test_support::writePointShapefile(path, 4, 0);

    auto undetermined = open(path, core::SourceKind::SHAPEFILE);
    auto reader = undetermined->createReader(core::OffsetRange(0, 4));
    EXPECT_THROW(reader->start(), core::CRSUndeterminedError);

    source::SourceOptions options;
    options.in_epsg = 32633;
    auto overridden = open(path, core::SourceKind::SHAPEFILE, options);
    auto records = readRange(*overridden, core::OffsetRange(0, 4));
    ASSERT_EQ(records.size(), 4u);
    const auto& point = std::get<core::Point>(records[0].geometry);
    EXPECT_NEAR(core::bg::get<0>(point), 15.0, 1e-3);
}

TEST_F(VectorSourceTest, ReaderIsClosedAfterFailedStart) {
    const std::string path = dir_ + "/noprj.shp";
    test_support::writePointShapefile(path, 4, 0);

    auto geo_source = open(path, core::SourceKind::SHAPEFILE);
    auto reader = geo_source->createReader(core::OffsetRange(0, 4));
    EXPECT_THROW(reader->start(), core::CRSUndeterminedError);
    EXPECT_FALSE(reader->advance());
    EXPECT_FALSE(reader->advance());
    EXPECT_EQ(geo_source->metrics()->records_emitted.load(), 0u);
    EXPECT_EQ(geo_source->metrics()->failed_ranges.load(), 0u);
}

TEST_F(VectorSourceTest, SkipReprojectKeepsSourceCoordinates) {
    const std::string path = dir_ + "/native.shp";
    test_support::writePointShapefile(path, 2, 0);

    source::SourceOptions options;
    options.skip_reproject = true;
    auto geo_source = open(path, core::SourceKind::SHAPEFILE, options);
    auto records = readRange(*geo_source, core::OffsetRange(0, 2));
    ASSERT_EQ(records.size(), 2u);
    const auto& point = std::get<core::Point>(records[1].geometry);
    EXPECT_DOUBLE_EQ(core::bg::get<0>(point), 500100.0);
    EXPECT_DOUBLE_EQ(core::bg::get<1>(point), 4000100.0);
}

TEST_F(VectorSourceTest, DynamicSplitCoversEveryFeature) {
    const std::string path = dir_ + "/dynamic.shp";
    test_support::writePointShapefile(path, 20, 32633);

    auto geo_source = open(path, core::SourceKind::SHAPEFILE);
    auto reader = geo_source->createReader(core::OffsetRange(0, 20));

    std::vector<core::GeoRecord> records;
    ASSERT_TRUE(reader->start());
    records.push_back(reader->getCurrent());
    ASSERT_TRUE(reader->advance());
    records.push_back(reader->getCurrent());

    auto residual = reader->trySplit(0.25);
    ASSERT_TRUE(residual.has_value());
    EXPECT_EQ(*residual, core::OffsetRange(5, 20));
    while (reader->advance()) {
        records.push_back(reader->getCurrent());
    }
    reader->close();
    EXPECT_EQ(records.size(), 5u);

    // A split point already claimed is refused
    auto finished = geo_source->createReader(core::OffsetRange(0, 4));
    ASSERT_TRUE(finished->start());
    ASSERT_TRUE(finished->advance());
    ASSERT_TRUE(finished->advance());
    EXPECT_FALSE(finished->trySplit(0.25).has_value());
    finished->close();

    auto rest = readRange(*geo_source, *residual);
    records.insert(records.end(), rest.begin(), rest.end());
    std::multiset<int> expected;
    for (int i = 0; i < 20; ++i) {
        expected.insert(i);
    }
    EXPECT_EQ(recordIds(records), expected);
}

TEST_F(VectorSourceTest, GeoJSONFeaturesWithoutGeometryAreCounted) {
    const std::string path = dir_ + "/features.geojson";
    test_support::writeTextFile(path, R"({
        "type": "FeatureCollection",
        "features": [
            {"type": "Feature", "properties": {"id": 1, "kind": "a"},
             "geometry": {"type": "Point", "coordinates": [10.5, 45.25]}},
            {"type": "Feature", "properties": {"id": 2, "kind": "b"}, "geometry": null},
            {"type": "Feature", "properties": {"id": 3, "kind": "c"},
             "geometry": {"type": "LineString", "coordinates": [[0, 0], [1, 1], [2, 0]]}}
        ]
    })");

    auto geo_source = open(path, core::SourceKind::GEOJSON);
    auto records = readRange(*geo_source, core::OffsetRange(0, 3));
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].attributes["kind"].get<std::string>(), "a");
    const auto& point = std::get<core::Point>(records[0].geometry);
    EXPECT_NEAR(core::bg::get<0>(point), 10.5, 1e-9);
    EXPECT_NEAR(core::bg::get<1>(point), 45.25, 1e-9);
    EXPECT_TRUE(std::holds_alternative<core::LineString>(records[1].geometry));

    EXPECT_EQ(geo_source->metrics()->missing_geometries.load(), 1u);
    EXPECT_EQ(geo_source->metrics()->droppedRecords(), 1u);
}

TEST_F(VectorSourceTest, UnknownLayerIsConfigurationError) {
    const std::string path = dir_ + "/layers.shp";
    test_support::writePointShapefile(path, 2, 32633);

    source::SourceOptions options;
    options.layer_name = "roads";
    EXPECT_THROW(open(path, core::SourceKind::SHAPEFILE, options), core::ConfigurationError);
}

TEST_F(VectorSourceTest, UnreadableFileIsRangeFailure) {
    EXPECT_THROW(open(dir_ + "/missing.shp", core::SourceKind::SHAPEFILE), core::RangeFailure);
}

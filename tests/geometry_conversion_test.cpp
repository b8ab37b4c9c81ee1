#include <gtest/gtest.h>
#include <ogr_geometry.h>
#include "core/geometry_conversion.hpp"

using namespace geosplit::core;

namespace {

std::unique_ptr<OGRGeometry> fromWkt(const char* wkt) {
    OGRGeometry* geometry = nullptr;
    OGRGeometryFactory::createFromWkt(wkt, nullptr, &geometry);
    return std::unique_ptr<OGRGeometry>(geometry);
}

// Shoelace area of a GeoJSON ring; positive for counter-clockwise rings
double signedArea(const nlohmann::json& ring) {
    double area = 0.0;
    for (size_t i = 0; i + 1 < ring.size(); ++i) {
        area += ring[i][0].get<double>() * ring[i + 1][1].get<double>() -
                ring[i + 1][0].get<double>() * ring[i][1].get<double>();
    }
    return area / 2.0;
}

} // namespace

TEST(GeometryConversionTest, PolygonIsCorrectedToBoostOrientation) {
    auto ogr = fromWkt("POLYGON ((0 0,4 0,4 4,0 4,0 0),(1 1,1 2,2 2,2 1,1 1))");
    ASSERT_NE(ogr, nullptr);

    Geometry geometry = ogrToGeometry(*ogr);
    ASSERT_TRUE(std::holds_alternative<Polygon>(geometry));
    const Polygon& polygon = std::get<Polygon>(geometry);
    EXPECT_EQ(polygon.inners().size(), 1u);
    EXPECT_DOUBLE_EQ(bg::area(polygon), 15.0);
}

TEST(GeometryConversionTest, CollectionKeepsHighestDimension) {
    auto ogr = fromWkt("GEOMETRYCOLLECTION (POINT (5 5),LINESTRING (0 0,1 1),POLYGON ((0 0,1 0,1 1,0 0)))");
    ASSERT_NE(ogr, nullptr);

    Geometry geometry = ogrToGeometry(*ogr);
    EXPECT_EQ(geometryTypeName(geometry), "Polygon");
    EXPECT_EQ(topologicalDimension(geometry), 2);
}

TEST(GeometryConversionTest, EmptyGeometryKeepsDimension) {
    auto ogr = fromWkt("MULTIPOLYGON EMPTY");
    ASSERT_NE(ogr, nullptr);

    Geometry geometry = ogrToGeometry(*ogr);
    EXPECT_TRUE(isEmptyGeometry(geometry));
    EXPECT_EQ(topologicalDimension(geometry), 2);
}

TEST(GeometryConversionTest, MultiLineStringToOgr) {
    MultiLineString lines;
    lines.push_back(LineString{Point(0, 0), Point(1, 1)});
    lines.push_back(LineString{Point(2, 2), Point(3, 3), Point(4, 2)});

    std::unique_ptr<OGRGeometry> ogr = geometryToOgr(Geometry(lines));
    ASSERT_EQ(wkbFlatten(ogr->getGeometryType()), wkbMultiLineString);
    EXPECT_EQ(ogr->toMultiLineString()->getNumGeometries(), 2);
    EXPECT_EQ(vertexCount(Geometry(lines)), 5u);
}

TEST(GeometryConversionTest, GeoJSONExteriorIsCounterClockwise) {
    auto ogr = fromWkt("POLYGON ((0 0,0 3,3 3,3 0,0 0))");
    ASSERT_NE(ogr, nullptr);

    nlohmann::json geojson = geometryToGeoJSON(ogrToGeometry(*ogr));
    EXPECT_EQ(geojson["type"], "Polygon");
    ASSERT_EQ(geojson["coordinates"].size(), 1u);
    EXPECT_DOUBLE_EQ(signedArea(geojson["coordinates"][0]), 9.0);
}

TEST(GeometryConversionTest, PointToGeoJSON) {
    nlohmann::json geojson = geometryToGeoJSON(Geometry(Point(12.5, -3.0)));
    EXPECT_EQ(geojson["type"], "Point");
    EXPECT_DOUBLE_EQ(geojson["coordinates"][0].get<double>(), 12.5);
    EXPECT_DOUBLE_EQ(geojson["coordinates"][1].get<double>(), -3.0);
}

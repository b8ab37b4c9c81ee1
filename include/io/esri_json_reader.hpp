#ifndef GEOSPLIT_ESRI_JSON_READER_HPP
#define GEOSPLIT_ESRI_JSON_READER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/common.hpp"

namespace geosplit {
namespace io {

/**
 * One feature of an ESRI JSON page
 */
struct EsriFeature {
    nlohmann::json attributes;
    std::optional<core::Geometry> geometry;   // nullopt if the feature has no geometry
};

/**
 * Parsed query page
 */
struct EsriPage {
    std::vector<EsriFeature> features;
    bool exceeded_transfer_limit;
    std::optional<int> wkid;          // Spatial reference of the page geometries
    std::string geometry_type;        // esriGeometryPoint, esriGeometryPolygon, ...

    EsriPage() : exceeded_transfer_limit(false) {}
};

/**
 * Layer metadata from the service's ?f=json endpoint
 */
struct EsriServiceInfo {
    std::optional<int> max_record_count;
    std::string object_id_field;
    std::optional<int> wkid;
};

/**
 * Parser and URL builder for ArcGIS feature service JSON
 */
class EsriJsonReader {
public:
    /**
     * Parse a query page
     * @param body Response body
     * @param error Set to the reason when parsing fails
     * @return Page, or nullopt if the body is malformed or is an error document
     */
    static std::optional<EsriPage> parsePage(const std::string& body, std::string& error);

    /**
     * Parse a returnCountOnly response
     * @return Feature count, or nullopt if the body has no count
     */
    static std::optional<int64_t> parseCount(const std::string& body);

    /**
     * Parse the layer metadata document
     * @return Info, or nullopt if the body is malformed or is an error document
     */
    static std::optional<EsriServiceInfo> parseServiceInfo(const std::string& body);

    /**
     * Convert an ESRI JSON geometry into a geometry.
     * Rings are classified by orientation: clockwise rings are exteriors and
     * counter-clockwise rings are holes of the exterior that contains them.
     * @param geometry ESRI geometry object
     * @return Geometry, or nullopt if the object has no coordinates
     */
    static std::optional<core::Geometry> parseGeometry(const nlohmann::json& geometry);

    /**
     * WKID of a spatialReference object, preferring latestWkid
     */
    static std::optional<int> parseSpatialReference(const nlohmann::json& spatial_reference);

    /**
     * URL of the feature count query
     */
    static std::string countUrl(const std::string& service_url);

    /**
     * URL of the layer metadata
     */
    static std::string infoUrl(const std::string& service_url);

    /**
     * URL of one page of features ordered by the object id field
     * @param service_url Layer URL (.../FeatureServer/0)
     * @param offset Index of the first feature
     * @param count Page size
     * @param object_id_field Field to order by, may be empty
     */
    static std::string pageUrl(const std::string& service_url, int64_t offset, int64_t count,
                               const std::string& object_id_field);

private:
    // Disable instantiation
    EsriJsonReader() = delete;

    static std::string baseUrl(const std::string& service_url);

    // Throws nlohmann::json::exception on fields of the wrong type
    static void readServiceInfo(const nlohmann::json& document, EsriServiceInfo& info);
};

} // namespace io
} // namespace geosplit

#endif // GEOSPLIT_ESRI_JSON_READER_HPP

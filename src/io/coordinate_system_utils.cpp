#include "io/coordinate_system_utils.hpp"
#include "core/errors.hpp"
#include <cpl_conv.h>
#include <ogr_srs_api.h>
#include <cstring>

namespace geosplit {
namespace io {

SpatialReferencePtr CoordinateSystemUtils::fromEPSG(int epsg) {
    SpatialReferencePtr srs(new OGRSpatialReference());
    if (srs->importFromEPSG(epsg) != OGRERR_NONE) {
        throw core::ConfigurationError("Unknown EPSG code: " + std::to_string(epsg));
    }

    // Set axis mapping strategy for GDAL 3+
    srs->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

SpatialReferencePtr CoordinateSystemUtils::fromUserInput(const std::string& definition) {
    SpatialReferencePtr srs(new OGRSpatialReference());
    if (srs->SetFromUserInput(definition.c_str()) != OGRERR_NONE) {
        throw core::ConfigurationError("Failed to parse coordinate system definition: " + definition);
    }

    srs->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

SpatialReferencePtr CoordinateSystemUtils::fromWkt(const std::string& wkt) {
    if (wkt.empty()) {
        return nullptr;
    }

    SpatialReferencePtr srs(new OGRSpatialReference());
    if (srs->importFromWkt(wkt.c_str()) != OGRERR_NONE) {
        return nullptr;
    }

    srs->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

SpatialReferencePtr CoordinateSystemUtils::resolveSourceCRS(const CRSSpec& spec, const std::string& embedded_wkt,
                                                            const std::string& source_label) {
    if (spec.epsg.has_value()) {
        return fromEPSG(*spec.epsg);
    }
    if (!spec.definition.empty()) {
        return fromUserInput(spec.definition);
    }

    SpatialReferencePtr embedded = fromWkt(embedded_wkt);
    if (embedded) {
        return embedded;
    }

    throw core::CRSUndeterminedError("Cannot determine the coordinate system of " + source_label +
                                     ": the file has no CRS and neither in_epsg nor in_proj is set");
}

int CoordinateSystemUtils::epsgCode(const OGRSpatialReference& spatial_ref) {
    const char* authority_name = spatial_ref.GetAuthorityName(nullptr);
    const char* authority_code = spatial_ref.GetAuthorityCode(nullptr);

    if (authority_name && authority_code && strcmp(authority_name, "EPSG") == 0) {
        return atoi(authority_code);
    }
    return -1;
}

std::string CoordinateSystemUtils::describe(const OGRSpatialReference& spatial_ref) {
    int epsg = epsgCode(spatial_ref);
    if (epsg > 0) {
        return "EPSG:" + std::to_string(epsg);
    }

    const char* name = spatial_ref.GetName();
    return name ? std::string(name) : std::string("unnamed CRS");
}

std::string CoordinateSystemUtils::toWkt(const OGRSpatialReference& spatial_ref) {
    char* wkt = nullptr;
    std::string result;
    if (spatial_ref.exportToWkt(&wkt) == OGRERR_NONE && wkt) {
        result = wkt;
    }
    CPLFree(wkt);
    return result;
}

} // namespace io
} // namespace geosplit

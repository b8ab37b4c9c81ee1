#ifndef GEOSPLIT_COORDINATE_SYSTEM_UTILS_HPP
#define GEOSPLIT_COORDINATE_SYSTEM_UTILS_HPP

#include <memory>
#include <optional>
#include <string>
#include <ogr_spatialref.h>

namespace geosplit {
namespace io {

// Releases a reference-counted spatial reference
struct SpatialReferenceReleaser {
    void operator()(OGRSpatialReference* srs) const {
        if (srs) {
            srs->Release();
        }
    }
};

using SpatialReferencePtr = std::unique_ptr<OGRSpatialReference, SpatialReferenceReleaser>;

/**
 * How the source CRS of a reader is determined.
 * An explicit EPSG code wins over a PROJ/WKT definition, which wins over the CRS
 * embedded in the file.
 */
struct CRSSpec {
    std::optional<int> epsg;    // in_epsg override
    std::string definition;     // in_proj override (PROJ string, WKT or any OSR user input)

    bool deriveFromFile() const { return !epsg.has_value() && definition.empty(); }
};

/**
 * Coordinate system utility functions for CRS resolution and description
 */
class CoordinateSystemUtils {
public:
    /**
     * Create a spatial reference from an EPSG code, in traditional GIS axis order
     * @param epsg EPSG code
     * @return Spatial reference
     * @throws core::ConfigurationError if the code is unknown
     */
    static SpatialReferencePtr fromEPSG(int epsg);

    /**
     * Create a spatial reference from a PROJ string, WKT or "EPSG:n" definition
     * @param definition User definition
     * @return Spatial reference
     * @throws core::ConfigurationError if the definition cannot be parsed
     */
    static SpatialReferencePtr fromUserInput(const std::string& definition);

    /**
     * Create a spatial reference from WKT embedded in a file
     * @param wkt WKT string, may be empty
     * @return Spatial reference, or null if the WKT is empty or cannot be parsed
     */
    static SpatialReferencePtr fromWkt(const std::string& wkt);

    /**
     * Resolve the effective source CRS: override > embedded > error
     * @param spec Configured overrides
     * @param embedded_wkt CRS found in the file, may be empty
     * @param source_label Source name used in the error message
     * @return Spatial reference
     * @throws core::CRSUndeterminedError if neither override nor embedded CRS exists
     */
    static SpatialReferencePtr resolveSourceCRS(const CRSSpec& spec, const std::string& embedded_wkt,
                                                const std::string& source_label);

    /**
     * EPSG code of a spatial reference
     * @return EPSG code, or -1 if the authority is not EPSG
     */
    static int epsgCode(const OGRSpatialReference& spatial_ref);

    /**
     * Short description for logging ("EPSG:32633" or the CRS name)
     */
    static std::string describe(const OGRSpatialReference& spatial_ref);

    /**
     * Export a spatial reference as WKT
     */
    static std::string toWkt(const OGRSpatialReference& spatial_ref);

private:
    // Disable instantiation
    CoordinateSystemUtils() = delete;
};

} // namespace io
} // namespace geosplit

#endif // GEOSPLIT_COORDINATE_SYSTEM_UTILS_HPP

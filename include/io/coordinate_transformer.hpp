#ifndef GEOSPLIT_COORDINATE_TRANSFORMER_HPP
#define GEOSPLIT_COORDINATE_TRANSFORMER_HPP

#include <memory>
#include <optional>
#include <string>
#include <ogr_spatialref.h>
#include "core/common.hpp"
#include "io/coordinate_system_utils.hpp"

namespace geosplit {
namespace io {

// Destroys an OGR coordinate transformation
struct CoordinateTransformationDeleter {
    void operator()(OGRCoordinateTransformation* transformation) const {
        OGRCoordinateTransformation::DestroyCT(transformation);
    }
};

using CoordinateTransformationPtr = std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformationDeleter>;

/**
 * Reprojects points and geometries from a source CRS into the target CRS.
 * One instance is owned by each reader; it is not shared between threads.
 */
class CoordinateTransformer {
public:
    /**
     * Identity transformer (skip_reproject)
     */
    CoordinateTransformer();

    /**
     * @param source Source CRS
     * @param target Target CRS
     * @throws core::ConfigurationError if no transformation exists between the two
     */
    CoordinateTransformer(SpatialReferencePtr source, SpatialReferencePtr target);

    CoordinateTransformer(CoordinateTransformer&&) = default;
    CoordinateTransformer& operator=(CoordinateTransformer&&) = default;

    /**
     * Build the transformer of a reader
     * @param spec Source CRS overrides
     * @param embedded_wkt CRS embedded in the file, may be empty
     * @param target_epsg Target EPSG code
     * @param skip_reproject Return an identity transformer
     * @param source_label Source name used in messages
     * @throws core::CRSUndeterminedError if the source CRS cannot be determined
     */
    static CoordinateTransformer resolve(const CRSSpec& spec, const std::string& embedded_wkt, int target_epsg,
                                         bool skip_reproject, const std::string& source_label);

    bool isIdentity() const { return !forward_; }

    /**
     * @return Transformed point, or nullopt if the transformation failed
     */
    std::optional<core::Point> transformPoint(double x, double y) const;

    /**
     * Transform every vertex of a geometry, keeping its topology
     * @return Transformed geometry, or nullopt if any vertex failed
     */
    std::optional<core::Geometry> transformGeometry(const core::Geometry& geometry) const;

    /**
     * Transform a point from the target CRS back into the source CRS
     */
    std::optional<core::Point> inverseTransformPoint(double x, double y);

    /**
     * Description of the transformation for logging
     */
    std::string describe() const;

private:
    SpatialReferencePtr source_;
    SpatialReferencePtr target_;
    CoordinateTransformationPtr forward_;
    CoordinateTransformationPtr inverse_;   // Created on first use
};

} // namespace io
} // namespace geosplit

#endif // GEOSPLIT_COORDINATE_TRANSFORMER_HPP

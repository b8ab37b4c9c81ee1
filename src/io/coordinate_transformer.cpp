#include "io/coordinate_transformer.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <iostream>

namespace geosplit {
namespace io {

namespace {

bool transformXY(OGRCoordinateTransformation& transformation, double& x, double& y) {
    int success = FALSE;
    if (!transformation.Transform(1, &x, &y, nullptr, &success)) {
        return false;
    }
    return success && std::isfinite(x) && std::isfinite(y);
}

} // namespace

CoordinateTransformer::CoordinateTransformer() = default;

CoordinateTransformer::CoordinateTransformer(SpatialReferencePtr source, SpatialReferencePtr target)
    : source_(std::move(source)), target_(std::move(target)) {
    if (!source_ || !target_) {
        throw core::ConfigurationError("Coordinate transformer needs both a source and a target CRS");
    }

    forward_.reset(OGRCreateCoordinateTransformation(source_.get(), target_.get()));
    if (!forward_) {
        throw core::ConfigurationError("Failed to create coordinate transformation from " +
                                       CoordinateSystemUtils::describe(*source_) + " to " +
                                       CoordinateSystemUtils::describe(*target_));
    }
}

CoordinateTransformer CoordinateTransformer::resolve(const CRSSpec& spec, const std::string& embedded_wkt,
                                                     int target_epsg, bool skip_reproject,
                                                     const std::string& source_label) {
    if (skip_reproject) {
        return CoordinateTransformer();
    }

    SpatialReferencePtr source = CoordinateSystemUtils::resolveSourceCRS(spec, embedded_wkt, source_label);
    SpatialReferencePtr target = CoordinateSystemUtils::fromEPSG(target_epsg);
    return CoordinateTransformer(std::move(source), std::move(target));
}

std::optional<core::Point> CoordinateTransformer::transformPoint(double x, double y) const {
    if (forward_ && !transformXY(*forward_, x, y)) {
        return std::nullopt;
    }
    return core::Point(x, y);
}

std::optional<core::Geometry> CoordinateTransformer::transformGeometry(const core::Geometry& geometry) const {
    if (!forward_) {
        return geometry;
    }

    core::Geometry result = geometry;
    bool ok = true;
    OGRCoordinateTransformation& transformation = *forward_;

    std::visit([&](auto& g) {
        core::bg::for_each_point(g, [&](core::Point& p) {
            if (!ok) {
                return;
            }
            double x = core::bg::get<0>(p);
            double y = core::bg::get<1>(p);
            if (!transformXY(transformation, x, y)) {
                ok = false;
                return;
            }
            core::bg::set<0>(p, x);
            core::bg::set<1>(p, y);
        });
    }, result);

    if (!ok) {
        return std::nullopt;
    }
    return result;
}

std::optional<core::Point> CoordinateTransformer::inverseTransformPoint(double x, double y) {
    if (!forward_) {
        return core::Point(x, y);
    }

    if (!inverse_) {
        inverse_.reset(OGRCreateCoordinateTransformation(target_.get(), source_.get()));
        if (!inverse_) {
            std::cerr << "Warning: Failed to create inverse transformation for " << describe() << std::endl;
            return std::nullopt;
        }
    }

    if (!transformXY(*inverse_, x, y)) {
        return std::nullopt;
    }
    return core::Point(x, y);
}

std::string CoordinateTransformer::describe() const {
    if (!forward_) {
        return "identity";
    }
    return CoordinateSystemUtils::describe(*source_) + " -> " + CoordinateSystemUtils::describe(*target_);
}

} // namespace io
} // namespace geosplit

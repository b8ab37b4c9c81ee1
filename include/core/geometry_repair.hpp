#ifndef GEOSPLIT_GEOMETRY_REPAIR_HPP
#define GEOSPLIT_GEOMETRY_REPAIR_HPP

#include <optional>
#include <string>
#include "core/common.hpp"

namespace geosplit {
namespace core {

/**
 * Validity check and repair of record geometries.
 * Geometry defects are data-quality facts: callers drop and count geometries that
 * are not acceptable instead of raising.
 */
class GeometryRepair {
public:
    /**
     * Check validity against the simple-feature model
     * @param geometry Geometry to check
     * @param reason Optional output for the failure description
     * @return true if valid
     */
    static bool isValid(const Geometry& geometry, std::string* reason = nullptr);

    /**
     * Repair a geometry without modifying the input.
     * Rings are closed and oriented first; remaining defects such as
     * self-intersections are removed with the GEOS-backed OGR MakeValid.
     * @param geometry Geometry to repair
     * @return The input itself if already valid, otherwise the repaired geometry
     */
    static Geometry makeValid(const Geometry& geometry);

    /**
     * True iff the repaired geometry is valid, non-empty and keeps the
     * topological dimension of the input
     * @param geometry Input geometry (before repair)
     */
    static bool isAcceptable(const Geometry& geometry);

    /**
     * makeValid() followed by the isAcceptable() test
     * @param geometry Input geometry
     * @return Repaired geometry, or nullopt if the record must be dropped
     */
    static std::optional<Geometry> repair(const Geometry& geometry);

private:
    // Disable instantiation
    GeometryRepair() = delete;
};

} // namespace core
} // namespace geosplit

#endif // GEOSPLIT_GEOMETRY_REPAIR_HPP

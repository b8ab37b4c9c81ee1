#ifndef GEOSPLIT_GEODATABASE_SOURCE_HPP
#define GEOSPLIT_GEODATABASE_SOURCE_HPP

#include <string>
#include <vector>
#include "source/vector_source.hpp"

namespace geosplit {
namespace source {

/**
 * File geodatabase source: a zipped .gdb directory (or a plain .gdb directory)
 */
class GeodatabaseSource : public VectorFileSource {
public:
    /**
     * @throws core::ConfigurationError if the .gdb member cannot be selected
     */
    GeodatabaseSource(const core::SourceDescriptor& descriptor, const SourceOptions& options);

    /**
     * Locate the .gdb member inside an archive
     * @param entries Archive entries as listed by GDALUtils::listRecursive
     * @param gdb_name Requested member, with or without ".gdb"; empty to pick the only one
     * @return Member path relative to the archive root
     * @throws core::ConfigurationError if no member or several members match
     */
    static std::string resolveMember(const std::vector<std::string>& entries, const std::string& gdb_name);

    /**
     * GDAL path of the geodatabase named by a URI
     */
    static std::string geodatabasePath(const std::string& uri, const std::string& gdb_name);

    /**
     * .gdb members found in archive entries, in sorted order
     */
    static std::vector<std::string> listMembers(const std::vector<std::string>& entries);
};

} // namespace source
} // namespace geosplit

#endif // GEOSPLIT_GEODATABASE_SOURCE_HPP

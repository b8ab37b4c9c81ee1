#ifndef GEOSPLIT_GDAL_UTILS_HPP
#define GEOSPLIT_GDAL_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <gdal_priv.h>

namespace geosplit {
namespace io {

/**
 * GDAL utility functions for driver registration, path mapping and dataset access
 */
class GDALUtils {
public:
    /**
     * Register all GDAL/OGR drivers once per process
     */
    static void registerDrivers();

    /**
     * Check if a specific GDAL driver is available
     * @param driver_name GDAL driver short name
     * @return true if the driver is registered, false otherwise
     */
    static bool isDriverAvailable(const std::string& driver_name);

    /**
     * Map a URI to a path GDAL can open.
     * gs:// and s3:// map to /vsigs/ and /vsis3/, http(s):// to /vsicurl/,
     * and .zip archives are opened through /vsizip/.
     * @param uri Local path or URI
     * @param open_archives Wrap .zip archives in /vsizip/
     * @return GDAL path
     */
    static std::string toGdalPath(const std::string& uri, bool open_archives = true);

    /**
     * Open a dataset read-only
     * @param path GDAL path
     * @param open_flags GDAL_OF_RASTER or GDAL_OF_VECTOR
     * @param allowed_drivers Driver short names to try, empty for all
     * @return Dataset, or null if it cannot be opened
     */
    static GDALDatasetUniquePtr openDataset(const std::string& path, unsigned int open_flags,
                                            const std::vector<std::string>& allowed_drivers = {});

    /**
     * Recursively list the entries below a directory or archive
     * @param path GDAL path of a directory or /vsizip/ archive
     * @return Relative entry paths
     */
    static std::vector<std::string> listRecursive(const std::string& path);

    /**
     * Size in bytes of a file, or of all files below a directory
     * @param path GDAL path
     * @return Size, or nullopt if the path cannot be stat'ed
     */
    static std::optional<int64_t> storageSize(const std::string& path);

    /**
     * Last error message reported by GDAL/CPL
     */
    static std::string lastErrorMessage();

    /**
     * Driver able to hold an in-memory vector layer ("MEM" or the older "Memory")
     * @return Driver, or null if neither is registered
     */
    static GDALDriver* vectorMemoryDriver();

private:
    // Disable instantiation
    GDALUtils() = delete;
};

} // namespace io
} // namespace geosplit

#endif // GEOSPLIT_GDAL_UTILS_HPP

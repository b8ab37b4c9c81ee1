#ifndef GEOSPLIT_GEOJSON_WRITER_HPP
#define GEOSPLIT_GEOJSON_WRITER_HPP

#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/common.hpp"

namespace geosplit {
namespace io {

/**
 * GeoJSON writer for converting GeoRecords to GeoJSON features and files
 */
class GeoJSONWriter {
public:
    /**
     * Write records to a GeoJSON FeatureCollection file
     * @param records Records to write
     * @param filepath Path to the output GeoJSON file
     * @param crs CRS name (e.g., "EPSG:4326"), empty to omit
     * @return true if successful, false otherwise
     */
    static bool writeToFile(const std::vector<core::GeoRecord>& records, const std::string& filepath,
                            const std::string& crs = "");

    /**
     * Convert records to a GeoJSON FeatureCollection string
     * @param records Records to convert
     * @param crs CRS name, empty to omit
     * @return GeoJSON string representation
     */
    static std::string writeToString(const std::vector<core::GeoRecord>& records, const std::string& crs = "");

    /**
     * Convert a record to a GeoJSON Feature
     * @param record Record to convert
     * @return JSON object representing the feature
     */
    static nlohmann::json recordToFeature(const core::GeoRecord& record);

    /**
     * Set CRS information in a GeoJSON object
     * @param geojson JSON object to modify
     * @param crs CRS string (e.g., "EPSG:32633")
     */
    static void setCRS(nlohmann::json& geojson, const std::string& crs);

    /**
     * Get the last error message
     * @return Error message from the last operation
     */
    static std::string getLastError() {
        return last_error_;
    }

private:
    static std::string last_error_;

    static void setError(const std::string& error) {
        last_error_ = error;
    }

    // Disable instantiation
    GeoJSONWriter() = delete;
};

/**
 * Newline-delimited GeoJSON (GeoJSONSeq) output shared by several worker threads
 */
class GeoJSONSeqWriter {
public:
    /**
     * @param filepath Output path
     */
    explicit GeoJSONSeqWriter(const std::string& filepath);

    /**
     * @return true if the output is open
     */
    bool isOpen() const;

    /**
     * Append one record as a single line
     * @return true if successful, false otherwise
     */
    bool write(const core::GeoRecord& record);

    /**
     * Number of records written
     */
    size_t count() const;

private:
    mutable std::mutex mutex_;
    std::ofstream file_;
    size_t count_;
};

} // namespace io
} // namespace geosplit

#endif // GEOSPLIT_GEOJSON_WRITER_HPP

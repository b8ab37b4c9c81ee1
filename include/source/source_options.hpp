#ifndef GEOSPLIT_SOURCE_OPTIONS_HPP
#define GEOSPLIT_SOURCE_OPTIONS_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "io/coordinate_system_utils.hpp"
#include "io/http_client.hpp"

namespace geosplit {
namespace source {

// Options shared by every source kind
struct SourceOptions {
    bool skip_reproject;            // Emit coordinates in the source CRS
    std::optional<int> in_epsg;     // Source CRS override as EPSG code
    std::string in_proj;            // Source CRS override as PROJ string or WKT
    int out_epsg;                   // Target CRS (default: 4326)
    int band_number;                // Raster band, 1-based (default: 1)
    bool include_nodata;            // Emit nodata pixels (default: false)
    std::string layer_name;         // Vector layer, required when a container has several
    std::string gdb_name;           // Member .gdb directory inside a zipped geodatabase
    std::optional<int> page_size;   // Feature service page size override
    int max_retries;                // Feature service retry budget (default: 5)
    int initial_backoff_ms;         // First retry delay (default: 500)

    SourceOptions()
        : skip_reproject(false),
          out_epsg(4326),
          band_number(1),
          include_nodata(false),
          max_retries(5),
          initial_backoff_ms(500) {}

    /**
     * Source CRS overrides
     */
    io::CRSSpec crsSpec() const;

    /**
     * Retry budget of feature service requests
     */
    io::RetryPolicy retryPolicy() const;
};

/**
 * Parse options from a JSON object.
 * Values may be given as JSON scalars or as strings (as they arrive from the command line).
 * @param options_json JSON object
 * @return Options with defaults for absent keys
 * @throws core::ConfigurationError for unknown keys or invalid values
 */
SourceOptions parseSourceOptions(const nlohmann::json& options_json);

} // namespace source
} // namespace geosplit

#endif // GEOSPLIT_SOURCE_OPTIONS_HPP

#include "source/source_factory.hpp"
#include "core/errors.hpp"
#include "io/gdal_utils.hpp"
#include "source/esri_server_source.hpp"
#include "source/geodatabase_source.hpp"
#include "source/raster_block_source.hpp"
#include "source/raster_polygon_source.hpp"
#include "source/shapefile_source.hpp"

namespace geosplit {
namespace source {

std::unique_ptr<GeoSource> createSource(const core::SourceDescriptor& descriptor, const SourceOptions& options,
                                        std::shared_ptr<io::HttpClient> http_client) {
    io::GDALUtils::registerDrivers();

    if (descriptor.uri.empty() && descriptor.locator.empty()) {
        throw core::ConfigurationError("Source URI is empty");
    }

    switch (descriptor.kind) {
        case core::SourceKind::RASTER:
            return std::make_unique<RasterBlockSource>(descriptor, options);
        case core::SourceKind::RASTER_POLYGON:
            return std::make_unique<RasterPolygonSource>(descriptor, options);
        case core::SourceKind::SHAPEFILE:
            return std::make_unique<ShapefileSource>(descriptor, options);
        case core::SourceKind::GEODATABASE:
            return std::make_unique<GeodatabaseSource>(descriptor, options);
        case core::SourceKind::GEOJSON:
            return std::make_unique<GeoJSONSource>(descriptor, options);
        case core::SourceKind::ESRI_SERVICE:
            if (!http_client) {
                http_client = std::make_shared<io::CplHttpClient>();
            }
            return std::make_unique<EsriServerSource>(descriptor, options, std::move(http_client));
    }

    throw core::ConfigurationError("Unsupported source kind");
}

} // namespace source
} // namespace geosplit

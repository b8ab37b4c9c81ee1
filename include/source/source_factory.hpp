#ifndef GEOSPLIT_SOURCE_FACTORY_HPP
#define GEOSPLIT_SOURCE_FACTORY_HPP

#include <memory>
#include "io/http_client.hpp"
#include "source/geo_source.hpp"
#include "source/source_options.hpp"

namespace geosplit {
namespace source {

/**
 * Build the source matching a descriptor's kind
 * @param descriptor Source descriptor
 * @param options Source options
 * @param http_client Client for feature services; a CplHttpClient is created when null
 * @return Source owned by the caller
 * @throws core::ConfigurationError for invalid options or ambiguous layers/members
 * @throws core::RangeFailure if a file-backed source cannot be opened
 */
std::unique_ptr<GeoSource> createSource(const core::SourceDescriptor& descriptor, const SourceOptions& options,
                                        std::shared_ptr<io::HttpClient> http_client = nullptr);

} // namespace source
} // namespace geosplit

#endif // GEOSPLIT_SOURCE_FACTORY_HPP

#ifndef GEOSPLIT_ESRI_SERVER_SOURCE_HPP
#define GEOSPLIT_ESRI_SERVER_SOURCE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "io/esri_json_reader.hpp"
#include "io/http_client.hpp"
#include "source/geo_source.hpp"

namespace geosplit {
namespace source {

// Page size used when neither page_size nor the service's maxRecordCount is known
constexpr int64_t kDefaultEsriPageSize = 1000;

// Assumed encoded size of one feature when grouping pages into ranges
constexpr int64_t kEsriFeatureBytesEstimate = 1024;

/**
 * Paging layout of a feature service layer
 */
struct EsriLayout {
    int64_t page_size;
    std::string object_id_field;
    std::optional<int> wkid;

    EsriLayout() : page_size(kDefaultEsriPageSize) {}
};

/**
 * ArcGIS feature service layer addressed by page index in [0, pageCount)
 */
class EsriServerSource : public GeoSource {
public:
    /**
     * @param descriptor Descriptor whose locator (or uri) is the layer URL
     * @param options Source options
     * @param client HTTP client shared by all readers
     */
    EsriServerSource(const core::SourceDescriptor& descriptor, const SourceOptions& options,
                     std::shared_ptr<io::HttpClient> client);

    /**
     * Remote services have no byte size
     */
    std::optional<int64_t> estimateSize() override;

    /**
     * Contiguous groups of pages sized by the desired bundle size,
     * or [0, unbounded) when the feature count is unavailable
     */
    std::vector<core::OffsetRange> getInitialRanges(int64_t desired_bundle_bytes) override;

    std::unique_ptr<RangeReader> createReader(const core::OffsetRange& range) override;

    /**
     * Paging layout, fetched from the service on first use
     */
    EsriLayout layout();

    /**
     * Number of features reported by the service
     * @return Count, or nullopt if the service did not answer with one
     */
    std::optional<int64_t> fetchFeatureCount();

    /**
     * Number of pages needed for a feature count
     */
    int64_t pageCount(int64_t feature_count);

    const std::string& serviceUrl() const { return service_url_; }
    io::HttpClient& client() const { return *client_; }

private:
    std::string service_url_;
    std::shared_ptr<io::HttpClient> client_;
    std::mutex layout_mutex_;
    std::optional<EsriLayout> layout_;
};

/**
 * Reads the pages of one range
 */
class EsriServerReader : public BufferedRangeReader {
public:
    EsriServerReader(EsriServerSource& source, const core::OffsetRange& range);

protected:
    void open() override;
    bool fillPending() override;
    void release() override;

private:
    /**
     * Build the transformer from the CRS reported by the first page
     */
    void resolveTransformer(const io::EsriPage& page);

    EsriServerSource& source_;
    SourceOptions options_;
    EsriLayout layout_;
    io::RetryPolicy retry_policy_;
    io::CoordinateTransformer transformer_;
    int64_t next_page_;
    bool transformer_resolved_;   // Set by the first good page of the range
};

} // namespace source
} // namespace geosplit

#endif // GEOSPLIT_ESRI_SERVER_SOURCE_HPP

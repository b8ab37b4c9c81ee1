#ifndef GEOSPLIT_VECTOR_SOURCE_HPP
#define GEOSPLIT_VECTOR_SOURCE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "io/vector_feature_index.hpp"
#include "source/geo_source.hpp"

namespace geosplit {
namespace source {

/**
 * File-backed vector source addressed by feature index in [0, featureCount)
 */
class VectorFileSource : public GeoSource {
public:
    /**
     * Open the dataset once to select the layer and count its features
     * @param descriptor Source descriptor
     * @param options Source options
     * @param gdal_path GDAL path of the dataset
     * @param drivers Driver short names allowed to open it
     * @throws core::ConfigurationError if the layer is missing or ambiguous
     * @throws core::RangeFailure if the dataset cannot be opened
     */
    VectorFileSource(const core::SourceDescriptor& descriptor, const SourceOptions& options,
                     const std::string& gdal_path, const std::vector<std::string>& drivers);

    std::optional<int64_t> estimateSize() override;
    std::vector<core::OffsetRange> getInitialRanges(int64_t desired_bundle_bytes) override;
    std::unique_ptr<RangeReader> createReader(const core::OffsetRange& range) override;

    int64_t featureCount() const { return feature_count_; }
    const std::string& gdalPath() const { return gdal_path_; }
    const std::string& layerName() const { return layer_name_; }
    const std::vector<std::string>& drivers() const { return drivers_; }

protected:
    /**
     * Bytes of storage behind the layer
     */
    virtual std::optional<int64_t> storageBytes() const;

    /**
     * Layer requested through layer_name, or the descriptor locator
     */
    static std::string requestedLayer(const core::SourceDescriptor& descriptor, const SourceOptions& options);

    std::string gdal_path_;
    std::vector<std::string> drivers_;
    std::string layer_name_;
    int64_t feature_count_;
};

/**
 * Reads features of one range in index order
 */
class VectorFileReader : public BufferedRangeReader {
public:
    VectorFileReader(const VectorFileSource& source, const core::OffsetRange& range);

protected:
    void open() override;
    bool fillPending() override;
    void release() override;

private:
    std::string gdal_path_;
    std::vector<std::string> drivers_;
    std::string layer_name_;
    SourceOptions options_;
    std::unique_ptr<io::VectorFeatureIndex> index_;
    io::CoordinateTransformer transformer_;
    int64_t next_position_;
};

} // namespace source
} // namespace geosplit

#endif // GEOSPLIT_VECTOR_SOURCE_HPP

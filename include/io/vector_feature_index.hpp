#ifndef GEOSPLIT_VECTOR_FEATURE_INDEX_HPP
#define GEOSPLIT_VECTOR_FEATURE_INDEX_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <nlohmann/json.hpp>

namespace geosplit {
namespace io {

/**
 * Indexed access to the features of one vector layer.
 * Each reader opens its own index; the layer cursor is not thread-safe.
 */
class VectorFeatureIndex {
public:
    /**
     * Open a dataset and select its layer
     * @param path GDAL path of the dataset
     * @param allowed_drivers Driver short names to try
     * @param layer_name Layer to read; may be empty when the dataset has one layer
     * @throws core::RangeFailure if the dataset cannot be opened
     * @throws core::ConfigurationError if the layer is missing or ambiguous
     */
    VectorFeatureIndex(const std::string& path, const std::vector<std::string>& allowed_drivers,
                       const std::string& layer_name);

    VectorFeatureIndex(const VectorFeatureIndex&) = delete;
    VectorFeatureIndex& operator=(const VectorFeatureIndex&) = delete;

    /**
     * Number of features in the layer (forces a full count when the driver has no fast count)
     */
    int64_t featureCount() const;

    const std::string& layerName() const { return layer_name_; }
    const std::string& path() const { return path_; }

    /**
     * CRS of the layer as WKT, empty if the layer has none
     */
    std::string crsWkt() const;

    /**
     * Position the cursor so that next() returns the feature at an index
     * @param index 0-based feature index
     * @return true if the driver accepted the position
     */
    bool seek(int64_t index);

    /**
     * Read the feature at the cursor and move forward
     * @return Feature, or null once the layer is exhausted
     */
    OGRFeatureUniquePtr next();

    /**
     * Index of the feature next() will return
     */
    int64_t nextIndex() const { return next_index_; }

    /**
     * Convert the fields of a feature into a JSON object of scalars
     * @param feature Feature to convert
     * @return Attributes
     */
    static nlohmann::json attributes(const OGRFeature& feature);

    /**
     * Names of the layers of a dataset
     */
    static std::vector<std::string> layerNames(GDALDataset& dataset);

private:
    std::string path_;
    std::string layer_name_;
    GDALDatasetUniquePtr dataset_;
    OGRLayer* layer_;   // Owned by dataset_
    int64_t next_index_;
};

} // namespace io
} // namespace geosplit

#endif // GEOSPLIT_VECTOR_FEATURE_INDEX_HPP

#include "source/vector_source.hpp"
#include "core/errors.hpp"
#include "core/geometry_conversion.hpp"
#include "io/gdal_utils.hpp"
#include <iostream>

namespace geosplit {
namespace source {

VectorFileSource::VectorFileSource(const core::SourceDescriptor& descriptor, const SourceOptions& options,
                                   const std::string& gdal_path, const std::vector<std::string>& drivers)
    : GeoSource(descriptor, options),
      gdal_path_(gdal_path),
      drivers_(drivers),
      feature_count_(0) {

    io::VectorFeatureIndex index(gdal_path_, drivers_, requestedLayer(descriptor, options));
    layer_name_ = index.layerName();
    feature_count_ = index.featureCount();
    if (feature_count_ < 0) {
        throw core::RangeFailure("Cannot count the features of layer " + layer_name_ + " in " + gdal_path_);
    }

    std::cout << "Layer " << layer_name_ << " of " << descriptor.uri << ": " << feature_count_ << " features"
              << std::endl;
}

std::string VectorFileSource::requestedLayer(const core::SourceDescriptor& descriptor, const SourceOptions& options) {
    if (!options.layer_name.empty()) {
        return options.layer_name;
    }
    if (descriptor.kind != core::SourceKind::GEODATABASE) {
        return descriptor.locator;
    }
    return "";
}

std::optional<int64_t> VectorFileSource::storageBytes() const {
    return io::GDALUtils::storageSize(io::GDALUtils::toGdalPath(descriptor_.uri, false));
}

std::optional<int64_t> VectorFileSource::estimateSize() {
    return storageBytes();
}

std::vector<core::OffsetRange> VectorFileSource::getInitialRanges(int64_t desired_bundle_bytes) {
    std::optional<int64_t> size = estimateSize();
    const int64_t bundles = core::bundleCountFor(feature_count_, size.value_or(0), desired_bundle_bytes);
    return core::splitEvenly(core::OffsetRange(0, feature_count_), bundles);
}

std::unique_ptr<RangeReader> VectorFileSource::createReader(const core::OffsetRange& range) {
    return std::make_unique<VectorFileReader>(*this, range);
}

VectorFileReader::VectorFileReader(const VectorFileSource& source, const core::OffsetRange& range)
    : BufferedRangeReader(range, source.metrics(), source.name()),
      gdal_path_(source.gdalPath()),
      drivers_(source.drivers()),
      layer_name_(source.layerName()),
      options_(source.options()),
      next_position_(range.start) {
}

void VectorFileReader::open() {
    index_ = std::make_unique<io::VectorFeatureIndex>(gdal_path_, drivers_, layer_name_);
    transformer_ = io::CoordinateTransformer::resolve(options_.crsSpec(), index_->crsWkt(), options_.out_epsg,
                                                      options_.skip_reproject, label_);
}

void VectorFileReader::release() {
    index_.reset();
}

bool VectorFileReader::fillPending() {
    const int64_t position = next_position_;
    if (!tracker_.tryClaim(position)) {
        return false;
    }
    next_position_++;

    if (index_->nextIndex() != position && !index_->seek(position)) {
        throw core::RangeFailure("Cannot position layer " + layer_name_ + " at feature " +
                                 std::to_string(position) + ": " + io::GDALUtils::lastErrorMessage());
    }

    OGRFeatureUniquePtr feature = index_->next();
    if (!feature) {
        // Fewer features than counted
        return false;
    }

    const OGRGeometry* geometry = feature->GetGeometryRef();
    if (!geometry || geometry->IsEmpty()) {
        metrics_->missing_geometries++;
        std::cerr << "Warning: Feature " << position << " of " << label_ << " has no geometry, record dropped"
                  << std::endl;
        return true;
    }

    core::Geometry converted;
    try {
        converted = core::ogrToGeometry(*geometry);
    } catch (const std::runtime_error& e) {
        metrics_->invalid_geometries++;
        std::cerr << "Warning: Feature " << position << " of " << label_ << ": " << e.what()
                  << ", record dropped" << std::endl;
        return true;
    }

    emit(io::VectorFeatureIndex::attributes(*feature), converted, transformer_);
    return true;
}

} // namespace source
} // namespace geosplit

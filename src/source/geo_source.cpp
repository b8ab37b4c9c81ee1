#include "source/geo_source.hpp"
#include "core/errors.hpp"
#include "core/geometry_conversion.hpp"
#include "core/geometry_repair.hpp"
#include <iostream>
#include <stdexcept>

namespace geosplit {
namespace source {

GeoSource::GeoSource(const core::SourceDescriptor& descriptor, const SourceOptions& options)
    : descriptor_(descriptor),
      options_(options),
      metrics_(std::make_shared<core::SourceMetrics>()) {
}

std::string GeoSource::name() const {
    return core::sourceKindToString(descriptor_.kind) + ":" + descriptor_.uri;
}

BufferedRangeReader::BufferedRangeReader(const core::OffsetRange& range,
                                         std::shared_ptr<core::SourceMetrics> metrics,
                                         const std::string& label)
    : tracker_(range), metrics_(std::move(metrics)), label_(label), closed_(false) {
}

bool BufferedRangeReader::start() {
    try {
        open();
    } catch (const core::RangeFailure& e) {
        metrics_->failed_ranges++;
        std::cerr << "Error: Range " << tracker_.currentRange().toString() << " of " << label_
                  << " failed: " << e.what() << std::endl;
        close();
        throw;
    } catch (const std::exception&) {
        close();
        throw;
    }
    return advance();
}

bool BufferedRangeReader::advance() {
    if (closed_) {
        current_.reset();
        return false;
    }

    try {
        while (pending_.empty()) {
            if (!fillPending()) {
                current_.reset();
                close();
                return false;
            }
        }
    } catch (const core::RangeFailure& e) {
        metrics_->failed_ranges++;
        std::cerr << "Error: Range " << tracker_.currentRange().toString() << " of " << label_
                  << " failed: " << e.what() << std::endl;
        current_.reset();
        close();
        throw;
    }

    current_ = std::move(pending_.front());
    pending_.pop_front();
    metrics_->records_emitted++;
    return true;
}

const core::GeoRecord& BufferedRangeReader::getCurrent() const {
    if (!current_) {
        throw std::logic_error("No current record in " + label_);
    }
    return *current_;
}

double BufferedRangeReader::getProgress() const {
    return tracker_.getFractionConsumed();
}

std::optional<core::OffsetRange> BufferedRangeReader::trySplit(double fraction) {
    return tracker_.trySplit(fraction);
}

void BufferedRangeReader::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    pending_.clear();
    release();
}

core::OffsetRange BufferedRangeReader::range() const {
    return tracker_.currentRange();
}

bool BufferedRangeReader::emit(nlohmann::json attributes, const core::Geometry& geometry,
                               const io::CoordinateTransformer& transformer) {
    auto transformed = transformer.transformGeometry(geometry);
    if (!transformed) {
        metrics_->transform_failures++;
        std::cerr << "Warning: Failed to transform " << core::geometryTypeName(geometry) << " in " << label_
                  << " (" << transformer.describe() << "), record dropped" << std::endl;
        return false;
    }

    auto repaired = core::GeometryRepair::repair(*transformed);
    if (!repaired) {
        metrics_->invalid_geometries++;
        std::cerr << "Warning: Invalid " << core::geometryTypeName(*transformed) << " in " << label_
                  << " could not be repaired, record dropped" << std::endl;
        return false;
    }

    pending_.emplace_back(std::move(attributes), std::move(*repaired));
    return true;
}

} // namespace source
} // namespace geosplit

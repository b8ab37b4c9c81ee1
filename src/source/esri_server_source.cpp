#include "source/esri_server_source.hpp"
#include "core/errors.hpp"
#include "io/coordinate_system_utils.hpp"
#include <algorithm>
#include <iostream>

namespace geosplit {
namespace source {

namespace {

// WKIDs of 100000 and above are ESRI authority codes
std::string wkidDefinition(int wkid) {
    return (wkid >= 100000 ? "ESRI:" : "EPSG:") + std::to_string(wkid);
}

} // namespace

EsriServerSource::EsriServerSource(const core::SourceDescriptor& descriptor, const SourceOptions& options,
                                   std::shared_ptr<io::HttpClient> client)
    : GeoSource(descriptor, options),
      service_url_(descriptor.locator.empty() ? descriptor.uri : descriptor.locator),
      client_(std::move(client)) {
    if (service_url_.empty()) {
        throw core::ConfigurationError("Feature service source needs a layer URL");
    }
    if (!client_) {
        throw core::ConfigurationError("Feature service source needs an HTTP client");
    }
}

std::optional<int64_t> EsriServerSource::estimateSize() {
    return std::nullopt;
}

EsriLayout EsriServerSource::layout() {
    std::lock_guard<std::mutex> lock(layout_mutex_);
    if (layout_) {
        return *layout_;
    }

    EsriLayout resolved;
    try {
        io::HttpResponse response = io::fetchWithRetry(*client_, io::EsriJsonReader::infoUrl(service_url_),
                                                       options_.retryPolicy(), metrics_.get());
        std::optional<io::EsriServiceInfo> info;
        if (response.isSuccess()) {
            info = io::EsriJsonReader::parseServiceInfo(response.body);
        }
        if (info) {
            if (info->max_record_count) {
                resolved.page_size = *info->max_record_count;
            }
            resolved.object_id_field = info->object_id_field;
            resolved.wkid = info->wkid;
        } else {
            std::cerr << "Warning: No layer metadata from " << service_url_ << ", using defaults" << std::endl;
        }
    } catch (const core::RangeFailure& e) {
        std::cerr << "Warning: Layer metadata of " << service_url_ << " unavailable: " << e.what() << std::endl;
    }

    if (options_.page_size) {
        resolved.page_size = *options_.page_size;
    }

    layout_ = resolved;
    return resolved;
}

std::optional<int64_t> EsriServerSource::fetchFeatureCount() {
    try {
        io::HttpResponse response = io::fetchWithRetry(*client_, io::EsriJsonReader::countUrl(service_url_),
                                                       options_.retryPolicy(), metrics_.get());
        if (response.isSuccess()) {
            return io::EsriJsonReader::parseCount(response.body);
        }
        std::cerr << "Warning: Feature count of " << service_url_ << " failed with HTTP " << response.status
                  << std::endl;
    } catch (const core::RangeFailure& e) {
        std::cerr << "Warning: Feature count of " << service_url_ << " unavailable: " << e.what() << std::endl;
    }
    return std::nullopt;
}

int64_t EsriServerSource::pageCount(int64_t feature_count) {
    const int64_t page_size = layout().page_size;
    return (feature_count + page_size - 1) / page_size;
}

std::vector<core::OffsetRange> EsriServerSource::getInitialRanges(int64_t desired_bundle_bytes) {
    std::optional<int64_t> count = fetchFeatureCount();
    if (!count) {
        std::cout << "Feature count of " << service_url_ << " unknown, reading it as one unbounded range"
                  << std::endl;
        return {core::OffsetRange(0, core::kUnboundedOffset)};
    }

    const int64_t pages = pageCount(*count);
    const int64_t bundles = core::bundleCountFor(pages, *count * kEsriFeatureBytesEstimate, desired_bundle_bytes);
    std::vector<core::OffsetRange> ranges = core::splitEvenly(core::OffsetRange(0, pages), bundles);

    std::cout << "Feature service " << service_url_ << ": " << *count << " features in " << pages << " pages, "
              << ranges.size() << " ranges" << std::endl;
    return ranges;
}

std::unique_ptr<RangeReader> EsriServerSource::createReader(const core::OffsetRange& range) {
    return std::make_unique<EsriServerReader>(*this, range);
}

EsriServerReader::EsriServerReader(EsriServerSource& source, const core::OffsetRange& range)
    : BufferedRangeReader(range, source.metrics(), source.name()),
      source_(source),
      options_(source.options()),
      retry_policy_(source.options().retryPolicy()),
      next_page_(range.start),
      transformer_resolved_(false) {
}

void EsriServerReader::open() {
    layout_ = source_.layout();

    if (tracker_.currentRange().isUnbounded()) {
        std::optional<int64_t> count = source_.fetchFeatureCount();
        if (count) {
            tracker_.updateStop(std::max(source_.pageCount(*count), tracker_.startPosition()));
        }
    }
}

void EsriServerReader::release() {
}

void EsriServerReader::resolveTransformer(const io::EsriPage& page) {
    std::string embedded_wkt;
    std::optional<int> wkid = page.wkid ? page.wkid : layout_.wkid;
    if (wkid) {
        try {
            embedded_wkt = io::CoordinateSystemUtils::toWkt(
                *io::CoordinateSystemUtils::fromUserInput(wkidDefinition(*wkid)));
        } catch (const core::ConfigurationError& e) {
            std::cerr << "Warning: Unknown service spatial reference " << *wkid << ": " << e.what() << std::endl;
        }
    }

    transformer_ = io::CoordinateTransformer::resolve(options_.crsSpec(), embedded_wkt, options_.out_epsg,
                                                      options_.skip_reproject, label_);
}

bool EsriServerReader::fillPending() {
    const int64_t page_index = next_page_;
    if (!tracker_.tryClaim(page_index)) {
        return false;
    }
    next_page_++;

    const std::string url = io::EsriJsonReader::pageUrl(source_.serviceUrl(), page_index * layout_.page_size,
                                                        layout_.page_size, layout_.object_id_field);
    io::HttpResponse response = io::fetchWithRetry(source_.client(), url, retry_policy_, metrics_.get());

    std::string error;
    std::optional<io::EsriPage> page;
    if (response.isSuccess()) {
        page = io::EsriJsonReader::parsePage(response.body, error);
    } else {
        error = "HTTP " + std::to_string(response.status);
    }

    if (!page) {
        if (page_index == 0) {
            // The first page of the service is the reference for its schema and CRS
            throw core::RangeFailure("First page of " + label_ + " is unusable: " + error);
        }
        metrics_->defective_pages++;
        std::cerr << "Warning: Page " << page_index << " of " << label_ << " is defective (" << error
                  << "), page skipped" << std::endl;
        return true;
    }

    if (!transformer_resolved_) {
        resolveTransformer(*page);
        transformer_resolved_ = true;
    }

    for (auto& feature : page->features) {
        if (!feature.geometry) {
            metrics_->missing_geometries++;
            std::cerr << "Warning: Feature on page " << page_index << " of " << label_
                      << " has no geometry, record dropped" << std::endl;
            continue;
        }
        emit(std::move(feature.attributes), *feature.geometry, transformer_);
    }

    // A short final page ends a feed of unknown length
    if (tracker_.currentRange().isUnbounded() &&
        static_cast<int64_t>(page->features.size()) < layout_.page_size && !page->exceeded_transfer_limit) {
        tracker_.updateStop(page_index + 1);
    }
    return true;
}

} // namespace source
} // namespace geosplit

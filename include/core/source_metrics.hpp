#ifndef GEOSPLIT_SOURCE_METRICS_HPP
#define GEOSPLIT_SOURCE_METRICS_HPP

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace geosplit {
namespace core {

/**
 * Counters shared by every reader of one source.
 * Record defects are counted here instead of being raised.
 */
struct SourceMetrics {
    std::atomic<uint64_t> records_emitted{0};
    std::atomic<uint64_t> invalid_geometries{0};   // Dropped after repair
    std::atomic<uint64_t> missing_geometries{0};   // Features without geometry
    std::atomic<uint64_t> transform_failures{0};   // Records whose reprojection failed
    std::atomic<uint64_t> skipped_blocks{0};       // Raster blocks that could not be read
    std::atomic<uint64_t> defective_pages{0};      // Malformed or error service pages
    std::atomic<uint64_t> http_retries{0};
    std::atomic<uint64_t> failed_ranges{0};

    uint64_t droppedRecords() const {
        return invalid_geometries.load() + missing_geometries.load() + transform_failures.load();
    }

    std::string summary() const {
        std::ostringstream oss;
        oss << "records_emitted=" << records_emitted.load()
            << " invalid_geometries=" << invalid_geometries.load()
            << " missing_geometries=" << missing_geometries.load()
            << " transform_failures=" << transform_failures.load()
            << " skipped_blocks=" << skipped_blocks.load()
            << " defective_pages=" << defective_pages.load()
            << " http_retries=" << http_retries.load()
            << " failed_ranges=" << failed_ranges.load();
        return oss.str();
    }
};

} // namespace core
} // namespace geosplit

#endif // GEOSPLIT_SOURCE_METRICS_HPP

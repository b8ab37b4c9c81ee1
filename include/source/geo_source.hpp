#ifndef GEOSPLIT_GEO_SOURCE_HPP
#define GEOSPLIT_GEO_SOURCE_HPP

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/common.hpp"
#include "core/range_tracker.hpp"
#include "core/source_metrics.hpp"
#include "io/coordinate_transformer.hpp"
#include "source/source_options.hpp"

namespace geosplit {
namespace source {

/**
 * Pull cursor over the records of one range.
 *
 * Lifecycle: start() once, then advance() until it returns false, then close().
 * trySplit() and getProgress() may be called from another thread while the
 * reading thread is inside advance().
 */
class RangeReader {
public:
    virtual ~RangeReader() = default;

    /**
     * Open the underlying data and move to the first record
     * @return true if a record is available
     * @throws core::CRSUndeterminedError if the source CRS cannot be determined
     * @throws core::RangeFailure if the range cannot be read at all
     */
    virtual bool start() = 0;

    /**
     * Move to the next record
     * @return true if a record is available, false once the range is exhausted
     * @throws core::RangeFailure if the rest of the range cannot be read
     */
    virtual bool advance() = 0;

    /**
     * Current record; valid after start() or advance() returned true
     * @throws std::logic_error if there is no current record
     */
    virtual const core::GeoRecord& getCurrent() const = 0;

    /**
     * Fraction of the range consumed so far in [0, 1]
     */
    virtual double getProgress() const = 0;

    /**
     * Give away the unread tail of the range
     * @param fraction Split point as a fraction of the current range
     * @return Residual range now owned by the caller, or nullopt if the range cannot be split
     */
    virtual std::optional<core::OffsetRange> trySplit(double fraction) = 0;

    /**
     * Release dataset handles; safe to call more than once
     */
    virtual void close() = 0;

    /**
     * Current range after any splits
     */
    virtual core::OffsetRange range() const = 0;
};

/**
 * Splittable source over one geospatial file or feed
 */
class GeoSource {
public:
    GeoSource(const core::SourceDescriptor& descriptor, const SourceOptions& options);
    virtual ~GeoSource() = default;

    GeoSource(const GeoSource&) = delete;
    GeoSource& operator=(const GeoSource&) = delete;

    /**
     * Estimated size of the whole source in bytes
     * @return Size, or nullopt if it cannot be estimated
     */
    virtual std::optional<int64_t> estimateSize() = 0;

    /**
     * Partition the source into ranges covering it exactly once
     * @param desired_bundle_bytes Desired size of one range in bytes
     * @return Contiguous ranges in order
     */
    virtual std::vector<core::OffsetRange> getInitialRanges(int64_t desired_bundle_bytes) = 0;

    /**
     * Create an independent reader positioned at the start of a range
     * @param range Range to read
     * @return Reader owned by the caller
     */
    virtual std::unique_ptr<RangeReader> createReader(const core::OffsetRange& range) = 0;

    const core::SourceDescriptor& descriptor() const { return descriptor_; }
    const SourceOptions& options() const { return options_; }

    /**
     * Display name ("shapefile:/data/roads.zip")
     */
    std::string name() const;

    /**
     * Counters shared by all readers of this source
     */
    std::shared_ptr<core::SourceMetrics> metrics() const { return metrics_; }

protected:
    core::SourceDescriptor descriptor_;
    SourceOptions options_;
    std::shared_ptr<core::SourceMetrics> metrics_;
};

/**
 * Reader base that produces records unit by unit (block, feature or page) into a
 * small queue. Subclasses claim one unit per fillPending() call.
 */
class BufferedRangeReader : public RangeReader {
public:
    BufferedRangeReader(const core::OffsetRange& range, std::shared_ptr<core::SourceMetrics> metrics,
                        const std::string& label);

    bool start() override;
    bool advance() override;
    const core::GeoRecord& getCurrent() const override;
    double getProgress() const override;
    std::optional<core::OffsetRange> trySplit(double fraction) override;
    void close() override;
    core::OffsetRange range() const override;

protected:
    /**
     * Open datasets or fetch metadata; called once by start()
     */
    virtual void open() = 0;

    /**
     * Claim the next unit and queue its records
     * @return false once a claim fails or the data is exhausted
     */
    virtual bool fillPending() = 0;

    /**
     * Release handles; called once by close()
     */
    virtual void release() = 0;

    /**
     * Reproject and repair a geometry, then queue the record or count it as dropped
     * @param attributes Record attributes
     * @param geometry Geometry in the source CRS
     * @param transformer Transformer of this reader
     * @return true if the record was queued
     */
    bool emit(nlohmann::json attributes, const core::Geometry& geometry,
              const io::CoordinateTransformer& transformer);

    core::RangeTracker tracker_;
    std::shared_ptr<core::SourceMetrics> metrics_;
    std::string label_;

private:
    std::deque<core::GeoRecord> pending_;
    std::optional<core::GeoRecord> current_;
    bool closed_;
};

} // namespace source
} // namespace geosplit

#endif // GEOSPLIT_GEO_SOURCE_HPP

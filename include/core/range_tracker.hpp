#ifndef GEOSPLIT_RANGE_TRACKER_HPP
#define GEOSPLIT_RANGE_TRACKER_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>
#include "core/common.hpp"

namespace geosplit {
namespace core {

/**
 * Tracks the claimed position of a reader inside [start, stop).
 *
 * Mutated by the reading thread through tryClaim() and by one external split
 * requester through trySplit(); both may run concurrently. Claimed positions are
 * non-decreasing and stop only shrinks, never below the last claimed position.
 */
class RangeTracker {
public:
    /**
     * @param range Initial range; its end may be kUnboundedOffset
     * @throws std::invalid_argument if start > end
     */
    explicit RangeTracker(const OffsetRange& range);

    // Not copyable: the tracker is the single owner of its claim state
    RangeTracker(const RangeTracker&) = delete;
    RangeTracker& operator=(const RangeTracker&) = delete;

    /**
     * Claim a position for the reader
     * @param position Block, feature or page index about to be produced
     * @return true if start <= position < stop and position >= last claimed position;
     *         false means the reader must stop producing records for this range
     */
    bool tryClaim(int64_t position);

    /**
     * Narrow stop to a point strictly between the last claimed position and stop
     * @param fraction Fraction of the whole range at which to split, in (0, 1)
     * @return Residual range [split, old stop), or nullopt if the range cannot be split
     */
    std::optional<OffsetRange> trySplit(double fraction);

    /**
     * Fraction of the range consumed so far, clamped to [0, 1]
     */
    double getFractionConsumed() const;

    /**
     * Record the real bound of a range that started unbounded (or shrink a known bound)
     * @param stop New stop position
     * @return true if the bound was accepted
     */
    bool updateStop(int64_t stop);

    int64_t startPosition() const;
    int64_t stopPosition() const;
    std::optional<int64_t> lastClaimedPosition() const;

    /**
     * Current [start, stop) after any splits
     */
    OffsetRange currentRange() const;

    /**
     * True once a claim failed because it reached stop
     */
    bool isDone() const;

private:
    mutable std::mutex mutex_;
    int64_t start_;
    int64_t stop_;
    std::optional<int64_t> last_claimed_;
    bool done_;
};

/**
 * Partition a range into contiguous, equal-ish sub-ranges.
 * Boundaries are start + ceil(i * size / bundles), so 10 units in 3 bundles
 * give [0,4) [4,7) [7,10).
 * @param range Bounded range to partition
 * @param bundles Requested number of sub-ranges (clamped to [1, size])
 * @return Sub-ranges in order; empty if the range is empty
 */
std::vector<OffsetRange> splitEvenly(const OffsetRange& range, int64_t bundles);

/**
 * Number of bundles for a desired bundle size in bytes
 * @param units Number of addressable units
 * @param estimated_bytes Estimated size of all units together
 * @param desired_bundle_bytes Desired bytes per bundle (<= 0 means one bundle)
 * @return Bundle count, 0 when there are no units
 */
int64_t bundleCountFor(int64_t units, int64_t estimated_bytes, int64_t desired_bundle_bytes);

} // namespace core
} // namespace geosplit

#endif // GEOSPLIT_RANGE_TRACKER_HPP

#include "core/range_tracker.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace geosplit {
namespace core {

RangeTracker::RangeTracker(const OffsetRange& range)
    : start_(range.start), stop_(range.end), done_(false) {
    if (range.start > range.end) {
        throw std::invalid_argument("Invalid range " + range.toString() + ": start is after end");
    }
}

bool RangeTracker::tryClaim(int64_t position) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (done_ || position < start_) {
        return false;
    }
    if (last_claimed_.has_value() && position < *last_claimed_) {
        return false;
    }
    if (position >= stop_) {
        done_ = true;
        return false;
    }

    last_claimed_ = position;
    return true;
}

std::optional<OffsetRange> RangeTracker::trySplit(double fraction) {
    std::lock_guard<std::mutex> lock(mutex_);

    // The real bound of an unbounded feed is not known yet
    if (stop_ == kUnboundedOffset || done_) {
        return std::nullopt;
    }
    if (!(fraction > 0.0 && fraction < 1.0)) {
        return std::nullopt;
    }

    double span = static_cast<double>(stop_ - start_);
    int64_t split = start_ + static_cast<int64_t>(std::ceil(fraction * span));
    int64_t lower = last_claimed_.has_value() ? *last_claimed_ : start_;

    if (split <= lower || split >= stop_) {
        return std::nullopt;
    }

    OffsetRange residual(split, stop_);
    stop_ = split;
    return residual;
}

double RangeTracker::getFractionConsumed() const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (done_) {
        return 1.0;
    }
    if (!last_claimed_.has_value() || stop_ == kUnboundedOffset || stop_ <= start_) {
        return 0.0;
    }

    double fraction = static_cast<double>(*last_claimed_ - start_) / static_cast<double>(stop_ - start_);
    return std::max(0.0, std::min(1.0, fraction));
}

bool RangeTracker::updateStop(int64_t stop) {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t lower = last_claimed_.has_value() ? *last_claimed_ + 1 : start_;
    if (stop > stop_ || stop < lower) {
        return false;
    }

    stop_ = stop;
    return true;
}

int64_t RangeTracker::startPosition() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_;
}

int64_t RangeTracker::stopPosition() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_;
}

std::optional<int64_t> RangeTracker::lastClaimedPosition() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_claimed_;
}

OffsetRange RangeTracker::currentRange() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return OffsetRange(start_, stop_);
}

bool RangeTracker::isDone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
}

std::vector<OffsetRange> splitEvenly(const OffsetRange& range, int64_t bundles) {
    std::vector<OffsetRange> ranges;
    if (range.empty()) {
        return ranges;
    }
    if (range.isUnbounded() || bundles <= 1) {
        ranges.push_back(range);
        return ranges;
    }

    int64_t size = range.end - range.start;
    bundles = std::min(bundles, size);

    // ceil(i * size / bundles) without overflowing i * size
    int64_t quotient = size / bundles;
    int64_t remainder = size % bundles;

    int64_t previous = range.start;
    for (int64_t i = 1; i <= bundles; ++i) {
        int64_t boundary = range.start + i * quotient + (i * remainder + bundles - 1) / bundles;
        ranges.emplace_back(previous, boundary);
        previous = boundary;
    }

    return ranges;
}

int64_t bundleCountFor(int64_t units, int64_t estimated_bytes, int64_t desired_bundle_bytes) {
    if (units <= 0) {
        return 0;
    }
    if (desired_bundle_bytes <= 0 || estimated_bytes <= 0) {
        return 1;
    }

    int64_t bytes_per_unit = std::max<int64_t>(1, estimated_bytes / units);
    int64_t units_per_bundle = std::max<int64_t>(1, desired_bundle_bytes / bytes_per_unit);
    return (units + units_per_bundle - 1) / units_per_bundle;
}

} // namespace core
} // namespace geosplit
